#include "standard_scaler.hpp"
#include "core/logger.hpp"
#include "utils/stats_tracker.hpp"

#include <cmath>
#include <cstddef>

namespace {
// Columns whose spread is below this are treated as constant
constexpr double ZERO_VARIANCE_EPSILON = 1e-12;
} // namespace

ScalerParams StandardScaler::fit(const FeatureMatrix &matrix) {
  StatsTracker<FEATURE_DIMENSIONS> tracker;
  for (const auto &row : matrix)
    tracker.update(row);

  ScalerParams params;
  params.mean = tracker.get_mean();
  auto stddev = tracker.get_population_stddev();
  for (size_t column = 0; column < FEATURE_DIMENSIONS; column++) {
    params.stddev[column] =
        stddev[column] > ZERO_VARIANCE_EPSILON ? stddev[column] : 0.0;

    LOG(LogLevel::DEBUG, LogComponent::ML_SCALER,
        get_feature_name(static_cast<Feature>(column))
            << ": mean=" << params.mean[column]
            << " stddev=" << params.stddev[column]);
  }
  return params;
}

FeatureMatrix StandardScaler::transform(const FeatureMatrix &matrix,
                                        const ScalerParams &params) {
  FeatureMatrix scaled;
  scaled.reserve(matrix.size());
  for (const auto &row : matrix) {
    std::array<double, FEATURE_DIMENSIONS> out{};
    for (size_t column = 0; column < FEATURE_DIMENSIONS; column++) {
      double centered = row[column] - params.mean[column];
      out[column] =
          params.stddev[column] > 0.0 ? centered / params.stddev[column] : 0.0;
    }
    scaled.push_back(out);
  }
  return scaled;
}

FeatureMatrix StandardScaler::fit_transform(const FeatureMatrix &matrix,
                                            ScalerParams *params_out) {
  ScalerParams params = fit(matrix);
  FeatureMatrix scaled = transform(matrix, params);
  if (params_out)
    *params_out = params;
  return scaled;
}
