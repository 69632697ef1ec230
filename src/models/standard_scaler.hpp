#ifndef STANDARD_SCALER_HPP
#define STANDARD_SCALER_HPP

#include "features.hpp"

#include <array>

// Per-column standardization parameters fitted on exactly one batch. The
// value is returned to the caller and never cached, so concurrent batches
// cannot see each other's statistics.
struct ScalerParams {
  std::array<double, FEATURE_DIMENSIONS> mean{};
  // Population standard deviation; 0 marks a constant column
  std::array<double, FEATURE_DIMENSIONS> stddev{};
};

class StandardScaler {
public:
  // Mean and stddev over the complete, already-materialized matrix
  static ScalerParams fit(const FeatureMatrix &matrix);

  // (x - mean) / stddev; constant columns become 0 after centering
  static FeatureMatrix transform(const FeatureMatrix &matrix,
                                 const ScalerParams &params);

  static FeatureMatrix fit_transform(const FeatureMatrix &matrix,
                                     ScalerParams *params_out = nullptr);
};

#endif // STANDARD_SCALER_HPP
