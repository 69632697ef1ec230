#ifndef FEATURES_HPP
#define FEATURES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Column order of the matrix handed to the anomaly model
enum class Feature {
  TOTAL_COUNT,
  FAILED_COUNT,
  SUCCESS_RATIO,
  UNIQUE_ENDPOINT_COUNT,
  REQUEST_RATE_PER_MINUTE,
  AVG_INTER_REQUEST_GAP_SECONDS,

  // This must always be the last item. It automatically provides the total
  // count.
  FEATURE_COUNT
};

constexpr size_t FEATURE_DIMENSIONS = static_cast<size_t>(Feature::FEATURE_COUNT);

std::string get_feature_name(Feature f);

// Behaviour of one address inside one epoch-aligned window
struct FeatureVector {
  std::string address;
  int64_t window_start_ms = 0;

  uint64_t failed_count = 0;
  uint64_t total_count = 0;
  double success_ratio = 0.0;
  uint64_t unique_endpoint_count = 0;
  double request_rate_per_minute = 0.0;
  double avg_inter_request_gap_seconds = 0.0;

  std::array<double, FEATURE_DIMENSIONS> to_array() const;
};

using FeatureMatrix = std::vector<std::array<double, FEATURE_DIMENSIONS>>;

FeatureMatrix to_matrix(const std::vector<FeatureVector> &vectors);

#endif // FEATURES_HPP
