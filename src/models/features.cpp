#include "features.hpp"

std::string get_feature_name(Feature f) {
  switch (f) {
  case Feature::TOTAL_COUNT:
    return "total_count";
  case Feature::FAILED_COUNT:
    return "failed_count";
  case Feature::SUCCESS_RATIO:
    return "success_ratio";
  case Feature::UNIQUE_ENDPOINT_COUNT:
    return "unique_endpoint_count";
  case Feature::REQUEST_RATE_PER_MINUTE:
    return "request_rate_per_minute";
  case Feature::AVG_INTER_REQUEST_GAP_SECONDS:
    return "avg_inter_request_gap_seconds";
  default:
    return "unknown_feature";
  }
}

std::array<double, FEATURE_DIMENSIONS> FeatureVector::to_array() const {
  std::array<double, FEATURE_DIMENSIONS> row{};
  row[static_cast<int>(Feature::TOTAL_COUNT)] =
      static_cast<double>(total_count);
  row[static_cast<int>(Feature::FAILED_COUNT)] =
      static_cast<double>(failed_count);
  row[static_cast<int>(Feature::SUCCESS_RATIO)] = success_ratio;
  row[static_cast<int>(Feature::UNIQUE_ENDPOINT_COUNT)] =
      static_cast<double>(unique_endpoint_count);
  row[static_cast<int>(Feature::REQUEST_RATE_PER_MINUTE)] =
      request_rate_per_minute;
  row[static_cast<int>(Feature::AVG_INTER_REQUEST_GAP_SECONDS)] =
      avg_inter_request_gap_seconds;
  return row;
}

FeatureMatrix to_matrix(const std::vector<FeatureVector> &vectors) {
  FeatureMatrix matrix;
  matrix.reserve(vectors.size());
  for (const auto &vector : vectors)
    matrix.push_back(vector.to_array());
  return matrix;
}
