#include "feature_aggregator.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

FeatureAggregator::FeatureAggregator(uint64_t window_seconds,
                                     int failed_status_threshold)
    : window_seconds_(window_seconds),
      window_ms_(static_cast<int64_t>(window_seconds) * 1000),
      failed_status_threshold_(failed_status_threshold) {
  if (window_seconds == 0)
    throw std::invalid_argument("Feature window width must be positive");
}

int64_t FeatureAggregator::window_start_for(int64_t timestamp_ms) const {
  int64_t bucket = timestamp_ms / window_ms_;
  // Floor rather than truncate toward zero
  if (timestamp_ms % window_ms_ < 0)
    bucket--;
  return bucket * window_ms_;
}

std::vector<FeatureVector>
FeatureAggregator::aggregate(const std::vector<LogRecord> &records) const {
  std::map<std::pair<std::string, int64_t>, std::vector<const LogRecord *>>
      groups;
  for (const auto &record : records)
    groups[{record.address, window_start_for(record.timestamp_ms)}].push_back(
        &record);

  std::vector<FeatureVector> vectors;
  vectors.reserve(groups.size());
  for (auto &[key, group] : groups) {
    std::stable_sort(group.begin(), group.end(),
                     [](const LogRecord *a, const LogRecord *b) {
                       return a->timestamp_ms < b->timestamp_ms;
                     });

    FeatureVector vector = build_vector(group);
    vector.address = key.first;
    vector.window_start_ms = key.second;

    LOG(LogLevel::TRACE, LogComponent::FEATURES,
        "Window " << vector.address << "@" << vector.window_start_ms
                  << ": total=" << vector.total_count
                  << " failed=" << vector.failed_count
                  << " endpoints=" << vector.unique_endpoint_count
                  << " gap=" << vector.avg_inter_request_gap_seconds);
    vectors.push_back(std::move(vector));
  }

  LOG(LogLevel::INFO, LogComponent::FEATURES,
      "Aggregated " << records.size() << " records into " << vectors.size()
                    << " windows of " << window_seconds_ << "s");
  return vectors;
}

FeatureVector FeatureAggregator::build_vector(
    const std::vector<const LogRecord *> &group) const {
  FeatureVector vector;
  vector.total_count = group.size();

  std::unordered_set<std::string> endpoints;
  for (const auto *record : group) {
    if (record->status >= failed_status_threshold_)
      vector.failed_count++;
    endpoints.insert(record->endpoint);
  }
  vector.unique_endpoint_count = endpoints.size();

  vector.success_ratio =
      static_cast<double>(vector.total_count - vector.failed_count) /
      static_cast<double>(vector.total_count);

  // Fixed denominator: the configured width, not the elapsed span
  vector.request_rate_per_minute = static_cast<double>(vector.total_count) /
                                   (static_cast<double>(window_seconds_) / 60.0);

  // A single request carries no gap information
  if (group.size() > 1) {
    double gap_sum_seconds = 0.0;
    for (size_t i = 1; i < group.size(); i++)
      gap_sum_seconds +=
          static_cast<double>(group[i]->timestamp_ms -
                              group[i - 1]->timestamp_ms) /
          1000.0;
    vector.avg_inter_request_gap_seconds =
        gap_sum_seconds / static_cast<double>(group.size() - 1);
  }

  return vector;
}
