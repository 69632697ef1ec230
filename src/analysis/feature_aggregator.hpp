#ifndef FEATURE_AGGREGATOR_HPP
#define FEATURE_AGGREGATOR_HPP

#include "core/log_record.hpp"
#include "models/features.hpp"

#include <cstdint>
#include <vector>

// Buckets records by (address, epoch-aligned window) and derives one
// FeatureVector per populated bucket. Empty windows are never emitted.
class FeatureAggregator {
public:
  explicit FeatureAggregator(uint64_t window_seconds = 300,
                             int failed_status_threshold = 400);

  // floor(timestamp / width) * width, independent of processing order
  int64_t window_start_for(int64_t timestamp_ms) const;

  // Output is ordered by address, then window start
  std::vector<FeatureVector>
  aggregate(const std::vector<LogRecord> &records) const;

private:
  FeatureVector build_vector(const std::vector<const LogRecord *> &group) const;

  uint64_t window_seconds_;
  int64_t window_ms_;
  int failed_status_threshold_;
};

#endif // FEATURE_AGGREGATOR_HPP
