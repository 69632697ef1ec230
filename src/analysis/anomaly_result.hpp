#ifndef ANOMALY_RESULT_HPP
#define ANOMALY_RESULT_HPP

#include "core/log_record.hpp"
#include "detection/risk_classifier.hpp"
#include "models/features.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct AnomalyResult {
  std::string address;
  int64_t window_start_ms = 0;

  // Smaller = more anomalous
  double raw_score = 0.0;
  // Batch-relative, larger = more anomalous
  double risk_score = 0.0;
  RiskLevel risk_level = RiskLevel::LOW;
  bool is_anomaly = false;

  FeatureVector features;
};

struct TopThreat {
  std::string address;
  int64_t window_start_ms = 0;
  double risk_score = 0.0;
};

struct BatchSummary {
  size_t total_addresses = 0;
  size_t high_risk_count = 0;
  double mean_risk_score = 0.0;

  size_t windows_scored = 0;
  size_t anomaly_count = 0;
  size_t rows_read = 0;
  size_t rows_dropped = 0;
  std::array<size_t, PARSE_ERROR_KIND_COUNT> rows_dropped_by_kind{};

  // Bins: <=20, <=40, <=60, <=80, >80
  std::array<size_t, 5> risk_distribution{};
  std::optional<TopThreat> top_threat;

  uint64_t seed_used = 0;
};

struct BatchReport {
  // Sorted by risk_score descending
  std::vector<AnomalyResult> results;
  BatchSummary summary;
  std::vector<ParseError> rejected_rows;
};

#endif // ANOMALY_RESULT_HPP
