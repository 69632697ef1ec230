#include "json_formatter.hpp"
#include "models/features.hpp"
#include "utils/utils.hpp"

#include <algorithm>

nlohmann::json JsonFormatter::result_to_json_object(const AnomalyResult &result) {
  nlohmann::json j;
  j["address"] = result.address;
  j["window_start"] = Utils::format_iso8601_ms(result.window_start_ms);
  j["window_start_ms"] = result.window_start_ms;
  j["raw_score"] = result.raw_score;
  j["risk_score"] = result.risk_score;
  j["risk_level"] = risk_level_to_string(result.risk_level);
  j["is_anomaly"] = result.is_anomaly;

  // === Feature vector the score was computed from ===
  const auto &f = result.features;
  nlohmann::json j_features;
  j_features[get_feature_name(Feature::TOTAL_COUNT)] = f.total_count;
  j_features[get_feature_name(Feature::FAILED_COUNT)] = f.failed_count;
  j_features[get_feature_name(Feature::SUCCESS_RATIO)] = f.success_ratio;
  j_features[get_feature_name(Feature::UNIQUE_ENDPOINT_COUNT)] =
      f.unique_endpoint_count;
  j_features[get_feature_name(Feature::REQUEST_RATE_PER_MINUTE)] =
      f.request_rate_per_minute;
  j_features[get_feature_name(Feature::AVG_INTER_REQUEST_GAP_SECONDS)] =
      f.avg_inter_request_gap_seconds;
  j["features"] = j_features;
  return j;
}

nlohmann::json
JsonFormatter::summary_to_json_object(const BatchSummary &summary) {
  nlohmann::json j;
  j["total_addresses"] = summary.total_addresses;
  j["high_risk_count"] = summary.high_risk_count;
  j["mean_risk_score"] = summary.mean_risk_score;
  j["windows_scored"] = summary.windows_scored;
  j["anomaly_count"] = summary.anomaly_count;
  j["rows_read"] = summary.rows_read;
  j["rows_dropped"] = summary.rows_dropped;

  nlohmann::json j_dropped;
  for (size_t i = 0; i < PARSE_ERROR_KIND_COUNT; i++)
    j_dropped[parse_error_kind_to_string(static_cast<ParseErrorKind>(i))] =
        summary.rows_dropped_by_kind[i];
  j["rows_dropped_by_kind"] = j_dropped;

  j["risk_distribution"] = summary.risk_distribution;
  if (summary.top_threat) {
    j["top_threat"] = {
        {"address", summary.top_threat->address},
        {"window_start",
         Utils::format_iso8601_ms(summary.top_threat->window_start_ms)},
        {"risk_score", summary.top_threat->risk_score}};
  } else {
    j["top_threat"] = nullptr;
  }
  j["seed"] = summary.seed_used;
  return j;
}

nlohmann::json JsonFormatter::report_to_json_object(const BatchReport &report,
                                                    size_t top_n) {
  nlohmann::json j;
  j["summary"] = summary_to_json_object(report.summary);

  size_t limit = top_n == 0 ? report.results.size()
                            : std::min(top_n, report.results.size());
  nlohmann::json j_results = nlohmann::json::array();
  for (size_t i = 0; i < limit; i++)
    j_results.push_back(result_to_json_object(report.results[i]));
  j["results"] = j_results;
  return j;
}

std::string JsonFormatter::format_report_to_json(const BatchReport &report,
                                                 size_t top_n, int indent) {
  // Cells come straight from the upload and need not be valid UTF-8
  return report_to_json_object(report, top_n)
      .dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json JsonFormatter::error_to_json_object(const LogRiskError &error) {
  nlohmann::json j;
  j["error"] = error.kind();
  j["detail"] = error.what();
  if (const auto *schema_error =
          dynamic_cast<const SchemaValidationError *>(&error))
    j["missing_field"] = schema_error->missing_field();
  return j;
}

std::string JsonFormatter::format_error_to_json(const LogRiskError &error) {
  return error_to_json_object(error).dump(
      -1, ' ', false, nlohmann::json::error_handler_t::replace);
}
