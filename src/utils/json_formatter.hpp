#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "analysis/anomaly_result.hpp"
#include "core/errors.hpp"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace JsonFormatter {

nlohmann::json result_to_json_object(const AnomalyResult &result);
nlohmann::json summary_to_json_object(const BatchSummary &summary);

// top_n of 0 keeps every result
nlohmann::json report_to_json_object(const BatchReport &report,
                                     size_t top_n = 0);
std::string format_report_to_json(const BatchReport &report, size_t top_n = 0,
                                  int indent = 2);

nlohmann::json error_to_json_object(const LogRiskError &error);
// Compact error body; invalid UTF-8 from the upload is replaced, not thrown
std::string format_error_to_json(const LogRiskError &error);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
