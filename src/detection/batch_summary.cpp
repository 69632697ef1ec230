#include "batch_summary.hpp"

#include <algorithm>
#include <unordered_set>

namespace Scoring {

void sort_by_risk(std::vector<AnomalyResult> &results) {
  std::sort(results.begin(), results.end(),
            [](const AnomalyResult &a, const AnomalyResult &b) {
              if (a.risk_score != b.risk_score)
                return a.risk_score > b.risk_score;
              if (a.address != b.address)
                return a.address < b.address;
              return a.window_start_ms < b.window_start_ms;
            });
}

size_t risk_distribution_bin(double risk_score) {
  if (risk_score <= 20.0)
    return 0;
  if (risk_score <= 40.0)
    return 1;
  if (risk_score <= 60.0)
    return 2;
  if (risk_score <= 80.0)
    return 3;
  return 4;
}

BatchSummary summarize(const std::vector<AnomalyResult> &results,
                       size_t rows_read,
                       const std::vector<ParseError> &rejected_rows) {
  BatchSummary summary;
  summary.rows_read = rows_read;
  summary.rows_dropped = rejected_rows.size();
  for (const auto &rejection : rejected_rows)
    summary.rows_dropped_by_kind[static_cast<size_t>(rejection.kind)]++;

  summary.windows_scored = results.size();
  if (results.empty())
    return summary;

  std::unordered_set<std::string> addresses;
  double risk_total = 0.0;
  const AnomalyResult *top = nullptr;
  for (const auto &result : results) {
    addresses.insert(result.address);
    risk_total += result.risk_score;
    if (result.risk_level == RiskLevel::HIGH)
      summary.high_risk_count++;
    if (result.is_anomaly)
      summary.anomaly_count++;
    summary.risk_distribution[risk_distribution_bin(result.risk_score)]++;
    if (!top || result.risk_score > top->risk_score)
      top = &result;
  }

  summary.total_addresses = addresses.size();
  summary.mean_risk_score = risk_total / static_cast<double>(results.size());
  summary.top_threat =
      TopThreat{top->address, top->window_start_ms, top->risk_score};
  return summary;
}

} // namespace Scoring
