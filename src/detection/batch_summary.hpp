#ifndef BATCH_SUMMARY_HPP
#define BATCH_SUMMARY_HPP

#include "analysis/anomaly_result.hpp"

#include <cstddef>
#include <vector>

namespace Scoring {

// Risk-descending, then address and window ascending for stable output
void sort_by_risk(std::vector<AnomalyResult> &results);

size_t risk_distribution_bin(double risk_score);

BatchSummary summarize(const std::vector<AnomalyResult> &results,
                       size_t rows_read,
                       const std::vector<ParseError> &rejected_rows);

} // namespace Scoring

#endif // BATCH_SUMMARY_HPP
