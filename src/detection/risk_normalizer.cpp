#include "risk_normalizer.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace Scoring {

RiskBounds compute_risk_bounds(const std::vector<double> &raw_scores) {
  RiskBounds bounds;
  if (raw_scores.empty())
    return bounds;

  auto [min_it, max_it] =
      std::minmax_element(raw_scores.begin(), raw_scores.end());
  bounds.batch_min = *min_it;
  bounds.batch_max = *max_it;
  return bounds;
}

double normalize_risk(double raw_score, const RiskBounds &bounds) {
  if (bounds.is_degenerate())
    return 0.0;

  double risk = (bounds.batch_max - raw_score) /
                (bounds.batch_max - bounds.batch_min) * 100.0;
  return std::clamp(risk, 0.0, 100.0);
}

std::vector<double>
normalize_risk_scores(const std::vector<double> &raw_scores) {
  // Bounds come from the full batch before any score is mapped
  RiskBounds bounds = compute_risk_bounds(raw_scores);
  if (bounds.is_degenerate())
    LOG(LogLevel::INFO, LogComponent::RISK,
        "All " << raw_scores.size()
               << " raw scores are identical, risk is 0 for the batch");

  std::vector<double> risk_scores;
  risk_scores.reserve(raw_scores.size());
  for (double raw : raw_scores)
    risk_scores.push_back(normalize_risk(raw, bounds));
  return risk_scores;
}

} // namespace Scoring
