#ifndef RISK_NORMALIZER_HPP
#define RISK_NORMALIZER_HPP

#include <vector>

namespace Scoring {

// Min and max raw score of one batch. Risk is relative to these, so the same
// behaviour can score differently against a different batch.
struct RiskBounds {
  double batch_min = 0.0;
  double batch_max = 0.0;

  bool is_degenerate() const { return !(batch_max > batch_min); }
};

RiskBounds compute_risk_bounds(const std::vector<double> &raw_scores);

// ((max - raw) / (max - min)) * 100 clipped to [0, 100]; 0 when the batch
// carries no spread
double normalize_risk(double raw_score, const RiskBounds &bounds);

std::vector<double> normalize_risk_scores(const std::vector<double> &raw_scores);

} // namespace Scoring

#endif // RISK_NORMALIZER_HPP
