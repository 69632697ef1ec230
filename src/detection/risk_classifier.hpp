#ifndef RISK_CLASSIFIER_HPP
#define RISK_CLASSIFIER_HPP

enum class RiskLevel { LOW, MEDIUM, HIGH };

const char *risk_level_to_string(RiskLevel level);

namespace Scoring {

// Lower bound of each band belongs to that band
constexpr double HIGH_RISK_THRESHOLD = 75.0;
constexpr double MEDIUM_RISK_THRESHOLD = 40.0;

inline RiskLevel classify_risk(double risk_score) {
  if (risk_score >= HIGH_RISK_THRESHOLD)
    return RiskLevel::HIGH;
  if (risk_score >= MEDIUM_RISK_THRESHOLD)
    return RiskLevel::MEDIUM;
  return RiskLevel::LOW;
}

} // namespace Scoring

#endif // RISK_CLASSIFIER_HPP
