#include "risk_classifier.hpp"

const char *risk_level_to_string(RiskLevel level) {
  switch (level) {
  case RiskLevel::LOW:
    return "LOW";
  case RiskLevel::MEDIUM:
    return "MEDIUM";
  case RiskLevel::HIGH:
    return "HIGH";
  }
  return "UNKNOWN";
}
