#ifndef ANOMALY_SCORER_HPP
#define ANOMALY_SCORER_HPP

#include "features.hpp"
#include "isolation_forest.hpp"
#include "standard_scaler.hpp"

#include <cstdint>
#include <optional>
#include <vector>

struct AnomalyScorerOptions {
  IsolationForestParams forest;
  // Expected share of anomalous windows; places the raw-score zero point
  double contamination = 0.05;
  // Unset draws a fresh seed from std::random_device
  std::optional<uint64_t> seed;
};

// Everything the scorer learned about one batch. Returned by value and
// owned by the caller; nothing here outlives the pipeline call.
struct ScoredBatch {
  // Smaller raw score = more anomalous
  std::vector<double> raw_scores;
  std::vector<bool> is_anomaly;
  ScalerParams scaler;
  double offset = 0.0;
  uint64_t seed_used = 0;
};

// Standardizes the batch, fits an isolation forest on it and emits
// raw_score = -s(x) - offset, where s is the isolation anomaly score and
// offset is the contamination quantile of -s over the batch. Negative raw
// scores flag the window as anomalous.
class AnomalyScorer {
public:
  explicit AnomalyScorer(AnomalyScorerOptions options);

  ScoredBatch score(const std::vector<FeatureVector> &vectors) const;

  // Linear-interpolated quantile, q in [0, 1]
  static double quantile(std::vector<double> values, double q);

private:
  AnomalyScorerOptions options_;
};

#endif // ANOMALY_SCORER_HPP
