#include "anomaly_scorer.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

AnomalyScorer::AnomalyScorer(AnomalyScorerOptions options)
    : options_(std::move(options)) {}

double AnomalyScorer::quantile(std::vector<double> values, double q) {
  if (values.empty())
    return 0.0;
  std::sort(values.begin(), values.end());
  q = std::clamp(q, 0.0, 1.0);

  double position = q * static_cast<double>(values.size() - 1);
  size_t lower = static_cast<size_t>(std::floor(position));
  size_t upper = std::min(lower + 1, values.size() - 1);
  double fraction = position - static_cast<double>(lower);
  return values[lower] + fraction * (values[upper] - values[lower]);
}

ScoredBatch
AnomalyScorer::score(const std::vector<FeatureVector> &vectors) const {
  ScoredBatch result;
  if (vectors.empty())
    return result;

  if (options_.seed) {
    result.seed_used = *options_.seed;
  } else {
    std::random_device rd;
    result.seed_used = (static_cast<uint64_t>(rd()) << 32) | rd();
  }

  FeatureMatrix scaled =
      StandardScaler::fit_transform(to_matrix(vectors), &result.scaler);

  IsolationForest forest(options_.forest, result.seed_used);
  std::vector<double> scores = forest.fit_score(scaled);

  // Negated so that lower means more anomalous
  std::vector<double> negated(scores.size());
  std::transform(scores.begin(), scores.end(), negated.begin(),
                 [](double s) { return -s; });

  result.offset = quantile(negated, options_.contamination);
  result.raw_scores.reserve(negated.size());
  result.is_anomaly.reserve(negated.size());
  size_t anomalies = 0;
  for (double value : negated) {
    double raw = value - result.offset;
    result.raw_scores.push_back(raw);
    result.is_anomaly.push_back(raw < 0.0);
    if (raw < 0.0)
      anomalies++;
  }

  LOG(LogLevel::INFO, LogComponent::ML_FOREST,
      "Scored " << vectors.size() << " windows with " << forest.tree_count()
                << " trees (seed " << result.seed_used << "), " << anomalies
                << " flagged below offset " << result.offset);
  return result;
}
