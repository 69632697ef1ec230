#include "models/anomaly_scorer.hpp"
#include "models/isolation_forest.hpp"

#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>

namespace {
// A tight cluster of ordinary points plus one far-away row at the end
FeatureMatrix clustered_with_outlier(size_t cluster_size) {
  FeatureMatrix matrix;
  for (size_t i = 0; i < cluster_size; i++) {
    std::array<double, FEATURE_DIMENSIONS> row{};
    for (size_t f = 0; f < FEATURE_DIMENSIONS; f++)
      row[f] = 0.01 * static_cast<double>((i * (f + 3)) % 11);
    matrix.push_back(row);
  }
  std::array<double, FEATURE_DIMENSIONS> outlier{};
  outlier.fill(25.0);
  matrix.push_back(outlier);
  return matrix;
}

FeatureVector vector_with(uint64_t total, uint64_t failed, double gap) {
  FeatureVector v;
  v.total_count = total;
  v.failed_count = failed;
  v.success_ratio =
      static_cast<double>(total - failed) / static_cast<double>(total);
  v.unique_endpoint_count = 3;
  v.request_rate_per_minute = static_cast<double>(total) / 5.0;
  v.avg_inter_request_gap_seconds = gap;
  return v;
}
} // namespace

TEST(IsolationForestTest, ExpectedPathLength) {
  EXPECT_DOUBLE_EQ(IsolationForest::expected_path_length(0), 0.0);
  EXPECT_DOUBLE_EQ(IsolationForest::expected_path_length(1), 0.0);
  EXPECT_DOUBLE_EQ(IsolationForest::expected_path_length(2), 1.0);
  // 2 * (ln(255) + 0.5772156649) - 2 * 255 / 256
  EXPECT_NEAR(IsolationForest::expected_path_length(256), 10.2448, 1e-3);
}

TEST(IsolationForestTest, OutlierScoresHighest) {
  FeatureMatrix matrix = clustered_with_outlier(60);
  IsolationForest forest({100, 256, 1}, 7);
  std::vector<double> scores = forest.fit_score(matrix);

  ASSERT_EQ(scores.size(), matrix.size());
  auto max_it = std::max_element(scores.begin(), scores.end());
  EXPECT_EQ(static_cast<size_t>(max_it - scores.begin()), matrix.size() - 1);
  for (double s : scores) {
    EXPECT_GT(s, 0.0);
    EXPECT_LE(s, 1.0);
  }
}

TEST(IsolationForestTest, SubsampleIsCappedByBatchSize) {
  FeatureMatrix matrix = clustered_with_outlier(9);
  IsolationForest forest({10, 256, 1}, 1);
  forest.fit(matrix);
  EXPECT_EQ(forest.subsample_size(), 10u);
  EXPECT_EQ(forest.tree_count(), 10u);
}

TEST(IsolationForestTest, SameSeedSameScores) {
  FeatureMatrix matrix = clustered_with_outlier(40);
  IsolationForest a({50, 32, 1}, 1234);
  IsolationForest b({50, 32, 1}, 1234);
  EXPECT_EQ(a.fit_score(matrix), b.fit_score(matrix));
}

TEST(IsolationForestTest, ThreadCountDoesNotChangeScores) {
  FeatureMatrix matrix = clustered_with_outlier(40);
  IsolationForest serial({64, 32, 1}, 99);
  IsolationForest parallel({64, 32, 4}, 99);
  EXPECT_EQ(serial.fit_score(matrix), parallel.fit_score(matrix));
}

TEST(IsolationForestTest, UnevenThreadSplitBuildsEveryTree) {
  // 5 trees over 4 workers leaves the last worker with an empty range
  FeatureMatrix matrix = clustered_with_outlier(30);
  IsolationForest serial({5, 16, 1}, 7);
  IsolationForest parallel({5, 16, 4}, 7);
  IsolationForest oversubscribed({5, 16, 32}, 7);
  std::vector<double> expected = serial.fit_score(matrix);
  EXPECT_EQ(parallel.fit_score(matrix), expected);
  EXPECT_EQ(oversubscribed.fit_score(matrix), expected);
}

TEST(IsolationForestTest, SinglePointScoresNeutral) {
  FeatureMatrix matrix = {std::array<double, FEATURE_DIMENSIONS>{}};
  IsolationForest forest({10, 256, 1}, 3);
  std::vector<double> scores = forest.fit_score(matrix);
  ASSERT_EQ(scores.size(), 1u);
  EXPECT_DOUBLE_EQ(scores[0], 0.5);
}

TEST(AnomalyScorerTest, QuantileInterpolates) {
  EXPECT_DOUBLE_EQ(AnomalyScorer::quantile({4.0, 1.0, 3.0, 2.0}, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(AnomalyScorer::quantile({4.0, 1.0, 3.0, 2.0}, 1.0), 4.0);
  EXPECT_DOUBLE_EQ(AnomalyScorer::quantile({4.0, 1.0, 3.0, 2.0}, 0.5), 2.5);
  EXPECT_DOUBLE_EQ(AnomalyScorer::quantile({}, 0.5), 0.0);
}

TEST(AnomalyScorerTest, LowerRawScoreForOutlier) {
  std::vector<FeatureVector> vectors;
  for (int i = 0; i < 30; i++)
    vectors.push_back(vector_with(100 + i % 3, 0, 3.0));
  vectors.push_back(vector_with(2, 2, 300.0));

  AnomalyScorerOptions options;
  options.seed = 42;
  ScoredBatch scored = AnomalyScorer(options).score(vectors);

  ASSERT_EQ(scored.raw_scores.size(), vectors.size());
  EXPECT_EQ(scored.seed_used, 42u);
  auto min_it =
      std::min_element(scored.raw_scores.begin(), scored.raw_scores.end());
  EXPECT_EQ(static_cast<size_t>(min_it - scored.raw_scores.begin()),
            vectors.size() - 1);
  EXPECT_TRUE(scored.is_anomaly.back());
}

TEST(AnomalyScorerTest, ContaminationControlsFlaggedShare) {
  std::vector<FeatureVector> vectors;
  for (int i = 0; i < 100; i++)
    vectors.push_back(vector_with(10 + i, i % 7, 1.0 + i));

  AnomalyScorerOptions options;
  options.seed = 5;
  options.contamination = 0.1;
  ScoredBatch scored = AnomalyScorer(options).score(vectors);

  size_t flagged = std::count(scored.is_anomaly.begin(),
                              scored.is_anomaly.end(), true);
  EXPECT_LE(flagged, 10u);
  EXPECT_GE(flagged, 1u);
}

TEST(AnomalyScorerTest, UnseededRunReportsItsSeed) {
  std::vector<FeatureVector> vectors = {vector_with(5, 1, 2.0),
                                        vector_with(7, 0, 1.0),
                                        vector_with(50, 40, 0.1)};
  AnomalyScorerOptions options;
  ScoredBatch first = AnomalyScorer(options).score(vectors);

  options.seed = first.seed_used;
  ScoredBatch replay = AnomalyScorer(options).score(vectors);
  EXPECT_EQ(first.raw_scores, replay.raw_scores);
}
