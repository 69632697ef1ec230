#include "batch_pipeline.hpp"
#include "analysis/feature_aggregator.hpp"
#include "analysis/schema_normalizer.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "detection/batch_summary.hpp"
#include "detection/risk_classifier.hpp"
#include "detection/risk_normalizer.hpp"
#include "utils/scoped_timer.hpp"

#include <utility>
#include <vector>

PipelineOptions PipelineOptions::from_config(const Config::AppConfig &config) {
  PipelineOptions options;
  options.window_seconds = config.features.window_seconds;
  options.failed_status_threshold = config.features.failed_status_threshold;
  options.scorer.forest.num_trees = config.model.num_trees;
  options.scorer.forest.max_samples = config.model.max_samples;
  options.scorer.forest.build_threads = config.model.build_threads;
  options.scorer.contamination = config.model.contamination;
  options.scorer.seed = config.model.seed;
  return options;
}

BatchPipeline::BatchPipeline(PipelineOptions options)
    : options_(std::move(options)) {}

BatchReport BatchPipeline::analyze(const RawTable &table) const {
  auto &metrics = PipelineMetrics::instance();
  ScopedTimer timer(metrics.batch_duration_seconds);

  try {
    LOG(LogLevel::INFO, LogComponent::PIPELINE,
        "Analyzing batch of " << table.rows.size() << " rows");

    SchemaNormalizer normalizer;
    NormalizedBatch normalized = normalizer.normalize(table);
    metrics.rows_read.Increment(static_cast<double>(normalized.rows_read));
    metrics.rows_dropped.Increment(
        static_cast<double>(normalized.rejected_rows.size()));

    if (normalized.records.empty())
      throw EmptyBatchError(normalized.rows_read,
                            normalized.rejected_rows.size());

    FeatureAggregator aggregator(options_.window_seconds,
                                 options_.failed_status_threshold);
    std::vector<FeatureVector> vectors =
        aggregator.aggregate(normalized.records);

    AnomalyScorer scorer(options_.scorer);
    ScoredBatch scored = scorer.score(vectors);

    std::vector<double> risk_scores =
        Scoring::normalize_risk_scores(scored.raw_scores);

    BatchReport report;
    report.results.reserve(vectors.size());
    for (size_t i = 0; i < vectors.size(); i++) {
      AnomalyResult result;
      result.address = vectors[i].address;
      result.window_start_ms = vectors[i].window_start_ms;
      result.raw_score = scored.raw_scores[i];
      result.risk_score = risk_scores[i];
      result.risk_level = Scoring::classify_risk(result.risk_score);
      result.is_anomaly = scored.is_anomaly[i];
      result.features = std::move(vectors[i]);
      report.results.push_back(std::move(result));
    }

    Scoring::sort_by_risk(report.results);
    report.summary = Scoring::summarize(report.results, normalized.rows_read,
                                        normalized.rejected_rows);
    report.summary.seed_used = scored.seed_used;
    report.rejected_rows = std::move(normalized.rejected_rows);

    metrics.windows_scored.Increment(
        static_cast<double>(report.results.size()));
    metrics.batches_analyzed.Increment();

    LOG(LogLevel::INFO, LogComponent::PIPELINE,
        "Batch complete in " << timer.elapsed_seconds() << "s: "
                             << report.summary.total_addresses
                             << " addresses, " << report.summary.windows_scored
                             << " windows, " << report.summary.high_risk_count
                             << " high risk, mean risk "
                             << report.summary.mean_risk_score);
    return report;
  } catch (const LogRiskError &e) {
    metrics.record_rejection(e.kind());
    LOG(LogLevel::WARN, LogComponent::PIPELINE,
        "Batch rejected (" << e.kind() << "): " << e.what());
    throw;
  }
}
