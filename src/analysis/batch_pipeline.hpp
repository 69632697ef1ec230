#ifndef BATCH_PIPELINE_HPP
#define BATCH_PIPELINE_HPP

#include "analysis/anomaly_result.hpp"
#include "core/config.hpp"
#include "core/log_record.hpp"
#include "models/anomaly_scorer.hpp"

#include <cstdint>

// Settings for one invocation, copied out of the application config so
// nothing global is consulted while a batch is running
struct PipelineOptions {
  uint64_t window_seconds = 300;
  int failed_status_threshold = 400;
  AnomalyScorerOptions scorer;

  static PipelineOptions from_config(const Config::AppConfig &config);
};

// Schema normalization -> window features -> anomaly scoring -> risk.
// Every statistic (scaler, forest, min/max bounds) lives on this call's
// stack, so the pipeline may run concurrently for independent uploads.
class BatchPipeline {
public:
  explicit BatchPipeline(PipelineOptions options);

  // Throws SchemaValidationError or EmptyBatchError; malformed rows are
  // dropped and reported in the summary
  BatchReport analyze(const RawTable &table) const;

private:
  PipelineOptions options_;
};

#endif // BATCH_PIPELINE_HPP
