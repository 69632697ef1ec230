#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <string>
#include <vector>

class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  std::shared_ptr<prometheus::Registry> get_registry();

  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Histogram &
  create_histogram(const std::string &name, const std::string &help,
                   const std::vector<double> &bucket_boundaries);

  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help,
                        const std::map<std::string, std::string> &labels);

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
};

// Process-level activity counters. They describe how much work was done and
// never feed back into any batch computation.
struct PipelineMetrics {
  static PipelineMetrics &instance();

  prometheus::Counter &batches_analyzed;
  prometheus::Family<prometheus::Counter> &batches_rejected;
  prometheus::Counter &rows_read;
  prometheus::Counter &rows_dropped;
  prometheus::Counter &windows_scored;
  prometheus::Histogram &batch_duration_seconds;

  void record_rejection(const std::string &kind);

private:
  PipelineMetrics();
};

#endif // METRICS_REGISTRY_HPP
