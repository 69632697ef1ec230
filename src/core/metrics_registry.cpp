#include "metrics_registry.hpp"

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

std::shared_ptr<prometheus::Registry> MetricsRegistry::get_registry() {
  return registry_;
}

prometheus::Counter &MetricsRegistry::create_counter(const std::string &name,
                                                     const std::string &help) {

  auto &counter_family =
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);

  return counter_family.Add({});
}

prometheus::Histogram &MetricsRegistry::create_histogram(
    const std::string &name, const std::string &help,
    const std::vector<double> &bucket_boundaries) {

  auto &histogram_family =
      prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);

  return histogram_family.Add({}, bucket_boundaries);
}

prometheus::Family<prometheus::Counter> &MetricsRegistry::create_counter_family(
    const std::string &name, const std::string &help,
    const std::map<std::string, std::string> &labels) {

  return prometheus::BuildCounter()
      .Name(name)
      .Help(help)
      .Labels(labels)
      .Register(*registry_);
}

PipelineMetrics &PipelineMetrics::instance() {
  static PipelineMetrics instance;
  return instance;
}

PipelineMetrics::PipelineMetrics()
    : batches_analyzed(MetricsRegistry::instance().create_counter(
          "logrisk_batches_analyzed_total",
          "Batches that produced a risk report.")),
      batches_rejected(MetricsRegistry::instance().create_counter_family(
          "logrisk_batches_rejected_total",
          "Batches aborted by a structural error, by error kind.", {})),
      rows_read(MetricsRegistry::instance().create_counter(
          "logrisk_rows_read_total", "Table rows handed to the normalizer.")),
      rows_dropped(MetricsRegistry::instance().create_counter(
          "logrisk_rows_dropped_total",
          "Rows dropped for unparsable or missing values.")),
      windows_scored(MetricsRegistry::instance().create_counter(
          "logrisk_windows_scored_total",
          "Address windows scored by the anomaly model.")),
      batch_duration_seconds(MetricsRegistry::instance().create_histogram(
          "logrisk_batch_duration_seconds",
          "Wall time of one pipeline invocation.",
          {0.005, 0.01, 0.05, 0.1, 0.5, 1.0, 5.0, 10.0, 30.0})) {}

void PipelineMetrics::record_rejection(const std::string &kind) {
  batches_rejected.Add({{"kind", kind}}).Increment();
}
