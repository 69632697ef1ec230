#include "web_server.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "io/table_readers/csv_table_reader.hpp"
#include "utils/json_formatter.hpp"

#include <exception>
#include <nlohmann/json.hpp>
#include <prometheus/text_serializer.h>
#include <utility>

WebServer::WebServer(const std::string &host, int port,
                     size_t max_upload_bytes, char input_delimiter,
                     PipelineOptions pipeline_options, size_t report_top_n)
    : host_(host), port_(port), input_delimiter_(input_delimiter),
      pipeline_options_(std::move(pipeline_options)),
      report_top_n_(report_top_n) {
  server_ = std::make_unique<httplib::Server>();
  server_->set_payload_max_length(max_upload_bytes);

  server_->Post("/api/v1/analyze",
                [this](const httplib::Request &req, httplib::Response &res) {
                  handle_analyze(req, res);
                });

  server_->Get("/health", [](const httplib::Request &, httplib::Response &res) {
    res.set_content(R"({"status":"ok"})", "application/json");
  });

  server_->Get("/metrics", [](const httplib::Request &req,
                              httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "WebServer: Received request for /metrics from " << req.remote_addr);
    prometheus::TextSerializer serializer;
    auto collected_metrics =
        MetricsRegistry::instance().get_registry()->Collect();
    res.set_content(serializer.Serialize(collected_metrics),
                    "text/plain; version=0.0.4");
  });

  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server initialized for " << host_ << ":" << port_);
}

WebServer::~WebServer() {
  if (server_thread_.joinable())
    stop();
}

void WebServer::handle_analyze(const httplib::Request &req,
                               httplib::Response &res) {
  LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
      "WebServer: analyze request from " << req.remote_addr << " ("
                                         << req.body.size() << " bytes)");

  std::string body;
  if (req.is_multipart_form_data()) {
    if (!req.has_file("file")) {
      res.status = 400;
      res.set_content(
          R"({"error":"bad_request","detail":"multipart field 'file' is required"})",
          "application/json");
      return;
    }
    body = req.get_file_value("file").content;
  } else {
    body = req.body;
  }

  try {
    CsvTableReader reader(input_delimiter_);
    RawTable table = reader.read_string(body);
    BatchPipeline pipeline(pipeline_options_);
    BatchReport report = pipeline.analyze(table);
    res.set_content(JsonFormatter::format_report_to_json(report, report_top_n_),
                    "application/json");
  } catch (const LogRiskError &e) {
    res.status = 400;
    res.set_content(JsonFormatter::format_error_to_json(e), "application/json");
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_WEB,
        "Analysis failed unexpectedly: " << e.what());
    PipelineMetrics::instance().record_rejection("internal");
    nlohmann::json j = {{"error", "internal"}, {"detail", e.what()}};
    res.status = 500;
    res.set_content(
        j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
        "application/json");
  }
}

void WebServer::start() {
  if (server_thread_.joinable())
    return; // Already running

  running_ = true;
  server_thread_ = std::thread(&WebServer::run, this);
}

void WebServer::stop() {
  if (server_)
    server_->stop();
  if (server_thread_.joinable())
    server_thread_.join();
  running_ = false;
  LOG(LogLevel::INFO, LogComponent::IO_WEB, "Web server stopped");
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server listening on " << host_ << ":" << port_);
  if (!server_->listen(host_.c_str(), port_)) {
    LOG(LogLevel::FATAL, LogComponent::IO_WEB,
        "Web server failed to listen on " << host_ << ":" << port_);
  }
  running_ = false;
}
