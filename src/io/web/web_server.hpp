#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "analysis/batch_pipeline.hpp"

#include <atomic>
#include <cstddef>
#include <httplib.h>
#include <memory>
#include <string>
#include <thread>

// Thin HTTP adapter: every upload becomes one independent pipeline call
class WebServer {
public:
  WebServer(const std::string &host, int port, size_t max_upload_bytes,
            char input_delimiter, PipelineOptions pipeline_options,
            size_t report_top_n = 0);
  ~WebServer();

  void start();
  void stop();
  bool is_running() const { return running_; }

private:
  void run();
  void handle_analyze(const httplib::Request &req, httplib::Response &res);

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};
  std::string host_;
  int port_;
  char input_delimiter_;
  PipelineOptions pipeline_options_;
  size_t report_top_n_;
};

#endif // WEB_SERVER_HPP
