#include "analysis/batch_pipeline.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "io/table_readers/csv_table_reader.hpp"
#include "io/web/web_server.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <thread>

namespace {

constexpr int EXIT_BATCH_REJECTED = 2;
constexpr int EXIT_TABLE_UNREADABLE = 3;

std::atomic<bool> g_shutdown_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
}

struct CliOptions {
  std::string config_path = "config.ini";
  std::optional<uint64_t> seed;
  std::optional<std::string> output_path;
  std::optional<size_t> top_n;
  std::string input_path; // empty or "-" reads stdin
  bool serve = false;
  bool show_help = false;
};

void print_usage(const char *prog) {
  std::cerr << "Usage: " << prog
            << " [--config PATH] [--seed N] [--serve] [--output PATH]"
               " [--top N] [FILE]\n"
            << "  FILE      delimited log table; omitted or '-' reads stdin\n"
            << "  --serve   run the HTTP service instead of a single batch\n";
}

// Returns false on a malformed command line
bool parse_arguments(int argc, char *argv[], CliOptions &options) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    auto next_value = [&](std::string &out) {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        return false;
      }
      out = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else if (arg == "--serve") {
      options.serve = true;
    } else if (arg == "--config") {
      if (!next_value(value))
        return false;
      options.config_path = value;
    } else if (arg == "--output") {
      if (!next_value(value))
        return false;
      options.output_path = value;
    } else if (arg == "--seed") {
      if (!next_value(value))
        return false;
      auto seed = Utils::string_to_number<uint64_t>(value);
      if (!seed) {
        std::cerr << "Invalid seed: " << value << std::endl;
        return false;
      }
      options.seed = seed;
    } else if (arg == "--top") {
      if (!next_value(value))
        return false;
      auto top = Utils::string_to_number<size_t>(value);
      if (!top) {
        std::cerr << "Invalid --top value: " << value << std::endl;
        return false;
      }
      options.top_n = top;
    } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
      std::cerr << "Unknown option: " << arg << std::endl;
      return false;
    } else if (options.input_path.empty()) {
      options.input_path = arg;
    } else {
      std::cerr << "Only one input file may be given" << std::endl;
      return false;
    }
  }
  return true;
}

RawTable read_input(const CliOptions &cli, char delimiter) {
  CsvTableReader reader(delimiter);
  if (cli.input_path.empty() || cli.input_path == "-") {
    LOG(LogLevel::INFO, LogComponent::IO_READER, "Reading table from stdin");
    std::string text((std::istreambuf_iterator<char>(std::cin)),
                     std::istreambuf_iterator<char>());
    return reader.read_string(text);
  }
  return reader.read_file(cli.input_path);
}

int run_service(const Config::AppConfig &config,
                const PipelineOptions &pipeline_options, size_t top_n) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  WebServer server(config.server.host, config.server.port,
                   config.server.max_upload_bytes, config.input_delimiter,
                   pipeline_options, top_n);
  server.start();

  while (!g_shutdown_requested && server.is_running())
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

  LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown requested, stopping.");
  server.stop();
  return 0;
}

int run_batch(const CliOptions &cli, const Config::AppConfig &config,
              const PipelineOptions &pipeline_options, size_t top_n) {
  RawTable table = read_input(cli, config.input_delimiter);
  BatchPipeline pipeline(pipeline_options);
  BatchReport report = pipeline.analyze(table);
  std::string json = JsonFormatter::format_report_to_json(report, top_n);

  std::string output_path = cli.output_path.value_or(config.report_output_path);
  if (output_path.empty() || output_path == "-") {
    std::cout << json << std::endl;
    return 0;
  }

  std::ofstream out(output_path);
  if (!out.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::CORE,
        "Could not open report output file: " << output_path);
    return 1;
  }
  out << json << std::endl;
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Wrote " << report.results.size() << " results to " << output_path);
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CliOptions cli;
  if (!parse_arguments(argc, argv, cli)) {
    print_usage(argv[0]);
    return 1;
  }
  if (cli.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  Config::ConfigManager config_manager;
  // A missing or invalid file leaves defaults in place
  bool config_loaded = config_manager.load_configuration(cli.config_path);
  auto config = config_manager.get_config();

  LogManager::instance().configure(config->logging);
  if (!config_loaded)
    LOG(LogLevel::WARN, LogComponent::CONFIG,
        "Running with default configuration (" << cli.config_path
                                               << " not applied)");
  LOG(LogLevel::INFO, LogComponent::CORE, "logrisk starting");

  PipelineOptions pipeline_options = PipelineOptions::from_config(*config);
  if (cli.seed)
    pipeline_options.scorer.seed = cli.seed;
  size_t top_n = cli.top_n.value_or(config->report_top_n);

  try {
    if (cli.serve || config->server.enabled)
      return run_service(*config, pipeline_options, top_n);
    return run_batch(cli, *config, pipeline_options, top_n);
  } catch (const TableReadError &e) {
    std::cerr << JsonFormatter::format_error_to_json(e) << std::endl;
    return EXIT_TABLE_UNREADABLE;
  } catch (const LogRiskError &e) {
    std::cerr << JsonFormatter::format_error_to_json(e) << std::endl;
    return EXIT_BATCH_REJECTED;
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Unhandled error: " << e.what());
    return 1;
  }
}
