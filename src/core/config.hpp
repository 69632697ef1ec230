#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *INPUT_DELIMITER = "input_delimiter";
constexpr const char *REPORT_OUTPUT_PATH = "report_output_path";
constexpr const char *REPORT_TOP_N = "report_top_n";

// Feature Settings
constexpr const char *FE_WINDOW_SECONDS = "window_seconds";
constexpr const char *FE_FAILED_STATUS_THRESHOLD = "failed_status_threshold";

// Model Settings
constexpr const char *MO_NUM_TREES = "num_trees";
constexpr const char *MO_MAX_SAMPLES = "max_samples";
constexpr const char *MO_CONTAMINATION = "contamination";
constexpr const char *MO_SEED = "seed";
constexpr const char *MO_BUILD_THREADS = "build_threads";

// Server Settings
constexpr const char *SV_ENABLED = "enabled";
constexpr const char *SV_HOST = "host";
constexpr const char *SV_PORT = "port";
constexpr const char *SV_MAX_UPLOAD_BYTES = "max_upload_bytes";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct FeatureConfig {
  uint64_t window_seconds = 300;
  int failed_status_threshold = 400;
};

struct ModelConfig {
  size_t num_trees = 100;
  size_t max_samples = 256;
  double contamination = 0.05;
  // Unset means every run draws a fresh seed
  std::optional<uint64_t> seed;
  size_t build_threads = 1;
};

struct ServerConfig {
  bool enabled = false;
  std::string host = "0.0.0.0";
  int port = 8080;
  size_t max_upload_bytes = 10 * 1024 * 1024;
};

struct AppConfig {
  char input_delimiter = ',';
  std::string report_output_path;
  size_t report_top_n = 0;

  FeatureConfig features;
  ModelConfig model;
  ServerConfig server;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig();
};

LogLevel string_to_log_level(const std::string &level_str_raw);

// Validation functions for configuration parameters
bool validate_feature_config(const FeatureConfig &config,
                             std::vector<std::string> &errors);
bool validate_model_config(const ModelConfig &config,
                           std::vector<std::string> &errors);
bool validate_server_config(const ServerConfig &config,
                            std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
