#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.reader", LogComponent::IO_READER},
    {"io.web", LogComponent::IO_WEB},
    {"schema", LogComponent::SCHEMA},
    {"features", LogComponent::FEATURES},
    {"ml.scaler", LogComponent::ML_SCALER},
    {"ml.forest", LogComponent::ML_FOREST},
    {"risk", LogComponent::RISK},
    {"pipeline", LogComponent::PIPELINE}};

AppConfig::AppConfig() {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

namespace {
// Rejects partial parses and, for unsigned types, negative input
template <typename T> T parse_number(const std::string &value) {
  auto parsed = Utils::string_to_number<T>(value);
  if (!parsed)
    throw std::invalid_argument("expected a number");
  return *parsed;
}
} // namespace

bool validate_feature_config(const FeatureConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.window_seconds < 1 || config.window_seconds > 86400) {
    errors.push_back("Feature window must be between 1 and 86400 seconds");
    valid = false;
  }

  if (config.failed_status_threshold < 100 ||
      config.failed_status_threshold > 599) {
    errors.push_back("Failed status threshold must be between 100 and 599");
    valid = false;
  }

  return valid;
}

bool validate_model_config(const ModelConfig &config,
                           std::vector<std::string> &errors) {
  bool valid = true;

  if (config.num_trees < 1 || config.num_trees > 10000) {
    errors.push_back("Model tree count must be between 1 and 10000");
    valid = false;
  }

  if (config.max_samples < 2) {
    errors.push_back("Model max_samples must be at least 2");
    valid = false;
  }

  if (!(config.contamination > 0.0) || config.contamination > 0.5) {
    errors.push_back("Model contamination must be in (0, 0.5]");
    valid = false;
  }

  if (config.build_threads < 1 || config.build_threads > 256) {
    errors.push_back("Model build threads must be between 1 and 256");
    valid = false;
  }

  return valid;
}

bool validate_server_config(const ServerConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.port < 1 || config.port > 65535) {
    errors.push_back("Server port must be between 1 and 65535");
    valid = false;
  }

  if (config.host.empty()) {
    errors.push_back("Server host must not be empty");
    valid = false;
  }

  if (config.max_upload_bytes < 1024) {
    errors.push_back("Server max upload size must be at least 1024 bytes");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.input_delimiter == '"' || config.input_delimiter == '\n' ||
      config.input_delimiter == '\r') {
    errors.push_back("Input delimiter cannot be a quote or line break");
    valid = false;
  }

  valid &= validate_feature_config(config.features, errors);
  valid &= validate_model_config(config.model, errors);
  valid &= validate_server_config(config.server, errors);

  return valid;
}

namespace {

std::optional<char> parse_delimiter(const std::string &value) {
  std::string lowered = Utils::to_lower_copy(value);
  if (lowered == "tab" || lowered == "\\t")
    return '\t';
  if (lowered == "comma")
    return ',';
  if (lowered == "semicolon")
    return ';';
  if (lowered == "pipe")
    return '|';
  if (value.size() == 1)
    return value[0];
  return std::nullopt;
}

} // namespace

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::cerr << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::INPUT_DELIMITER) {
          auto delimiter = parse_delimiter(value);
          if (!delimiter)
            throw std::invalid_argument("expected a single character");
          config.input_delimiter = *delimiter;
        } else if (key == Keys::REPORT_OUTPUT_PATH)
          config.report_output_path = value;
        else if (key == Keys::REPORT_TOP_N)
          config.report_top_n = parse_number<size_t>(value);
        else
          config.custom_settings[key] = value;

        // Feature settings
      } else if (current_section == "Features") {
        if (key == Keys::FE_WINDOW_SECONDS)
          config.features.window_seconds = parse_number<uint64_t>(value);
        else if (key == Keys::FE_FAILED_STATUS_THRESHOLD)
          config.features.failed_status_threshold = parse_number<int>(value);

        // Model settings
      } else if (current_section == "Model") {
        if (key == Keys::MO_NUM_TREES)
          config.model.num_trees = parse_number<size_t>(value);
        else if (key == Keys::MO_MAX_SAMPLES)
          config.model.max_samples = parse_number<size_t>(value);
        else if (key == Keys::MO_CONTAMINATION)
          config.model.contamination = std::stod(value);
        else if (key == Keys::MO_SEED) {
          if (value.empty() || Utils::to_lower_copy(value) == "random")
            config.model.seed.reset();
          else
            config.model.seed = parse_number<uint64_t>(value);
        } else if (key == Keys::MO_BUILD_THREADS)
          config.model.build_threads = parse_number<size_t>(value);

        // Server settings
      } else if (current_section == "Server") {
        if (key == Keys::SV_ENABLED)
          config.server.enabled = string_to_bool(value);
        else if (key == Keys::SV_HOST)
          config.server.host = value;
        else if (key == Keys::SV_PORT)
          config.server.port = parse_number<int>(value);
        else if (key == Keys::SV_MAX_UPLOAD_BYTES)
          config.server.max_upload_bytes = parse_number<size_t>(value);

        // Logging Settings
      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          std::string lowered_key = Utils::to_lower_copy(key);
          auto comp_it = key_to_component_map.find(lowered_key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (lowered_key.length() > 2 &&
                   lowered_key.substr(lowered_key.length() - 2) == ".*") {
            // Wildcard match, e.g., "ml.* = DEBUG"
            std::string prefix =
                lowered_key.substr(0, lowered_key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
            }
          }
        }
      } else {
        config.custom_settings[current_section + "." + key] = value;
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  std::cerr << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cerr << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
