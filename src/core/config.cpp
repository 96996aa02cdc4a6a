#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
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
    {"store", LogComponent::STORE},
    {"ingest", LogComponent::INGEST},
    {"web", LogComponent::WEB},
    {"analytics.session", LogComponent::ANALYTICS_SESSION},
    {"analytics.stats", LogComponent::ANALYTICS_STATS},
    {"analytics.snapshot", LogComponent::ANALYTICS_SNAPSHOT},
    {"metrics", LogComponent::METRICS}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

std::vector<std::string> parse_domain_list(const std::string &value) {
  std::vector<std::string> domains;
  for (const auto &raw : Utils::split_string(value, ',')) {
    std::string domain = Utils::trim_copy(raw);
    if (!domain.empty())
      domains.push_back(domain);
  }
  return domains;
}

bool validate_store_config(const StoreConfig &config,
                           std::vector<std::string> &errors) {
  bool valid = true;

  if (config.backend != STORE_BACKEND_MEMORY &&
      config.backend != STORE_BACKEND_MONGODB) {
    errors.push_back("Store backend must be 'memory' or 'mongodb', got '" +
                     config.backend + "'");
    valid = false;
  }

  if (config.backend == STORE_BACKEND_MONGODB) {
    if (config.uri.empty()) {
      errors.push_back("MongoDB store requires a connection uri");
      valid = false;
    }
    if (config.database.empty() || config.collection.empty()) {
      errors.push_back("MongoDB store requires a database and a collection");
      valid = false;
    }
  }

  return valid;
}

bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.port < 1 || config.port > 65535) {
    errors.push_back("Prometheus port must be between 1 and 65535");
    valid = false;
  }

  if (config.metrics_path.empty() || config.metrics_path[0] != '/') {
    errors.push_back("Prometheus metrics path must start with '/'");
    valid = false;
  }

  if (config.health_path.empty() || config.health_path[0] != '/') {
    errors.push_back("Prometheus health path must start with '/'");
    valid = false;
  }

  if (config.metrics_path == config.health_path) {
    errors.push_back("Prometheus metrics and health paths must differ");
    valid = false;
  }

  if (config.snapshot_cache_seconds > 3600) {
    errors.push_back(
        "Prometheus snapshot cache must be between 0 and 3600 seconds");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.domains.empty()) {
    errors.push_back("At least one domain must be configured");
    valid = false;
  }

  std::set<std::string> unique_domains(config.domains.begin(),
                                       config.domains.end());
  if (unique_domains.size() != config.domains.size()) {
    errors.push_back("Configured domains must be unique");
    valid = false;
  }

  if (config.web.ingest_port < 1 || config.web.ingest_port > 65535) {
    errors.push_back("Ingest port must be between 1 and 65535");
    valid = false;
  }

  if (!validate_store_config(config.store, errors))
    valid = false;

  if (!validate_prometheus_config(config.prometheus, errors))
    valid = false;

  // Cross-component validation
  if (config.web.ingest_port == config.prometheus.port) {
    errors.push_back("Ingest API and Prometheus cannot use the same port");
    valid = false;
  }

  return valid;
}

void apply_default_log_levels(AppConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  config.logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  apply_default_log_levels(config);

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;
  // Explicit [Logging] entries win over the global debug switch
  std::map<LogComponent, LogLevel> explicit_levels;

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
        if (key == Keys::BIND_ADDR)
          config.bind_addr = value;
        else if (key == Keys::DEBUG)
          config.debug = string_to_bool(value);
        else if (key == Keys::MOCK_DATA)
          config.mock_data = string_to_bool(value);
        else if (key == Keys::DOMAINS)
          config.domains = parse_domain_list(value);
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown key '" << key << "'" << std::endl;

        // Store Settings
      } else if (current_section == "Store") {
        if (key == Keys::STORE_BACKEND)
          config.store.backend = value;
        else if (key == Keys::STORE_URI)
          config.store.uri = value;
        else if (key == Keys::STORE_DATABASE)
          config.store.database = value;
        else if (key == Keys::STORE_COLLECTION)
          config.store.collection = value;

        // Web Settings
      } else if (current_section == "Web") {
        if (key == Keys::WEB_INGEST_PORT)
          config.web.ingest_port = Utils::string_to_number<int>(value).value_or(
              config.web.ingest_port);

        // Prometheus Settings
      } else if (current_section == "Prometheus") {
        if (key == Keys::PROMETHEUS_PORT)
          config.prometheus.port = Utils::string_to_number<int>(value).value_or(
              config.prometheus.port);
        else if (key == Keys::PROMETHEUS_METRICS_PATH)
          config.prometheus.metrics_path = value;
        else if (key == Keys::PROMETHEUS_HEALTH_PATH)
          config.prometheus.health_path = value;
        else if (key == Keys::PROMETHEUS_SNAPSHOT_CACHE_SECONDS)
          config.prometheus.snapshot_cache_seconds =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.prometheus.snapshot_cache_seconds);

        // Logging Settings
      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels) {
            pair.second = default_level;
            explicit_levels[pair.first] = default_level;
          }
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end()) {
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
            explicit_levels[comp_it->second] = string_to_log_level(value);
          } else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "analytics.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0) {
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
                explicit_levels[pair.second] = string_to_log_level(value);
              }
            }
          } else {
            std::cerr << "Warning (Config Line " << line_num
                      << "): Unknown logging component '" << key << "'"
                      << std::endl;
          }
        }
      } else {
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown section '" << current_section << "'"
                  << std::endl;
      }
    } catch (const std::exception &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Could not parse value for key '" << key << "' - "
                << e.what() << std::endl;
    }
  }

  if (config.debug) {
    for (auto &pair : config.logging.log_levels) {
      if (explicit_levels.find(pair.first) == explicit_levels.end())
        pair.second = LogLevel::DEBUG;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
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
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
