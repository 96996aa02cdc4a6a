#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *BIND_ADDR = "bind_addr";
constexpr const char *DEBUG = "debug";
constexpr const char *MOCK_DATA = "mock_data";
constexpr const char *DOMAINS = "domains";

// Store Settings
constexpr const char *STORE_BACKEND = "backend";
constexpr const char *STORE_URI = "uri";
constexpr const char *STORE_DATABASE = "database";
constexpr const char *STORE_COLLECTION = "collection";

// Web Settings
constexpr const char *WEB_INGEST_PORT = "ingest_port";

// Prometheus Settings
constexpr const char *PROMETHEUS_PORT = "port";
constexpr const char *PROMETHEUS_METRICS_PATH = "metrics_path";
constexpr const char *PROMETHEUS_HEALTH_PATH = "health_path";
constexpr const char *PROMETHEUS_SNAPSHOT_CACHE_SECONDS =
    "snapshot_cache_seconds";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

constexpr const char *STORE_BACKEND_MEMORY = "memory";
constexpr const char *STORE_BACKEND_MONGODB = "mongodb";

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct StoreConfig {
  std::string backend = STORE_BACKEND_MEMORY;
  std::string uri = "mongodb://localhost:27017";
  std::string database = "analytics";
  std::string collection = "events";
};

struct WebConfig {
  int ingest_port = 8081;
};

struct PrometheusConfig {
  int port = 9090;
  std::string metrics_path = "/metrics";
  std::string health_path = "/health";
  // 0 recomputes the snapshot on every scrape
  uint32_t snapshot_cache_seconds = 0;
};

struct AppConfig {
  std::string bind_addr = "0.0.0.0";
  bool debug = false;
  bool mock_data = false;
  std::vector<std::string> domains;

  StoreConfig store;
  WebConfig web;
  PrometheusConfig prometheus;
  LoggingConfig logging;

  AppConfig() = default;
};

LogLevel string_to_log_level(const std::string &level_str_raw);

// Validation functions for configuration parameters
bool validate_store_config(const StoreConfig &config,
                           std::vector<std::string> &errors);
bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Fills `config` from an INI file. Returns false if the file can't be opened.
bool parse_config_into(const std::string &filepath, AppConfig &config);

// Resets logging levels to the built-in defaults (WARN, CORE at INFO).
void apply_default_log_levels(AppConfig &config);

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
