#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <memory>
#include "../src/core/config.hpp"
#include "../src/core/logger.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "pageview_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfigFile(const std::string& content) {
        auto config_path = test_dir / "test_config.ini";
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    std::filesystem::path test_dir;
};

// Test global keys and domain list parsing
TEST_F(ConfigTest, GlobalSettingsParsing) {
    std::string config_content = R"(
# exporter settings
bind_addr = 127.0.0.1
debug = false
mock_data = yes
domains = example.com, blog.example.com ,shop.example.org
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->bind_addr, "127.0.0.1");
    EXPECT_FALSE(config->debug);
    EXPECT_TRUE(config->mock_data);
    ASSERT_EQ(config->domains.size(), 3);
    EXPECT_EQ(config->domains[0], "example.com");
    EXPECT_EQ(config->domains[1], "blog.example.com");
    EXPECT_EQ(config->domains[2], "shop.example.org");
}

// Test Prometheus configuration parsing
TEST_F(ConfigTest, PrometheusConfigParsing) {
    std::string config_content = R"(
domains = example.com

[Prometheus]
port = 9191
metrics_path = /custom/metrics
health_path = /custom/health
snapshot_cache_seconds = 15
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->prometheus.port, 9191);
    EXPECT_EQ(config->prometheus.metrics_path, "/custom/metrics");
    EXPECT_EQ(config->prometheus.health_path, "/custom/health");
    EXPECT_EQ(config->prometheus.snapshot_cache_seconds, 15u);
}

// Test Store and Web configuration parsing
TEST_F(ConfigTest, StoreAndWebConfigParsing) {
    std::string config_content = R"(
domains = example.com

[Store]
backend = mongodb
uri = mongodb://db.internal:27017
database = web_analytics
collection = page_events

[Web]
ingest_port = 8181
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->store.backend, "mongodb");
    EXPECT_EQ(config->store.uri, "mongodb://db.internal:27017");
    EXPECT_EQ(config->store.database, "web_analytics");
    EXPECT_EQ(config->store.collection, "page_events");
    EXPECT_EQ(config->web.ingest_port, 8181);
}

// Test defaults when only the required keys are present
TEST_F(ConfigTest, DefaultsApply) {
    std::string config_file = createTestConfigFile("domains = example.com\n");
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->bind_addr, "0.0.0.0");
    EXPECT_EQ(config->store.backend, Config::STORE_BACKEND_MEMORY);
    EXPECT_EQ(config->web.ingest_port, 8081);
    EXPECT_EQ(config->prometheus.port, 9090);
    EXPECT_EQ(config->prometheus.metrics_path, "/metrics");
    EXPECT_EQ(config->prometheus.snapshot_cache_seconds, 0u);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::CORE), LogLevel::INFO);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::METRICS), LogLevel::WARN);
}

// Test logging levels, wildcards and the debug switch
TEST_F(ConfigTest, LoggingConfigParsing) {
    std::string config_content = R"(
domains = example.com
debug = true

[Logging]
analytics.* = TRACE
web = error
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    const auto &levels = manager.get_config()->logging.log_levels;
    EXPECT_EQ(levels.at(LogComponent::ANALYTICS_SESSION), LogLevel::TRACE);
    EXPECT_EQ(levels.at(LogComponent::ANALYTICS_STATS), LogLevel::TRACE);
    EXPECT_EQ(levels.at(LogComponent::ANALYTICS_SNAPSHOT), LogLevel::TRACE);
    EXPECT_EQ(levels.at(LogComponent::WEB), LogLevel::ERROR);
    // Components without an explicit level follow debug
    EXPECT_EQ(levels.at(LogComponent::STORE), LogLevel::DEBUG);
    EXPECT_EQ(levels.at(LogComponent::CORE), LogLevel::DEBUG);
}

// Unknown global keys are reported and otherwise ignored
TEST_F(ConfigTest, UnknownGlobalKeyIsIgnored) {
    std::string config_content = R"(
domains = example.com
retention_days = 30
bind_addr = 10.0.0.1
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    testing::internal::CaptureStderr();
    ASSERT_TRUE(manager.load_configuration(config_file));
    std::string warnings = testing::internal::GetCapturedStderr();

    EXPECT_NE(warnings.find("Unknown key 'retention_days'"), std::string::npos);
    auto config = manager.get_config();
    EXPECT_EQ(config->bind_addr, "10.0.0.1");
    ASSERT_EQ(config->domains.size(), 1);
    EXPECT_EQ(config->domains[0], "example.com");
}

// A missing file is reported and leaves the previous configuration in place
TEST_F(ConfigTest, MissingFileKeepsPreviousConfig) {
    Config::ConfigManager manager;
    auto before = manager.get_config();
    EXPECT_FALSE(manager.load_configuration((test_dir / "absent.ini").string()));
    EXPECT_EQ(manager.get_config(), before);
}

// A file without domains fails validation
TEST_F(ConfigTest, MissingDomainsFailsValidation) {
    std::string config_file = createTestConfigFile("bind_addr = 0.0.0.0\n");
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration(config_file));
    EXPECT_TRUE(manager.get_config()->domains.empty());
}

// Test configuration validation - valid Prometheus config
TEST_F(ConfigTest, PrometheusConfigValidation_Valid) {
    Config::PrometheusConfig config;
    config.port = 9090;
    config.metrics_path = "/metrics";
    config.health_path = "/health";
    config.snapshot_cache_seconds = 30;

    std::vector<std::string> errors;
    EXPECT_TRUE(Config::validate_prometheus_config(config, errors));
    EXPECT_TRUE(errors.empty());
}

// Test configuration validation - invalid Prometheus config
TEST_F(ConfigTest, PrometheusConfigValidation_Invalid) {
    Config::PrometheusConfig config;
    config.port = 70000; // Invalid port
    config.metrics_path = "metrics"; // Missing leading slash
    config.health_path = ""; // Empty path
    config.snapshot_cache_seconds = 5000; // Too high

    std::vector<std::string> errors;
    EXPECT_FALSE(Config::validate_prometheus_config(config, errors));
    EXPECT_EQ(errors.size(), 4);
}

// Test configuration validation - Store backends
TEST_F(ConfigTest, StoreConfigValidation) {
    Config::StoreConfig memory;
    std::vector<std::string> errors;
    EXPECT_TRUE(Config::validate_store_config(memory, errors));
    EXPECT_TRUE(errors.empty());

    Config::StoreConfig unknown;
    unknown.backend = "redis";
    EXPECT_FALSE(Config::validate_store_config(unknown, errors));
    EXPECT_EQ(errors.size(), 1);

    errors.clear();
    Config::StoreConfig mongo;
    mongo.backend = Config::STORE_BACKEND_MONGODB;
    mongo.uri = "";
    mongo.collection = "";
    EXPECT_FALSE(Config::validate_store_config(mongo, errors));
    EXPECT_EQ(errors.size(), 2);
}

// Test cross-component validation
TEST_F(ConfigTest, AppConfigValidation_Invalid) {
    Config::AppConfig config;
    config.domains = {"example.com", "example.com"}; // Duplicate
    config.web.ingest_port = 9090; // Same as Prometheus

    std::vector<std::string> errors;
    EXPECT_FALSE(Config::validate_app_config(config, errors));
    EXPECT_EQ(errors.size(), 2);
}

// Test configuration validation - valid app config
TEST_F(ConfigTest, AppConfigValidation_Valid) {
    Config::AppConfig config;
    config.domains = {"example.com", "example.org"};

    std::vector<std::string> errors;
    EXPECT_TRUE(Config::validate_app_config(config, errors));
    EXPECT_TRUE(errors.empty());
}
