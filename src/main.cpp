#include "analysis/snapshot_provider.hpp"
#include "core/analytics_collector.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "io/db/in_memory_event_store.hpp"
#include "io/db/mongo_event_store.hpp"
#include "io/db/mongo_manager.hpp"
#include "io/ingest/daily_salt.hpp"
#include "io/ingest/event_ingestor.hpp"
#include "io/web/web_server.hpp"
#include "tools/mock_data_generator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
#include <unistd.h>
#endif

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_config_requested = false;

// A simple, safe signal handler function
void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM) {
    g_shutdown_requested = true;
  } else if (signum == SIGHUP) {
    g_reload_config_requested = true;
  }
}

std::shared_ptr<IEventStore> make_event_store(const Config::StoreConfig &config) {
  if (config.backend == Config::STORE_BACKEND_MONGODB) {
    auto mongo_manager = std::make_shared<MongoManager>(config);
    if (mongo_manager->ping())
      mongo_manager->ensure_indexes();
    else
      LOG(LogLevel::WARN, LogComponent::STORE,
          "MongoDB is not reachable yet, scrapes fail until it is");
    LOG(LogLevel::INFO, LogComponent::STORE,
        "Using MongoDB event store " << config.database << "."
                                     << config.collection);
    return std::make_shared<MongoEventStore>(mongo_manager);
  }

  LOG(LogLevel::INFO, LogComponent::STORE, "Using in-memory event store");
  return std::make_shared<InMemoryEventStore>();
}

int main(int argc, char *argv[]) {
  // Register signal handlers
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];

  if (!config_manager.load_configuration(config_file_to_load)) {
    std::cerr << "No usable configuration in '" << config_file_to_load
              << "'. Exiting." << std::endl;
    return 1;
  }

  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE, "Pageview exporter starting up...");
#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());
#endif

  // --- Event Store ---
  std::shared_ptr<IEventStore> event_store;
  try {
    event_store = make_event_store(current_config->store);
  } catch (const analytics::StoreUnavailableError &e) {
    LOG(LogLevel::FATAL, LogComponent::STORE,
        "Cannot open event store: " << e.what() << ". Exiting.");
    return 1;
  }

  // --- Metrics Registration ---
  auto &scrape_failures = MetricsRegistry::instance().create_counter(
      "pageview_exporter_scrape_failures_total",
      "Scrapes that failed because a snapshot could not be computed.");
  auto &events_ingested = MetricsRegistry::instance().create_counter(
      "pageview_exporter_events_ingested_total",
      "Events accepted by the ingestion API.");

  auto snapshot_provider =
      std::make_shared<const analytics::SnapshotProvider>(event_store);

  std::vector<std::shared_ptr<analytics::AnalyticsCollector>> collectors;
  for (const auto &domain : current_config->domains) {
    auto collector = std::make_shared<analytics::AnalyticsCollector>(
        domain, snapshot_provider,
        std::map<std::string, std::string>{{"domain", domain}},
        std::chrono::seconds(current_config->prometheus.snapshot_cache_seconds));
    MetricsRegistry::instance().register_collectable(collector);
    collectors.push_back(collector);
    LOG(LogLevel::INFO, LogComponent::METRICS,
        "Registered analytics collector for " << domain);
  }

  // --- Ingestion ---
  EventIngestor ingestor(event_store, DailySalt::global(), &events_ingested);

  // --- Web Servers ---
  WebServer metrics_server(current_config->bind_addr,
                           current_config->prometheus.port);
  metrics_server.mount_metrics(MetricsRegistry::instance(),
                               current_config->prometheus, scrape_failures);
  metrics_server.start();
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Metrics exposed on " << current_config->bind_addr << ":"
                            << current_config->prometheus.port
                            << current_config->prometheus.metrics_path);

  WebServer ingest_server(current_config->bind_addr,
                          current_config->web.ingest_port);
  ingest_server.mount_ingest_api(ingestor);
  ingest_server.start();
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Ingestion API listening on " << current_config->bind_addr << ":"
                                    << current_config->web.ingest_port);

  // --- Mock Data ---
  std::thread mock_thread;
  std::unique_ptr<MockDataGenerator> mock_generator;
  if (current_config->mock_data) {
    mock_generator = std::make_unique<MockDataGenerator>(
        event_store, current_config->domains.front());
    mock_thread = std::thread(&MockDataGenerator::run, mock_generator.get(),
                              std::cref(g_shutdown_requested));
  }

  while (!g_shutdown_requested) {
    if (g_reload_config_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CONFIG,
          "SIGHUP detected. Reloading logging configuration from "
              << config_file_to_load);
      if (config_manager.load_configuration(config_file_to_load)) {
        current_config = config_manager.get_config();
        LogManager::instance().configure(current_config->logging);
        LOG(LogLevel::INFO, LogComponent::CONFIG,
            "Logging levels reloaded. Other settings apply on restart.");
      } else {
        LOG(LogLevel::WARN, LogComponent::CONFIG,
            "Reload failed. Keeping previous configuration.");
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Shutdown signal received. Stopping...");

  if (mock_thread.joinable())
    mock_thread.join();

  ingest_server.stop();
  metrics_server.stop();

  LOG(LogLevel::INFO, LogComponent::CORE, "Pageview exporter finished.");
  return 0;
}
