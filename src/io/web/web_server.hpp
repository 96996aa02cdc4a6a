#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "io/ingest/event_ingestor.hpp"

#include <httplib.h>

#include <atomic>
#include <memory>
#include <prometheus/counter.h>
#include <string>
#include <thread>

// One HTTP listener. The metrics and ingestion routes are mounted separately
// so each can live on its own port.
class WebServer {
public:
  WebServer(const std::string &host, int port);
  ~WebServer();

  WebServer(const WebServer &) = delete;
  WebServer &operator=(const WebServer &) = delete;

  void mount_metrics(MetricsRegistry &metrics_registry,
                     const Config::PrometheusConfig &config,
                     prometheus::Counter &scrape_failures);
  void mount_ingest_api(EventIngestor &ingestor);

  void start();
  void stop();
  bool is_running() const { return running_; }

  // Route handlers, public so they can be driven without a socket.
  void handle_metrics(const httplib::Request &req, httplib::Response &res);
  void handle_health(const httplib::Request &req, httplib::Response &res);
  void handle_create_event(const httplib::Request &req,
                           httplib::Response &res);
  void handle_list_events(const httplib::Request &req, httplib::Response &res);

  static std::string client_address(const httplib::Request &req);

private:
  void run();

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};
  std::string host_;
  int port_;

  MetricsRegistry *metrics_registry_ = nullptr;
  prometheus::Counter *scrape_failures_ = nullptr;
  EventIngestor *ingestor_ = nullptr;
};

#endif // WEB_SERVER_HPP
