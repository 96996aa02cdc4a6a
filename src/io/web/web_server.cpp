#include "web_server.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <nlohmann/json.hpp>
#include <prometheus/text_serializer.h>

#include <chrono>
#include <exception>

namespace {
void set_json_error(httplib::Response &res, int status,
                    const std::string &message) {
  nlohmann::json j;
  j["error"] = message;
  res.set_content(j.dump(), "application/json");
  res.status = status;
}
} // namespace

WebServer::WebServer(const std::string &host, int port)
    : server_(std::make_unique<httplib::Server>()), host_(host), port_(port) {
  LOG(LogLevel::INFO, LogComponent::WEB,
      "Web server initialized for " << host_ << ":" << port_);
}

WebServer::~WebServer() { stop(); }

void WebServer::mount_metrics(MetricsRegistry &metrics_registry,
                              const Config::PrometheusConfig &config,
                              prometheus::Counter &scrape_failures) {
  metrics_registry_ = &metrics_registry;
  scrape_failures_ = &scrape_failures;

  server_->Get(config.metrics_path,
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_metrics(req, res);
               });
  server_->Get(config.health_path,
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_health(req, res);
               });
}

void WebServer::mount_ingest_api(EventIngestor &ingestor) {
  ingestor_ = &ingestor;

  server_->Post("/api/event",
                [this](const httplib::Request &req, httplib::Response &res) {
                  handle_create_event(req, res);
                });
  server_->Get("/api/events",
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_list_events(req, res);
               });
}

void WebServer::handle_metrics(const httplib::Request &req,
                               httplib::Response &res) {
  LOG(LogLevel::DEBUG, LogComponent::WEB,
      "Received request for metrics from " << req.remote_addr);
  if (!metrics_registry_) {
    res.set_content("metrics are not mounted", "text/plain");
    res.status = 500;
    return;
  }

  try {
    prometheus::TextSerializer serializer;
    auto collected_metrics = metrics_registry_->collect();
    res.set_content(serializer.Serialize(collected_metrics),
                    "text/plain; version=0.0.4; charset=utf-8");
    res.status = 200;
    res.set_header("Cache-Control",
                   "no-store, no-cache, must-revalidate, max-age=0");
  } catch (const std::exception &e) {
    // A failed snapshot fails the whole scrape; no partial exposition.
    if (scrape_failures_)
      scrape_failures_->Increment();
    LOG(LogLevel::ERROR, LogComponent::WEB,
        "Scrape failed: " << e.what());
    res.set_content("Error generating metrics: " + std::string(e.what()),
                    "text/plain");
    res.status = 500;
  }
}

void WebServer::handle_health([[maybe_unused]] const httplib::Request &req,
                              httplib::Response &res) {
  res.set_content("OK", "text/plain");
  res.status = 200;
}

std::string WebServer::client_address(const httplib::Request &req) {
  if (req.has_header("X-Forwarded-For")) {
    auto hops = Utils::split_string(req.get_header_value("X-Forwarded-For"), ',');
    if (!hops.empty()) {
      std::string first = Utils::trim_copy(hops.front());
      if (!first.empty())
        return first;
    }
  }
  return req.remote_addr;
}

void WebServer::handle_create_event(const httplib::Request &req,
                                    httplib::Response &res) {
  if (!ingestor_) {
    set_json_error(res, 500, "ingestion is not mounted");
    return;
  }

  try {
    auto body = nlohmann::json::parse(req.body);
    auto request = JsonFormatter::event_request_from_json(body);
    auto event = ingestor_->create_event(request, client_address(req),
                                         req.get_header_value("User-Agent"));
    res.set_content("{}", "application/json");
    res.status = 200;
    LOG(LogLevel::TRACE, LogComponent::WEB, "Accepted event " << event.id);
  } catch (const nlohmann::json::exception &e) {
    set_json_error(res, 400, std::string("invalid event body: ") + e.what());
  } catch (const analytics::InvalidEventError &e) {
    set_json_error(res, 400, e.what());
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::WEB,
        "Cannot create event: " << e.what());
    set_json_error(res, 500, std::string("cannot create event: ") + e.what());
  }
}

void WebServer::handle_list_events(const httplib::Request &req,
                                   httplib::Response &res) {
  if (!ingestor_) {
    set_json_error(res, 500, "ingestion is not mounted");
    return;
  }

  std::string domain = req.get_param_value("domain");
  if (domain.empty()) {
    set_json_error(res, 400, "domain is missing");
    return;
  }

  try {
    auto events = ingestor_->list_events(domain);
    nlohmann::json j;
    j["events"] = JsonFormatter::events_to_json_array(events);
    res.set_content(j.dump(), "application/json");
    res.status = 200;
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::WEB,
        "Cannot list events for " << domain << ": " << e.what());
    set_json_error(res, 500, std::string("cannot list events: ") + e.what());
  }
}

void WebServer::start() {
  if (server_thread_.joinable())
    return; // Already running

  running_ = true;
  server_thread_ = std::thread(&WebServer::run, this);
}

void WebServer::stop() {
  // A stop() that lands before listen() binds would be lost
  while (running_ && !server_->is_running())
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  server_->stop();

  if (server_thread_.joinable()) {
    server_thread_.join();
    LOG(LogLevel::INFO, LogComponent::WEB,
        "Web server on " << host_ << ":" << port_ << " stopped");
  }
  running_ = false;
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::WEB,
      "Web server listening on " << host_ << ":" << port_);
  if (!server_->listen(host_.c_str(), port_)) {
    LOG(LogLevel::FATAL, LogComponent::WEB,
        "Web server failed to listen on " << host_ << ":" << port_);
  }
  running_ = false;
}
