#include "event_ingestor.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/hashing.hpp"
#include "utils/ua_parser.hpp"

#include <prometheus/counter.h>

#include <utility>

EventIngestor::EventIngestor(std::shared_ptr<IEventStore> store,
                             DailySalt &salt,
                             prometheus::Counter *ingested_counter)
    : store_(std::move(store)), salt_(salt),
      ingested_counter_(ingested_counter) {
  if (!store_)
    throw analytics::StoreUnavailableError("event store is not configured");
}

analytics::Event
EventIngestor::create_event(const JsonFormatter::EventRequest &request,
                            const std::string &client_ip,
                            const std::string &user_agent) {
  return create_event(request, client_ip, user_agent,
                      std::chrono::system_clock::now());
}

analytics::Event
EventIngestor::create_event(const JsonFormatter::EventRequest &request,
                            const std::string &client_ip,
                            const std::string &user_agent,
                            std::chrono::system_clock::time_point now) {
  if (request.domain.empty())
    throw analytics::InvalidEventError("domain is missing");
  if (client_ip.empty())
    throw analytics::InvalidEventError("client address is missing");
  if (user_agent.empty())
    throw analytics::InvalidEventError("user agent is missing");

  // hash(daily_salt + website_domain + ip_address + user_agent)
  std::string fingerprint = Hashing::sha256_hex(
      {salt_.current(now), request.domain, client_ip, user_agent});

  UAParser::UserAgentInfo ua = UAParser::parse(user_agent);

  analytics::Event event;
  event.id = Hashing::random_uuid();
  event.type = request.type;
  event.url = request.url;
  event.domain = request.domain;
  event.referrer = request.referrer;
  event.browser = std::move(ua.browser);
  event.os = std::move(ua.os);
  event.device = ua.device;
  event.hashed_visit = std::move(fingerprint);
  event.meta = request.meta;
  event.props = request.props;
  event.timestamp = now;

  store_->insert(event);
  if (ingested_counter_)
    ingested_counter_->Increment();

  LOG(LogLevel::DEBUG, LogComponent::INGEST,
      "Stored " << event.type << " " << event.id << " for " << event.domain
                << " (" << analytics::device_label(event.device) << ", "
                << event.os << ", " << event.browser << ")");
  return event;
}

analytics::Events EventIngestor::list_events(const std::string &domain) const {
  return store_->list(domain);
}
