#ifndef EVENT_INGESTOR_HPP
#define EVENT_INGESTOR_HPP

#include "core/event.hpp"
#include "io/db/event_store.hpp"
#include "io/ingest/daily_salt.hpp"
#include "utils/json_formatter.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace prometheus {
class Counter;
}

// Turns client reports into stored events: fingerprints the visitor,
// classifies the user agent and stamps id and time.
class EventIngestor {
public:
  EventIngestor(std::shared_ptr<IEventStore> store, DailySalt &salt,
                prometheus::Counter *ingested_counter = nullptr);

  // Throws analytics::InvalidEventError for a request without domain, client
  // address or user agent, and analytics::StoreWriteError if the insert fails.
  analytics::Event create_event(const JsonFormatter::EventRequest &request,
                                const std::string &client_ip,
                                const std::string &user_agent);
  analytics::Event create_event(const JsonFormatter::EventRequest &request,
                                const std::string &client_ip,
                                const std::string &user_agent,
                                std::chrono::system_clock::time_point now);

  analytics::Events list_events(const std::string &domain) const;

private:
  std::shared_ptr<IEventStore> store_;
  DailySalt &salt_;
  prometheus::Counter *ingested_counter_;
};

#endif // EVENT_INGESTOR_HPP
