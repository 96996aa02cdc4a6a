#ifndef SNAPSHOT_PROVIDER_HPP
#define SNAPSHOT_PROVIDER_HPP

#include "analysis/stats_aggregator.hpp"
#include "io/db/event_store.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace analytics {

// Reads a property's events from the store and aggregates them. Nothing is
// kept between calls.
class SnapshotProvider {
public:
  explicit SnapshotProvider(std::shared_ptr<const IEventStore> store);

  // Throws StoreUnavailableError when no store is configured, and lets
  // StoreReadError and MalformedUrlError propagate.
  AnalyticsStats snapshot(const std::string &domain) const;
  AnalyticsStats snapshot(const std::string &domain,
                          std::chrono::system_clock::time_point now) const;

private:
  std::shared_ptr<const IEventStore> store_;
};

} // namespace analytics

#endif // SNAPSHOT_PROVIDER_HPP
