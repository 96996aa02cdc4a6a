#include "snapshot_provider.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <utility>

namespace analytics {

SnapshotProvider::SnapshotProvider(std::shared_ptr<const IEventStore> store)
    : store_(std::move(store)) {}

AnalyticsStats SnapshotProvider::snapshot(const std::string &domain) const {
  return snapshot(domain, std::chrono::system_clock::now());
}

AnalyticsStats
SnapshotProvider::snapshot(const std::string &domain,
                           std::chrono::system_clock::time_point now) const {
  if (!store_)
    throw StoreUnavailableError("event store is not configured");

  auto started = std::chrono::steady_clock::now();
  Events events = store_->list(domain);
  AnalyticsStats stats = aggregate_stats(std::move(events), now);

  LOG(LogLevel::DEBUG, LogComponent::ANALYTICS_SNAPSHOT,
      "Snapshot for " << domain << " computed in "
                      << std::chrono::duration_cast<std::chrono::microseconds>(
                             std::chrono::steady_clock::now() - started)
                             .count()
                      << "us");
  return stats;
}

} // namespace analytics
