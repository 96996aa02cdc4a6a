#ifndef ANALYTICS_COLLECTOR_HPP
#define ANALYTICS_COLLECTOR_HPP

#include "analysis/snapshot_provider.hpp"
#include "analysis/stats_aggregator.hpp"

#include <prometheus/collectable.h>
#include <prometheus/metric_family.h>
#include <prometheus/metric_type.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace analytics {

struct MetricDescriptor {
  std::string name;
  std::string help;
  prometheus::MetricType type;
  // Empty for single-sample metrics
  std::string variable_label;
  std::map<std::string, std::string> const_labels;
};

/**
 * Exposes one property's visitor statistics to a Prometheus registry.
 *
 * Every Collect() recomputes a snapshot from the event store while holding
 * the collector's mutex, so concurrent scrapes of the same property are
 * serialised. A failing snapshot throws out of Collect() and nothing is
 * emitted for that scrape.
 *
 * With a non-zero `cache_ttl` a snapshot younger than the ttl is reused
 * instead of being recomputed.
 */
class AnalyticsCollector : public prometheus::Collectable {
public:
  AnalyticsCollector(std::string domain,
                     std::shared_ptr<const SnapshotProvider> provider,
                     std::map<std::string, std::string> const_labels,
                     std::chrono::seconds cache_ttl = std::chrono::seconds(0));

  AnalyticsCollector(const AnalyticsCollector &) = delete;
  AnalyticsCollector &operator=(const AnalyticsCollector &) = delete;

  // Static metric shapes, independent of any snapshot.
  const std::vector<MetricDescriptor> &Describe() const { return metrics_; }

  std::vector<prometheus::MetricFamily> Collect() const override;

  const std::string &domain() const { return domain_; }

  // Converts a snapshot into metric families in Describe() order.
  std::vector<prometheus::MetricFamily>
  to_metric_families(const AnalyticsStats &stats) const;

private:
  AnalyticsStats current_snapshot() const;

  std::string domain_;
  std::shared_ptr<const SnapshotProvider> provider_;
  std::vector<MetricDescriptor> metrics_;
  std::chrono::seconds cache_ttl_;

  mutable std::mutex mutex_;
  mutable std::optional<AnalyticsStats> cached_stats_;
  mutable std::chrono::steady_clock::time_point cached_at_;
};

} // namespace analytics

#endif // ANALYTICS_COLLECTOR_HPP
