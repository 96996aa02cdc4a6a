#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <prometheus/collectable.h>
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/metric_family.h>
#include <prometheus/registry.h>
#include <string>
#include <vector>

class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  std::shared_ptr<prometheus::Registry> get_registry();

  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Gauge &create_gauge(const std::string &name,
                                  const std::string &help);

  // Collectables are held weakly; expired ones are dropped on the next
  // collect().
  void register_collectable(std::weak_ptr<prometheus::Collectable> collectable);

  // Collects the registry and every registered collectable. Families sharing
  // a name are merged so each name appears once in the exposition. An
  // exception from any collectable propagates and nothing is returned.
  std::vector<prometheus::MetricFamily> collect();

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
  std::vector<std::weak_ptr<prometheus::Collectable>> collectables_;
  std::mutex collectables_mutex_;
};

#endif // METRICS_REGISTRY_HPP
