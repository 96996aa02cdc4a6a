#include "metrics_registry.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_map>
#include <utility>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

std::shared_ptr<prometheus::Registry> MetricsRegistry::get_registry() {
  return registry_;
}

prometheus::Counter &MetricsRegistry::create_counter(const std::string &name,
                                                     const std::string &help) {

  auto &counter_family =
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);

  return counter_family.Add({});
}

prometheus::Gauge &MetricsRegistry::create_gauge(const std::string &name,
                                                 const std::string &help) {

  auto &gauge_family =
      prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);

  return gauge_family.Add({});
}

void MetricsRegistry::register_collectable(
    std::weak_ptr<prometheus::Collectable> collectable) {
  std::lock_guard<std::mutex> lock(collectables_mutex_);
  collectables_.push_back(std::move(collectable));
}

std::vector<prometheus::MetricFamily> MetricsRegistry::collect() {
  std::vector<std::shared_ptr<prometheus::Collectable>> live;
  {
    std::lock_guard<std::mutex> lock(collectables_mutex_);
    collectables_.erase(
        std::remove_if(collectables_.begin(), collectables_.end(),
                       [](const auto &weak) { return weak.expired(); }),
        collectables_.end());
    for (const auto &weak : collectables_) {
      if (auto collectable = weak.lock())
        live.push_back(std::move(collectable));
    }
  }

  std::vector<prometheus::MetricFamily> merged = registry_->Collect();
  std::unordered_map<std::string, size_t> index;
  for (size_t i = 0; i < merged.size(); ++i)
    index.emplace(merged[i].name, i);

  for (const auto &collectable : live) {
    for (auto &family : collectable->Collect()) {
      auto it = index.find(family.name);
      if (it == index.end()) {
        index.emplace(family.name, merged.size());
        merged.push_back(std::move(family));
        continue;
      }
      auto &target = merged[it->second].metric;
      target.insert(target.end(),
                    std::make_move_iterator(family.metric.begin()),
                    std::make_move_iterator(family.metric.end()));
    }
  }

  return merged;
}
