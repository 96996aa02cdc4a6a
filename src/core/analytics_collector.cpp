#include "analytics_collector.hpp"
#include "core/logger.hpp"

#include <exception>
#include <utility>

namespace analytics {

namespace {

enum MetricIndex {
  UNIQUE_VISITORS = 0,
  VISITS,
  PAGE_VIEWS,
  CURRENT_VISITORS,
  BOUNCE_RATE,
  PAGE_RATE,
  SOURCE_RATE,
  DEVICE_RATE,
  OS_RATE,
  BROWSER_RATE,
  ENTRY_PAGES_RATE,
  EXIT_PAGES_RATE,
  METRIC_COUNT
};

std::vector<prometheus::ClientMetric::Label>
make_labels(const std::map<std::string, std::string> &const_labels) {
  std::vector<prometheus::ClientMetric::Label> labels;
  labels.reserve(const_labels.size() + 1);
  for (const auto &[name, value] : const_labels) {
    prometheus::ClientMetric::Label label;
    label.name = name;
    label.value = value;
    labels.push_back(std::move(label));
  }
  return labels;
}

prometheus::MetricFamily empty_family(const MetricDescriptor &desc) {
  prometheus::MetricFamily family;
  family.name = desc.name;
  family.help = desc.help;
  family.type = desc.type;
  return family;
}

prometheus::ClientMetric make_sample(const MetricDescriptor &desc,
                                     double value) {
  prometheus::ClientMetric metric;
  metric.label = make_labels(desc.const_labels);
  if (desc.type == prometheus::MetricType::Counter)
    metric.counter.value = value;
  else
    metric.gauge.value = value;
  return metric;
}

prometheus::MetricFamily single_sample_family(const MetricDescriptor &desc,
                                              double value) {
  auto family = empty_family(desc);
  family.metric.push_back(make_sample(desc, value));
  return family;
}

prometheus::MetricFamily rate_family(const MetricDescriptor &desc,
                                     const RateMap &rates) {
  auto family = empty_family(desc);
  family.metric.reserve(rates.size());
  for (const auto &[key, count] : rates) {
    auto metric = make_sample(desc, static_cast<double>(count));
    prometheus::ClientMetric::Label label;
    label.name = desc.variable_label;
    label.value = key;
    metric.label.push_back(std::move(label));
    family.metric.push_back(std::move(metric));
  }
  return family;
}

} // namespace

AnalyticsCollector::AnalyticsCollector(
    std::string domain, std::shared_ptr<const SnapshotProvider> provider,
    std::map<std::string, std::string> const_labels,
    std::chrono::seconds cache_ttl)
    : domain_(std::move(domain)), provider_(std::move(provider)),
      cache_ttl_(cache_ttl) {
  using prometheus::MetricType;
  auto desc = [&const_labels](const char *name, const char *help,
                              MetricType type, const char *label = "") {
    return MetricDescriptor{name, help, type, label, const_labels};
  };

  metrics_.reserve(METRIC_COUNT);
  metrics_.push_back(desc("unique_visitors_total",
                          "Total number of unique visitors",
                          MetricType::Counter));
  metrics_.push_back(
      desc("visits_total", "Total number of visits", MetricType::Counter));
  metrics_.push_back(
      desc("page_views", "Total number of page views", MetricType::Counter));
  metrics_.push_back(
      desc("current_visitors", "Current visitors", MetricType::Gauge));
  metrics_.push_back(desc("bounce_rate",
                          "One-page visits per page view, absent without "
                          "page views",
                          MetricType::Gauge));
  metrics_.push_back(
      desc("page_rate", "Rating of page", MetricType::Gauge, "page"));
  metrics_.push_back(
      desc("source_rate", "Rating of source", MetricType::Gauge, "source"));
  metrics_.push_back(
      desc("device_rate", "Rating of device", MetricType::Gauge, "device"));
  metrics_.push_back(desc("os_rate", "Rating of OS", MetricType::Gauge, "os"));
  metrics_.push_back(desc("browser_rate", "Rating of browser",
                          MetricType::Gauge, "browser"));
  metrics_.push_back(desc("entry_pages_rate", "Rating of entry pages",
                          MetricType::Gauge, "page"));
  metrics_.push_back(desc("exit_pages_rate", "Rating of exit pages",
                          MetricType::Gauge, "page"));
}

AnalyticsStats AnalyticsCollector::current_snapshot() const {
  auto now = std::chrono::steady_clock::now();
  if (cache_ttl_.count() > 0 && cached_stats_ && now - cached_at_ < cache_ttl_)
    return *cached_stats_;

  AnalyticsStats stats = provider_->snapshot(domain_);
  if (cache_ttl_.count() > 0) {
    cached_stats_ = stats;
    cached_at_ = now;
  }
  return stats;
}

std::vector<prometheus::MetricFamily> AnalyticsCollector::Collect() const {
  std::lock_guard<std::mutex> lock(mutex_);

  AnalyticsStats stats;
  try {
    stats = current_snapshot();
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::METRICS,
        "Error getting stats for " << domain_ << ": " << e.what());
    throw;
  }

  return to_metric_families(stats);
}

std::vector<prometheus::MetricFamily>
AnalyticsCollector::to_metric_families(const AnalyticsStats &stats) const {
  std::vector<prometheus::MetricFamily> families;
  families.reserve(METRIC_COUNT);

  families.push_back(single_sample_family(
      metrics_[UNIQUE_VISITORS], static_cast<double>(stats.unique_visitors)));
  families.push_back(single_sample_family(
      metrics_[VISITS], static_cast<double>(stats.total_visits)));
  families.push_back(single_sample_family(
      metrics_[PAGE_VIEWS], static_cast<double>(stats.total_page_views)));
  families.push_back(single_sample_family(
      metrics_[CURRENT_VISITORS], static_cast<double>(stats.current_visitors)));

  if (stats.bounce_rate) {
    families.push_back(
        single_sample_family(metrics_[BOUNCE_RATE], *stats.bounce_rate));
  } else {
    LOG(LogLevel::DEBUG, LogComponent::METRICS,
        "No page views for " << domain_ << ", bounce_rate sample skipped");
    families.push_back(empty_family(metrics_[BOUNCE_RATE]));
  }

  families.push_back(rate_family(metrics_[PAGE_RATE], stats.pages_rate));
  families.push_back(rate_family(metrics_[SOURCE_RATE], stats.sources_rate));
  families.push_back(rate_family(metrics_[DEVICE_RATE], stats.devices_rate));
  families.push_back(rate_family(metrics_[OS_RATE], stats.oss_rate));
  families.push_back(rate_family(metrics_[BROWSER_RATE], stats.browsers_rate));
  families.push_back(
      rate_family(metrics_[ENTRY_PAGES_RATE], stats.entry_pages_rate));
  families.push_back(
      rate_family(metrics_[EXIT_PAGES_RATE], stats.exit_pages_rate));

  return families;
}

} // namespace analytics
