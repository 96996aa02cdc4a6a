#include "stats_aggregator.hpp"
#include "analysis/session_tracker.hpp"
#include "analysis/url_normalizer.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <chrono>
#include <string>

namespace analytics {

namespace {

void count_source(const Event &event, const std::string &event_host,
                  RateMap &sources) {
  // No referrer: the page was opened directly or the browser withheld it
  if (event.referrer.empty()) {
    sources[DIRECT_SOURCE]++;
    return;
  }

  HostAndPath referrer = extract_domain_and_path(event.referrer);
  // Internal navigation is not a traffic source
  if (referrer.host == event_host)
    return;

  sources[source_label(referrer.host)]++;
}

const std::string &or_unknown(const std::string &value) {
  static const std::string unknown = UNKNOWN_BUCKET;
  return value.empty() ? unknown : value;
}

} // namespace

AnalyticsStats aggregate_stats(Events events,
                               std::chrono::system_clock::time_point now) {
  std::stable_sort(events.begin(), events.end(),
                   [](const Event &a, const Event &b) {
                     return a.timestamp < b.timestamp;
                   });

  AnalyticsStats stats;
  SessionTracker tracker;

  for (const auto &event : events) {
    // Other event kinds are stored but neither counted nor sessionized
    if (!event.is_pageview())
      continue;
    stats.total_page_views++;

    HostAndPath location = extract_domain_and_path(event.url);
    std::string page = canonical_page_path(location.path);

    stats.pages_rate[page]++;
    tracker.record(event.hashed_visit, page, event.timestamp);
    count_source(event, location.host, stats.sources_rate);

    stats.devices_rate[device_label(event.device)]++;
    stats.oss_rate[or_unknown(event.os)]++;
    stats.browsers_rate[or_unknown(event.browser)]++;
  }

  int64_t one_page_visits = 0;
  for (const auto &[fingerprint, visits] : tracker.sessions()) {
    for (const auto &visit : visits) {
      if (visit.is_bounce())
        one_page_visits++;

      auto idle = now - visit.last_pageview;
      if (idle < std::chrono::system_clock::duration::zero())
        idle = -idle;
      if (idle < CURRENT_VISITOR_WINDOW)
        stats.current_visitors++;

      stats.entry_pages_rate[visit.entry_page]++;
      stats.exit_pages_rate[visit.exit_page]++;
      stats.total_visits++;
    }
  }

  stats.unique_visitors = static_cast<int64_t>(tracker.visitor_count());
  if (stats.total_page_views > 0)
    stats.bounce_rate = static_cast<double>(one_page_visits) /
                        static_cast<double>(stats.total_page_views);

  LOG(LogLevel::DEBUG, LogComponent::ANALYTICS_STATS,
      "Aggregated " << events.size() << " events into "
                    << stats.total_visits << " visits from "
                    << stats.unique_visitors << " visitors");
  return stats;
}

} // namespace analytics
