#ifndef STATS_AGGREGATOR_HPP
#define STATS_AGGREGATOR_HPP

#include "core/event.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace analytics {

// A session whose last page view is closer to "now" than this is live.
constexpr std::chrono::minutes CURRENT_VISITOR_WINDOW{5};

constexpr const char *DIRECT_SOURCE = "Direct/None";
constexpr const char *UNKNOWN_BUCKET = "Unknown";

using RateMap = std::map<std::string, int64_t>;

struct AnalyticsStats {
  int64_t unique_visitors = 0;
  int64_t total_visits = 0;
  int64_t total_page_views = 0;
  int64_t current_visitors = 0;
  // One-page visits divided by page views (not by visits). Empty when there
  // were no page views.
  std::optional<double> bounce_rate;

  RateMap pages_rate;
  RateMap sources_rate;
  RateMap devices_rate;
  RateMap oss_rate;
  RateMap browsers_rate;
  RateMap entry_pages_rate;
  RateMap exit_pages_rate;
};

// Builds a snapshot from one property's events. The events are sorted by
// timestamp internally, so any order is accepted. Throws MalformedUrlError if
// any URL or non-empty referrer can't be decomposed.
AnalyticsStats aggregate_stats(Events events,
                               std::chrono::system_clock::time_point now);

} // namespace analytics

#endif // STATS_AGGREGATOR_HPP
