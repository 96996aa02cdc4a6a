#include "core/analytics_collector.hpp"
#include "core/errors.hpp"
#include "io/db/in_memory_event_store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace analytics;
using namespace std::chrono_literals;

namespace {

// Wraps an in-memory store, counts reads and tracks how many overlap.
class CountingEventStore : public IEventStore {
public:
  Events list(const std::string &domain) const override {
    ++reads;
    int now_in_flight = ++in_flight;
    int seen = max_in_flight.load();
    while (now_in_flight > seen &&
           !max_in_flight.compare_exchange_weak(seen, now_in_flight)) {
    }
    if (read_delay.count() > 0)
      std::this_thread::sleep_for(read_delay);
    --in_flight;
    if (fail)
      throw StoreReadError("store is down");
    return inner.list(domain);
  }
  void insert(const Event &event) override { inner.insert(event); }

  InMemoryEventStore inner;
  mutable std::atomic<int> reads{0};
  mutable std::atomic<int> in_flight{0};
  mutable std::atomic<int> max_in_flight{0};
  std::chrono::milliseconds read_delay{0};
  bool fail = false;
};

Event make_event(const std::string &id, const std::string &fingerprint,
                 const std::string &url, const std::string &referrer = "") {
  Event event;
  event.id = id;
  event.type = PAGEVIEW_EVENT_TYPE;
  event.url = url;
  event.domain = "example.com";
  event.referrer = referrer;
  event.browser = "Chrome";
  event.os = "Android";
  event.device = device::Mobile{};
  event.hashed_visit = fingerprint;
  event.timestamp = std::chrono::system_clock::now();
  return event;
}

const prometheus::MetricFamily &
find_family(const std::vector<prometheus::MetricFamily> &families,
            const std::string &name) {
  auto it = std::find_if(families.begin(), families.end(),
                         [&name](const auto &f) { return f.name == name; });
  if (it == families.end())
    throw std::runtime_error("family not found: " + name);
  return *it;
}

std::string label_value(const prometheus::ClientMetric &metric,
                        const std::string &name) {
  for (const auto &label : metric.label)
    if (label.name == name)
      return label.value;
  return "";
}

} // namespace

class AnalyticsCollectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_shared<CountingEventStore>();
    provider_ = std::make_shared<const SnapshotProvider>(store_);
  }

  std::unique_ptr<AnalyticsCollector>
  make_collector(std::chrono::seconds ttl = std::chrono::seconds(0)) {
    return std::make_unique<AnalyticsCollector>(
        "example.com", provider_,
        std::map<std::string, std::string>{{"domain", "example.com"}}, ttl);
  }

  std::shared_ptr<CountingEventStore> store_;
  std::shared_ptr<const SnapshotProvider> provider_;
};

TEST_F(AnalyticsCollectorTest, DescribeListsTwelveStableMetrics) {
  auto collector = make_collector();
  const auto &first = collector->Describe();
  ASSERT_EQ(first.size(), 12u);

  const std::vector<std::string> expected = {
      "unique_visitors_total", "visits_total",   "page_views",
      "current_visitors",      "bounce_rate",    "page_rate",
      "source_rate",           "device_rate",    "os_rate",
      "browser_rate",          "entry_pages_rate", "exit_pages_rate"};
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(first[i].name, expected[i]);
    EXPECT_EQ(first[i].const_labels.at("domain"), "example.com");
  }

  EXPECT_EQ(first[0].type, prometheus::MetricType::Counter);
  EXPECT_EQ(first[1].type, prometheus::MetricType::Counter);
  EXPECT_EQ(first[2].type, prometheus::MetricType::Counter);
  EXPECT_EQ(first[3].type, prometheus::MetricType::Gauge);
  EXPECT_EQ(first[4].type, prometheus::MetricType::Gauge);
  EXPECT_EQ(first[5].variable_label, "page");
  EXPECT_EQ(first[6].variable_label, "source");
  EXPECT_EQ(first[7].variable_label, "device");
  EXPECT_EQ(first[8].variable_label, "os");
  EXPECT_EQ(first[9].variable_label, "browser");
  EXPECT_EQ(first[10].variable_label, "page");
  EXPECT_EQ(first[11].variable_label, "page");

  // Describe does not touch the store
  EXPECT_EQ(store_->reads.load(), 0);

  const auto &second = collector->Describe();
  ASSERT_EQ(second.size(), first.size());
  for (size_t i = 0; i < first.size(); ++i)
    EXPECT_EQ(second[i].name, first[i].name);
}

TEST_F(AnalyticsCollectorTest, CollectEmitsSamplesWithLabels) {
  store_->insert(make_event("1", "F1", "https://example.com/",
                            "https://news.ycombinator.com/item"));
  store_->insert(make_event("2", "F2", "https://example.com/pricing.html"));

  auto collector = make_collector();
  auto families = collector->Collect();
  ASSERT_EQ(families.size(), 12u);

  const auto &page_views = find_family(families, "page_views");
  EXPECT_EQ(page_views.type, prometheus::MetricType::Counter);
  ASSERT_EQ(page_views.metric.size(), 1u);
  EXPECT_DOUBLE_EQ(page_views.metric[0].counter.value, 2.0);
  EXPECT_EQ(label_value(page_views.metric[0], "domain"), "example.com");

  const auto &visitors = find_family(families, "unique_visitors_total");
  EXPECT_DOUBLE_EQ(visitors.metric[0].counter.value, 2.0);

  const auto &current = find_family(families, "current_visitors");
  EXPECT_DOUBLE_EQ(current.metric[0].gauge.value, 2.0);

  const auto &bounce = find_family(families, "bounce_rate");
  ASSERT_EQ(bounce.metric.size(), 1u);
  EXPECT_DOUBLE_EQ(bounce.metric[0].gauge.value, 1.0);

  const auto &pages = find_family(families, "page_rate");
  ASSERT_EQ(pages.metric.size(), 2u);
  EXPECT_EQ(label_value(pages.metric[0], "page"), "/");
  EXPECT_EQ(label_value(pages.metric[1], "page"), "/pricing");
  EXPECT_EQ(label_value(pages.metric[1], "domain"), "example.com");
  EXPECT_DOUBLE_EQ(pages.metric[1].gauge.value, 1.0);

  const auto &sources = find_family(families, "source_rate");
  ASSERT_EQ(sources.metric.size(), 2u);
  EXPECT_EQ(label_value(sources.metric[0], "source"), DIRECT_SOURCE);
  EXPECT_EQ(label_value(sources.metric[1], "source"), "ycombinator.com");

  const auto &devices = find_family(families, "device_rate");
  ASSERT_EQ(devices.metric.size(), 1u);
  EXPECT_EQ(label_value(devices.metric[0], "device"), "Mobile");
  EXPECT_DOUBLE_EQ(devices.metric[0].gauge.value, 2.0);
}

TEST_F(AnalyticsCollectorTest, EmptyPropertySkipsBounceSample) {
  auto collector = make_collector();
  auto families = collector->Collect();

  const auto &bounce = find_family(families, "bounce_rate");
  EXPECT_TRUE(bounce.metric.empty());

  const auto &visits = find_family(families, "visits_total");
  ASSERT_EQ(visits.metric.size(), 1u);
  EXPECT_DOUBLE_EQ(visits.metric[0].counter.value, 0.0);

  EXPECT_TRUE(find_family(families, "page_rate").metric.empty());
}

TEST_F(AnalyticsCollectorTest, SnapshotFailureFailsCollect) {
  store_->fail = true;
  auto collector = make_collector();
  EXPECT_THROW(collector->Collect(), StoreReadError);
}

TEST_F(AnalyticsCollectorTest, EveryCollectReadsStoreWithoutCache) {
  auto collector = make_collector();
  collector->Collect();
  collector->Collect();
  EXPECT_EQ(store_->reads.load(), 2);
}

TEST_F(AnalyticsCollectorTest, CacheReusesRecentSnapshot) {
  store_->insert(make_event("1", "F1", "https://example.com/"));
  auto collector = make_collector(std::chrono::seconds(60));

  auto first = collector->Collect();
  store_->insert(make_event("2", "F2", "https://example.com/"));
  auto second = collector->Collect();

  EXPECT_EQ(store_->reads.load(), 1);
  EXPECT_DOUBLE_EQ(find_family(second, "page_views").metric[0].counter.value,
                   1.0);
}

TEST_F(AnalyticsCollectorTest, FailedSnapshotIsNotCached) {
  store_->fail = true;
  auto collector = make_collector(std::chrono::seconds(60));
  EXPECT_THROW(collector->Collect(), StoreReadError);

  store_->fail = false;
  EXPECT_NO_THROW(collector->Collect());
  EXPECT_EQ(store_->reads.load(), 2);
}

TEST_F(AnalyticsCollectorTest, ConcurrentCollectsAreSerialized) {
  store_->insert(make_event("1", "F1", "https://example.com/"));
  store_->insert(make_event("2", "F2", "https://example.com/docs"));
  store_->read_delay = std::chrono::milliseconds(20);
  auto collector = make_collector();

  constexpr int kThreads = 8;
  std::vector<size_t> family_counts(kThreads, 0);
  std::vector<double> page_view_values(kThreads, 0.0);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() {
      auto families = collector->Collect();
      family_counts[i] = families.size();
      page_view_values[i] =
          find_family(families, "page_views").metric[0].counter.value;
    });
  }
  for (auto &t : threads)
    t.join();

  EXPECT_EQ(store_->reads.load(), kThreads);
  EXPECT_EQ(store_->max_in_flight.load(), 1);
  for (int i = 0; i < kThreads; ++i) {
    EXPECT_EQ(family_counts[i], 12u);
    EXPECT_DOUBLE_EQ(page_view_values[i], 2.0);
  }
}
