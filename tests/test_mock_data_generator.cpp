#include "analysis/stats_aggregator.hpp"
#include "io/db/in_memory_event_store.hpp"
#include "tools/mock_data_generator.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <thread>

TEST(MockDataGeneratorTest, BatchHasPlausibleShape) {
  auto store = std::make_shared<InMemoryEventStore>();
  MockDataGenerator generator(store, "example.com", 42);
  auto start = std::chrono::system_clock::now();

  auto batch = generator.generate_batch(start);

  std::map<std::string, int> per_visitor;
  for (const auto &event : batch) {
    EXPECT_TRUE(event.is_pageview());
    EXPECT_EQ(event.domain, "example.com");
    EXPECT_EQ(event.url.rfind("mockdata.example.com/", 0), 0u);
    EXPECT_GE(event.timestamp, start);
    EXPECT_FALSE(event.id.empty());
    per_visitor[event.hashed_visit]++;
  }

  EXPECT_GE(per_visitor.size(), 1u);
  EXPECT_LE(per_visitor.size(), 10u);
  for (const auto &[visitor, views] : per_visitor) {
    EXPECT_GE(views, 1);
    EXPECT_LE(views, 5 * 10);
  }

  // Nothing is stored until run()
  EXPECT_EQ(store->size(), 0u);
}

TEST(MockDataGeneratorTest, BatchAggregatesCleanly) {
  MockDataGenerator generator(std::make_shared<InMemoryEventStore>(),
                              "example.com", 7);
  auto start = std::chrono::system_clock::now();
  auto batch = generator.generate_batch(start);

  auto stats = analytics::aggregate_stats(batch, start);
  EXPECT_EQ(stats.total_page_views, static_cast<int64_t>(batch.size()));
  EXPECT_TRUE(stats.bounce_rate.has_value());
}

TEST(MockDataGeneratorTest, RunStopsOnShutdownFlag) {
  auto store = std::make_shared<InMemoryEventStore>();
  MockDataGenerator generator(store, "example.com", 1);
  std::atomic<bool> shutdown{false};

  std::thread runner(&MockDataGenerator::run, &generator, std::cref(shutdown));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  shutdown = true;
  runner.join();

  SUCCEED();
}
