#ifndef MOCK_DATA_GENERATOR_HPP
#define MOCK_DATA_GENERATOR_HPP

#include "core/event.hpp"
#include "io/db/event_store.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <random>
#include <string>

// Feeds synthetic page views into a store so dashboards have something to
// show without real traffic.
class MockDataGenerator {
public:
  MockDataGenerator(std::shared_ptr<IEventStore> store, std::string domain,
                    unsigned int seed = std::random_device{}());

  // 1-10 visitors with 1-5 page views each, starting at `initial_time` and
  // spaced 0-39 minutes apart per visitor.
  analytics::Events
  generate_batch(std::chrono::system_clock::time_point initial_time);

  // Inserts batches until `shutdown_flag` is set, moving the batch start
  // 3h20m forward after each one.
  void run(const std::atomic<bool> &shutdown_flag);

private:
  bool sleep_unless_shutdown(std::chrono::milliseconds duration,
                             const std::atomic<bool> &shutdown_flag);

  std::shared_ptr<IEventStore> store_;
  std::string domain_;
  std::mt19937 rng_;
};

#endif // MOCK_DATA_GENERATOR_HPP
