#include "mock_data_generator.hpp"
#include "core/logger.hpp"
#include "utils/hashing.hpp"

#include <array>
#include <exception>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

const std::string MOCK_HOST = "mockdata.example.com";
const std::string IP_PREFIX = "132.14.53.";

const std::array<std::string, 9> oss = {
    "Windows", "Windows Phone", "Android", "macOS",     "iOS",
    "Linux",   "FreeBSD",       "ChromeOS", "BlackBerry"};
const std::array<std::string, 10> browsers = {
    "Opera",   "Opera Mini",        "Opera Touch", "Chrome", "Headless Chrome",
    "Firefox", "Internet Explorer", "Safari",      "Edge",   "Vivaldi"};
const std::array<std::string, 5> referrers = {
    "", "https://www.google.com", "https://ua.linkedin.com",
    "https://www.bing.com", "https://yahoo.com"};
const std::array<std::string, 5> paths = {"/", "/foo", "/bar", "/foo/bar",
                                          "/bar/foo"};
const std::array<analytics::DeviceClass, 4> devices = {
    analytics::device::Mobile{}, analytics::device::Tablet{},
    analytics::device::Desktop{}, analytics::device::Bot{}};

template <typename Container>
const typename Container::value_type &pick(const Container &values,
                                           std::mt19937 &rng) {
  std::uniform_int_distribution<size_t> dist(0, values.size() - 1);
  return values[dist(rng)];
}

} // namespace

MockDataGenerator::MockDataGenerator(std::shared_ptr<IEventStore> store,
                                     std::string domain, unsigned int seed)
    : store_(std::move(store)), domain_(std::move(domain)), rng_(seed) {}

analytics::Events MockDataGenerator::generate_batch(
    std::chrono::system_clock::time_point initial_time) {
  analytics::Events batch;

  std::uniform_int_distribution<int> visitor_dist(1, 10);
  std::uniform_int_distribution<int> ip_dist(1, 255);
  std::uniform_int_distribution<int> views_dist(1, 5);
  std::uniform_int_distribution<int> shift_dist(0, 39);
  std::uniform_int_distribution<int> coin(0, 1);

  int total_visitors = visitor_dist(rng_);
  for (int i = 0; i < total_visitors; ++i) {
    std::string ip = IP_PREFIX + std::to_string(ip_dist(rng_));
    const std::string &browser = pick(browsers, rng_);
    const std::string &os = pick(oss, rng_);
    const analytics::DeviceClass &device = pick(devices, rng_);
    std::string fingerprint = Hashing::sha256_hex(
        {ip, browser, analytics::device_label(device)});

    int page_views = views_dist(rng_);
    int time_shift = 0;
    for (int j = 0; j < page_views; ++j) {
      analytics::Event event;
      event.id = Hashing::random_uuid();
      event.type = analytics::PAGEVIEW_EVENT_TYPE;
      event.url = MOCK_HOST + pick(paths, rng_);
      event.domain = domain_;
      event.referrer = coin(rng_) == 1 ? MOCK_HOST : pick(referrers, rng_);
      event.browser = browser;
      event.os = os;
      event.device = device;
      event.hashed_visit = fingerprint;
      event.timestamp = initial_time + std::chrono::minutes(time_shift);
      batch.push_back(std::move(event));

      time_shift += shift_dist(rng_);
    }
  }
  return batch;
}

bool MockDataGenerator::sleep_unless_shutdown(
    std::chrono::milliseconds duration, const std::atomic<bool> &shutdown_flag) {
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (std::chrono::steady_clock::now() < deadline) {
    if (shutdown_flag)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return !shutdown_flag;
}

void MockDataGenerator::run(const std::atomic<bool> &shutdown_flag) {
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Mock data generator started for " << domain_);
  std::uniform_int_distribution<int> event_pause_s(0, 14);
  std::uniform_int_distribution<int> batch_pause_min(0, 4);

  auto initial_time = std::chrono::system_clock::now();
  while (!shutdown_flag) {
    for (const auto &event : generate_batch(initial_time)) {
      if (!sleep_unless_shutdown(std::chrono::seconds(event_pause_s(rng_)),
                                 shutdown_flag))
        return;
      try {
        store_->insert(event);
      } catch (const std::exception &e) {
        LOG(LogLevel::ERROR, LogComponent::CORE,
            "Failed to mock the data: " << e.what());
        return;
      }
    }
    initial_time += std::chrono::hours(3) + std::chrono::minutes(20);
    LOG(LogLevel::INFO, LogComponent::CORE, "Data is mocked");

    if (!sleep_unless_shutdown(std::chrono::minutes(batch_pause_min(rng_)),
                               shutdown_flag))
      return;
  }
}
