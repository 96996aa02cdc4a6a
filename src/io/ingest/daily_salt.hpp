#ifndef DAILY_SALT_HPP
#define DAILY_SALT_HPP

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

// Random secret mixed into visitor fingerprints. Created on first use and
// replaced once it is older than its lifetime, so fingerprints can't be
// linked across rotation windows.
class DailySalt {
public:
  static constexpr std::chrono::hours LIFETIME{24};
  static constexpr size_t BYTES = 32;

  static DailySalt &global();

  DailySalt() = default;
  DailySalt(const DailySalt &) = delete;
  DailySalt &operator=(const DailySalt &) = delete;

  // Returns the salt valid at `now`, rotating it first if it expired.
  std::string current(std::chrono::system_clock::time_point now);

private:
  std::string salt_;
  std::chrono::system_clock::time_point created_at_;
  std::mutex mutex_;
};

#endif // DAILY_SALT_HPP
