#include "daily_salt.hpp"
#include "core/logger.hpp"
#include "utils/hashing.hpp"

DailySalt &DailySalt::global() {
  static DailySalt instance;
  return instance;
}

std::string DailySalt::current(std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (salt_.empty() || now - created_at_ > LIFETIME) {
    auto bytes = Hashing::random_bytes(BYTES);
    salt_.assign(bytes.begin(), bytes.end());
    created_at_ = now;
    LOG(LogLevel::INFO, LogComponent::INGEST, "Generated a new daily salt");
  }
  return salt_;
}
