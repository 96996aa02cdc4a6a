#include "in_memory_event_store.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <mutex>

analytics::Events InMemoryEventStore::list(const std::string &domain) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  analytics::Events result;
  auto it = domain_index_.find(domain);
  if (it == domain_index_.end())
    return result;

  result.reserve(it->second.size());
  for (const auto &id : it->second) {
    auto event_it = events_.find(id);
    if (event_it == events_.end())
      throw analytics::StoreReadError("index references missing event " +
                                      id);
    result.push_back(event_it->second);
  }
  return result;
}

void InMemoryEventStore::insert(const analytics::Event &event) {
  if (event.id.empty())
    throw analytics::StoreWriteError("event id is empty");

  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto existing = events_.find(event.id);
  if (existing != events_.end() && existing->second.domain != event.domain) {
    auto old_index = domain_index_.find(existing->second.domain);
    if (old_index != domain_index_.end()) {
      old_index->second.erase(event.id);
      if (old_index->second.empty())
        domain_index_.erase(old_index);
    }
  }

  events_[event.id] = event;
  domain_index_[event.domain].insert(event.id);

  LOG(LogLevel::DEBUG, LogComponent::STORE,
      "insert " << event.id << " for " << event.domain);
}

size_t InMemoryEventStore::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return events_.size();
}
