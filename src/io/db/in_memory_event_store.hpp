#ifndef IN_MEMORY_EVENT_STORE_HPP
#define IN_MEMORY_EVENT_STORE_HPP

#include "event_store.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

class InMemoryEventStore : public IEventStore {
public:
  InMemoryEventStore() = default;

  analytics::Events list(const std::string &domain) const override;
  void insert(const analytics::Event &event) override;

  size_t size() const;

private:
  // id -> event
  std::unordered_map<std::string, analytics::Event> events_;
  // domain -> ids of its events
  std::unordered_map<std::string, std::unordered_set<std::string>> domain_index_;
  mutable std::shared_mutex mutex_;
};

#endif // IN_MEMORY_EVENT_STORE_HPP
