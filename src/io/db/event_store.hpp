#ifndef EVENT_STORE_HPP
#define EVENT_STORE_HPP

#include "core/event.hpp"

#include <string>

class IEventStore {
public:
  virtual ~IEventStore() = default;

  // Returns every event recorded for `domain`, in no particular order.
  // Throws analytics::StoreReadError when the backend can't be read.
  virtual analytics::Events list(const std::string &domain) const = 0;

  // Inserts the event, replacing any stored event with the same id.
  // Throws analytics::StoreWriteError on failure.
  virtual void insert(const analytics::Event &event) = 0;
};

#endif // EVENT_STORE_HPP
