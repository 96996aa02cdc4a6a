#ifndef MONGO_EVENT_STORE_HPP
#define MONGO_EVENT_STORE_HPP

#include "event_store.hpp"

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>
#include <memory>
#include <string>

class MongoManager;

// Stores one document per event, keyed by the event id.
class MongoEventStore : public IEventStore {
public:
  explicit MongoEventStore(std::shared_ptr<MongoManager> manager);

  analytics::Events list(const std::string &domain) const override;
  void insert(const analytics::Event &event) override;

  static bsoncxx::document::value event_to_bson(const analytics::Event &event);
  static analytics::Event bson_to_event(const bsoncxx::document::view &doc);

private:
  std::shared_ptr<MongoManager> mongo_manager_;
};

#endif // MONGO_EVENT_STORE_HPP
