#include "mongo_event_store.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "io/db/mongo_manager.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/options/replace.hpp>

#include <chrono>
#include <exception>
#include <map>
#include <string>
#include <string_view>
#include <utility>

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using bsoncxx::builder::basic::sub_document;

namespace {

std::string get_string(const bsoncxx::document::view &doc, const char *key) {
  auto element = doc[key];
  if (element && element.type() == bsoncxx::type::k_string)
    return std::string(element.get_string().value);
  return "";
}

std::map<std::string, std::string>
get_string_map(const bsoncxx::document::view &doc, const char *key) {
  std::map<std::string, std::string> result;
  auto element = doc[key];
  if (!element || element.type() != bsoncxx::type::k_document)
    return result;

  for (const auto &entry : element.get_document().value) {
    if (entry.type() == bsoncxx::type::k_string)
      result.emplace(std::string(entry.key()),
                     std::string(entry.get_string().value));
  }
  return result;
}

void append_string_map(sub_document &sub,
                       const std::map<std::string, std::string> &values) {
  for (const auto &[key, value] : values)
    sub.append(kvp(key, value));
}

} // namespace

MongoEventStore::MongoEventStore(std::shared_ptr<MongoManager> manager)
    : mongo_manager_(std::move(manager)) {
  if (!mongo_manager_)
    throw analytics::StoreUnavailableError("MongoDB manager is not set");
}

bsoncxx::document::value
MongoEventStore::event_to_bson(const analytics::Event &event) {
  return make_document(
      kvp("_id", event.id), kvp("type", event.type), kvp("url", event.url),
      kvp("domain", event.domain), kvp("referrer", event.referrer),
      kvp("browser", event.browser), kvp("os", event.os),
      kvp("device", analytics::device_label(event.device)),
      kvp("hashed_visit", event.hashed_visit),
      kvp("meta",
          [&event](sub_document sub) { append_string_map(sub, event.meta); }),
      kvp("props",
          [&event](sub_document sub) { append_string_map(sub, event.props); }),
      kvp("timestamp", bsoncxx::types::b_date{event.timestamp}));
}

analytics::Event
MongoEventStore::bson_to_event(const bsoncxx::document::view &doc) {
  analytics::Event event;
  event.id = get_string(doc, "_id");
  event.type = get_string(doc, "type");
  event.url = get_string(doc, "url");
  event.domain = get_string(doc, "domain");
  event.referrer = get_string(doc, "referrer");
  event.browser = get_string(doc, "browser");
  event.os = get_string(doc, "os");
  event.device = analytics::device_from_label(get_string(doc, "device"))
                     .value_or(analytics::DeviceClass{});
  event.hashed_visit = get_string(doc, "hashed_visit");
  event.meta = get_string_map(doc, "meta");
  event.props = get_string_map(doc, "props");

  auto ts = doc["timestamp"];
  if (ts && ts.type() == bsoncxx::type::k_date)
    event.timestamp = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            ts.get_date().value));
  return event;
}

analytics::Events MongoEventStore::list(const std::string &domain) const {
  analytics::Events events;
  try {
    mongo_manager_->with_events_collection(
        [&](mongocxx::collection &collection) {
          auto cursor = collection.find(make_document(kvp("domain", domain)));
          for (const bsoncxx::document::view &doc : cursor)
            events.push_back(bson_to_event(doc));
        });
  } catch (const analytics::AnalyticsError &) {
    throw;
  } catch (const mongocxx::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::STORE,
        "MongoDB query for " << domain << " failed: " << e.what());
    throw analytics::StoreReadError("cannot list events for " + domain +
                                    ": " + e.what());
  }

  LOG(LogLevel::DEBUG, LogComponent::STORE,
      "Listed " << events.size() << " events for " << domain);
  return events;
}

void MongoEventStore::insert(const analytics::Event &event) {
  if (event.id.empty())
    throw analytics::StoreWriteError("event id is empty");

  try {
    mongo_manager_->with_events_collection(
        [&event](mongocxx::collection &collection) {
          mongocxx::options::replace options;
          options.upsert(true);
          collection.replace_one(make_document(kvp("_id", event.id)),
                                 event_to_bson(event).view(), options);
        });
  } catch (const analytics::AnalyticsError &) {
    throw;
  } catch (const mongocxx::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::STORE,
        "MongoDB insert of " << event.id << " failed: " << e.what());
    throw analytics::StoreWriteError("cannot insert event " + event.id + ": " +
                                     e.what());
  }

  LOG(LogLevel::DEBUG, LogComponent::STORE,
      "insert " << event.id << " for " << event.domain);
}
