#ifndef MONGO_MANAGER_HPP
#define MONGO_MANAGER_HPP

#include "core/config.hpp"

#include <memory>
#include <mongocxx/client.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>
#include <string>
#include <utility>

// Owns the connection pool for the events collection named in [Store].
class MongoManager {
public:
  // Throws analytics::StoreUnavailableError if the uri can't be used.
  explicit MongoManager(const Config::StoreConfig &config);

  // Runs fn on the events collection while a pooled client is held.
  template <typename Fn> auto with_events_collection(Fn &&fn) {
    auto client = acquire();
    mongocxx::collection collection = (*client)[database_][collection_];
    return std::forward<Fn>(fn)(collection);
  }

  bool ping();
  // Index backing the per-domain listing. Returns false if it can't be built.
  bool ensure_indexes();

  const std::string &database() const { return database_; }
  const std::string &collection() const { return collection_; }

private:
  mongocxx::pool::entry acquire();

  static mongocxx::instance instance_;
  std::unique_ptr<mongocxx::pool> pool_;
  std::string database_;
  std::string collection_;
};

#endif // MONGO_MANAGER_HPP
