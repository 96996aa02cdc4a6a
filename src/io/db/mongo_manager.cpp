#include "mongo_manager.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <exception>
#include <memory>

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

mongocxx::instance MongoManager::instance_{};

MongoManager::MongoManager(const Config::StoreConfig &config)
    : database_(config.database), collection_(config.collection) {
  try {
    mongocxx::uri mongo_uri(config.uri);
    pool_ = std::make_unique<mongocxx::pool>(mongo_uri);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::STORE,
        "Could not open MongoDB pool for " << config.uri << ": " << e.what());
    throw analytics::StoreUnavailableError(
        std::string("cannot create MongoDB pool: ") + e.what());
  }
  LOG(LogLevel::INFO, LogComponent::STORE,
      "MongoDB pool ready for " << database_ << "." << collection_);
}

mongocxx::pool::entry MongoManager::acquire() {
  try {
    return pool_->acquire();
  } catch (const std::exception &e) {
    throw analytics::StoreUnavailableError(
        std::string("no MongoDB client available: ") + e.what());
  }
}

bool MongoManager::ping() {
  try {
    auto client = acquire();
    (*client)[database_].run_command(make_document(kvp("ping", 1)));
    LOG(LogLevel::TRACE, LogComponent::STORE,
        "MongoDB answered ping on " << database_);
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::STORE,
        "MongoDB ping on " << database_ << " failed: " << e.what());
    return false;
  }
}

bool MongoManager::ensure_indexes() {
  try {
    with_events_collection([](mongocxx::collection &events) {
      events.create_index(make_document(kvp("domain", 1), kvp("timestamp", 1)));
    });
    LOG(LogLevel::DEBUG, LogComponent::STORE,
        "Index {domain, timestamp} present on " << database_ << "."
                                                << collection_);
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::STORE,
        "Could not create index on " << database_ << "." << collection_
                                     << ": " << e.what());
    return false;
  }
}
