#include "session_tracker.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace analytics {

Session
SessionTracker::open_session(const std::string &page,
                             std::chrono::system_clock::time_point timestamp) {
  Session session;
  session.entry_page = page;
  session.exit_page = page;
  session.pages_visited = 1;
  session.last_pageview = timestamp;
  return session;
}

void SessionTracker::record(const std::string &fingerprint,
                            const std::string &page,
                            std::chrono::system_clock::time_point timestamp) {
  auto it = sessions_.find(fingerprint);
  if (it == sessions_.end()) {
    sessions_.emplace(fingerprint,
                      std::vector<Session>{open_session(page, timestamp)});
    return;
  }

  Session &last = it->second.back();
  if (timestamp - last.last_pageview > SESSION_TIMEOUT) {
    LOG(LogLevel::TRACE, LogComponent::ANALYTICS_SESSION,
        "Visit " << fingerprint << " idle past timeout, opening session #"
                 << it->second.size() + 1 << " at " << page);
    it->second.push_back(open_session(page, timestamp));
    return;
  }

  last.exit_page = page;
  last.pages_visited++;
  last.last_pageview = std::max(last.last_pageview, timestamp);
}

size_t SessionTracker::session_count() const {
  size_t total = 0;
  for (const auto &entry : sessions_)
    total += entry.second.size();
  return total;
}

} // namespace analytics
