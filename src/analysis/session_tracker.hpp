#ifndef SESSION_TRACKER_HPP
#define SESSION_TRACKER_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace analytics {

// Inactivity gap after which the next page view opens a new visit.
constexpr std::chrono::minutes SESSION_TIMEOUT{30};

struct Session {
  std::string entry_page;
  std::string exit_page;
  uint32_t pages_visited = 0;
  std::chrono::system_clock::time_point last_pageview;

  bool is_bounce() const { return pages_visited == 1; }
};

/**
 * Folds time-ordered page views into per-fingerprint visits. Only the most
 * recent session of a fingerprint is ever extended; earlier ones are closed.
 * Feeding events out of timestamp order makes the timeout decision
 * meaningless, so callers sort first.
 */
class SessionTracker {
public:
  using SessionMap = std::unordered_map<std::string, std::vector<Session>>;

  void record(const std::string &fingerprint, const std::string &page,
              std::chrono::system_clock::time_point timestamp);

  const SessionMap &sessions() const { return sessions_; }

  size_t visitor_count() const { return sessions_.size(); }
  size_t session_count() const;

private:
  static Session open_session(const std::string &page,
                              std::chrono::system_clock::time_point timestamp);

  SessionMap sessions_;
};

} // namespace analytics

#endif // SESSION_TRACKER_HPP
