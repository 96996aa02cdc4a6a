#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace analytics {

class AnalyticsError : public std::runtime_error {
public:
  explicit AnalyticsError(const std::string &what) : std::runtime_error(what) {}
};

// A URL or referrer that can't be split into host and path. Aborts the whole
// aggregation pass.
class MalformedUrlError : public AnalyticsError {
public:
  explicit MalformedUrlError(const std::string &url)
      : AnalyticsError("unable to extract domain and path from the link: '" +
                       url + "'"),
        url_(url) {}

  const std::string &url() const { return url_; }

private:
  std::string url_;
};

class StoreUnavailableError : public AnalyticsError {
public:
  explicit StoreUnavailableError(const std::string &what)
      : AnalyticsError(what) {}
};

class StoreReadError : public AnalyticsError {
public:
  explicit StoreReadError(const std::string &what) : AnalyticsError(what) {}
};

class StoreWriteError : public AnalyticsError {
public:
  explicit StoreWriteError(const std::string &what) : AnalyticsError(what) {}
};

// Rejected ingestion request (missing domain, client address or user agent).
class InvalidEventError : public AnalyticsError {
public:
  explicit InvalidEventError(const std::string &what) : AnalyticsError(what) {}
};

} // namespace analytics

#endif // ERRORS_HPP
