#ifndef EVENT_HPP
#define EVENT_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace analytics {

constexpr const char *PAGEVIEW_EVENT_TYPE = "pageview";

namespace device {
struct Desktop {};
struct Mobile {};
struct Tablet {};
struct Bot {};
struct Unknown {};
} // namespace device

// Exactly one device class per event, Unknown when the user agent gave none.
using DeviceClass = std::variant<device::Unknown, device::Desktop,
                                 device::Mobile, device::Tablet, device::Bot>;

// Label used both as the `device_rate` bucket and as the wire value.
std::string device_label(const DeviceClass &device);
std::optional<DeviceClass> device_from_label(std::string_view label);

struct Event {
  std::string id;
  std::string type;
  std::string url;
  std::string domain;
  std::string referrer;
  std::string browser;
  std::string os;
  DeviceClass device;
  std::string hashed_visit;
  std::map<std::string, std::string> meta;
  std::map<std::string, std::string> props;
  std::chrono::system_clock::time_point timestamp;

  bool is_pageview() const { return type == PAGEVIEW_EVENT_TYPE; }
};

using Events = std::vector<Event>;

} // namespace analytics

#endif // EVENT_HPP
