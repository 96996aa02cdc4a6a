#include "json_formatter.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace JsonFormatter {

namespace {
std::map<std::string, std::string> string_map_or_empty(const nlohmann::json &j,
                                                       const char *key) {
  if (!j.contains(key) || j.at(key).is_null())
    return {};
  return j.at(key).get<std::map<std::string, std::string>>();
}
} // namespace

nlohmann::json event_to_json_object(const analytics::Event &event) {
  nlohmann::json j;
  j["id"] = event.id;
  j["type"] = event.type;
  j["url"] = event.url;
  j["domain"] = event.domain;
  j["referrer"] = event.referrer;
  j["browser"] = event.browser;
  j["os"] = event.os;
  std::string device = analytics::device_label(event.device);
  std::transform(device.begin(), device.end(), device.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  j["device"] = device;
  j["hashed_visit"] = event.hashed_visit;
  j["meta"] = event.meta;
  j["props"] = event.props;
  j["timestamp"] = Utils::time_point_to_ms(event.timestamp);
  return j;
}

nlohmann::json events_to_json_array(const analytics::Events &events) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &event : events)
    j.push_back(event_to_json_object(event));
  return j;
}

analytics::Event event_from_json_object(const nlohmann::json &j) {
  analytics::Event event;
  event.id = j.value("id", "");
  event.type = j.value("type", "");
  event.url = j.value("url", "");
  event.domain = j.value("domain", "");
  event.referrer = j.value("referrer", "");
  event.browser = j.value("browser", "");
  event.os = j.value("os", "");

  std::string device = j.value("device", "");
  auto parsed_device = analytics::device_from_label(device);
  if (!parsed_device)
    throw std::invalid_argument("unknown device '" + device + "'");
  event.device = *parsed_device;

  event.hashed_visit = j.value("hashed_visit", "");
  event.meta = string_map_or_empty(j, "meta");
  event.props = string_map_or_empty(j, "props");
  event.timestamp =
      Utils::time_point_from_ms(j.value("timestamp", static_cast<int64_t>(0)));
  return event;
}

EventRequest event_request_from_json(const nlohmann::json &j) {
  EventRequest request;
  request.type = j.value("type", "");
  request.url = j.value("url", "");
  request.domain = j.value("domain", "");
  request.referrer = j.value("referrer", "");
  request.meta = string_map_or_empty(j, "meta");
  request.props = string_map_or_empty(j, "props");
  return request;
}

} // namespace JsonFormatter
