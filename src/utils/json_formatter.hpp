#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/event.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace JsonFormatter {

// Fields a client may send when reporting an event.
struct EventRequest {
  std::string type;
  std::string url;
  std::string domain;
  std::string referrer;
  std::map<std::string, std::string> meta;
  std::map<std::string, std::string> props;
};

nlohmann::json event_to_json_object(const analytics::Event &event);
nlohmann::json events_to_json_array(const analytics::Events &events);

// Throws nlohmann::json::exception on a malformed document and
// std::invalid_argument on an unknown device label.
analytics::Event event_from_json_object(const nlohmann::json &j);

// Missing fields are left empty; wrong types throw nlohmann::json::exception.
EventRequest event_request_from_json(const nlohmann::json &j);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
