#ifndef UA_PARSER_HPP
#define UA_PARSER_HPP

#include "core/event.hpp"

#include <string>
#include <string_view>

namespace UAParser {

struct UserAgentInfo {
  std::string browser;
  std::string os;
  analytics::DeviceClass device;
};

// Token based classification. Unrecognised parts stay empty / Unknown.
UserAgentInfo parse(std::string_view ua);
} // namespace UAParser

#endif // UA_PARSER_HPP
