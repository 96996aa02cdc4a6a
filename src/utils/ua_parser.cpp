#include "ua_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace UAParser {

namespace {

bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

bool contains_ci(std::string_view haystack, std::string_view needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                        needle.end(), [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                        });
  return it != haystack.end();
}

// Order matters: Chromium derivatives also carry "Chrome/" and "Safari/".
const std::array<std::pair<const char *, const char *>, 8> browser_tokens = {{
    {"Edg/", "Edge"},
    {"Edge/", "Edge"},
    {"OPR/", "Opera"},
    {"Opera", "Opera"},
    {"Chrome/", "Chrome"},
    {"CriOS/", "Chrome"},
    {"Firefox/", "Firefox"},
    {"FxiOS/", "Firefox"},
}};

const std::array<const char *, 8> bot_tokens = {
    "bot",     "crawler", "spider",     "slurp",
    "curl/",   "wget/",   "python-requests", "headlesschrome"};

std::string detect_browser(std::string_view ua) {
  for (const auto &[token, name] : browser_tokens) {
    if (contains(ua, token))
      return name;
  }
  if (contains(ua, "MSIE ") || contains(ua, "Trident/"))
    return "Internet Explorer";
  if (contains(ua, "Safari/") && contains(ua, "Version/"))
    return "Safari";
  return "";
}

std::string detect_os(std::string_view ua) {
  if (contains(ua, "Windows Phone"))
    return "Windows Phone";
  if (contains(ua, "Windows"))
    return "Windows";
  if (contains(ua, "Android"))
    return "Android";
  if (contains(ua, "iPhone") || contains(ua, "iPad") || contains(ua, "iPod"))
    return "iOS";
  if (contains(ua, "CrOS"))
    return "ChromeOS";
  if (contains(ua, "Mac OS X") || contains(ua, "Macintosh"))
    return "macOS";
  if (contains(ua, "FreeBSD"))
    return "FreeBSD";
  if (contains(ua, "Linux"))
    return "Linux";
  return "";
}

analytics::DeviceClass detect_device(std::string_view ua,
                                     const std::string &os) {
  for (const char *token : bot_tokens) {
    if (contains_ci(ua, token))
      return analytics::device::Bot{};
  }
  if (contains(ua, "iPad") || contains(ua, "Tablet") ||
      (os == "Android" && !contains(ua, "Mobile")))
    return analytics::device::Tablet{};
  if (contains(ua, "Mobile") || contains(ua, "iPhone") || os == "Windows Phone")
    return analytics::device::Mobile{};
  if (!os.empty())
    return analytics::device::Desktop{};
  return analytics::device::Unknown{};
}

} // namespace

UserAgentInfo parse(std::string_view ua) {
  UserAgentInfo info;
  info.browser = detect_browser(ua);
  info.os = detect_os(ua);
  info.device = detect_device(ua, info.os);
  return info;
}
} // namespace UAParser
