#include "event.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace analytics {

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

std::string device_label(const DeviceClass &device) {
  return std::visit(overloaded{[](const device::Desktop &) { return "Desktop"; },
                               [](const device::Mobile &) { return "Mobile"; },
                               [](const device::Tablet &) { return "Tablet"; },
                               [](const device::Bot &) { return "Bot"; },
                               [](const device::Unknown &) { return "Unknown"; }},
                    device);
}

std::optional<DeviceClass> device_from_label(std::string_view label) {
  std::string lowered(label);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "desktop")
    return DeviceClass{device::Desktop{}};
  if (lowered == "mobile")
    return DeviceClass{device::Mobile{}};
  if (lowered == "tablet")
    return DeviceClass{device::Tablet{}};
  if (lowered == "bot")
    return DeviceClass{device::Bot{}};
  if (lowered == "unknown" || lowered.empty())
    return DeviceClass{device::Unknown{}};
  return std::nullopt;
}

} // namespace analytics
