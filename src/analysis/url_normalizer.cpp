#include "url_normalizer.hpp"
#include "core/errors.hpp"
#include "utils/utils.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace analytics {

namespace {
constexpr std::string_view HTML_SUFFIX = ".html";

std::string_view strip_scheme(std::string_view url) {
  for (std::string_view scheme : {"https://", "http://"}) {
    if (url.substr(0, scheme.size()) == scheme)
      return url.substr(scheme.size());
  }
  return url;
}
} // namespace

HostAndPath extract_domain_and_path(std::string_view url) {
  std::string_view rest = strip_scheme(url);

  size_t slash = rest.find('/');
  std::string_view host = rest.substr(0, slash);
  if (host.empty())
    throw MalformedUrlError(std::string(url));

  HostAndPath result;
  result.host = std::string(host);
  result.path = slash == std::string_view::npos
                    ? std::string("/")
                    : std::string(rest.substr(slash));
  return result;
}

std::string canonical_page_path(std::string_view path) {
  if (Utils::ends_with(path, HTML_SUFFIX))
    path.remove_suffix(HTML_SUFFIX.size());
  return std::string(path);
}

std::string source_label(std::string_view referrer_host) {
  std::vector<std::string_view> labels =
      Utils::split_string_view(referrer_host, '.');
  if (labels.size() < 2)
    return std::string(referrer_host);

  const auto &second_level = labels[labels.size() - 2];
  const auto &top_level = labels.back();
  std::string label;
  label.reserve(second_level.size() + top_level.size() + 1);
  label.append(second_level).append(".").append(top_level);
  return label;
}

} // namespace analytics
