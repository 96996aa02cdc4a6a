#ifndef URL_NORMALIZER_HPP
#define URL_NORMALIZER_HPP

#include <string>
#include <string_view>

namespace analytics {

struct HostAndPath {
  std::string host;
  std::string path;
};

// Splits `[http[s]://]host[/path]` into host and path. Path defaults to "/".
// Throws MalformedUrlError when no host can be extracted.
HostAndPath extract_domain_and_path(std::string_view url);

// Strips a trailing ".html" so "/page.html" and "/page" count as one page.
std::string canonical_page_path(std::string_view path);

// Short source label for a referrer host: the last two labels, so
// "news.ycombinator.com" becomes "ycombinator.com". Single-label hosts are
// returned unchanged.
std::string source_label(std::string_view referrer_host);

} // namespace analytics

#endif // URL_NORMALIZER_HPP
