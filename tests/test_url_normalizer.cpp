#include "analysis/url_normalizer.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

using namespace analytics;

TEST(UrlNormalizerTest, SplitsSchemeHostAndPath) {
  auto parsed = extract_domain_and_path("https://example.com/foo/bar");
  EXPECT_EQ(parsed.host, "example.com");
  EXPECT_EQ(parsed.path, "/foo/bar");

  parsed = extract_domain_and_path("http://example.com/");
  EXPECT_EQ(parsed.host, "example.com");
  EXPECT_EQ(parsed.path, "/");
}

TEST(UrlNormalizerTest, SchemeIsOptional) {
  auto parsed = extract_domain_and_path("example.com/about");
  EXPECT_EQ(parsed.host, "example.com");
  EXPECT_EQ(parsed.path, "/about");
}

TEST(UrlNormalizerTest, MissingPathDefaultsToRoot) {
  EXPECT_EQ(extract_domain_and_path("https://example.com").path, "/");
  EXPECT_EQ(extract_domain_and_path("example.com").path, "/");
}

TEST(UrlNormalizerTest, QueryStaysPartOfPath) {
  auto parsed = extract_domain_and_path("https://example.com/search?q=1");
  EXPECT_EQ(parsed.path, "/search?q=1");
}

TEST(UrlNormalizerTest, HostlessInputIsMalformed) {
  EXPECT_THROW(extract_domain_and_path(""), MalformedUrlError);
  EXPECT_THROW(extract_domain_and_path("https://"), MalformedUrlError);
  EXPECT_THROW(extract_domain_and_path("/only/a/path"), MalformedUrlError);

  try {
    extract_domain_and_path("https:///x");
    FAIL() << "expected MalformedUrlError";
  } catch (const MalformedUrlError &e) {
    EXPECT_EQ(e.url(), "https:///x");
    EXPECT_NE(std::string(e.what()).find("https:///x"), std::string::npos);
  }
}

TEST(UrlNormalizerTest, HtmlSuffixIsStripped) {
  EXPECT_EQ(canonical_page_path("/page.html"), "/page");
  EXPECT_EQ(canonical_page_path("/dir/index.html"), "/dir/index");
  EXPECT_EQ(canonical_page_path("/page"), "/page");
  EXPECT_EQ(canonical_page_path("/page.htm"), "/page.htm");
  EXPECT_EQ(canonical_page_path("/"), "/");
}

TEST(UrlNormalizerTest, SourceLabelKeepsLastTwoLabels) {
  EXPECT_EQ(source_label("news.ycombinator.com"), "ycombinator.com");
  EXPECT_EQ(source_label("www.google.com"), "google.com");
  EXPECT_EQ(source_label("ua.linkedin.com"), "linkedin.com");
  EXPECT_EQ(source_label("yahoo.com"), "yahoo.com");
  EXPECT_EQ(source_label("localhost"), "localhost");
}
