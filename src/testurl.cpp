#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <core/url.hpp>

using std::string;
using namespace ldmill::core;

// See: https://www.rfc-editor.org/rfc/rfc3986#section-5.4
TEST(Url, ResolveReferenceExamples) {
  auto const base = string("http://a/b/c/d;p?q");
  auto const cases = std::vector<std::pair<string, string>>{
    {"g:h", "g:h"},
    {"g", "http://a/b/c/g"},
    {"./g", "http://a/b/c/g"},
    {"g/", "http://a/b/c/g/"},
    {"/g", "http://a/g"},
    {"//g", "http://g"},
    {"?y", "http://a/b/c/d;p?y"},
    {"g?y", "http://a/b/c/g?y"},
    {"#s", "http://a/b/c/d;p?q#s"},
    {"g#s", "http://a/b/c/g#s"},
    {";x", "http://a/b/c/;x"},
    {"", "http://a/b/c/d;p?q"},
    {".", "http://a/b/c/"},
    {"./", "http://a/b/c/"},
    {"..", "http://a/b/"},
    {"../g", "http://a/b/g"},
    {"../..", "http://a/"},
    {"../../g", "http://a/g"},
    {"../../../g", "http://a/g"},
    {"/./g", "http://a/g"},
    {"/../g", "http://a/g"},
    {"g.", "http://a/b/c/g."},
    {"..g", "http://a/b/c/..g"},
    {"./g/.", "http://a/b/c/g/"},
    {"g;x=1/../y", "http://a/b/c/y"},
  };
  for (auto const& [ref, expected]: cases) EXPECT_EQ(resolve(base, ref), expected) << ref;
}

TEST(Url, ResolveWithoutBase) {
  EXPECT_EQ(resolve("", "relative/path"), "relative/path");
}

TEST(Url, RemoveDotSegments) {
  EXPECT_EQ(removeDotSegments("/a/b/c/./../../g"), "/a/g");
  EXPECT_EQ(removeDotSegments("mid/content=5/../6"), "mid/6");
}

TEST(Url, RemoveBase) {
  auto const base = string("http://a/b/c/d");
  EXPECT_EQ(removeBase(base, "http://a/b/c/e"), "e");
  EXPECT_EQ(removeBase(base, "http://a/b/x"), "../x");
  EXPECT_EQ(removeBase(base, "http://a/b/c/d#frag"), "#frag");
  EXPECT_EQ(removeBase(base, "http://other/b/c/e"), "http://other/b/c/e");
  EXPECT_EQ(removeBase("", "http://a/b"), "http://a/b");
}

TEST(Url, RemoveBaseInvertsResolve) {
  auto const base = string("http://example.com/docs/guide/intro");
  for (auto const* iri: {"http://example.com/docs/guide/setup", "http://example.com/docs/api", "http://example.com/",
                         "http://example.com/docs/guide/intro?x=1", "http://example.com/docs/guide/sub/page#top"})
    EXPECT_EQ(resolve(base, removeBase(base, iri)), iri) << iri;
}

TEST(Url, Classification) {
  EXPECT_TRUE(isAbsoluteIri("http://example.com/"));
  EXPECT_TRUE(isAbsoluteIri("urn:isbn:0451450523"));
  EXPECT_TRUE(isAbsoluteIri("_:b0"));
  EXPECT_FALSE(isAbsoluteIri("relative/path"));
  EXPECT_FALSE(isAbsoluteIri("#fragment"));
  EXPECT_FALSE(isAbsoluteIri("1abc:def"));
  EXPECT_FALSE(isAbsoluteIri(""));

  EXPECT_TRUE(isRelativeIri("relative/path"));
  EXPECT_FALSE(isRelativeIri("@id"));
  EXPECT_FALSE(isRelativeIri("http://example.com/"));

  EXPECT_TRUE(isBlankNodeId("_:x"));
  EXPECT_FALSE(isBlankNodeId("http://example.com/_:x"));
}

TEST(Url, ParseComponents) {
  auto const url = Url::parse("https://user@host:8080/p/a/t/h?query=1#frag");
  EXPECT_EQ(url.scheme, "https");
  EXPECT_EQ(url.authority, "user@host:8080");
  EXPECT_EQ(url.path, "/p/a/t/h");
  EXPECT_EQ(url.query, "query=1");
  EXPECT_EQ(url.fragment, "frag");
  EXPECT_EQ(url.toString(), "https://user@host:8080/p/a/t/h?query=1#frag");

  auto const empty = Url::parse("http://host?");
  EXPECT_EQ(empty.query, "");
  EXPECT_FALSE(empty.fragment.has_value());
}
