#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <core/document_loader.hpp>
#include <core/error.hpp>
#include <processor.hpp>

using std::string;
using namespace ldmill;
using core::ErrorCode;

namespace {

  auto compact(Json const& input, Json const& context, core::Options opts = {}) -> Json {
    return Processor(std::move(opts)).compact(input, context);
  }

  // Serves one context document and counts how often it is fetched.
  class CountingLoader: public core::DocumentLoader {
  public:
    size_t loads = 0;

    auto load(string const& url) -> core::RemoteDocument override {
      if (url != "http://ex/context")
        throw core::JsonLdError(ErrorCode::loadingDocumentFailed, url);
      loads++;
      return {.documentUrl = url, .document = Json::parse(R"({"@context": {"name": "http://ex/name"}})")};
    }
  };

}

TEST(Compact, Basic) {
  auto const expanded = Json::parse(R"([{
    "@id": "http://me.markus-lanthaler.com/",
    "http://xmlns.com/foaf/0.1/homepage": [{"@id": "http://manu.sporny.org/"}],
    "http://xmlns.com/foaf/0.1/name": [{"@value": "Manu Sporny"}]
  }])");
  auto const context = Json::parse(R"({"@context": {
    "name": "http://xmlns.com/foaf/0.1/name",
    "homepage": {"@id": "http://xmlns.com/foaf/0.1/homepage", "@type": "@id"}
  }})");
  auto const expected = Json::parse(R"({
    "@context": {
      "name": "http://xmlns.com/foaf/0.1/name",
      "homepage": {"@id": "http://xmlns.com/foaf/0.1/homepage", "@type": "@id"}
    },
    "@id": "http://me.markus-lanthaler.com/",
    "homepage": "http://manu.sporny.org/",
    "name": "Manu Sporny"
  })");
  EXPECT_EQ(compact(expanded, context), expected);
}

TEST(Compact, PrefixesAndAliases) {
  auto const expanded = Json::parse(R"([{
    "@id": "http://ex/a",
    "@type": ["http://ex/T"],
    "http://ex/p": [{"@value": "v"}]
  }])");
  EXPECT_EQ(
    compact(expanded, Json{{"ex", "http://ex/"}}),
    Json::parse(R"({"@context": {"ex": "http://ex/"}, "@id": "ex:a", "@type": "ex:T", "ex:p": "v"})")
  );
  EXPECT_EQ(
    compact(expanded, Json::parse(R"({"@vocab": "http://ex/", "id": "@id", "type": "@type"})")),
    Json::parse(R"({
      "@context": {"@vocab": "http://ex/", "id": "@id", "type": "@type"},
      "id": "http://ex/a", "type": "T", "p": "v"
    })")
  );
}

TEST(Compact, EmptyResult) {
  EXPECT_EQ(compact(Json::array(), Json::object()), Json::object());
  EXPECT_EQ(compact(Json::array(), Json{{"ex", "http://ex/"}}), Json::parse(R"({"@context": {"ex": "http://ex/"}})"));
}

TEST(Compact, WrapsSeveralNodesInGraph) {
  auto const expanded = Json::parse(R"([
    {"@id": "http://ex/a", "http://ex/p": [{"@value": 1}]},
    {"@id": "http://ex/b", "http://ex/p": [{"@value": 2}]}
  ])");
  auto const expected = Json::parse(R"({
    "@context": {"@vocab": "http://ex/"},
    "@graph": [{"@id": "http://ex/a", "p": 1}, {"@id": "http://ex/b", "p": 2}]
  })");
  EXPECT_EQ(compact(expanded, Json{{"@vocab", "http://ex/"}}), expected);
}

TEST(Compact, CompactArraysOff) {
  auto opts = core::Options();
  opts.compactArrays = false;
  auto const expanded = Json::parse(R"([{"@id": "http://ex/a", "http://ex/name": [{"@value": "x"}]}])");
  EXPECT_EQ(
    compact(expanded, Json{{"@vocab", "http://ex/"}}, opts),
    Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "@graph": [{"@id": "http://ex/a", "name": ["x"]}]})")
  );
}

TEST(Compact, Containers) {
  auto const expanded = Json::parse(R"([{
    "@id": "http://ex/s",
    "http://ex/l": [{"@list": [{"@value": 1}, {"@value": 2}]}],
    "http://ex/label": [{"@value": "Hi", "@language": "en"}, {"@value": "Hallo", "@language": "de"}],
    "http://ex/tag": [{"@value": "a"}],
    "http://ex/post": [{"@id": "http://ex/p1", "@index": "one"}, {"@value": "text", "@index": "two"}],
    "http://ex/byId": [{"@id": "http://ex/n1", "http://ex/p": [{"@value": 1}]}]
  }])");
  auto const context = Json::parse(R"({
    "@vocab": "http://ex/",
    "l": {"@container": "@list"},
    "label": {"@container": "@language"},
    "tag": {"@container": "@set"},
    "post": {"@container": "@index"},
    "byId": {"@container": "@id"}
  })");
  auto compacted = compact(expanded, context);
  compacted.erase("@context");
  auto const expected = Json::parse(R"({
    "@id": "http://ex/s",
    "l": [1, 2],
    "label": {"en": "Hi", "de": "Hallo"},
    "tag": ["a"],
    "post": {"one": {"@id": "http://ex/p1"}, "two": "text"},
    "byId": {"http://ex/n1": {"p": 1}}
  })");
  EXPECT_EQ(compacted, expected);
}

TEST(Compact, ReverseProperties) {
  auto const expanded = Json::parse(R"([{
    "@id": "http://ex/a",
    "@reverse": {"http://ex/knows": [{"@id": "http://ex/b"}]}
  }])");
  auto compacted = compact(expanded, Json::parse(R"({"knownBy": {"@reverse": "http://ex/knows"}})"));
  compacted.erase("@context");
  EXPECT_EQ(compacted, Json::parse(R"({"@id": "http://ex/a", "knownBy": {"@id": "http://ex/b"}})"));
}

TEST(Compact, ListOfListsIsAnError) {
  auto const expanded = Json::parse(R"([{
    "http://ex/l": [{"@list": [{"@value": 1}]}, {"@list": [{"@value": 2}]}]
  }])");
  try {
    compact(expanded, Json::parse(R"({"l": {"@id": "http://ex/l", "@container": "@list"}})"));
    FAIL() << "expected an error";
  } catch (core::JsonLdError& e) {
    EXPECT_EQ(e.code, ErrorCode::compactionToListOfLists);
  }
}

TEST(Compact, NullContextIsAnError) {
  try {
    compact(Json::array(), nullptr);
    FAIL() << "expected an error";
  } catch (core::JsonLdError& e) {
    EXPECT_EQ(e.code, ErrorCode::invalidLocalContext);
  }
}

TEST(Compact, RoundTrip) {
  auto const input = Json::parse(R"({
    "@context": {
      "@vocab": "http://ex/",
      "@base": "http://base/",
      "l": {"@container": "@list"},
      "label": {"@container": "@language"},
      "knownBy": {"@reverse": "knows"},
      "ref": {"@type": "@id"}
    },
    "@id": "doc",
    "@type": "Thing",
    "l": [{"@id": "x"}, 2],
    "label": {"fr": "Salut"},
    "knownBy": {"@id": "other"},
    "ref": "relative",
    "nested": {"@graph": {"@id": "g1", "p": true}}
  })");
  auto const processor = Processor();
  auto const expanded = processor.expand(input);
  auto const compacted = processor.compact(input, Json{{"@context", input["@context"]}});
  EXPECT_EQ(processor.expand(compacted), expanded);
  EXPECT_EQ(compacted["@id"], "doc");
  EXPECT_EQ(compacted["ref"], "relative");
  EXPECT_EQ(compacted["l"], Json::parse(R"([{"@id": "x"}, 2])"));
}

TEST(Compact, RemoteContext) {
  auto loader = std::make_shared<core::CachingDocumentLoader>();
  loader->addDocument("http://ex/context", Json::parse(R"({"@context": {"name": "http://ex/name"}})"));
  auto opts = core::Options();
  opts.documentLoader = loader;

  auto const expanded = Json::parse(R"([{"@id": "http://ex/a", "http://ex/name": [{"@value": "x"}]}])");
  auto const compacted = compact(expanded, Json("http://ex/context"), opts);
  EXPECT_EQ(compacted["name"], "x");
}

TEST(Compact, FetchesSharedRemoteContextOncePerCall) {
  auto loader = std::make_shared<CountingLoader>();
  auto opts = core::Options();
  opts.documentLoader = loader;
  auto const processor = Processor(opts);

  auto const input = Json::parse(R"({"@context": "http://ex/context", "@id": "http://ex/a", "name": "x"})");
  auto const context = Json::parse(R"({"@context": "http://ex/context"})");
  auto const compacted = processor.compact(input, context);
  EXPECT_EQ(compacted["name"], "x");
  EXPECT_EQ(compacted["@context"], "http://ex/context");
  EXPECT_EQ(loader->loads, 1u);

  static_cast<void>(processor.compact(input, context));
  EXPECT_EQ(loader->loads, 2u);
}
