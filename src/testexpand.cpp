#include <memory>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include <algo/expand.hpp>
#include <core/context.hpp>
#include <core/document_loader.hpp>
#include <core/error.hpp>
#include <processor.hpp>

using std::string;
using namespace ldmill;
using core::ErrorCode;

namespace {

  auto expand(Json const& input, core::Options opts = {}) -> Json {
    return Processor(std::move(opts)).expand(input);
  }

  auto expandError(string const& input) -> std::optional<ErrorCode> {
    try {
      expand(Json::parse(input));
    } catch (core::JsonLdError& e) {
      return e.code;
    }
    return std::nullopt;
  }

}

TEST(Expand, Basic) {
  auto const input = Json::parse(R"({
    "@context": {
      "name": "http://xmlns.com/foaf/0.1/name",
      "homepage": {"@id": "http://xmlns.com/foaf/0.1/homepage", "@type": "@id"}
    },
    "@id": "http://me.markus-lanthaler.com/",
    "name": "Manu Sporny",
    "homepage": "http://manu.sporny.org/",
    "unmapped": "dropped"
  })");
  auto const expected = Json::parse(R"([{
    "@id": "http://me.markus-lanthaler.com/",
    "http://xmlns.com/foaf/0.1/homepage": [{"@id": "http://manu.sporny.org/"}],
    "http://xmlns.com/foaf/0.1/name": [{"@value": "Manu Sporny"}]
  }])");
  EXPECT_EQ(expand(input), expected);
}

TEST(Expand, TypedAndLanguageValues) {
  auto const input = Json::parse(R"({
    "@context": {
      "@vocab": "http://ex/",
      "@language": "EN",
      "age": {"@type": "http://www.w3.org/2001/XMLSchema#integer"},
      "nolang": {"@language": null},
      "data": {"@type": "@json"}
    },
    "label": "hi",
    "nolang": "plain",
    "age": "5",
    "n": 5,
    "data": {"b": [1, 2], "a": null},
    "@type": "Thing"
  })");
  auto const expected = Json::parse(R"([{
    "@type": ["http://ex/Thing"],
    "http://ex/label": [{"@value": "hi", "@language": "en"}],
    "http://ex/nolang": [{"@value": "plain"}],
    "http://ex/age": [{"@value": "5", "@type": "http://www.w3.org/2001/XMLSchema#integer"}],
    "http://ex/n": [{"@value": 5}],
    "http://ex/data": [{"@value": {"b": [1, 2], "a": null}, "@type": "@json"}]
  }])");
  EXPECT_EQ(expand(input), expected);
}

TEST(Expand, DropsFreeFloatingValues) {
  auto const input = Json::parse(R"({
    "@context": {"@vocab": "http://ex/"},
    "@graph": [
      {"@id": "http://ex/a", "p": 1},
      {"@value": "free"},
      {"@id": "http://ex/b"},
      {"@list": [1]},
      {}
    ]
  })");
  EXPECT_EQ(expand(input), Json::parse(R"([{"@id": "http://ex/a", "http://ex/p": [{"@value": 1}]}])"));
  EXPECT_EQ(expand(Json::parse(R"({"@id": "http://ex/only"})")), Json::array());
  EXPECT_EQ(expand(Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "p": null})")), Json::array());
}

TEST(Expand, Lists) {
  auto const input = Json::parse(R"({
    "@context": {"@vocab": "http://ex/", "l": {"@container": "@list"}},
    "@id": "http://ex/s",
    "l": [1, "two"],
    "explicit": {"@list": []},
    "single": {"@list": 3}
  })");
  auto const expected = Json::parse(R"([{
    "@id": "http://ex/s",
    "http://ex/l": [{"@list": [{"@value": 1}, {"@value": "two"}]}],
    "http://ex/explicit": [{"@list": []}],
    "http://ex/single": [{"@list": [{"@value": 3}]}]
  }])");
  EXPECT_EQ(expand(input), expected);

  EXPECT_EQ(
    expandError(R"({"@context": {"l": {"@id": "http://ex/l", "@container": "@list"}}, "l": [1, [2]]})"), ErrorCode::listOfLists
  );
  EXPECT_EQ(expandError(R"({"http://ex/l": {"@list": [{"@list": [1]}]}})"), ErrorCode::listOfLists);
}

TEST(Expand, ReverseProperties) {
  auto const input = Json::parse(R"({
    "@context": {"knownBy": {"@reverse": "http://ex/knows"}},
    "@id": "http://ex/a",
    "knownBy": [{"@id": "http://ex/b"}, {"@id": "http://ex/c"}],
    "@reverse": {"http://ex/parent": {"@id": "http://ex/d"}}
  })");
  auto const expected = Json::parse(R"([{
    "@id": "http://ex/a",
    "@reverse": {
      "http://ex/knows": [{"@id": "http://ex/b"}, {"@id": "http://ex/c"}],
      "http://ex/parent": [{"@id": "http://ex/d"}]
    }
  }])");
  EXPECT_EQ(expand(input), expected);

  EXPECT_EQ(
    expandError(R"({"@context": {"knownBy": {"@reverse": "http://ex/knows"}}, "@id": "http://ex/a", "knownBy": "literal"})"),
    ErrorCode::invalidReversePropertyValue
  );
}

TEST(Expand, ContainerMaps) {
  auto const input = Json::parse(R"({
    "@context": {
      "@vocab": "http://ex/",
      "label": {"@container": "@language"},
      "post": {"@container": "@index"},
      "byId": {"@container": "@id"},
      "byType": {"@container": "@type"}
    },
    "@id": "http://ex/s",
    "label": {"en": "Hi", "DE": ["Hallo"], "@none": "?"},
    "post": {"one": {"@id": "http://ex/p1"}, "two": "text"},
    "byId": {"http://ex/n1": {"p": 1}},
    "byType": {"T": {"@id": "http://ex/t1"}}
  })");
  auto const expected = Json::parse(R"([{
    "@id": "http://ex/s",
    "http://ex/label": [{"@value": "?"}, {"@value": "Hallo", "@language": "de"}, {"@value": "Hi", "@language": "en"}],
    "http://ex/post": [{"@id": "http://ex/p1", "@index": "one"}, {"@value": "text", "@index": "two"}],
    "http://ex/byId": [{"@id": "http://ex/n1", "http://ex/p": [{"@value": 1}]}],
    "http://ex/byType": [{"@id": "http://ex/t1", "@type": ["http://ex/T"]}]
  }])");
  EXPECT_EQ(expand(input), expected);
}

TEST(Expand, ScopedContexts) {
  auto const input = Json::parse(R"({
    "@context": {
      "@vocab": "http://ex/",
      "Person": {"@context": {"name": "http://schema.org/name"}},
      "address": {"@context": {"@vocab": "http://address/"}}
    },
    "@type": "Person",
    "name": "Bob",
    "address": {"street": "Main"}
  })");
  auto const expected = Json::parse(R"([{
    "@type": ["http://ex/Person"],
    "http://schema.org/name": [{"@value": "Bob"}],
    "http://ex/address": [{"http://address/street": [{"@value": "Main"}]}]
  }])");
  EXPECT_EQ(expand(input), expected);
}

TEST(Expand, IsIdempotent) {
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
    "l": [{"@id": "x"}, 2],
    "label": {"fr": "Salut"},
    "knownBy": {"@id": "other"},
    "ref": "relative",
    "nested": {"@graph": {"@id": "g1", "p": true}}
  })");
  auto const once = expand(input);
  EXPECT_EQ(expand(once), once);
  EXPECT_EQ(once[0]["@id"], "http://base/doc");
  EXPECT_EQ(once[0]["http://ex/ref"], Json::parse(R"([{"@id": "http://base/relative"}])"));
}

TEST(Expand, ExpandContextOption) {
  auto opts = core::Options();
  opts.expandContext = Json::parse(R"({"@context": {"@vocab": "http://ex/"}})");
  EXPECT_EQ(expand(Json::parse(R"({"p": 1})"), opts), Json::parse(R"([{"http://ex/p": [{"@value": 1}]}])"));
}

TEST(Expand, LoadsRemoteDocuments) {
  auto loader = std::make_shared<core::CachingDocumentLoader>();
  loader->addDocument("http://ex/dir/doc", Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "@id": "rel", "p": "v"})"));
  auto opts = core::Options();
  opts.documentLoader = loader;

  EXPECT_EQ(
    expand(Json("http://ex/dir/doc"), opts), Json::parse(R"([{"@id": "http://ex/dir/rel", "http://ex/p": [{"@value": "v"}]}])")
  );

  try {
    expand(Json("http://ex/dir/doc"));
    FAIL() << "expected a loading error";
  } catch (core::JsonLdError& e) {
    EXPECT_EQ(e.code, ErrorCode::loadingDocumentFailed);
  }
}

TEST(Expand, Errors) {
  EXPECT_EQ(expandError(R"({"@id": 5})"), ErrorCode::invalidIdValue);
  EXPECT_EQ(expandError(R"({"@type": 5})"), ErrorCode::invalidTypeValue);
  EXPECT_EQ(expandError(R"({"http://ex/p": {"@value": "x", "@id": "http://ex/y"}})"), ErrorCode::invalidValueObject);
  EXPECT_EQ(
    expandError(R"({"http://ex/p": {"@value": "x", "@type": "http://ex/T", "@language": "en"}})"), ErrorCode::invalidValueObject
  );
  EXPECT_EQ(expandError(R"({"http://ex/p": {"@value": {"a": 1}}})"), ErrorCode::invalidValueObjectValue);
  EXPECT_EQ(expandError(R"({"http://ex/p": {"@value": 5, "@language": "en"}})"), ErrorCode::invalidLanguageTaggedValue);
  EXPECT_EQ(expandError(R"({"http://ex/p": {"@value": "x", "@language": 5}})"), ErrorCode::invalidLanguageTaggedString);
  EXPECT_EQ(expandError(R"({"http://ex/p": {"@value": "x", "@type": "relative"}})"), ErrorCode::invalidTypedValue);
  EXPECT_EQ(expandError(R"({"http://ex/p": {"@list": [1], "@id": "http://ex/x"}})"), ErrorCode::invalidSetOrListObject);
  EXPECT_EQ(expandError(R"({"@reverse": 5})"), ErrorCode::invalidReverseValue);
  EXPECT_EQ(expandError(R"({"@context": {"id": "@id"}, "@id": "http://ex/a", "id": "http://ex/b"})"), ErrorCode::collidingKeywords);
}

TEST(Expand, FrameExpansionKeepsNodeReferences) {
  auto const ctx = core::Context(std::make_shared<core::Options const>());
  auto const ref = Json::parse(R"({"@id": "http://ex/a"})");
  EXPECT_EQ(algo::expand(ctx, ref, "", true), Json::parse(R"([{"@id": "http://ex/a"}])"));
  EXPECT_EQ(algo::expand(ctx, ref, "", false), Json::array());

  EXPECT_EQ(algo::expand(ctx, Json::object(), "", true), Json::array());
  EXPECT_EQ(algo::expand(ctx, Json::parse(R"({"@value": "x"})"), "", true), Json::array());
  EXPECT_EQ(algo::expand(ctx, Json::parse(R"({"@list": [1]})"), "", true), Json::array());
}
