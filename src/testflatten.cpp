#include <string>
#include <gtest/gtest.h>
#include <algo/node_map.hpp>
#include <core/error.hpp>
#include <core/identifier_issuer.hpp>
#include <processor.hpp>

using std::string;
using namespace ldmill;

namespace {

  auto flatten(string const& input) -> Json {
    return Processor().flatten(Json::parse(input));
  }

}

TEST(Flatten, EmbeddedNodesBecomeTopLevel) {
  auto const flattened = flatten(R"({
    "@context": {"@vocab": "http://ex/"},
    "@id": "http://ex/a",
    "knows": {"name": "Bob", "knows": {"@id": "http://ex/c"}}
  })");
  auto const expected = Json::parse(R"([
    {"@id": "_:b0", "http://ex/knows": [{"@id": "http://ex/c"}], "http://ex/name": [{"@value": "Bob"}]},
    {"@id": "http://ex/a", "http://ex/knows": [{"@id": "_:b0"}]}
  ])");
  EXPECT_EQ(flattened, expected);
}

TEST(Flatten, RelabelsBlankNodesInOrderOfAppearance) {
  auto const flattened = flatten(R"({
    "@context": {"@vocab": "http://ex/"},
    "@graph": [
      {"@id": "_:y", "p": {"@id": "_:x"}},
      {"@id": "_:x", "p": "v"}
    ]
  })");
  auto const expected = Json::parse(R"([
    {"@id": "_:b0", "http://ex/p": [{"@id": "_:b1"}]},
    {"@id": "_:b1", "http://ex/p": [{"@value": "v"}]}
  ])");
  EXPECT_EQ(flattened, expected);
}

TEST(Flatten, MergesNodeDefinitions) {
  auto const flattened = flatten(R"({
    "@context": {"@vocab": "http://ex/"},
    "@graph": [
      {"@id": "http://ex/a", "p": 1, "@type": "T"},
      {"@id": "http://ex/a", "p": [2, 1], "@type": ["T", "U"]}
    ]
  })");
  auto const expected = Json::parse(R"([{
    "@id": "http://ex/a",
    "@type": ["http://ex/T", "http://ex/U"],
    "http://ex/p": [{"@value": 1}, {"@value": 2}]
  }])");
  EXPECT_EQ(flattened, expected);
}

TEST(Flatten, NamedGraphs) {
  auto const flattened = flatten(R"({
    "@context": {"@vocab": "http://ex/"},
    "@id": "http://ex/g",
    "label": "G",
    "@graph": [{"@id": "http://ex/b", "p": {"@id": "http://ex/a", "q": 1}}]
  })");
  auto const expected = Json::parse(R"([{
    "@id": "http://ex/g",
    "@graph": [
      {"@id": "http://ex/a", "http://ex/q": [{"@value": 1}]},
      {"@id": "http://ex/b", "http://ex/p": [{"@id": "http://ex/a"}]}
    ],
    "http://ex/label": [{"@value": "G"}]
  }])");
  EXPECT_EQ(flattened, expected);
}

TEST(Flatten, KeepsListsInPlace) {
  auto const flattened = flatten(R"({
    "@context": {"@vocab": "http://ex/", "l": {"@container": "@list"}},
    "@id": "http://ex/a",
    "l": [{"@id": "http://ex/b", "p": 1}, 2]
  })");
  auto const expected = Json::parse(R"([
    {"@id": "http://ex/a", "http://ex/l": [{"@list": [{"@id": "http://ex/b"}, {"@value": 2}]}]},
    {"@id": "http://ex/b", "http://ex/p": [{"@value": 1}]}
  ])");
  EXPECT_EQ(flattened, expected);
}

TEST(Flatten, ReversePropertiesPointBack) {
  auto const flattened = flatten(R"({
    "@id": "http://ex/a",
    "@reverse": {"http://ex/knows": {"@id": "http://ex/b"}}
  })");
  EXPECT_EQ(flattened, Json::parse(R"([{"@id": "http://ex/b", "http://ex/knows": [{"@id": "http://ex/a"}]}])"));
}

TEST(Flatten, ConflictingIndexes) {
  try {
    flatten(R"({"@graph": [
      {"@id": "http://ex/a", "@index": "1", "http://ex/p": 1},
      {"@id": "http://ex/a", "@index": "2", "http://ex/p": 2}
    ]})");
    FAIL() << "expected an error";
  } catch (core::JsonLdError& e) {
    EXPECT_EQ(e.code, core::ErrorCode::conflictingIndexes);
  }
}

TEST(Flatten, CompactsAgainstContext) {
  auto const flattened = Processor().flatten(
    Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "@id": "http://ex/a", "p": 1})"), Json{{"@vocab", "http://ex/"}}
  );
  EXPECT_EQ(
    flattened, Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "@graph": [{"@id": "http://ex/a", "p": 1}]})")
  );
}

TEST(NodeMap, MergesGraphs) {
  auto const expanded = Processor().expand(Json::parse(R"({
    "@context": {"@vocab": "http://ex/"},
    "@graph": [
      {"@id": "http://ex/a", "p": 1},
      {"@id": "http://ex/g", "@graph": {"@id": "http://ex/a", "q": 2}}
    ]
  })"));
  auto issuer = core::IdentifierIssuer("_:b");
  auto const graphs = algo::createNodeMap(expanded, issuer);
  EXPECT_TRUE(graphs.contains("@default"));
  EXPECT_TRUE(graphs.contains("http://ex/g"));
  EXPECT_EQ(graphs["http://ex/g"]["http://ex/a"]["http://ex/q"], Json::parse(R"([{"@value": 2}])"));
  EXPECT_FALSE(graphs["@default"]["http://ex/a"].contains("http://ex/q"));

  auto const merged = algo::mergeNodeMaps(graphs);
  EXPECT_EQ(
    merged["http://ex/a"],
    Json::parse(R"({"@id": "http://ex/a", "http://ex/p": [{"@value": 1}], "http://ex/q": [{"@value": 2}]})")
  );
}
