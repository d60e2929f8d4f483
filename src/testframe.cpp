#include <optional>
#include <string>
#include <gtest/gtest.h>
#include <algo/frame.hpp>
#include <core/error.hpp>
#include <processor.hpp>

using std::string;
using namespace ldmill;
using core::ErrorCode;

namespace {

  auto const library = Json::parse(R"({
    "@context": {"@vocab": "http://ex/", "contains": {"@type": "@id"}},
    "@graph": [
      {"@id": "http://ex/library", "@type": "Library", "contains": "http://ex/library/the-republic"},
      {
        "@id": "http://ex/library/the-republic",
        "@type": "Book",
        "creator": "Plato",
        "title": "The Republic",
        "contains": "http://ex/library/the-republic#introduction"
      },
      {
        "@id": "http://ex/library/the-republic#introduction",
        "@type": "Chapter",
        "description": "An introductory chapter on The Republic.",
        "title": "The Introduction"
      }
    ]
  })");

  auto const shared = Json::parse(R"({
    "@context": {"@vocab": "http://ex/"},
    "@graph": [
      {"@id": "http://ex/a", "p": {"@id": "http://ex/c"}, "q": {"@id": "http://ex/c"}},
      {"@id": "http://ex/c", "r": 1}
    ]
  })");

  auto frame(Json const& input, string const& frame, core::Options opts = {}) -> Json {
    return Processor(std::move(opts)).frame(input, Json::parse(frame));
  }

  auto frameError(Json const& input, Json const& frame) -> std::optional<ErrorCode> {
    try {
      Processor().frame(input, frame);
    } catch (core::JsonLdError& e) {
      return e.code;
    }
    return std::nullopt;
  }

}

TEST(Frame, EmbedsMatchingNodes) {
  auto const framed = frame(library, R"({
    "@context": {"@vocab": "http://ex/"},
    "@type": "Library",
    "contains": {"@type": "Book", "contains": {"@type": "Chapter"}}
  })");
  auto const expected = Json::parse(R"({
    "@context": {"@vocab": "http://ex/"},
    "@id": "http://ex/library",
    "@type": "Library",
    "contains": {
      "@id": "http://ex/library/the-republic",
      "@type": "Book",
      "contains": {
        "@id": "http://ex/library/the-republic#introduction",
        "@type": "Chapter",
        "description": "An introductory chapter on The Republic.",
        "title": "The Introduction"
      },
      "creator": "Plato",
      "title": "The Republic"
    }
  })");
  EXPECT_EQ(framed, expected);
}

TEST(Frame, OmitGraphOption) {
  auto opts = core::Options();
  opts.omitGraph = false;
  auto const framed = frame(library, R"({"@context": {"@vocab": "http://ex/"}, "@type": "Chapter"})", opts);
  ASSERT_TRUE(framed.contains("@graph"));
  ASSERT_EQ(framed["@graph"].size(), 1u);
  EXPECT_EQ(framed["@graph"][0]["@id"], "http://ex/library/the-republic#introduction");
}

TEST(Frame, EmbedNever) {
  auto const framed = frame(library, R"({
    "@context": {"@vocab": "http://ex/"},
    "@type": "Library",
    "contains": {"@embed": "@never"}
  })");
  EXPECT_EQ(framed["contains"], Json::parse(R"({"@id": "http://ex/library/the-republic"})"));
}

TEST(Frame, EmbedOnceAndAlways) {
  auto const once = frame(shared, R"({"@context": {"@vocab": "http://ex/"}, "@id": "http://ex/a"})");
  EXPECT_EQ(once["p"], Json::parse(R"({"@id": "http://ex/c", "r": 1})"));
  EXPECT_EQ(once["q"], Json::parse(R"({"@id": "http://ex/c"})"));

  auto const always = frame(shared, R"({"@context": {"@vocab": "http://ex/"}, "@id": "http://ex/a", "@embed": "@always"})");
  EXPECT_EQ(always["p"], Json::parse(R"({"@id": "http://ex/c", "r": 1})"));
  EXPECT_EQ(always["q"], Json::parse(R"({"@id": "http://ex/c", "r": 1})"));

  auto opts = core::Options();
  opts.embed = core::Embed::always;
  auto const byOption = frame(shared, R"({"@context": {"@vocab": "http://ex/"}, "@id": "http://ex/a"})", opts);
  EXPECT_EQ(byOption["q"], always["q"]);
}

TEST(Frame, EmptyFrameMatchesEveryNode) {
  auto opts = core::Options();
  opts.embed = core::Embed::never;
  auto const framed = frame(shared, R"({"@context": {"@vocab": "http://ex/"}})", opts);
  ASSERT_TRUE(framed.contains("@graph"));
  ASSERT_EQ(framed["@graph"].size(), 2u);
  EXPECT_EQ(framed["@graph"][0]["@id"], "http://ex/a");
  EXPECT_EQ(framed["@graph"][1]["@id"], "http://ex/c");
}

TEST(Frame, RemovedEmbedValuesAreRejected) {
  auto const link = Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "@type": "Library", "@embed": "@link"})");
  EXPECT_EQ(frameError(library, link), ErrorCode::invalidEmbedValue);
  auto const last = Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "@type": "Library", "@embed": "@last"})");
  EXPECT_EQ(frameError(library, last), ErrorCode::invalidEmbedValue);
}

TEST(Frame, DefaultsAndNull) {
  auto const framed = frame(Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "@id": "http://ex/a", "@type": "T"})"), R"({
    "@context": {"@vocab": "http://ex/"},
    "@type": "T",
    "missing": {"@default": "dflt"},
    "gone": {}
  })");
  auto const expected = Json::parse(R"({
    "@context": {"@vocab": "http://ex/"},
    "@id": "http://ex/a",
    "@type": "T",
    "gone": null,
    "missing": "dflt"
  })");
  EXPECT_EQ(framed, expected);
}

TEST(Frame, ExplicitInclusion) {
  auto const input = Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "@id": "http://ex/a", "@type": "T", "keep": 1, "drop": 2})");
  auto const framed = frame(input, R"({"@context": {"@vocab": "http://ex/"}, "@type": "T", "@explicit": true, "keep": {}})");
  EXPECT_EQ(framed, Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "@id": "http://ex/a", "@type": "T", "keep": 1})"));
}

TEST(Frame, DropsSingleUseBlankNodeIds) {
  auto const input = Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "@type": "T", "p": "v"})");
  auto const framed = frame(input, R"({"@context": {"@vocab": "http://ex/"}, "@type": "T"})");
  EXPECT_EQ(framed, Json::parse(R"({"@context": {"@vocab": "http://ex/"}, "@type": "T", "p": "v"})"));
}

TEST(Frame, InvalidFrames) {
  EXPECT_EQ(frameError(library, Json(5)), ErrorCode::invalidFrame);
  EXPECT_EQ(frameError(library, Json::parse(R"({"@id": "relative"})")), ErrorCode::invalidFrame);
  EXPECT_EQ(frameError(library, Json::parse(R"({"@type": "http://ex/Library", "@explicit": "sometimes"})")), ErrorCode::invalidFrame);
}

TEST(Frame, RemoveNullPlaceholders) {
  auto const input = Json::parse(R"({"a": "@null", "b": ["@null", 1], "c": {"d": "@null"}})");
  EXPECT_EQ(algo::removeNullPlaceholders(input), Json::parse(R"({"a": null, "b": [1], "c": {"d": null}})"));
}
