#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <core/context.hpp>
#include <core/document_loader.hpp>
#include <core/error.hpp>
#include <core/options.hpp>

using std::string;
using namespace ldmill;
using namespace ldmill::core;

namespace {

  auto emptyContext(Options opts = {}) -> Context {
    return Context(std::make_shared<Options const>(std::move(opts)));
  }

  auto errorOf(auto&& f) -> std::optional<ErrorCode> {
    try {
      f();
    } catch (JsonLdError& e) {
      return e.code;
    }
    return std::nullopt;
  }

}

TEST(Context, ExpandsTermsAndCompactIris) {
  auto opts = Options();
  opts.base = "http://base/doc";
  auto const ctx = emptyContext(opts).parse(Json::parse(R"({
    "@vocab": "http://vocab/",
    "ex": "http://ex/",
    "name": "ex:name",
    "id": "@id"
  })"));

  EXPECT_EQ(ctx.expandIri("name", false, true), "http://ex/name");
  EXPECT_EQ(ctx.expandIri("ex:foo", false, true), "http://ex/foo");
  EXPECT_EQ(ctx.expandIri("other", false, true), "http://vocab/other");
  EXPECT_EQ(ctx.expandIri("rel", true, false), "http://base/rel");
  EXPECT_EQ(ctx.expandIri("_:b0", true, true), "_:b0");
  EXPECT_EQ(ctx.expandIri("id", false, true), "@id");
  EXPECT_EQ(ctx.expandIri("http://abs/x", true, true), "http://abs/x");

  EXPECT_EQ(ctx.compactIri("http://ex/name", nullptr, true), "name");
  EXPECT_EQ(ctx.compactIri("http://ex/other", nullptr, true), "ex:other");
  EXPECT_EQ(ctx.compactIri("http://vocab/thing", nullptr, true), "thing");
  EXPECT_EQ(ctx.compactIri("http://base/rel", nullptr, false), "rel");
  EXPECT_EQ(ctx.compactIri("@id", nullptr, true), "id");

  auto const* def = ctx.termDefinition("ex");
  ASSERT_NE(def, nullptr);
  EXPECT_TRUE(def->prefix);
  EXPECT_FALSE(ctx.termDefinition("name")->prefix);
}

TEST(Context, IsAValue) {
  auto const base = emptyContext().parse(Json{{"a", "http://ex/a"}});
  auto const derived = base.parse(Json{{"a", "http://ex/other"}, {"b", "http://ex/b"}});
  EXPECT_EQ(base.expandIri("a", false, true), "http://ex/a");
  EXPECT_FALSE(base.hasTerm("b"));
  EXPECT_EQ(derived.expandIri("a", false, true), "http://ex/other");
  EXPECT_TRUE(derived.hasTerm("b"));

  auto const cleared = derived.parse(nullptr);
  EXPECT_FALSE(cleared.hasTerm("a"));
}

TEST(Context, SelectsTermsByLanguage) {
  auto const ctx = emptyContext().parse(Json::parse(R"({
    "@language": "en",
    "label": {"@id": "http://ex/label", "@language": null},
    "labelEn": "http://ex/label",
    "labels": {"@id": "http://ex/label", "@container": "@language"}
  })"));
  EXPECT_EQ(ctx.compactIri("http://ex/label", Json{{"@value", "x"}}, true), "label");
  EXPECT_EQ(ctx.compactIri("http://ex/label", Json{{"@value", "x"}, {"@language", "en"}}, true), "labels");
  EXPECT_EQ(ctx.languageMapping("label"), std::nullopt);
  EXPECT_EQ(ctx.languageMapping("labelEn"), "en");
}

TEST(Context, ValueExpansion) {
  auto const ctx = emptyContext().parse(Json::parse(R"({
    "@language": "de",
    "ref": {"@id": "http://ex/ref", "@type": "@id"},
    "date": {"@id": "http://ex/date", "@type": "http://www.w3.org/2001/XMLSchema#date"},
    "plain": "http://ex/plain"
  })"));
  EXPECT_EQ(ctx.expandValue("ref", "http://ex/x"), (Json{{"@id", "http://ex/x"}}));
  EXPECT_EQ(
    ctx.expandValue("date", "2020-01-01"),
    (Json{{"@value", "2020-01-01"}, {"@type", "http://www.w3.org/2001/XMLSchema#date"}})
  );
  EXPECT_EQ(ctx.expandValue("plain", "hallo"), (Json{{"@value", "hallo"}, {"@language", "de"}}));
  EXPECT_EQ(ctx.expandValue("plain", 3), (Json{{"@value", 3}}));

  EXPECT_EQ(ctx.compactValue("ref", Json{{"@id", "http://ex/x"}}), "http://ex/x");
  EXPECT_EQ(ctx.compactValue("plain", Json{{"@value", "hallo"}, {"@language", "de"}}), "hallo");
  EXPECT_EQ(ctx.compactValue("plain", Json{{"@value", "hello"}, {"@language", "en"}}), (Json{{"@language", "en"}, {"@value", "hello"}}));
}

TEST(Context, RejectsInvalidDefinitions) {
  auto const ctx = emptyContext();
  EXPECT_EQ(errorOf([&] { ctx.parse(Json{{"@id", "http://ex/"}}); }), ErrorCode::keywordRedefinition);
  EXPECT_EQ(errorOf([&] { ctx.parse(Json{{"a", "b:x"}, {"b", "a:y"}}); }), ErrorCode::cyclicIriMapping);
  EXPECT_EQ(errorOf([&] { ctx.parse(Json{{"term", 5}}); }), ErrorCode::invalidTermDefinition);
  EXPECT_EQ(errorOf([&] { ctx.parse(Json{{"relative", Json::object()}}); }), ErrorCode::invalidIriMapping);
  EXPECT_EQ(
    errorOf([&] { ctx.parse(Json::parse(R"({"p": {"@id": "http://ex/p", "@container": "@foo"}})")); }),
    ErrorCode::invalidContainerMapping
  );
  EXPECT_EQ(
    errorOf([&] { ctx.parse(Json::parse(R"({"p": {"@id": "http://ex/p", "@type": "relative"}})")); }),
    ErrorCode::invalidTypeMapping
  );
  EXPECT_EQ(errorOf([&] { ctx.parse(Json::parse(R"({"@version": 1.0})")); }), ErrorCode::invalidVersionValue);
  EXPECT_EQ(errorOf([&] { ctx.parse(Json(42)); }), ErrorCode::invalidLocalContext);

  auto legacy = Options();
  legacy.processingMode = ProcessingMode::jsonLd10;
  EXPECT_EQ(errorOf([&] { emptyContext(legacy).parse(Json::parse(R"({"@version": 1.1})")); }), ErrorCode::processingModeConflict);
}

TEST(Context, ProtectedTerms) {
  auto const ctx = emptyContext().parse(Json::parse(R"({"@protected": true, "name": "http://ex/name"})"));
  EXPECT_TRUE(ctx.hasProtectedTerms());
  EXPECT_EQ(errorOf([&] { ctx.parse(Json{{"name", "http://ex/other"}}); }), ErrorCode::protectedTermRedefinition);
  EXPECT_EQ(errorOf([&] { ctx.parse(nullptr); }), ErrorCode::invalidContextNullification);

  // Identical redefinitions are allowed.
  auto const same = ctx.parse(Json{{"name", "http://ex/name"}});
  EXPECT_EQ(same.expandIri("name", false, true), "http://ex/name");

  // Property-scoped contexts may override protection.
  auto const overridden = ctx.parse(Json{{"name", "http://ex/other"}}, "", {.overrideProtected = true});
  EXPECT_EQ(overridden.expandIri("name", false, true), "http://ex/other");
}

TEST(Context, IriConfusedWithPrefix) {
  auto const ctx = emptyContext().parse(Json{{"ex", "http://ex/"}});
  EXPECT_EQ(errorOf([&] { static_cast<void>(ctx.compactIri("ex:foo", nullptr, false)); }), ErrorCode::iriConfusedWithPrefix);
}

TEST(Context, DropsKeywordLikeTerms) {
  auto log = std::ostringstream();
  auto opts = Options();
  opts.log = &log;
  auto const ctx = emptyContext(opts).parse(Json{{"@foo", "http://ex/foo"}, {"bar", "http://ex/bar"}});
  EXPECT_FALSE(ctx.hasTerm("@foo"));
  EXPECT_TRUE(ctx.hasTerm("bar"));
  EXPECT_NE(log.str().find("@foo"), string::npos);

  opts.safeMode = true;
  EXPECT_EQ(errorOf([&] { emptyContext(opts).parse(Json{{"@foo", "http://ex/foo"}}); }), ErrorCode::invalidInput);
}

TEST(Context, RemoteContexts) {
  auto loader = std::make_shared<CachingDocumentLoader>();
  loader->addDocument("http://ex/ctx", Json::parse(R"({"@context": {"name": "http://schema.org/name"}})"));
  loader->addDocument("http://ex/nested", Json::parse(R"({"@context": ["ctx", {"age": "http://schema.org/age"}]})"));
  loader->addDocument("http://ex/a", Json::parse(R"({"@context": "http://ex/b"})"));
  loader->addDocument("http://ex/b", Json::parse(R"({"@context": "http://ex/a"})"));
  loader->addDocument("http://ex/plain", Json::parse(R"({"name": "not a context"})"));

  auto opts = Options();
  opts.documentLoader = loader;
  auto const ctx = emptyContext(opts);

  EXPECT_EQ(ctx.parse(Json("http://ex/ctx")).expandIri("name", false, true), "http://schema.org/name");

  // Relative references resolve against the referencing context document.
  auto const nested = ctx.parse(Json("http://ex/nested"));
  EXPECT_EQ(nested.expandIri("name", false, true), "http://schema.org/name");
  EXPECT_EQ(nested.expandIri("age", false, true), "http://schema.org/age");

  EXPECT_EQ(errorOf([&] { ctx.parse(Json("http://ex/a")); }), ErrorCode::recursiveContextInclusion);
  EXPECT_EQ(errorOf([&] { ctx.parse(Json("http://ex/missing")); }), ErrorCode::loadingRemoteContextFailed);
  EXPECT_EQ(errorOf([&] { ctx.parse(Json("http://ex/plain")); }), ErrorCode::invalidRemoteContext);
  EXPECT_EQ(errorOf([&] { emptyContext().parse(Json("http://ex/ctx")); }), ErrorCode::loadingRemoteContextFailed);
}

TEST(Context, ImportedContexts) {
  auto loader = std::make_shared<CachingDocumentLoader>();
  loader->addDocument("http://ex/base", Json::parse(R"({"@context": {"a": "http://ex/a", "b": "http://ex/b"}})"));
  auto opts = Options();
  opts.documentLoader = loader;

  auto const ctx = emptyContext(opts).parse(Json::parse(R"({"@import": "http://ex/base", "b": "http://ex/overridden"})"));
  EXPECT_EQ(ctx.expandIri("a", false, true), "http://ex/a");
  EXPECT_EQ(ctx.expandIri("b", false, true), "http://ex/overridden");
}

TEST(Context, ParseLinkHeader) {
  auto const links = parseLinkHeader(
    R"(<http://ex/ctx.jsonld>; rel="http://www.w3.org/ns/json-ld#context"; type="application/ld+json", <http://ex/next>; rel=next)"
  );
  ASSERT_EQ(links.count("http://www.w3.org/ns/json-ld#context"), 1u);
  auto const& context = links.at("http://www.w3.org/ns/json-ld#context");
  ASSERT_EQ(context.size(), 1u);
  EXPECT_EQ(context[0].at("target"), "http://ex/ctx.jsonld");
  EXPECT_EQ(context[0].at("type"), "application/ld+json");
  ASSERT_EQ(links.count("next"), 1u);
  EXPECT_EQ(links.at("next")[0].at("target"), "http://ex/next");
}
