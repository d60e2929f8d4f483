#include <algorithm>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <core/error.hpp>
#include <core/options.hpp>
#include <rdf/dataset.hpp>
#include <rdf/from_rdf.hpp>
#include <rdf/nquads.hpp>
#include <rdf/to_rdf.hpp>

using std::string;
using std::vector;
using namespace ldmill;
using namespace ldmill::rdf;

namespace {

  auto const xsd = string("http://www.w3.org/2001/XMLSchema#");
  auto const rdfNs = string("http://www.w3.org/1999/02/22-rdf-syntax-ns#");

  auto lines(Dataset const& dataset) -> vector<string> {
    auto res = vector<string>();
    for (auto const& quad: dataset.allQuads()) res.push_back(toNQuad(quad));
    std::sort(res.begin(), res.end());
    return res;
  }

  // The object of the only quad with the given predicate.
  auto objectOf(Dataset const& dataset, string const& predicate) -> Literal {
    auto res = std::optional<Literal>();
    for (auto const& quad: dataset.allQuads()) {
      if (nodeValue(quad.predicate) != predicate) continue;
      EXPECT_FALSE(res.has_value()) << "several quads with " << predicate;
      res = std::get<Literal>(quad.object);
    }
    EXPECT_TRUE(res.has_value()) << "no quad with " << predicate;
    return res.value_or(Literal{});
  }

}

TEST(ToRdf, ConvertsLiterals) {
  auto const expanded = Json::parse(R"([{
    "@id": "http://ex/s",
    "@type": ["http://ex/T"],
    "http://ex/bool": [{"@value": true}],
    "http://ex/int": [{"@value": 5}],
    "http://ex/intFloat": [{"@value": 6.0}],
    "http://ex/dbl": [{"@value": 1.1}],
    "http://ex/forcedDbl": [{"@value": 5, "@type": "http://www.w3.org/2001/XMLSchema#double"}],
    "http://ex/big": [{"@value": 1e21}],
    "http://ex/lang": [{"@value": "hi", "@language": "en-GB"}],
    "http://ex/typed": [{"@value": "2020-01-01", "@type": "http://www.w3.org/2001/XMLSchema#date"}],
    "http://ex/json": [{"@value": {"b": 1, "a": [1.0, "x"]}, "@type": "@json"}],
    "http://ex/str": [{"@value": "plain", "@direction": "rtl"}]
  }])");
  auto const dataset = toRdf(expanded, {});
  EXPECT_EQ(dataset.size(), 12u);

  auto const check = [&](string const& property, string const& value, string const& datatype) {
    auto const literal = objectOf(dataset, "http://ex/" + property);
    EXPECT_EQ(literal.value, value) << property;
    EXPECT_EQ(literal.datatype, datatype) << property;
  };
  check("bool", "true", xsd + "boolean");
  check("int", "5", xsd + "integer");
  check("intFloat", "6", xsd + "integer");
  check("dbl", "1.1E0", xsd + "double");
  check("forcedDbl", "5.0E0", xsd + "double");
  check("big", "1.0E21", xsd + "double");
  check("lang", "hi", rdfNs + "langString");
  check("typed", "2020-01-01", xsd + "date");
  check("json", R"({"a":[1,"x"],"b":1})", rdfNs + "JSON");
  check("str", "plain", xsd + "string");
  EXPECT_EQ(objectOf(dataset, "http://ex/lang").language, "en-GB");

  auto typeQuads = 0;
  for (auto const& quad: dataset.allQuads())
    if (nodeValue(quad.predicate) == rdfNs + "type") {
      EXPECT_EQ(quad.object, Node(Iri{"http://ex/T"}));
      typeQuads++;
    }
  EXPECT_EQ(typeQuads, 1);
}

TEST(ToRdf, ListsBecomeChains) {
  auto const expanded = Json::parse(R"([{
    "@id": "http://ex/s",
    "http://ex/p": [{"@list": [{"@value": "a"}, {"@id": "http://ex/o"}]}],
    "http://ex/e": [{"@list": []}]
  }])");
  auto const expected = vector<string>{
    "<http://ex/s> <http://ex/e> <http://www.w3.org/1999/02/22-rdf-syntax-ns#nil> .\n",
    "<http://ex/s> <http://ex/p> _:b0 .\n",
    "_:b0 <http://www.w3.org/1999/02/22-rdf-syntax-ns#first> \"a\" .\n",
    "_:b0 <http://www.w3.org/1999/02/22-rdf-syntax-ns#rest> _:b1 .\n",
    "_:b1 <http://www.w3.org/1999/02/22-rdf-syntax-ns#first> <http://ex/o> .\n",
    "_:b1 <http://www.w3.org/1999/02/22-rdf-syntax-ns#rest> <http://www.w3.org/1999/02/22-rdf-syntax-ns#nil> .\n",
  };
  EXPECT_EQ(lines(toRdf(expanded, {})), expected);
}

TEST(ToRdf, NamedGraphsAndBlankNodes) {
  auto const expanded = Json::parse(R"([{
    "@id": "http://ex/g",
    "@graph": [{"@id": "_:x", "http://ex/p": [{"@id": "_:y"}]}]
  }])");
  auto const expected = vector<string>{"_:b0 <http://ex/p> _:b1 <http://ex/g> .\n"};
  EXPECT_EQ(lines(toRdf(expanded, {})), expected);
}

TEST(ToRdf, DropsRelativeAndMalformedContent) {
  auto const expanded = Json::parse(R"([
    {"@id": "relative", "http://ex/p": [{"@value": "x"}]},
    {"@id": "http://ex/s",
     "http://ex/ref": [{"@id": "relative/ref"}],
     "relativeProperty": [{"@value": "x"}],
     "_:blankProperty": [{"@value": "x"}],
     "http://ex/lang": [{"@value": "x", "@language": "not a tag"}],
     "http://ex/type": [{"@value": "x", "@type": "relative/type"}],
     "http://ex/ok": [{"@value": "kept"}]}
  ])");
  auto log = std::ostringstream();
  auto opts = core::Options();
  opts.log = &log;
  auto const dataset = toRdf(expanded, opts);
  ASSERT_EQ(dataset.size(), 1u);
  EXPECT_EQ(objectOf(dataset, "http://ex/ok").value, "kept");
  EXPECT_NE(log.str().find("relative"), string::npos);
}

TEST(ToRdf, GeneralizedRdfKeepsBlankPredicates) {
  auto const expanded = Json::parse(R"([{"@id": "http://ex/s", "_:p": [{"@value": "x"}]}])");
  auto opts = core::Options();
  opts.produceGeneralizedRdf = true;
  auto const dataset = toRdf(expanded, opts);
  ASSERT_EQ(dataset.size(), 1u);
  EXPECT_TRUE(isBlank(dataset.allQuads()[0].predicate));
}

TEST(ToRdf, SafeModeRejectsDroppedContent) {
  auto const expanded = Json::parse(R"([{"@id": "http://ex/s", "http://ex/p": [{"@id": "relative"}]}])");
  auto opts = core::Options();
  opts.safeMode = true;
  EXPECT_THROW(toRdf(expanded, opts), core::JsonLdError);
}

TEST(ToRdf, LanguageTags) {
  EXPECT_TRUE(isWellFormedLanguage("en"));
  EXPECT_TRUE(isWellFormedLanguage("en-GB"));
  EXPECT_TRUE(isWellFormedLanguage("zh-Hant-TW"));
  EXPECT_FALSE(isWellFormedLanguage(""));
  EXPECT_FALSE(isWellFormedLanguage("en-"));
  EXPECT_FALSE(isWellFormedLanguage("1en"));
  EXPECT_FALSE(isWellFormedLanguage("toolongtag"));
  EXPECT_FALSE(isWellFormedLanguage("en GB"));
}

TEST(FromRdf, BuildsNodes) {
  auto const dataset = parseNQuads(
    "<http://ex/s> <http://www.w3.org/1999/02/22-rdf-syntax-ns#type> <http://ex/T> .\n"
    "<http://ex/s> <http://ex/p> \"5\"^^<http://www.w3.org/2001/XMLSchema#integer> .\n"
    "<http://ex/s> <http://ex/q> \"x\" .\n"
    "<http://ex/s> <http://ex/q> \"x\"@en .\n"
    "<http://ex/s> <http://ex/r> <http://ex/o> .\n"
  );
  auto const expected = Json::parse(R"([{
    "@id": "http://ex/s",
    "@type": ["http://ex/T"],
    "http://ex/p": [{"@value": "5", "@type": "http://www.w3.org/2001/XMLSchema#integer"}],
    "http://ex/q": [{"@value": "x"}, {"@value": "x", "@language": "en"}],
    "http://ex/r": [{"@id": "http://ex/o"}]
  }])");
  EXPECT_EQ(fromRdf(dataset, {}), expected);
}

TEST(FromRdf, UseRdfType) {
  auto const dataset = parseNQuads("<http://ex/s> <http://www.w3.org/1999/02/22-rdf-syntax-ns#type> <http://ex/T> .\n");
  auto opts = core::Options();
  opts.useRdfType = true;
  auto const expected = Json::parse(R"([{
    "@id": "http://ex/s",
    "http://www.w3.org/1999/02/22-rdf-syntax-ns#type": [{"@id": "http://ex/T"}]
  }])");
  EXPECT_EQ(fromRdf(dataset, opts), expected);
}

TEST(FromRdf, UseNativeTypes) {
  auto const dataset = parseNQuads(
    "<http://ex/s> <http://ex/a> \"5\"^^<http://www.w3.org/2001/XMLSchema#integer> .\n"
    "<http://ex/s> <http://ex/b> \"true\"^^<http://www.w3.org/2001/XMLSchema#boolean> .\n"
    "<http://ex/s> <http://ex/c> \"1.5E0\"^^<http://www.w3.org/2001/XMLSchema#double> .\n"
    "<http://ex/s> <http://ex/d> \"05\"^^<http://www.w3.org/2001/XMLSchema#integer> .\n"
    "<http://ex/s> <http://ex/e> \"yes\"^^<http://www.w3.org/2001/XMLSchema#boolean> .\n"
    "<http://ex/s> <http://ex/f> \"plain\"^^<http://www.w3.org/2001/XMLSchema#string> .\n"
  );
  auto opts = core::Options();
  opts.useNativeTypes = true;
  auto const expected = Json::parse(R"([{
    "@id": "http://ex/s",
    "http://ex/a": [{"@value": 5}],
    "http://ex/b": [{"@value": true}],
    "http://ex/c": [{"@value": 1.5}],
    "http://ex/d": [{"@value": "05", "@type": "http://www.w3.org/2001/XMLSchema#integer"}],
    "http://ex/e": [{"@value": "yes", "@type": "http://www.w3.org/2001/XMLSchema#boolean"}],
    "http://ex/f": [{"@value": "plain"}]
  }])");
  EXPECT_EQ(fromRdf(dataset, opts), expected);
}

TEST(FromRdf, JsonLiterals) {
  auto const dataset = parseNQuads(
    "<http://ex/s> <http://ex/j> \"{\\\"a\\\":[1,true]}\"^^<http://www.w3.org/1999/02/22-rdf-syntax-ns#JSON> .\n"
  );
  auto const expected = Json::parse(R"([{"@id": "http://ex/s", "http://ex/j": [{"@value": {"a": [1, true]}, "@type": "@json"}]}])");
  EXPECT_EQ(fromRdf(dataset, {}), expected);

  auto const broken = parseNQuads("<http://ex/s> <http://ex/j> \"{oops\"^^<http://www.w3.org/1999/02/22-rdf-syntax-ns#JSON> .\n");
  try {
    fromRdf(broken, {});
    FAIL() << "expected an error";
  } catch (core::JsonLdError& e) {
    EXPECT_EQ(e.code, core::ErrorCode::invalidJsonLiteral);
  }
}

TEST(FromRdf, FoldsWellFormedLists) {
  auto const dataset = parseNQuads(
    "<http://ex/s> <http://ex/p> _:l1 .\n"
    "_:l1 <http://www.w3.org/1999/02/22-rdf-syntax-ns#first> \"a\" .\n"
    "_:l1 <http://www.w3.org/1999/02/22-rdf-syntax-ns#rest> _:l2 .\n"
    "_:l2 <http://www.w3.org/1999/02/22-rdf-syntax-ns#first> \"b\" .\n"
    "_:l2 <http://www.w3.org/1999/02/22-rdf-syntax-ns#rest> <http://www.w3.org/1999/02/22-rdf-syntax-ns#nil> .\n"
    "<http://ex/s> <http://ex/empty> <http://www.w3.org/1999/02/22-rdf-syntax-ns#nil> .\n"
  );
  auto const expected = Json::parse(R"([{
    "@id": "http://ex/s",
    "http://ex/empty": [{"@list": []}],
    "http://ex/p": [{"@list": [{"@value": "a"}, {"@value": "b"}]}]
  }])");
  EXPECT_EQ(fromRdf(dataset, {}), expected);
}

TEST(FromRdf, LeavesMalformedListNodes) {
  // `_:l1` has an extra property, so it cannot be folded; only its `rdf:nil` tail becomes an empty list.
  auto const dataset = parseNQuads(
    "<http://ex/s> <http://ex/p> _:l1 .\n"
    "_:l1 <http://www.w3.org/1999/02/22-rdf-syntax-ns#first> \"a\" .\n"
    "_:l1 <http://www.w3.org/1999/02/22-rdf-syntax-ns#rest> <http://www.w3.org/1999/02/22-rdf-syntax-ns#nil> .\n"
    "_:l1 <http://ex/extra> \"x\" .\n"
  );
  auto const expected = Json::parse(R"([
    {
      "@id": "_:l1",
      "http://ex/extra": [{"@value": "x"}],
      "http://www.w3.org/1999/02/22-rdf-syntax-ns#first": [{"@value": "a"}],
      "http://www.w3.org/1999/02/22-rdf-syntax-ns#rest": [{"@list": []}]
    },
    {"@id": "http://ex/s", "http://ex/p": [{"@id": "_:l1"}]}
  ])");
  EXPECT_EQ(fromRdf(dataset, {}), expected);
}

TEST(FromRdf, LeavesUnterminatedChains) {
  auto const dataset = parseNQuads(
    "<http://ex/s> <http://ex/p> _:l1 .\n"
    "_:l1 <http://www.w3.org/1999/02/22-rdf-syntax-ns#first> \"a\" .\n"
    "_:l1 <http://www.w3.org/1999/02/22-rdf-syntax-ns#rest> _:l2 .\n"
    "_:l2 <http://www.w3.org/1999/02/22-rdf-syntax-ns#first> \"b\" .\n"
  );
  auto const result = fromRdf(dataset, {});
  ASSERT_EQ(result.size(), 3u);
  EXPECT_EQ(result[0]["@id"], "_:l1");
  EXPECT_EQ(result[1]["@id"], "_:l2");
  EXPECT_EQ(result[2]["http://ex/p"], Json::parse(R"([{"@id": "_:l1"}])"));
}

TEST(FromRdf, SharedListNodesAreNotFolded) {
  // `_:l1` is referenced from two subjects.
  auto const dataset = parseNQuads(
    "<http://ex/s> <http://ex/p> _:l1 .\n"
    "<http://ex/t> <http://ex/p> _:l1 .\n"
    "_:l1 <http://www.w3.org/1999/02/22-rdf-syntax-ns#first> \"a\" .\n"
    "_:l1 <http://www.w3.org/1999/02/22-rdf-syntax-ns#rest> <http://www.w3.org/1999/02/22-rdf-syntax-ns#nil> .\n"
  );
  auto const result = fromRdf(dataset, {});
  ASSERT_EQ(result.size(), 3u);
  EXPECT_EQ(result[0]["@id"], "_:l1");
  EXPECT_EQ(result[0]["http://www.w3.org/1999/02/22-rdf-syntax-ns#rest"], Json::parse(R"([{"@list": []}])"));
}

TEST(FromRdf, NamedGraphs) {
  auto const dataset = parseNQuads(
    "<http://ex/s> <http://ex/p> \"x\" <http://ex/g> .\n"
    "<http://ex/g> <http://ex/label> \"graph\" .\n"
  );
  auto const expected = Json::parse(R"([{
    "@id": "http://ex/g",
    "@graph": [{"@id": "http://ex/s", "http://ex/p": [{"@value": "x"}]}],
    "http://ex/label": [{"@value": "graph"}]
  }])");
  EXPECT_EQ(fromRdf(dataset, {}), expected);
}

TEST(FromRdf, InvertsToRdf) {
  auto const expanded = Json::parse(R"([{
    "@id": "http://ex/s",
    "http://ex/p": [{"@list": [{"@value": "a"}, {"@id": "http://ex/o"}, {"@value": "b", "@language": "en"}]}],
    "http://ex/q": [{"@value": "5", "@type": "http://www.w3.org/2001/XMLSchema#integer"}]
  }])");
  EXPECT_EQ(fromRdf(toRdf(expanded, {}), {}), expanded);
}
