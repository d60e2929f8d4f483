#include <string>
#include <gtest/gtest.h>
#include <core/error.hpp>
#include <rdf/dataset.hpp>
#include <rdf/nquads.hpp>

using std::string;
using namespace ldmill;
using namespace ldmill::rdf;

TEST(NQuads, SerializesTerms) {
  EXPECT_EQ(
    toNQuad(Quad{Iri{"http://example.com/s"}, Iri{"http://example.com/p"}, Literal{"plain"}, std::nullopt}),
    "<http://example.com/s> <http://example.com/p> \"plain\" .\n"
  );
  EXPECT_EQ(
    toNQuad(Quad{BlankNode{"_:b0"}, Iri{"http://example.com/p"}, Literal{"hi", vocab::rdfLangString, "en-GB"}, Iri{"http://g"}}),
    "_:b0 <http://example.com/p> \"hi\"@en-GB <http://g> .\n"
  );
  EXPECT_EQ(
    toNQuad(Quad{Iri{"http://s"}, Iri{"http://p"}, Literal{"5", vocab::xsdInteger}, BlankNode{"_:g"}}),
    "<http://s> <http://p> \"5\"^^<http://www.w3.org/2001/XMLSchema#integer> _:g .\n"
  );
}

TEST(NQuads, EscapesLiterals) {
  auto const quad = Quad{Iri{"http://s"}, Iri{"http://p"}, Literal{"a \"b\"\\\n\r\tc"}, std::nullopt};
  EXPECT_EQ(toNQuad(quad), "<http://s> <http://p> \"a \\\"b\\\"\\\\\\n\\r\\tc\" .\n");
}

TEST(NQuads, ParsesDocument) {
  auto const input = string(
    "# leading comment\n"
    "<http://example.com/s> <http://example.com/p> \"v\\u00e9\\n\"@fr .\r\n"
    "\n"
    "_:x <http://example.com/p> \"1\"^^<http://www.w3.org/2001/XMLSchema#integer> <http://g> . # trailing\n"
    "  _:x\t<http://example.com/q> _:y _:g.\n"
  );
  auto const dataset = parseNQuads(input);
  EXPECT_EQ(dataset.size(), 3u);

  auto const& defaults = dataset.quads("@default");
  ASSERT_EQ(defaults.size(), 1u);
  auto const& literal = std::get<Literal>(defaults[0].object);
  EXPECT_EQ(literal.value, "v\xC3\xA9\n");
  EXPECT_EQ(literal.language, "fr");
  EXPECT_EQ(literal.datatype, vocab::rdfLangString);

  auto const& named = dataset.quads("http://g");
  ASSERT_EQ(named.size(), 1u);
  EXPECT_EQ(std::get<Literal>(named[0].object).datatype, vocab::xsdInteger);
  EXPECT_EQ(nodeValue(named[0].subject), "_:x");

  auto const& blankGraph = dataset.quads("_:g");
  ASSERT_EQ(blankGraph.size(), 1u);
  EXPECT_TRUE(isBlank(blankGraph[0].object));
  EXPECT_EQ(graphName(blankGraph[0]), "_:g");
}

TEST(NQuads, DropsDuplicates) {
  auto const dataset = parseNQuads("<http://s> <http://p> <http://o> .\n<http://s> <http://p> <http://o> .\n");
  EXPECT_EQ(dataset.size(), 1u);
}

TEST(NQuads, SerializationParsesBack) {
  auto dataset = Dataset();
  dataset.add(Quad{Iri{"http://s"}, Iri{"http://p"}, Literal{"line\nbreak \"quoted\""}, std::nullopt});
  dataset.add(Quad{BlankNode{"_:b1"}, Iri{"http://p"}, Literal{"x", vocab::rdfLangString, "en"}, Iri{"http://g"}});
  dataset.add(Quad{BlankNode{"_:b1"}, Iri{"http://p"}, Literal{"1.5E0", vocab::xsdDouble}, Iri{"http://g"}});
  EXPECT_EQ(parseNQuads(toNQuads(dataset)), dataset);
}

TEST(NQuads, ReportsLineOfSyntaxError) {
  auto const input = "<http://s> <http://p> <http://o> .\n<http://s> <http://p> \"unterminated .\n";
  try {
    parseNQuads(input);
    FAIL() << "expected a syntax error";
  } catch (core::JsonLdError& e) {
    EXPECT_EQ(e.code, core::ErrorCode::syntaxError);
    EXPECT_NE(string(e.what()).find("line 2"), string::npos) << e.what();
  }
}

TEST(NQuads, RejectsMalformedLines) {
  for (auto const* line: {
         "<http://s> <http://p> <http://o>\n",         // Missing '.'
         "<relative> <http://p> <http://o> .\n",       // Relative IRI
         "\"literal\" <http://p> <http://o> .\n",      // Literal subject
         "<http://s> _:p <http://o> .\n",              // Blank predicate
         "<http://s> <http://p> <http://o> . extra\n", // Trailing content
         "<http://s> <http://p> \"x\"@ .\n",            // Empty language tag
       }) {
    EXPECT_THROW(parseNQuads(line), core::JsonLdError) << line;
  }
}

TEST(Dataset, GroupsByGraph) {
  auto dataset = Dataset();
  EXPECT_TRUE(dataset.empty());
  EXPECT_EQ(dataset.graphs().size(), 1u);
  EXPECT_TRUE(dataset.add(Quad{Iri{"http://s"}, Iri{"http://p"}, Iri{"http://o"}, Iri{"http://g"}}));
  EXPECT_FALSE(dataset.add(Quad{Iri{"http://s"}, Iri{"http://p"}, Iri{"http://o"}, Iri{"http://g"}}));
  EXPECT_TRUE(dataset.add(Quad{Iri{"http://s"}, Iri{"http://p"}, Iri{"http://o"}, std::nullopt}));
  EXPECT_EQ(dataset.size(), 2u);
  EXPECT_EQ(dataset.allQuads().size(), 2u);
  EXPECT_TRUE(dataset.quads("http://missing").empty());
}
