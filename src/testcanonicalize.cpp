#include <algorithm>
#include <random>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <core/error.hpp>
#include <core/options.hpp>
#include <rdf/canonicalize.hpp>
#include <rdf/nquads.hpp>

using std::string;
using std::vector;
using namespace ldmill;
using namespace ldmill::rdf;

namespace {

  auto canonical(string const& nquads, core::Algorithm algorithm = core::Algorithm::urdna2015) -> string {
    auto opts = core::Options();
    opts.algorithm = algorithm;
    return canonicalNQuads(parseNQuads(nquads), opts);
  }

  // Permutes the blank node labels among themselves and shuffles the line order.
  auto scramble(vector<string> lines, vector<string> const& labels, std::mt19937& rng) -> string {
    auto names = labels;
    std::shuffle(names.begin(), names.end(), rng);
    for (auto& line: lines) {
      auto res = string();
      for (auto i = 0uz; i < line.size();) {
        if (line.compare(i, 2, "_:") != 0) {
          res += line[i++];
          continue;
        }
        auto const end = line.find(' ', i);
        auto const label = line.substr(i, end - i);
        auto const index = std::find(labels.begin(), labels.end(), label) - labels.begin();
        res += names[static_cast<size_t>(index)];
        i = end;
      }
      line = res;
    }
    std::shuffle(lines.begin(), lines.end(), rng);
    auto res = string();
    for (auto const& line: lines) res += line + "\n";
    return res;
  }

}

TEST(Permutator, SteinhausJohnsonTrotterOrder) {
  auto permutator = Permutator({"c", "a", "b"});
  auto all = vector<vector<string>>();
  while (permutator.hasNext()) all.push_back(permutator.next());
  auto const expected = vector<vector<string>>{
    {"a", "b", "c"}, {"a", "c", "b"}, {"c", "a", "b"}, {"c", "b", "a"}, {"b", "c", "a"}, {"b", "a", "c"},
  };
  EXPECT_EQ(all, expected);
}

TEST(Permutator, SingleElement) {
  auto permutator = Permutator({"x"});
  ASSERT_TRUE(permutator.hasNext());
  EXPECT_EQ(permutator.next(), vector<string>{"x"});
  EXPECT_FALSE(permutator.hasNext());
}

TEST(Canonicalize, GroundDatasetIsSorted) {
  auto const input =
    "<http://ex/s2> <http://ex/p> \"b\" .\n"
    "<http://ex/s1> <http://ex/p> \"a\" <http://ex/g> .\n"
    "<http://ex/s1> <http://ex/p> \"a\" .\n";
  auto const expected =
    "<http://ex/s1> <http://ex/p> \"a\" .\n"
    "<http://ex/s1> <http://ex/p> \"a\" <http://ex/g> .\n"
    "<http://ex/s2> <http://ex/p> \"b\" .\n";
  EXPECT_EQ(canonical(input), expected);
}

TEST(Canonicalize, FirstDegreeHashesOrderLabels) {
  // The first-degree hash of `_:y` sorts before that of `_:x`, for both hash functions.
  auto const input = "_:x <http://ex/p> _:y .\n";
  EXPECT_EQ(canonical(input), "_:c14n1 <http://ex/p> _:c14n0 .\n");
  EXPECT_EQ(canonical(input, core::Algorithm::urgna2012), "_:c14n1 <http://ex/p> _:c14n0 .\n");
}

TEST(Canonicalize, SymmetricPair) {
  auto const input = "_:a <http://ex/p> _:b .\n_:b <http://ex/p> _:a .\n";
  EXPECT_EQ(canonical(input), "_:c14n0 <http://ex/p> _:c14n1 .\n_:c14n1 <http://ex/p> _:c14n0 .\n");
}

TEST(Canonicalize, InvariantUnderRelabellingAndReordering) {
  auto const lines = vector<string>{
    "_:n1 <http://ex/next> _:n2 .",
    "_:n2 <http://ex/next> _:n3 .",
    "_:n3 <http://ex/next> _:n4 .",
    "_:n4 <http://ex/next> _:n5 .",
    "_:n5 <http://ex/next> _:n6 .",
    "_:n6 <http://ex/next> _:n1 .",
    "_:n1 <http://ex/chord> _:n4 .",
    "_:n2 <http://ex/label> \"two\" .",
    "_:n5 <http://ex/label> \"two\" .",
    "_:n3 <http://ex/in> <http://ex/thing> _:n6 .",
  };
  auto const labels = vector<string>{"_:n1", "_:n2", "_:n3", "_:n4", "_:n5", "_:n6"};

  auto rng = std::mt19937(7);
  for (auto const algorithm: {core::Algorithm::urdna2015, core::Algorithm::urgna2012}) {
    auto const reference = canonical(scramble(lines, labels, rng), algorithm);
    for (auto i = 0; i < 20; i++) EXPECT_EQ(canonical(scramble(lines, labels, rng), algorithm), reference);
  }
}

TEST(Canonicalize, DistinguishesNonIsomorphicGraphs) {
  // A four-cycle and two two-cycles: every blank node has the same first-degree hash in both.
  auto const cycle =
    "_:a <http://ex/p> _:b .\n_:b <http://ex/p> _:c .\n_:c <http://ex/p> _:d .\n_:d <http://ex/p> _:a .\n";
  auto const pairs =
    "_:a <http://ex/p> _:b .\n_:b <http://ex/p> _:a .\n_:c <http://ex/p> _:d .\n_:d <http://ex/p> _:c .\n";
  auto const renamedCycle =
    "_:w <http://ex/p> _:x .\n_:y <http://ex/p> _:z .\n_:x <http://ex/p> _:y .\n_:z <http://ex/p> _:w .\n";
  EXPECT_NE(canonical(cycle), canonical(pairs));
  EXPECT_EQ(canonical(cycle), canonical(renamedCycle));
}

TEST(Canonicalize, BlankGraphNames) {
  auto const input = "<http://ex/s> <http://ex/p> <http://ex/o> _:g .\n";
  EXPECT_EQ(canonical(input), "<http://ex/s> <http://ex/p> <http://ex/o> _:c14n0 .\n");
}

TEST(Canonicalize, ComplexityLimit) {
  auto opts = core::Options();
  opts.complexityLimit = 1;
  auto const symmetric = parseNQuads("_:a <http://ex/p> _:b .\n_:b <http://ex/p> _:a .\n");
  try {
    canonicalize(symmetric, opts);
    FAIL() << "expected the complexity limit to be hit";
  } catch (core::JsonLdError& e) {
    EXPECT_EQ(e.code, core::ErrorCode::canonicalizationComplexityExceeded);
  }

  // Datasets that never need N-degree hashing are unaffected.
  EXPECT_NO_THROW(canonicalize(parseNQuads("_:x <http://ex/p> _:y .\n"), opts));
}
