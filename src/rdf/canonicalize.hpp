#ifndef LDMILL_RDF_CANONICALIZE_HPP
#define LDMILL_RDF_CANONICALIZE_HPP

#include <string>
#include <vector>
#include <common.hpp>
#include <core/options.hpp>
#include "dataset.hpp"

namespace ldmill::rdf {
#include "macros_open.hpp"

  // Relabels the blank nodes of `dataset` with canonical `_:c14n<n>` labels, using `opts.algorithm`
  // (URDNA2015 or URGNA2012). Returns the relabelled quads ordered by their N-Quads serialization.
  // Throws `JsonLdError` with `canonicalizationComplexityExceeded` once more than `opts.complexityLimit`
  // N-degree hash steps are taken.
  // See: https://www.w3.org/TR/rdf-canon/
  auto canonicalize(Dataset const& dataset, core::Options const& opts) -> std::vector<Quad>;

  // The canonical N-Quads document: one line per quad in code point order.
  auto canonicalNQuads(Dataset const& dataset, core::Options const& opts) -> std::string;

  // Enumerates the permutations of a list in Steinhaus-Johnson-Trotter order, starting from the sorted list.
  class Permutator {
  public:
    explicit Permutator(std::vector<std::string> list);

    auto hasNext() const -> bool {
      return !done;
    }
    auto next() -> std::vector<std::string>;

  private:
    std::vector<std::string> list;
    // Direction of each element: true for "looking left".
    std::vector<bool> left;
    bool done = false;
  };

#include "macros_close.hpp"
}

#endif // LDMILL_RDF_CANONICALIZE_HPP
