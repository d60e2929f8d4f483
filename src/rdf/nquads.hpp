#ifndef LDMILL_RDF_NQUADS_HPP
#define LDMILL_RDF_NQUADS_HPP

#include <string>
#include <string_view>
#include <common.hpp>
#include "dataset.hpp"

namespace ldmill::rdf {
#include "macros_open.hpp"

  // Serializes one quad as a canonical N-Quads line, including the trailing newline.
  auto toNQuad(Quad const& quad) -> std::string;

  // Serializes a dataset graph by graph, in insertion order within each graph.
  auto toNQuads(Dataset const& dataset) -> std::string;

  // Parses N-Quads text. Blank lines and comments are skipped; duplicate quads are dropped.
  // Malformed lines throw `JsonLdError` with `syntaxError`, naming the line number.
  auto parseNQuads(std::string_view input) -> Dataset;

#include "macros_close.hpp"
}

#endif // LDMILL_RDF_NQUADS_HPP
