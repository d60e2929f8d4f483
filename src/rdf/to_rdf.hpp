#ifndef LDMILL_RDF_TO_RDF_HPP
#define LDMILL_RDF_TO_RDF_HPP

#include <common.hpp>
#include <core/options.hpp>
#include "dataset.hpp"

namespace ldmill::rdf {
#include "macros_open.hpp"

  // Converts an expanded document into a dataset. Blank nodes are relabelled `_:b0`, `_:b1`, ...
  // Quads with relative or malformed IRIs and literals with malformed language tags are dropped
  // (reported through `Options::dropped`).
  // See: https://www.w3.org/TR/json-ld11-api/#deserialize-json-ld-to-rdf-algorithm
  auto toRdf(Json const& expanded, core::Options const& opts) -> Dataset;

  // Whether `tag` has the shape of a BCP47 language tag (`[a-zA-Z]{1,8}(-[a-zA-Z0-9]{1,8})*`).
  auto isWellFormedLanguage(std::string_view tag) -> bool;

  // Whether `iri` is absolute and contains no characters N-Quads forbids inside `<...>`. Blank node labels qualify.
  auto isWellFormedIri(std::string_view iri) -> bool;

#include "macros_close.hpp"
}

#endif // LDMILL_RDF_TO_RDF_HPP
