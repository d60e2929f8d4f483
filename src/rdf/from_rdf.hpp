#ifndef LDMILL_RDF_FROM_RDF_HPP
#define LDMILL_RDF_FROM_RDF_HPP

#include <common.hpp>
#include <core/options.hpp>
#include "dataset.hpp"

namespace ldmill::rdf {
#include "macros_open.hpp"

  // Converts a dataset into an expanded JSON-LD document, with nodes ordered by identifier.
  // Well-formed `rdf:first`/`rdf:rest` chains of blank nodes become `@list` objects.
  // See: https://www.w3.org/TR/json-ld11-api/#serialize-rdf-as-json-ld-algorithm
  auto fromRdf(Dataset const& dataset, core::Options const& opts) -> Json;

  // The JSON-LD value object for an RDF term.
  auto rdfToObject(Node const& node, core::Options const& opts) -> Json;

#include "macros_close.hpp"
}

#endif // LDMILL_RDF_FROM_RDF_HPP
