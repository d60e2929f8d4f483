#ifndef LDMILL_ALGO_NODE_MAP_HPP
#define LDMILL_ALGO_NODE_MAP_HPP

#include <common.hpp>
#include <core/identifier_issuer.hpp>

namespace ldmill::algo {
#include "macros_open.hpp"

  // Collects the nodes of an expanded document into `graphs`, a map from graph name (`@default` for the default graph)
  // to a map from node identifier to the flattened node. Blank node identifiers are relabelled by `issuer`; nested
  // nodes are replaced by references.
  // See: https://www.w3.org/TR/json-ld11-api/#node-map-generation
  auto generateNodeMap(Json const& expanded, Json& graphs, core::IdentifierIssuer& issuer) -> void;

  // Returns a fresh node map holding (at least) the default graph.
  auto createNodeMap(Json const& expanded, core::IdentifierIssuer& issuer) -> Json;

  // Merges the nodes of every graph into a single map from identifier to node.
  // See: https://www.w3.org/TR/json-ld11-api/#merge-node-maps
  auto mergeNodeMaps(Json const& graphs) -> Json;

#include "macros_close.hpp"
}

#endif // LDMILL_ALGO_NODE_MAP_HPP
