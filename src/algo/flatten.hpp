#ifndef LDMILL_ALGO_FLATTEN_HPP
#define LDMILL_ALGO_FLATTEN_HPP

#include <common.hpp>

namespace ldmill::algo {
#include "macros_open.hpp"

  // Flattening algorithm: collects all nodes of an expanded document into a single array ordered by identifier.
  // Named graphs become `@graph` entries of their graph node; nodes holding nothing but `@id` are left out.
  // Blank nodes are relabelled `_:b0`, `_:b1`, ... in order of first appearance.
  // See: https://www.w3.org/TR/json-ld11-api/#flattening-algorithm
  auto flatten(Json const& expanded) -> Json;

#include "macros_close.hpp"
}

#endif // LDMILL_ALGO_FLATTEN_HPP
