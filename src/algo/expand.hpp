#ifndef LDMILL_ALGO_EXPAND_HPP
#define LDMILL_ALGO_EXPAND_HPP

#include <string>
#include <common.hpp>
#include <core/context.hpp>

namespace ldmill::algo {
#include "macros_open.hpp"

  // Expansion algorithm: removes the context, turning every property into an IRI and every value into an array of
  // node, value or list objects. Always returns an array.
  // `frameExpansion` admits the wildcard and matching forms only meaningful in frames.
  // See: https://www.w3.org/TR/json-ld11-api/#expansion-algorithm
  auto expand(core::Context const& activeCtx, Json const& element, std::string const& baseUrl, bool frameExpansion = false)
    -> Json;

#include "macros_close.hpp"
}

#endif // LDMILL_ALGO_EXPAND_HPP
