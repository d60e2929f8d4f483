#ifndef LDMILL_ALGO_COMPACT_HPP
#define LDMILL_ALGO_COMPACT_HPP

#include <string>
#include <common.hpp>
#include <core/context.hpp>

namespace ldmill::algo {
#include "macros_open.hpp"

  // Compaction algorithm: shortens an expanded element using the terms, containers and keyword aliases of a context.
  // `activeProperty` is empty at the top level.
  // See: https://www.w3.org/TR/json-ld11-api/#compaction-algorithm
  auto compact(core::Context const& activeCtx, std::string const& activeProperty, Json const& element, bool compactArrays = true)
    -> Json;

#include "macros_close.hpp"
}

#endif // LDMILL_ALGO_COMPACT_HPP
