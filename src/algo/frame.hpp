#ifndef LDMILL_ALGO_FRAME_HPP
#define LDMILL_ALGO_FRAME_HPP

#include <common.hpp>
#include <core/options.hpp>

namespace ldmill::algo {
#include "macros_open.hpp"

  // Framing algorithm: reshapes the expanded `input` into trees matching the expanded `frame` (an array holding
  // a single frame object). Matches are taken from the merged node map, or from the default graph only if
  // `opts.frameDefault` is set.
  // Missing properties with defaults are filled with their default (or `"@null"`). The result is expanded and
  // still has to be compacted against the frame's context.
  // See: https://www.w3.org/TR/json-ld11-framing/#framing-algorithm
  auto frame(Json const& input, Json const& frame, core::Options const& opts) -> Json;

  // Replaces the `"@null"` placeholders of a compacted framing result by null, removing them from arrays.
  auto removeNullPlaceholders(Json const& element) -> Json;

#include "macros_close.hpp"
}

#endif // LDMILL_ALGO_FRAME_HPP
