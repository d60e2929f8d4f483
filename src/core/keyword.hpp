#ifndef LDMILL_CORE_KEYWORD_HPP
#define LDMILL_CORE_KEYWORD_HPP

#include <optional>
#include <string_view>
#include <common.hpp>

namespace ldmill::core {
#include "macros_open.hpp"

  // Recognised keywords (including the ones only meaningful in frames).
  // Key dispatch goes through this enumeration; anything else is a term, a compact IRI or an IRI.
  enum class Keyword : uint8_t {
    atBase,
    atContainer,
    atContext,
    atDefault,
    atDirection,
    atEmbed,
    atExplicit,
    atFirst,
    atGraph,
    atId,
    atImport,
    atIncluded,
    atIndex,
    atJson,
    atLanguage,
    atList,
    atNest,
    atNone,
    atOmitDefault,
    atPrefix,
    atPreserve,
    atPropagate,
    atProtected,
    atRequireAll,
    atReverse,
    atSet,
    atType,
    atValue,
    atVersion,
    atVocab
  };

  auto parseKeyword(std::string_view s) -> std::optional<Keyword>;
  auto keywordName(Keyword k) -> std::string_view;

  inline auto isKeyword(std::string_view s) -> bool {
    return parseKeyword(s).has_value();
  }

  // Matches `@[a-zA-Z]+`: reserved for future keywords, ignored with a warning.
  auto hasKeywordForm(std::string_view s) -> bool;

#include "macros_close.hpp"
}

#endif // LDMILL_CORE_KEYWORD_HPP
