#include "keyword.hpp"
#include <array>

namespace ldmill::core {
#include "macros_open.hpp"

  namespace {
    using enum Keyword;

    // clang-format off
    constexpr auto keywordTable = std::to_array<std::pair<std::string_view, Keyword>>({
      {"@base", atBase},           {"@container", atContainer}, {"@context", atContext},
      {"@default", atDefault},     {"@direction", atDirection}, {"@embed", atEmbed},
      {"@explicit", atExplicit},   {"@first", atFirst},         {"@graph", atGraph},
      {"@id", atId},               {"@import", atImport},       {"@included", atIncluded},
      {"@index", atIndex},         {"@json", atJson},           {"@language", atLanguage},
      {"@list", atList},           {"@nest", atNest},           {"@none", atNone},
      {"@omitDefault", atOmitDefault}, {"@prefix", atPrefix},   {"@preserve", atPreserve},
      {"@propagate", atPropagate}, {"@protected", atProtected}, {"@requireAll", atRequireAll},
      {"@reverse", atReverse},     {"@set", atSet},             {"@type", atType},
      {"@value", atValue},         {"@version", atVersion},     {"@vocab", atVocab}
    });
    // clang-format on
  }

  auto parseKeyword(std::string_view s) -> std::optional<Keyword> {
    if (!s.starts_with('@')) return {};
    for (auto const& [name, k]: keywordTable)
      if (name == s) return k;
    return {};
  }

  auto keywordName(Keyword k) -> std::string_view {
    for (auto const& [name, kw]: keywordTable)
      if (kw == k) return name;
    unreachable;
  }

  auto hasKeywordForm(std::string_view s) -> bool {
    if (s.size() < 2 || s[0] != '@') return false;
    for (auto c: s.substr(1))
      if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))) return false;
    return true;
  }

#include "macros_close.hpp"
}
