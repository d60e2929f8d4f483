#ifndef LDMILL_CORE_URL_HPP
#define LDMILL_CORE_URL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <common.hpp>

namespace ldmill::core {
#include "macros_open.hpp"

  // Components of a URI reference, as split by RFC 3986 appendix B.
  // Undefined components are distinguished from empty ones.
  struct Url {
    std::optional<std::string> scheme;
    std::optional<std::string> authority;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;

    static auto parse(std::string const& s) -> Url;
    auto toString() const -> std::string;
  };

  // RFC 3986 section 5.2.4.
  auto removeDotSegments(std::string const& path) -> std::string;

  // Resolves `iri` against `base` (RFC 3986 section 5.2.2). An empty base leaves `iri` unchanged.
  auto resolve(std::string const& base, std::string const& iri) -> std::string;

  // Produces the shortest reference to `iri` relative to `base`, or `iri` itself if it is not under base.
  auto removeBase(std::string const& base, std::string const& iri) -> std::string;

  inline auto isBlankNodeId(std::string_view s) -> bool {
    return s.starts_with("_:");
  }

  // Blank node identifiers count as absolute.
  auto isAbsoluteIri(std::string_view s) -> bool;

  auto isRelativeIri(std::string_view s) -> bool;

#include "macros_close.hpp"
}

#endif // LDMILL_CORE_URL_HPP
