#ifndef LDMILL_CORE_IDENTIFIER_ISSUER_HPP
#define LDMILL_CORE_IDENTIFIER_ISSUER_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <common.hpp>

namespace ldmill::core {
#include "macros_open.hpp"

  // Issues blank node identifiers `<prefix>0`, `<prefix>1`, ..., remembering the old identifier each was issued for.
  // Copying an issuer gives an independent issuer with the same state.
  class IdentifierIssuer {
  public:
    explicit IdentifierIssuer(std::string prefix):
      prefix(std::move(prefix)) {}

    // Returns the identifier previously issued for `old`, or issues a new one.
    // An empty `old` always issues a fresh identifier without recording it.
    auto getId(std::string const& old = "") -> std::string;

    auto hasId(std::string const& old) const -> bool {
      return existing.contains(old);
    }

    // The identifier issued for `old`, if any.
    auto issued(std::string const& old) const -> std::optional<std::string> {
      if (auto const it = existing.find(old); it != existing.end()) return it->second;
      return std::nullopt;
    }

    // Old identifiers in the order they were first seen.
    auto issuedOrder() const -> std::vector<std::string> const& {
      return order;
    }

  private:
    std::string prefix;
    size_t counter = 0;
    std::unordered_map<std::string, std::string> existing;
    std::vector<std::string> order;
  };

#include "macros_close.hpp"
}

#endif // LDMILL_CORE_IDENTIFIER_ISSUER_HPP
