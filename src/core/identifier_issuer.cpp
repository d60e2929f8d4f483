#include "identifier_issuer.hpp"

namespace ldmill::core {
#include "macros_open.hpp"

  auto IdentifierIssuer::getId(std::string const& old) -> std::string {
    if (!old.empty()) {
      if (auto const it = existing.find(old); it != existing.end()) return it->second;
    }
    auto res = prefix + std::to_string(counter++);
    if (!old.empty()) {
      existing.emplace(old, res);
      order.push_back(old);
    }
    return res;
  }

#include "macros_close.hpp"
}
