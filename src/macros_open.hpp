// Syntax helpers, enabled between `#include "macros_open.hpp"` and `#include "macros_close.hpp"`.
#define required = 0

// Declares a class as an "interface": copyable by subclasses only, virtual destructor.
// See: https://softwareengineering.stackexchange.com/questions/235674/what-is-the-pattern-for-a-safe-interface-in-c
#define interface(T)                                 \
protected:                                           \
  T() noexcept = default;                            \
  T(T const&) noexcept = default;                    \
  T(T&&) noexcept = default;                         \
  auto operator=(T const&) noexcept -> T& = default; \
  auto operator=(T&&) noexcept -> T& = default;      \
public:                                              \
  virtual ~T() = default

#define unreachable   ::ldmill::unreachable(__FILE__, __LINE__, static_cast<char const*>(__func__))
