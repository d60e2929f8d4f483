#ifndef LDMILL_COMMON_HPP
#define LDMILL_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace ldmill {

  using std::int8_t;
  using std::int16_t;
  using std::int32_t;
  using std::int64_t;
  using std::ptrdiff_t;
  using std::uint8_t;
  using std::uint16_t;
  using std::uint32_t;
  using std::uint64_t;
  using std::size_t;

  // The dynamically-typed document tree.
  // Object keys are kept in lexicographic order, which all algorithms rely on for deterministic output.
  using Json = nlohmann::json;

  // "Unreachable" mark.
  [[noreturn]] inline auto unreachable(char const* file, int line, char const* func) -> void {
    std::cerr << "\"Unreachable\" code was reached: " << file << ":" << line << ", at function " << func << std::endl;
    std::terminate();
  }

  // ASCII lowercase copy.
  inline auto lowercase(std::string s) -> std::string {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  // Returns a sorted copy.
  template <typename T, typename Compare = std::less<>>
  auto sorted(std::vector<T> v, Compare cmp = Compare{}) -> std::vector<T> {
    std::sort(v.begin(), v.end(), cmp);
    return v;
  }

  // "Pattern matching" on `std::variant`.
  // See: https://en.cppreference.com/w/cpp/utility/variant/visit
  // See: https://en.cppreference.com/w/cpp/language/aggregate_initialization
  template <typename... Ts>
  struct Matcher: Ts... {
    using Ts::operator()...;
  };

  // Usage: `match(variant, [&](CaseType1 v) { return ...; }, [&](CaseType2 v) { return ...; }, ...)`
  // Return values of each lambda must have the same type.
  template <typename T, typename... Ts>
  constexpr auto match(T&& variant, Ts&&... lambdas) {
    return std::visit(Matcher<Ts...>{std::forward<Ts>(lambdas)...}, std::forward<T>(variant));
  }

}

#endif // LDMILL_COMMON_HPP
