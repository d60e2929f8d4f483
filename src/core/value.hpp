#ifndef LDMILL_CORE_VALUE_HPP
#define LDMILL_CORE_VALUE_HPP

#include <string>
#include <vector>
#include <common.hpp>

namespace ldmill::core {
#include "macros_open.hpp"

  // Shape predicates on expanded (or partially expanded) elements.
  auto isValue(Json const& v) -> bool;
  auto isList(Json const& v) -> bool;
  // An object with `@graph` and optionally `@id`/`@index`, nothing else.
  auto isGraph(Json const& v) -> bool;
  auto isSimpleGraph(Json const& v) -> bool;
  // A node object with properties, i.e. not a value, list, set or bare reference.
  auto isSubject(Json const& v) -> bool;
  auto isSubjectReference(Json const& v) -> bool;
  auto isBlankNode(Json const& v) -> bool;
  auto isEmptyObject(Json const& v) -> bool;

  // Returns `v` itself if it is an array, otherwise `[v]`.
  auto arrayify(Json const& v) -> Json;

  // Looks up `key` in an object, giving a null value for missing keys and non-objects.
  auto member(Json const& obj, std::string const& key) -> Json const&;

  // Object keys in lexicographic order.
  auto keysOf(Json const& obj) -> std::vector<std::string>;

  // Structural equality; arrays may be compared as multisets.
  auto deepCompare(Json const& a, Json const& b, bool listOrderMatters) -> bool;

  // Two values are equal if they are equal primitives, value objects with identical `@value`, `@type`,
  // `@language` and `@index`, or node objects with the same `@id`.
  auto compareValues(Json const& a, Json const& b) -> bool;

  auto hasValue(Json const& subject, std::string const& property, Json const& value) -> bool;

  struct AddValueOptions {
    bool propertyIsArray = false;
    bool allowDuplicate = true;
  };

  // Adds one value (or each element of an array value) to `subject[property]`.
  auto addValue(Json& subject, std::string const& property, Json const& value, AddValueOptions opts = {}) -> void;

  // Appends to `obj[key]` (always an array) unless an equal value is present; lists are always appended.
  auto mergeValue(Json& obj, std::string const& key, Json const& value) -> void;

  // Orders strings by length first, then lexicographically.
  auto compareShortestLeast(std::string const& a, std::string const& b) -> bool;

#include "macros_close.hpp"
}

#endif // LDMILL_CORE_VALUE_HPP
