#include "value.hpp"

namespace ldmill::core {
#include "macros_open.hpp"

  auto isValue(Json const& v) -> bool {
    return v.is_object() && v.contains("@value");
  }

  auto isList(Json const& v) -> bool {
    return v.is_object() && v.contains("@list");
  }

  auto isGraph(Json const& v) -> bool {
    if (!v.is_object() || !v.contains("@graph")) return false;
    for (auto const& [k, _]: v.items())
      if (k != "@id" && k != "@index" && k != "@graph") return false;
    return true;
  }

  auto isSimpleGraph(Json const& v) -> bool {
    return isGraph(v) && !v.contains("@id");
  }

  auto isSubject(Json const& v) -> bool {
    if (!v.is_object() || v.contains("@value") || v.contains("@set") || v.contains("@list")) return false;
    return v.size() > 1 || !v.contains("@id");
  }

  auto isSubjectReference(Json const& v) -> bool {
    return v.is_object() && v.size() == 1 && v.contains("@id");
  }

  auto isBlankNode(Json const& v) -> bool {
    if (!v.is_object()) return false;
    if (auto const it = v.find("@id"); it != v.end())
      return it->is_string() && it->get_ref<std::string const&>().starts_with("_:");
    return v.empty() || !(v.contains("@value") || v.contains("@set") || v.contains("@list"));
  }

  auto isEmptyObject(Json const& v) -> bool {
    return v.is_object() && v.empty();
  }

  auto arrayify(Json const& v) -> Json {
    if (v.is_array()) return v;
    return Json::array({v});
  }

  auto member(Json const& obj, std::string const& key) -> Json const& {
    static auto const null = Json();
    if (!obj.is_object()) return null;
    auto const it = obj.find(key);
    return it == obj.end() ? null : *it;
  }

  auto keysOf(Json const& obj) -> std::vector<std::string> {
    auto res = std::vector<std::string>();
    if (!obj.is_object()) return res;
    for (auto const& [k, _]: obj.items()) res.push_back(k);
    return res;
  }

  auto deepCompare(Json const& a, Json const& b, bool listOrderMatters) -> bool {
    if (a.is_object() && b.is_object()) {
      if (a.size() != b.size()) return false;
      for (auto const& [k, v]: a.items()) {
        auto const it = b.find(k);
        if (it == b.end() || !deepCompare(v, *it, listOrderMatters)) return false;
      }
      return true;
    }
    if (a.is_array() && b.is_array()) {
      if (a.size() != b.size()) return false;
      // Marks members of `b` already matched, for arrays with duplicates
      auto matched = std::vector<bool>(b.size(), false);
      for (auto i = 0uz; i < a.size(); i++) {
        auto found = false;
        if (listOrderMatters) {
          found = deepCompare(a[i], b[i], listOrderMatters);
        } else {
          for (auto j = 0uz; j < b.size(); j++) {
            if (!matched[j] && deepCompare(a[i], b[j], listOrderMatters)) {
              matched[j] = found = true;
              break;
            }
          }
        }
        if (!found) return false;
      }
      return true;
    }
    return a == b;
  }

  auto compareValues(Json const& a, Json const& b) -> bool {
    if (!a.is_object() && !b.is_object() && a == b) return true;
    if (isValue(a) && isValue(b)) {
      if (member(a, "@value") == member(b, "@value") && member(a, "@type") == member(b, "@type") &&
          member(a, "@language") == member(b, "@language") && member(a, "@index") == member(b, "@index"))
        return true;
    }
    if (a.is_object() && b.is_object() && a.contains("@id") && b.contains("@id")) return a["@id"] == b["@id"];
    return false;
  }

  auto hasValue(Json const& subject, std::string const& property, Json const& value) -> bool {
    auto const& val = member(subject, property);
    if (val.is_null()) return false;
    if (val.is_array() || isList(val)) {
      auto const& arr = isList(val) ? val["@list"] : val;
      for (auto const& v: arr)
        if (compareValues(value, v)) return true;
      return false;
    }
    // Avoid matching the set of values with an array value parameter
    if (!value.is_array()) return compareValues(value, val);
    return false;
  }

  auto addValue(Json& subject, std::string const& property, Json const& value, AddValueOptions opts) -> void {
    if (value.is_array()) {
      if (value.empty() && opts.propertyIsArray && !subject.contains(property)) subject[property] = Json::array();
      for (auto const& v: value) addValue(subject, property, v, opts);
      return;
    }
    if (subject.contains(property)) {
      // Check if subject already has value if duplicates not allowed
      auto const has = !opts.allowDuplicate && hasValue(subject, property, value);
      auto& current = subject[property];
      // Make property an array if value not present or always an array
      if (!current.is_array() && (!has || opts.propertyIsArray)) current = Json::array({current});
      if (!has) current.push_back(value);
    } else if (opts.propertyIsArray) {
      subject[property] = Json::array({value});
    } else {
      subject[property] = value;
    }
  }

  auto mergeValue(Json& obj, std::string const& key, Json const& value) -> void {
    auto& values = obj[key];
    if (!values.is_array()) values = Json::array();
    if (key == "@list" || isList(value)) {
      values.push_back(value);
      return;
    }
    for (auto const& v: values)
      if (deepCompare(v, value, false)) return;
    values.push_back(value);
  }

  auto compareShortestLeast(std::string const& a, std::string const& b) -> bool {
    if (a.size() != b.size()) return a.size() < b.size();
    return a < b;
  }

#include "macros_close.hpp"
}
