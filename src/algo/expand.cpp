#include "expand.hpp"
#include <optional>
#include <set>
#include <core/error.hpp>
#include <core/keyword.hpp>
#include <core/url.hpp>
#include <core/value.hpp>

using std::string;
using std::vector;

namespace ldmill::algo {
#include "macros_open.hpp"

  using namespace core;

  namespace {

    struct Flags {
      bool frameExpansion = false;
      bool fromMap = false;
      // Set while expanding the value of `@list`: nested arrays would form lists of lists.
      bool insideList = false;
    };

    auto isScalarArray(Json const& v) -> bool {
      return v.is_array() && std::ranges::all_of(v, [](Json const& x) { return !x.is_structured(); });
    }

    auto isStringArray(Json const& v) -> bool {
      return v.is_array() && std::ranges::all_of(v, [](Json const& x) { return x.is_string(); });
    }

    auto isEmptyMap(Json const& v) -> bool {
      return v.is_object() && v.empty();
    }

    // A node object, as allowed in `@included`.
    auto isNodeObject(Json const& v) -> bool {
      return v.is_object() && !v.contains("@value") && !v.contains("@list") && !v.contains("@set");
    }

    class Expander {
    public:
      auto element(Context const& activeCtx, string const& activeProperty, Json const& element, string const& baseUrl, Flags flags)
        -> Json;

    private:
      auto object(
        Context const& ctx, Context const& typeScoped, string const& activeProperty, string const& expandedActiveProperty,
        Json const& element, string const& baseUrl, std::optional<string> const& inputType, bool frame, Json& result
      ) -> void;
      auto keyword(
        Context const& ctx, Context const& typeScoped, string const& activeProperty, string const& expandedActiveProperty,
        string const& expandedProperty, Json const& value, string const& baseUrl, std::optional<string> const& inputType,
        bool frame, Json& result
      ) -> void;
      auto languageMap(Context const& ctx, string const& key, Json const& value) -> Json;
      auto indexMap(Context const& ctx, string const& key, Json const& value, string const& baseUrl, bool frame) -> Json;
    };

    auto Expander::element(Context const& activeCtx, string const& activeProperty, Json const& element, string const& baseUrl, Flags flags)
      -> Json {
      if (element.is_null()) return nullptr;
      if (activeProperty == "@default") flags.frameExpansion = false;

      auto const expandedActiveProperty = activeProperty.empty() ? string() : activeCtx.expandIri(activeProperty, false, true).value_or("");
      auto const* propertyDef = activeCtx.termDefinition(activeProperty);
      auto const hasScopedContext = propertyDef && propertyDef->context;

      // Scalars
      if (!element.is_structured()) {
        if (expandedActiveProperty.empty() || expandedActiveProperty == "@graph") return nullptr;
        if (hasScopedContext) {
          auto const ctx = activeCtx.parse(*propertyDef->context, propertyDef->contextBase, {.overrideProtected = true});
          return ctx.expandValue(activeProperty, element);
        }
        return activeCtx.expandValue(activeProperty, element);
      }

      // Arrays
      if (element.is_array()) {
        auto const inList = flags.insideList || activeCtx.hasContainer(activeProperty, "@list");
        auto res = Json::array();
        for (auto const& item: element) {
          auto expanded = this->element(activeCtx, activeProperty, item, baseUrl, {flags.frameExpansion, flags.fromMap, false});
          if (inList && (expanded.is_array() || isList(expanded))) throw JsonLdError(ErrorCode::listOfLists, activeProperty);
          if (expanded.is_array()) res.insert(res.end(), expanded.begin(), expanded.end());
          else if (!expanded.is_null()) res.push_back(std::move(expanded));
        }
        return res;
      }

      // Maps
      auto ctx = activeCtx;
      if (ctx.previousContext() && !flags.fromMap) {
        auto hasValue = false;
        auto onlyId = element.size() == 1;
        for (auto const& [key, _]: element.items()) {
          auto const expanded = ctx.expandIri(key, false, true);
          if (expanded == "@value") hasValue = true;
          if (expanded != "@id") onlyId = false;
        }
        if (!hasValue && !onlyId) ctx = Context(*ctx.previousContext());
      }
      if (hasScopedContext) ctx = ctx.parse(*propertyDef->context, propertyDef->contextBase, {.overrideProtected = true});
      if (element.contains("@context")) ctx = ctx.parse(element["@context"], baseUrl, {});

      auto const typeScoped = ctx;
      auto inputType = std::optional<string>();
      for (auto const& [key, value]: element.items()) {
        if (typeScoped.expandIri(key, false, true) != "@type") continue;
        auto types = vector<string>();
        for (auto const& t: arrayify(value))
          if (t.is_string()) types.push_back(t.get<string>());
        for (auto const& t: sorted(types))
          if (auto const* def = typeScoped.termDefinition(t); def && def->context)
            ctx = ctx.parse(*def->context, def->contextBase, {.propagate = false});
        if (!inputType && !types.empty()) inputType = typeScoped.expandIri(types.back(), false, true);
      }

      auto result = Json::object();
      object(ctx, typeScoped, activeProperty, expandedActiveProperty, element, baseUrl, inputType, flags.frameExpansion, result);
      auto const frame = flags.frameExpansion;

      if (result.contains("@value")) {
        static auto const allowed = std::set<string>{"@direction", "@index", "@language", "@type", "@value"};
        for (auto const& [k, _]: result.items())
          if (!allowed.contains(k)) throw JsonLdError(ErrorCode::invalidValueObject, "unexpected " + k);
        if (result.contains("@type") && (result.contains("@language") || result.contains("@direction")))
          throw JsonLdError(ErrorCode::invalidValueObject, "typed value with language or direction");
        auto const& v = result["@value"];
        if (result.contains("@type") && result["@type"] == "@json") {
          // Any JSON is allowed
        } else if (v.is_null() || (v.is_array() && v.empty())) {
          return nullptr;
        } else if (!frame && !v.is_string() && result.contains("@language")) {
          throw JsonLdError(ErrorCode::invalidLanguageTaggedValue, v.dump());
        } else if (!frame && result.contains("@type")) {
          auto const& t = result["@type"];
          if (!t.is_string() || !isAbsoluteIri(t.get<string>()) || isBlankNodeId(t.get<string>()))
            throw JsonLdError(ErrorCode::invalidTypedValue, t.dump());
        }
      } else {
        if (result.contains("@type") && !result["@type"].is_array()) result["@type"] = arrayify(result["@type"]);
        if (result.contains("@set") || result.contains("@list")) {
          if (result.size() > 2 || (result.size() == 2 && !result.contains("@index")))
            throw JsonLdError(ErrorCode::invalidSetOrListObject, result.dump());
          if (result.contains("@set")) {
            auto set = std::move(result["@set"]);
            result = std::move(set);
          }
        }
      }

      if (result.is_object() && result.size() == 1 && result.contains("@language")) return nullptr;

      // Drop free-floating values; frames keep bare node references as `@id` patterns
      if ((expandedActiveProperty.empty() || expandedActiveProperty == "@graph") && result.is_object()) {
        if (result.empty() || result.contains("@value") || result.contains("@list")) return nullptr;
        if (!frame && result.size() == 1 && result.contains("@id")) return nullptr;
      }
      return result;
    }

    auto Expander::object(
      Context const& ctx, Context const& typeScoped, string const& activeProperty, string const& expandedActiveProperty,
      Json const& element, string const& baseUrl, std::optional<string> const& inputType, bool frame, Json& result
    ) -> void {
      auto nests = vector<string>();

      for (auto const& [key, value]: element.items()) {
        if (key == "@context") continue;
        auto const expanded = ctx.expandIri(key, false, true);
        if (!expanded || (!expanded->contains(':') && !isKeyword(*expanded))) continue;
        auto const& expandedProperty = *expanded;

        if (isKeyword(expandedProperty)) {
          if (expandedActiveProperty == "@reverse") throw JsonLdError(ErrorCode::invalidReversePropertyMap, key);
          if (result.contains(expandedProperty) && expandedProperty != "@included" &&
              (expandedProperty != "@type" || ctx.isLegacyMode()))
            throw JsonLdError(ErrorCode::collidingKeywords, expandedProperty);
          if (expandedProperty == "@nest") {
            nests.push_back(key);
            continue;
          }
          keyword(ctx, typeScoped, activeProperty, expandedActiveProperty, expandedProperty, value, baseUrl, inputType, frame, result);
          continue;
        }

        auto const* def = ctx.termDefinition(key);
        auto const noContainer = std::set<string>();
        auto const& container = def ? def->container : noContainer;
        auto expandedValue = Json();
        if (def && def->type == "@json") {
          expandedValue = Json{{"@value", value}, {"@type", "@json"}};
        } else if (container.contains("@language") && value.is_object()) {
          expandedValue = languageMap(ctx, key, value);
        } else if ((container.contains("@index") || container.contains("@type") || container.contains("@id")) && value.is_object()) {
          expandedValue = indexMap(ctx, key, value, baseUrl, frame);
        } else {
          expandedValue = this->element(ctx, key, value, baseUrl, {.frameExpansion = frame});
        }
        if (expandedValue.is_null()) continue;

        if (container.contains("@list") && !isList(expandedValue)) expandedValue = Json{{"@list", arrayify(expandedValue)}};
        if (container.contains("@graph") && !container.contains("@id") && !container.contains("@index")) {
          auto wrapped = Json::array();
          for (auto const& ev: arrayify(expandedValue)) wrapped.push_back(Json{{"@graph", arrayify(ev)}});
          expandedValue = std::move(wrapped);
        }

        if (def && def->reverse) {
          if (!result.contains("@reverse")) result["@reverse"] = Json::object();
          auto& reverseMap = result["@reverse"];
          for (auto const& item: arrayify(expandedValue)) {
            if (isValue(item) || isList(item)) throw JsonLdError(ErrorCode::invalidReversePropertyValue, key);
            addValue(reverseMap, expandedProperty, item, {.propertyIsArray = true});
          }
        } else {
          addValue(result, expandedProperty, expandedValue, {.propertyIsArray = true});
        }
      }

      for (auto const& nestingKey: nests) {
        for (auto const& nested: arrayify(element[nestingKey])) {
          if (!nested.is_object()) throw JsonLdError(ErrorCode::invalidNestValue, nestingKey);
          for (auto const& [k, _]: nested.items())
            if (ctx.expandIri(k, false, true) == "@value") throw JsonLdError(ErrorCode::invalidNestValue, "@value in nested object");
          object(ctx, typeScoped, activeProperty, expandedActiveProperty, nested, baseUrl, inputType, frame, result);
        }
      }
    }

    auto Expander::keyword(
      Context const& ctx, Context const& typeScoped, string const& activeProperty, string const& expandedActiveProperty,
      string const& expandedProperty, Json const& value, string const& baseUrl, std::optional<string> const& inputType,
      bool frame, Json& result
    ) -> void {
      auto expandedValue = Json();

      switch (*parseKeyword(expandedProperty)) {
        case Keyword::atId: {
          auto const expandId = [&](Json const& v) -> Json {
            if (!v.is_string()) return v;
            auto const id = ctx.expandIri(v.get<string>(), true, false);
            return id ? Json(*id) : Json(nullptr);
          };
          if (value.is_string()) expandedValue = expandId(value);
          else if (!frame || !(isEmptyMap(value) || isStringArray(value))) throw JsonLdError(ErrorCode::invalidIdValue, value.dump());
          if (frame) {
            expandedValue = Json::array();
            for (auto const& v: arrayify(value)) expandedValue.push_back(expandId(v));
          }
          break;
        }

        case Keyword::atType: {
          auto const isDefault = frame && value.is_object() && value.size() == 1 && value.contains("@default") &&
                                 value["@default"].is_string();
          if (!value.is_string() && !isStringArray(value) && !(frame && (isEmptyMap(value) || isDefault)))
            throw JsonLdError(ErrorCode::invalidTypeValue, value.dump());
          auto const expandType = [&](string const& t) -> Json {
            auto const iri = typeScoped.expandIri(t, true, true);
            return iri ? Json(*iri) : Json(nullptr);
          };
          if (isEmptyMap(value)) expandedValue = value;
          else if (isDefault) expandedValue = Json{{"@default", expandType(value["@default"].get<string>())}};
          else if (value.is_string()) expandedValue = expandType(value.get<string>());
          else {
            expandedValue = Json::array();
            for (auto const& t: value)
              if (auto iri = expandType(t.get<string>()); !iri.is_null()) expandedValue.push_back(std::move(iri));
          }
          if (result.contains("@type")) {
            auto combined = arrayify(result["@type"]);
            for (auto const& t: arrayify(expandedValue)) combined.push_back(t);
            expandedValue = std::move(combined);
          }
          if (frame) expandedValue = arrayify(expandedValue);
          break;
        }

        case Keyword::atGraph:
          expandedValue = arrayify(element(ctx, "@graph", value, baseUrl, {.frameExpansion = frame}));
          break;

        case Keyword::atIncluded: {
          if (ctx.isLegacyMode()) return;
          expandedValue = arrayify(element(ctx, activeProperty, value, baseUrl, {.frameExpansion = frame}));
          for (auto const& item: expandedValue)
            if (!isNodeObject(item)) throw JsonLdError(ErrorCode::invalidIncludedValue, item.dump());
          if (result.contains("@included")) {
            auto combined = result["@included"];
            combined.insert(combined.end(), expandedValue.begin(), expandedValue.end());
            expandedValue = std::move(combined);
          }
          break;
        }

        case Keyword::atValue:
          if (inputType == "@json") {
            if (ctx.isLegacyMode()) throw JsonLdError(ErrorCode::invalidValueObjectValue, "@json in JSON-LD 1.0 mode");
            result["@value"] = value;
            return;
          }
          if (value.is_structured() && !(frame && (isEmptyMap(value) || isScalarArray(value))))
            throw JsonLdError(ErrorCode::invalidValueObjectValue, value.dump());
          if (value.is_null()) {
            result["@value"] = nullptr;
            return;
          }
          expandedValue = frame ? arrayify(value) : value;
          break;

        case Keyword::atLanguage:
          if (value.is_string()) expandedValue = lowercase(value.get<string>());
          else if (frame && (isEmptyMap(value) || isStringArray(value))) {
            expandedValue = Json::array();
            for (auto const& l: arrayify(value)) expandedValue.push_back(l.is_string() ? Json(lowercase(l.get<string>())) : l);
          } else {
            throw JsonLdError(ErrorCode::invalidLanguageTaggedString, value.dump());
          }
          if (frame) expandedValue = arrayify(expandedValue);
          break;

        case Keyword::atDirection:
          if (ctx.isLegacyMode()) return;
          if (value == "ltr" || value == "rtl") expandedValue = value;
          else if (frame && (isEmptyMap(value) || isStringArray(value))) expandedValue = value;
          else throw JsonLdError(ErrorCode::invalidBaseDirection, value.dump());
          if (frame) expandedValue = arrayify(expandedValue);
          break;

        case Keyword::atIndex:
          if (!value.is_string()) throw JsonLdError(ErrorCode::invalidIndexValue, value.dump());
          expandedValue = value;
          break;

        case Keyword::atList: {
          if (expandedActiveProperty.empty() || expandedActiveProperty == "@graph") return;
          expandedValue = element(ctx, activeProperty, value, baseUrl, {.frameExpansion = frame, .insideList = true});
          if (isList(expandedValue)) throw JsonLdError(ErrorCode::listOfLists, activeProperty);
          expandedValue = arrayify(expandedValue);
          break;
        }

        case Keyword::atSet:
          expandedValue = element(ctx, activeProperty, value, baseUrl, {.frameExpansion = frame});
          break;

        case Keyword::atReverse: {
          if (!value.is_object()) throw JsonLdError(ErrorCode::invalidReverseValue, value.dump());
          auto const reversed = element(ctx, "@reverse", value, baseUrl, {.frameExpansion = frame});
          if (!reversed.is_object()) return;
          if (reversed.contains("@reverse"))
            for (auto const& [property, item]: reversed["@reverse"].items()) addValue(result, property, item, {.propertyIsArray = true});
          for (auto const& [property, items]: reversed.items()) {
            if (property == "@reverse") continue;
            if (!result.contains("@reverse")) result["@reverse"] = Json::object();
            for (auto const& item: items) {
              if (isValue(item) || isList(item)) throw JsonLdError(ErrorCode::invalidReversePropertyValue, property);
              addValue(result["@reverse"], property, item, {.propertyIsArray = true});
            }
          }
          return;
        }

        case Keyword::atDefault:
          if (!frame) return;
          expandedValue = value == "@null" ? value : element(ctx, "@default", value, baseUrl, {});
          expandedValue = arrayify(expandedValue);
          break;

        case Keyword::atEmbed:
        case Keyword::atExplicit:
        case Keyword::atOmitDefault:
        case Keyword::atRequireAll:
          if (!frame) return;
          expandedValue = arrayify(value);
          break;

        default:
          // Context-only keywords and `@preserve`, `@first`, `@none`, `@json` carry no meaning here
          return;
      }

      if (!expandedValue.is_null()) result[expandedProperty] = std::move(expandedValue);
    }

    auto Expander::languageMap(Context const& ctx, string const& key, Json const& value) -> Json {
      auto res = Json::array();
      auto const direction = ctx.directionMapping(key);
      for (auto const& [language, languageValue]: value.items()) {
        auto const none = ctx.expandIri(language, false, true) == "@none";
        for (auto const& item: arrayify(languageValue)) {
          if (item.is_null()) continue;
          if (!item.is_string()) throw JsonLdError(ErrorCode::invalidLanguageMapValue, item.dump());
          auto v = Json{{"@value", item}};
          if (!none) v["@language"] = lowercase(language);
          if (direction) v["@direction"] = *direction;
          res.push_back(std::move(v));
        }
      }
      return res;
    }

    auto Expander::indexMap(Context const& ctx, string const& key, Json const& value, string const& baseUrl, bool frame) -> Json {
      auto const& def = *ctx.termDefinition(key);
      auto const& container = def.container;
      auto const indexKey = def.index.value_or("@index");
      auto res = Json::array();

      for (auto const& [index, indexValue]: value.items()) {
        auto mapCtx = ctx;
        if (container.contains("@type")) {
          if (auto const* prev = ctx.previousContext()) mapCtx = *prev;
          if (auto const* indexDef = mapCtx.termDefinition(index); indexDef && indexDef->context)
            mapCtx = mapCtx.parse(*indexDef->context, indexDef->contextBase, {.propagate = false});
        }
        auto const expandedIndex = ctx.expandIri(index, false, true);
        auto const none = expandedIndex == "@none";
        auto const items = element(mapCtx, key, arrayify(indexValue), baseUrl, {.frameExpansion = frame, .fromMap = true});

        for (auto item: arrayify(items)) {
          if (container.contains("@graph") && !isGraph(item)) item = Json{{"@graph", arrayify(item)}};
          if (container.contains("@index") && indexKey != "@index" && !none) {
            if (isValue(item)) throw JsonLdError(ErrorCode::invalidValueObject, "property-valued index on a value object");
            auto const property = ctx.expandIri(indexKey, false, true);
            if (!property) throw JsonLdError(ErrorCode::invalidTermDefinition, "@index does not expand: " + indexKey);
            auto values = Json::array({ctx.expandValue(indexKey, index)});
            if (item.contains(*property))
              for (auto const& v: arrayify(item[*property])) values.push_back(v);
            item[*property] = std::move(values);
          } else if (container.contains("@index") && !item.contains("@index") && !none) {
            item["@index"] = index;
          } else if (container.contains("@id") && !item.contains("@id") && !none) {
            auto const id = ctx.expandIri(index, true, false);
            item["@id"] = id ? Json(*id) : Json(nullptr);
          } else if (container.contains("@type") && !none && expandedIndex) {
            auto types = Json::array({*expandedIndex});
            if (item.contains("@type"))
              for (auto const& t: arrayify(item["@type"])) types.push_back(t);
            item["@type"] = std::move(types);
          }
          res.push_back(std::move(item));
        }
      }
      return res;
    }

  }

  auto expand(Context const& activeCtx, Json const& element, string const& baseUrl, bool frameExpansion) -> Json {
    auto expanded = Expander().element(activeCtx, "", element, baseUrl, {.frameExpansion = frameExpansion});
    if (expanded.is_object() && expanded.size() == 1 && expanded.contains("@graph")) {
      auto graph = std::move(expanded["@graph"]);
      expanded = std::move(graph);
    }
    if (expanded.is_null()) return Json::array();
    return arrayify(expanded);
  }

#include "macros_close.hpp"
}
