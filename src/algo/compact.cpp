#include "compact.hpp"
#include <set>
#include <core/error.hpp>
#include <core/value.hpp>

using std::string;
using std::vector;

namespace ldmill::algo {
#include "macros_open.hpp"

  using namespace core;

  namespace {

    class Compactor {
    public:
      explicit Compactor(bool compactArrays):
        compactArrays(compactArrays) {}

      auto element(Context const& activeCtx, string const& activeProperty, Json const& element) -> Json;

    private:
      bool compactArrays;

      auto item(Context const& ctx, string const& expandedProperty, Json const& expandedItem, bool insideReverse, Json& result) -> void;
    };

    auto alias(Context const& ctx, string const& keyword) -> string {
      return ctx.compactIri(keyword, nullptr, true);
    }

    // The object an item of `property` goes into: the result itself, or the entry of its nesting term.
    auto nestTarget(Context const& ctx, Json& result, string const& property) -> Json& {
      auto const* def = ctx.termDefinition(property);
      if (!def || !def->nest) return result;
      auto const& nestTerm = *def->nest;
      if (nestTerm != "@nest" && ctx.expandIri(nestTerm, false, true) != "@nest") throw JsonLdError(ErrorCode::invalidNestValue, nestTerm);
      if (!result.contains(nestTerm)) result[nestTerm] = Json::object();
      return result[nestTerm];
    }

    // Takes the first value of `key` in a compacted item as its map key, keeping the rest.
    auto takeFirst(Json& compactedItem, string const& key) -> Json {
      if (!compactedItem.is_object() || !compactedItem.contains(key)) return nullptr;
      auto values = arrayify(compactedItem[key]);
      if (values.empty() || !values[0].is_string()) return nullptr;
      auto first = values[0];
      compactedItem.erase(key);
      for (auto i = 1uz; i < values.size(); i++) addValue(compactedItem, key, values[i]);
      return first;
    }

    auto Compactor::element(Context const& activeCtx, string const& activeProperty, Json const& element) -> Json {
      if (!element.is_structured()) return element;

      if (element.is_array()) {
        auto res = Json::array();
        for (auto const& e: element) {
          auto compacted = this->element(activeCtx, activeProperty, e);
          if (!compacted.is_null()) res.push_back(std::move(compacted));
        }
        if (res.size() != 1 || !compactArrays || activeProperty == "@graph" || activeProperty == "@set" ||
            activeCtx.hasContainer(activeProperty, "@list") || activeCtx.hasContainer(activeProperty, "@set"))
          return res;
        return res[0];
      }

      auto ctx = activeCtx;
      if (ctx.previousContext() && !element.contains("@value") && !isSubjectReference(element)) ctx = Context(*ctx.previousContext());
      if (auto const* def = activeCtx.termDefinition(activeProperty); def && def->context)
        ctx = ctx.parse(*def->context, def->contextBase, {.overrideProtected = true});

      if (element.contains("@value") || element.contains("@id")) {
        auto res = ctx.compactValue(activeProperty, element);
        if (!res.is_structured() || ctx.typeMapping(activeProperty) == "@json") return res;
      }

      if (isList(element) && ctx.hasContainer(activeProperty, "@list")) return this->element(ctx, activeProperty, element["@list"]);

      auto const insideReverse = activeProperty == "@reverse";
      auto result = Json::object();

      auto const typeScoped = ctx;
      if (element.contains("@type")) {
        auto types = vector<string>();
        for (auto const& t: arrayify(element["@type"]))
          if (t.is_string()) types.push_back(typeScoped.compactIri(t.get<string>(), nullptr, true));
        for (auto const& term: sorted(types))
          if (auto const* def = typeScoped.termDefinition(term); def && def->context)
            ctx = ctx.parse(*def->context, def->contextBase, {.propagate = false});
      }

      for (auto const& [expandedProperty, expandedValue]: element.items()) {
        if (expandedProperty == "@id") {
          if (expandedValue.is_string()) result[alias(ctx, "@id")] = ctx.compactIri(expandedValue.get<string>(), nullptr, false);
          continue;
        }

        if (expandedProperty == "@type") {
          auto compacted = Json::array();
          for (auto const& t: arrayify(expandedValue)) compacted.push_back(typeScoped.compactIri(t.get<string>(), nullptr, true));
          auto const typeAlias = alias(ctx, "@type");
          auto const asArray = (!ctx.isLegacyMode() && ctx.hasContainer(typeAlias, "@set")) || !compactArrays;
          addValue(result, typeAlias, expandedValue.is_array() ? compacted : compacted[0], {.propertyIsArray = asArray});
          continue;
        }

        if (expandedProperty == "@reverse") {
          auto compacted = this->element(ctx, "@reverse", expandedValue);
          for (auto const& property: keysOf(compacted)) {
            if (!ctx.isReverseProperty(property)) continue;
            auto const asArray = ctx.hasContainer(property, "@set") || !compactArrays;
            addValue(result, property, compacted[property], {.propertyIsArray = asArray});
            compacted.erase(property);
          }
          if (!compacted.empty()) result[alias(ctx, "@reverse")] = std::move(compacted);
          continue;
        }

        if (expandedProperty == "@index" && ctx.hasContainer(activeProperty, "@index")) continue;

        if (expandedProperty == "@direction" || expandedProperty == "@index" || expandedProperty == "@language" ||
            expandedProperty == "@value") {
          result[alias(ctx, expandedProperty)] = expandedValue;
          continue;
        }

        if (expandedValue.is_array() && expandedValue.empty()) {
          auto const itemActiveProperty = ctx.compactIri(expandedProperty, expandedValue, true, insideReverse);
          auto& nestResult = nestTarget(ctx, result, itemActiveProperty);
          addValue(nestResult, itemActiveProperty, Json::array(), {.propertyIsArray = true});
        }

        for (auto const& expandedItem: arrayify(expandedValue)) item(ctx, expandedProperty, expandedItem, insideReverse, result);
      }
      return result;
    }

    auto Compactor::item(Context const& ctx, string const& expandedProperty, Json const& expandedItem, bool insideReverse, Json& result)
      -> void {
      auto const itemActiveProperty = ctx.compactIri(expandedProperty, expandedItem, true, insideReverse);
      auto& nestResult = nestTarget(ctx, result, itemActiveProperty);
      auto const* def = ctx.termDefinition(itemActiveProperty);
      auto const noContainer = std::set<string>();
      auto const& container = def ? def->container : noContainer;
      auto const asArray = container.contains("@set") || itemActiveProperty == "@graph" || itemActiveProperty == "@list" || !compactArrays;

      auto const& itemToCompact = isList(expandedItem) ? expandedItem["@list"] : isGraph(expandedItem) ? expandedItem["@graph"] : expandedItem;
      auto compactedItem = element(ctx, itemActiveProperty, itemToCompact);

      if (isList(expandedItem)) {
        compactedItem = arrayify(compactedItem);
        if (!container.contains("@list")) {
          auto wrapper = Json{{alias(ctx, "@list"), std::move(compactedItem)}};
          if (expandedItem.contains("@index")) wrapper[alias(ctx, "@index")] = expandedItem["@index"];
          addValue(nestResult, itemActiveProperty, wrapper, {.propertyIsArray = asArray});
        } else {
          if (nestResult.contains(itemActiveProperty)) throw JsonLdError(ErrorCode::compactionToListOfLists, itemActiveProperty);
          nestResult[itemActiveProperty] = std::move(compactedItem);
        }
        return;
      }

      if (isGraph(expandedItem)) {
        if (container.contains("@graph") && container.contains("@id")) {
          auto& mapObject = nestResult[itemActiveProperty];
          if (!mapObject.is_object()) mapObject = Json::object();
          auto const mapKey = expandedItem.contains("@id") ? ctx.compactIri(expandedItem["@id"].get<string>(), nullptr, false)
                                                           : alias(ctx, "@none");
          addValue(mapObject, mapKey, compactedItem, {.propertyIsArray = asArray});
        } else if (container.contains("@graph") && container.contains("@index") && isSimpleGraph(expandedItem)) {
          auto& mapObject = nestResult[itemActiveProperty];
          if (!mapObject.is_object()) mapObject = Json::object();
          auto const mapKey = expandedItem.contains("@index") ? expandedItem["@index"].get<string>() : alias(ctx, "@none");
          addValue(mapObject, mapKey, compactedItem, {.propertyIsArray = asArray});
        } else if (container.contains("@graph") && isSimpleGraph(expandedItem)) {
          if (compactedItem.is_array() && compactedItem.size() > 1) compactedItem = Json{{alias(ctx, "@included"), std::move(compactedItem)}};
          addValue(nestResult, itemActiveProperty, compactedItem, {.propertyIsArray = asArray});
        } else {
          auto wrapper = Json{{alias(ctx, "@graph"), std::move(compactedItem)}};
          if (expandedItem.contains("@id")) wrapper[alias(ctx, "@id")] = ctx.compactIri(expandedItem["@id"].get<string>(), nullptr, false);
          if (expandedItem.contains("@index")) wrapper[alias(ctx, "@index")] = expandedItem["@index"];
          addValue(nestResult, itemActiveProperty, wrapper, {.propertyIsArray = asArray});
        }
        return;
      }

      if (container.contains("@graph") || !(container.contains("@language") || container.contains("@index") ||
                                             container.contains("@id") || container.contains("@type"))) {
        addValue(nestResult, itemActiveProperty, compactedItem, {.propertyIsArray = asArray});
        return;
      }

      auto& mapObject = nestResult[itemActiveProperty];
      if (!mapObject.is_object()) mapObject = Json::object();
      auto containerKey = alias(ctx, container.contains("@language") ? "@language"
                                     : container.contains("@index") ? "@index"
                                     : container.contains("@id")    ? "@id"
                                                                    : "@type");
      auto const indexKey = def->index.value_or("@index");
      auto mapKey = Json();

      if (container.contains("@language") && expandedItem.contains("@value")) {
        compactedItem = expandedItem["@value"];
        if (expandedItem.contains("@language")) mapKey = expandedItem["@language"];
      } else if (container.contains("@index") && indexKey == "@index") {
        if (expandedItem.contains("@index")) mapKey = expandedItem["@index"];
      } else if (container.contains("@index")) {
        containerKey = ctx.compactIri(ctx.expandIri(indexKey, false, true).value_or(indexKey), nullptr, true);
        mapKey = takeFirst(compactedItem, containerKey);
      } else if (container.contains("@id")) {
        if (compactedItem.is_object() && compactedItem.contains(containerKey)) {
          mapKey = compactedItem[containerKey];
          compactedItem.erase(containerKey);
        }
      } else {
        mapKey = takeFirst(compactedItem, containerKey);
        if (compactedItem.is_object() && compactedItem.size() == 1 &&
            ctx.expandIri(compactedItem.begin().key(), false, true) == "@id")
          compactedItem = element(ctx, itemActiveProperty, Json{{"@id", expandedItem["@id"]}});
      }

      auto const key = mapKey.is_string() ? mapKey.get<string>() : alias(ctx, "@none");
      addValue(mapObject, key, compactedItem, {.propertyIsArray = asArray});
    }

  }

  auto compact(Context const& activeCtx, string const& activeProperty, Json const& element, bool compactArrays) -> Json {
    return Compactor(compactArrays).element(activeCtx, activeProperty, element);
  }

#include "macros_close.hpp"
}
