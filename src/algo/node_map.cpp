#include "node_map.hpp"
#include <core/error.hpp>
#include <core/keyword.hpp>
#include <core/url.hpp>
#include <core/value.hpp>

using std::string;

namespace ldmill::algo {
#include "macros_open.hpp"

  using namespace core;

  namespace {

    class NodeMapBuilder {
    public:
      NodeMapBuilder(Json& graphs, IdentifierIssuer& issuer):
        graphs(graphs),
        issuer(issuer) {}

      // `activeSubject` is null at the top level, an identifier for ordinary properties, and a node reference
      // while processing a reverse property. `list`, when given, receives items instead of the subject.
      auto element(Json const& element, string const& activeGraph, Json const& activeSubject, string const& activeProperty, Json* list)
        -> void;

    private:
      Json& graphs;
      IdentifierIssuer& issuer;

      auto relabel(string const& id) -> string {
        return isBlankNodeId(id) ? issuer.getId(id) : id;
      }

      auto graph(string const& name) -> Json& {
        auto& res = graphs[name];
        if (!res.is_object()) res = Json::object();
        return res;
      }

      // Adds `value` to the active subject (or the list being built).
      auto attach(string const& activeGraph, Json const& activeSubject, string const& activeProperty, Json* list, Json const& value)
        -> void {
        if (list) {
          (*list)["@list"].push_back(value);
        } else if (activeSubject.is_string()) {
          auto& subject = graph(activeGraph)[activeSubject.get<string>()];
          addValue(subject, activeProperty, value, {.propertyIsArray = true, .allowDuplicate = false});
        }
      }
    };

    auto NodeMapBuilder::element(Json const& element, string const& activeGraph, Json const& activeSubject, string const& activeProperty, Json* list)
      -> void {
      if (element.is_array()) {
        for (auto const& item: element) this->element(item, activeGraph, activeSubject, activeProperty, list);
        return;
      }
      if (!element.is_object()) throw JsonLdError(ErrorCode::invalidInput, "node map generation expects objects, got " + element.dump());

      // Relabel blank node types
      auto types = Json::array();
      if (element.contains("@type"))
        for (auto const& t: arrayify(element["@type"])) types.push_back(t.is_string() ? Json(relabel(t.get<string>())) : t);

      if (isValue(element)) {
        auto value = element;
        if (element.contains("@type") && !element["@type"].is_array()) value["@type"] = types[0];
        attach(activeGraph, activeSubject, activeProperty, list, value);
        return;
      }

      if (isList(element)) {
        auto result = Json{{"@list", Json::array()}};
        this->element(element["@list"], activeGraph, activeSubject, activeProperty, &result);
        if (element.contains("@index")) result["@index"] = element["@index"];
        attach(activeGraph, activeSubject, activeProperty, list, result);
        return;
      }

      // Node object
      auto const idValue = member(element, "@id");
      if (!idValue.is_null() && !idValue.is_string()) throw JsonLdError(ErrorCode::invalidIdValue, idValue.dump());
      auto const id = idValue.is_null() ? issuer.getId() : relabel(idValue.get<string>());

      {
        auto& node = graph(activeGraph)[id];
        if (!node.is_object()) node = Json{{"@id", id}};
      }

      auto const reference = Json{{"@id", id}};
      if (activeSubject.is_object()) {
        // Reverse property: the active subject is the value
        addValue(graph(activeGraph)[id], activeProperty, activeSubject, {.propertyIsArray = true, .allowDuplicate = false});
      } else if (!activeProperty.empty()) {
        attach(activeGraph, activeSubject, activeProperty, list, reference);
      }

      if (element.contains("@type")) {
        auto& node = graph(activeGraph)[id];
        addValue(node, "@type", types, {.propertyIsArray = true, .allowDuplicate = false});
      }

      if (element.contains("@index")) {
        auto& node = graph(activeGraph)[id];
        if (node.contains("@index") && node["@index"] != element["@index"])
          throw JsonLdError(ErrorCode::conflictingIndexes, "conflicting @index property detected for " + id);
        node["@index"] = element["@index"];
      }

      if (element.contains("@reverse")) {
        for (auto const& [reverseProperty, values]: element["@reverse"].items())
          for (auto const& v: arrayify(values)) this->element(v, activeGraph, reference, reverseProperty, nullptr);
      }

      if (element.contains("@graph")) this->element(element["@graph"], id, nullptr, "", nullptr);

      if (element.contains("@included")) this->element(element["@included"], activeGraph, nullptr, "", nullptr);

      for (auto const& [key, value]: element.items()) {
        if (key == "@id" || key == "@type" || key == "@index" || key == "@reverse" || key == "@graph" || key == "@included")
          continue;
        auto const property = relabel(key);
        {
          auto& node = graph(activeGraph)[id];
          if (!node.contains(property)) node[property] = Json::array();
        }
        this->element(value, activeGraph, id, property, nullptr);
      }
    }

  }

  auto generateNodeMap(Json const& expanded, Json& graphs, IdentifierIssuer& issuer) -> void {
    NodeMapBuilder(graphs, issuer).element(expanded, "@default", nullptr, "", nullptr);
  }

  auto createNodeMap(Json const& expanded, IdentifierIssuer& issuer) -> Json {
    auto graphs = Json{{"@default", Json::object()}};
    generateNodeMap(expanded, graphs, issuer);
    return graphs;
  }

  auto mergeNodeMaps(Json const& graphs) -> Json {
    auto result = Json::object();
    for (auto const& [_, nodeMap]: graphs.items()) {
      for (auto const& [id, node]: nodeMap.items()) {
        auto& merged = result[id];
        if (!merged.is_object()) merged = Json{{"@id", id}};
        for (auto const& [property, values]: node.items()) {
          if (property != "@type" && isKeyword(property)) {
            merged[property] = values;
          } else {
            addValue(merged, property, values, {.propertyIsArray = true, .allowDuplicate = false});
          }
        }
      }
    }
    return result;
  }

#include "macros_close.hpp"
}
