#include "flatten.hpp"
#include <core/identifier_issuer.hpp>
#include <core/value.hpp>
#include "node_map.hpp"

namespace ldmill::algo {
#include "macros_open.hpp"

  using namespace core;

  auto flatten(Json const& expanded) -> Json {
    auto issuer = IdentifierIssuer("_:b");
    auto graphs = createNodeMap(expanded, issuer);
    auto& defaultGraph = graphs["@default"];

    for (auto const& [graphName, nodeMap]: graphs.items()) {
      if (graphName == "@default") continue;
      auto& entry = defaultGraph[graphName];
      if (!entry.is_object()) entry = Json{{"@id", graphName}};
      auto& graph = entry["@graph"];
      if (!graph.is_array()) graph = Json::array();
      for (auto const& [_, node]: nodeMap.items())
        if (!isSubjectReference(node)) graph.push_back(node);
    }

    auto flattened = Json::array();
    for (auto const& [_, node]: defaultGraph.items())
      if (!isSubjectReference(node)) flattened.push_back(node);
    return flattened;
  }

#include "macros_close.hpp"
}
