#include "dataset.hpp"

namespace ldmill::rdf {
#include "macros_open.hpp"

  auto nodeValue(Node const& node) -> std::string const& {
    if (auto const* iri = std::get_if<Iri>(&node)) return iri->value;
    if (auto const* blank = std::get_if<BlankNode>(&node)) return blank->label;
    return std::get<Literal>(node).value;
  }

  auto resource(std::string const& id) -> Node {
    if (id.starts_with("_:")) return BlankNode{id};
    return Iri{id};
  }

  auto graphName(Quad const& quad) -> std::string {
    return quad.graph ? nodeValue(*quad.graph) : "@default";
  }

  Dataset::Dataset() {
    graphMap["@default"];
  }

  auto Dataset::add(Quad quad) -> bool {
    auto const name = graphName(quad);
    if (!seen[name].insert(quad).second) return false;
    graphMap[name].push_back(std::move(quad));
    return true;
  }

  auto Dataset::quads(std::string const& graph) const -> std::vector<Quad> const& {
    static auto const none = std::vector<Quad>();
    auto const it = graphMap.find(graph);
    return it == graphMap.end() ? none : it->second;
  }

  auto Dataset::allQuads() const -> std::vector<Quad> {
    auto res = std::vector<Quad>();
    for (auto const& [_, quads]: graphMap) res.insert(res.end(), quads.begin(), quads.end());
    return res;
  }

  auto Dataset::size() const -> size_t {
    auto res = 0uz;
    for (auto const& [_, quads]: graphMap) res += quads.size();
    return res;
  }

#include "macros_close.hpp"
}
