#ifndef LDMILL_RDF_DATASET_HPP
#define LDMILL_RDF_DATASET_HPP

#include <compare>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include <common.hpp>

namespace ldmill::rdf {
#include "macros_open.hpp"

  namespace vocab {
    inline std::string const rdf = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    inline std::string const xsd = "http://www.w3.org/2001/XMLSchema#";

    inline std::string const rdfType = rdf + "type";
    inline std::string const rdfFirst = rdf + "first";
    inline std::string const rdfRest = rdf + "rest";
    inline std::string const rdfNil = rdf + "nil";
    inline std::string const rdfList = rdf + "List";
    inline std::string const rdfLangString = rdf + "langString";
    inline std::string const rdfJson = rdf + "JSON";

    inline std::string const xsdBoolean = xsd + "boolean";
    inline std::string const xsdDouble = xsd + "double";
    inline std::string const xsdInteger = xsd + "integer";
    inline std::string const xsdString = xsd + "string";
  }

  struct Iri {
    std::string value;
    auto operator<=>(Iri const&) const = default;
  };

  // The label includes the `_:` prefix.
  struct BlankNode {
    std::string label;
    auto operator<=>(BlankNode const&) const = default;
  };

  // `language` is non-empty only for `rdf:langString` literals.
  struct Literal {
    std::string value;
    std::string datatype = vocab::xsdString;
    std::string language;
    auto operator<=>(Literal const&) const = default;
  };

  using Node = std::variant<Iri, BlankNode, Literal>;

  // The IRI, blank node label or lexical form.
  auto nodeValue(Node const& node) -> std::string const&;

  inline auto isIri(Node const& node) -> bool {
    return std::holds_alternative<Iri>(node);
  }
  inline auto isBlank(Node const& node) -> bool {
    return std::holds_alternative<BlankNode>(node);
  }
  inline auto isLiteral(Node const& node) -> bool {
    return std::holds_alternative<Literal>(node);
  }

  // Builds a blank node for `_:` labels and an IRI otherwise.
  auto resource(std::string const& id) -> Node;

  // `graph` is empty for quads of the default graph.
  struct Quad {
    Node subject;
    Node predicate;
    Node object;
    std::optional<Node> graph;
    auto operator<=>(Quad const&) const = default;
  };

  // Name of the graph holding `quad` in a `Dataset`: the graph IRI or label, or `@default`.
  auto graphName(Quad const& quad) -> std::string;

  // Quads grouped by graph name (`@default` for the default graph).
  // Within a graph, quads keep insertion order and are never duplicated.
  class Dataset {
  public:
    Dataset();

    // Adds a quad to its graph; returns false if it was already present.
    auto add(Quad quad) -> bool;

    auto graphs() const -> std::map<std::string, std::vector<Quad>> const& {
      return graphMap;
    }
    auto quads(std::string const& graph) const -> std::vector<Quad> const&;
    // All quads, graph by graph.
    auto allQuads() const -> std::vector<Quad>;
    auto size() const -> size_t;
    auto empty() const -> bool {
      return size() == 0;
    }

    auto operator==(Dataset const& other) const -> bool {
      return graphMap == other.graphMap;
    }

  private:
    std::map<std::string, std::vector<Quad>> graphMap;
    std::map<std::string, std::set<Quad>> seen;
  };

#include "macros_close.hpp"
}

#endif // LDMILL_RDF_DATASET_HPP
