#include "to_rdf.hpp"
#include <cmath>
#include <core/identifier_issuer.hpp>
#include <core/keyword.hpp>
#include <core/url.hpp>
#include <core/value.hpp>
#include <algo/node_map.hpp>
#include "number_format.hpp"

using std::string;
using std::vector;

namespace ldmill::rdf {
#include "macros_open.hpp"

  using core::IdentifierIssuer;
  using core::Options;
  using core::isList;
  using core::isValue;

  auto isWellFormedLanguage(std::string_view tag) -> bool {
    auto const isAlpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); };
    auto const isAlnum = [&](char c) { return isAlpha(c) || (c >= '0' && c <= '9'); };
    auto first = true;
    while (true) {
      auto const end = tag.find('-');
      auto const part = tag.substr(0, end);
      if (part.empty() || part.size() > 8) return false;
      for (auto c: part)
        if (!(first ? isAlpha(c) : isAlnum(c))) return false;
      if (end == std::string_view::npos) return true;
      tag.remove_prefix(end + 1);
      first = false;
    }
  }

  auto isWellFormedIri(std::string_view iri) -> bool {
    if (!core::isAbsoluteIri(iri)) return false;
    for (auto c: iri) {
      if (static_cast<unsigned char>(c) <= 0x20) return false;
      switch (c) {
        case '<': case '>': case '"': case '{': case '}': case '|': case '^': case '`': case '\\': return false;
        default: break;
      }
    }
    return true;
  }

  namespace {

    // Integral numbers below 10^21 keep their integer form; everything else is an `xsd:double`.
    auto isIntegral(Json const& value) -> bool {
      if (value.is_number_integer()) return true;
      auto const d = value.get<double>();
      return std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e21;
    }

    auto integerForm(Json const& value) -> string {
      if (value.is_number_unsigned()) return std::to_string(value.get<uint64_t>());
      if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
      return formatNumber(value.get<double>());
    }

    class Converter {
    public:
      Converter(Options const& opts, IdentifierIssuer& issuer, Dataset& dataset):
        opts(opts),
        issuer(issuer),
        dataset(dataset) {}

      auto graph(string const& name, Json const& nodes) -> void;

    private:
      Options const& opts;
      IdentifierIssuer& issuer;
      Dataset& dataset;
      std::optional<Node> graphName;

      auto add(Node subject, Node predicate, Node object) -> void {
        dataset.add(Quad{std::move(subject), std::move(predicate), std::move(object), graphName});
      }
      auto object(Json const& item) -> std::optional<Node>;
      auto literal(Json const& item) -> std::optional<Node>;
      auto list(Json const& items) -> Node;
    };

    auto Converter::graph(string const& name, Json const& nodes) -> void {
      if (name == "@default") graphName.reset();
      else if (isWellFormedIri(name)) graphName = resource(name);
      else {
        opts.dropped("dropping graph with relative or malformed name: " + name);
        return;
      }

      for (auto const& [id, node]: nodes.items()) {
        if (!isWellFormedIri(id)) {
          opts.dropped("dropping node with relative or malformed identifier: " + id);
          continue;
        }
        auto const subject = resource(id);
        for (auto const& [property, values]: node.items()) {
          if (property == "@type") {
            for (auto const& type: values) {
              auto const& t = type.get_ref<string const&>();
              if (isWellFormedIri(t)) add(subject, Iri{vocab::rdfType}, resource(t));
              else opts.dropped("dropping relative or malformed type: " + t);
            }
            continue;
          }
          if (core::isKeyword(property)) continue;
          if (core::isBlankNodeId(property) && !opts.produceGeneralizedRdf) {
            opts.dropped("dropping blank node predicate: " + property);
            continue;
          }
          if (!isWellFormedIri(property)) {
            opts.dropped("dropping relative or malformed property: " + property);
            continue;
          }
          auto const predicate = resource(property);
          for (auto const& item: values)
            if (auto o = object(item)) add(subject, predicate, std::move(*o));
        }
      }
    }

    auto Converter::object(Json const& item) -> std::optional<Node> {
      if (isList(item)) return list(item["@list"]);
      if (isValue(item)) return literal(item);
      auto const& id = item["@id"].get_ref<string const&>();
      if (!isWellFormedIri(id)) {
        opts.dropped("dropping reference with relative or malformed identifier: " + id);
        return std::nullopt;
      }
      return resource(id);
    }

    auto Converter::literal(Json const& item) -> std::optional<Node> {
      auto const& value = item["@value"];
      auto datatype = item.contains("@type") ? item["@type"].get<string>() : string();

      if (!datatype.empty() && datatype != "@json" && !isWellFormedIri(datatype)) {
        opts.dropped("dropping literal with relative or malformed datatype: " + datatype);
        return std::nullopt;
      }
      if (item.contains("@language") && !isWellFormedLanguage(item["@language"].get_ref<string const&>())) {
        opts.dropped("dropping literal with malformed language tag: " + item["@language"].get<string>());
        return std::nullopt;
      }

      if (datatype == "@json") return Literal{canonicalJson(value), vocab::rdfJson};
      if (value.is_boolean()) return Literal{value.get<bool>() ? "true" : "false", datatype.empty() ? vocab::xsdBoolean : datatype};
      if (value.is_number()) {
        if (!isIntegral(value) || datatype == vocab::xsdDouble)
          return Literal{formatXsdDouble(value.get<double>()), datatype.empty() ? vocab::xsdDouble : datatype};
        return Literal{integerForm(value), datatype.empty() ? vocab::xsdInteger : datatype};
      }
      if (item.contains("@language"))
        return Literal{value.get<string>(), vocab::rdfLangString, item["@language"].get<string>()};
      return Literal{value.get<string>(), datatype.empty() ? vocab::xsdString : datatype};
    }

    auto Converter::list(Json const& items) -> Node {
      if (items.empty()) return Iri{vocab::rdfNil};
      auto nodes = vector<Node>();
      for (auto i = 0uz; i < items.size(); i++) nodes.push_back(BlankNode{issuer.getId()});
      for (auto i = 0uz; i < items.size(); i++) {
        if (auto o = object(items[i])) add(nodes[i], Iri{vocab::rdfFirst}, std::move(*o));
        add(nodes[i], Iri{vocab::rdfRest}, i + 1 < nodes.size() ? nodes[i + 1] : Node(Iri{vocab::rdfNil}));
      }
      return nodes[0];
    }

  }

  auto toRdf(Json const& expanded, Options const& opts) -> Dataset {
    auto issuer = IdentifierIssuer("_:b");
    auto const graphs = algo::createNodeMap(expanded, issuer);
    auto res = Dataset();
    auto converter = Converter(opts, issuer, res);
    for (auto const& [name, nodes]: graphs.items()) converter.graph(name, nodes);
    return res;
  }

#include "macros_close.hpp"
}
