#include "from_rdf.hpp"
#include <algorithm>
#include <charconv>
#include <map>
#include <regex>
#include <core/error.hpp>
#include <core/url.hpp>
#include <core/value.hpp>

using std::string;
using std::vector;

namespace ldmill::rdf {
#include "macros_open.hpp"

  using core::ErrorCode;
  using core::JsonLdError;
  using core::Options;

  namespace {

    auto parseInteger(string const& s) -> std::optional<int64_t> {
      auto res = int64_t{};
      auto const [end, ec] = std::from_chars(s.data(), s.data() + s.size(), res);
      if (ec != std::errc() || end != s.data() + s.size()) return std::nullopt;
      // Only the canonical form converts losslessly.
      if (std::to_string(res) != s) return std::nullopt;
      return res;
    }

    auto parseDouble(string const& s) -> std::optional<double> {
      static auto const pattern = std::regex(R"(^[+-]?(\d+(\.\d*)?|\.\d+)([Ee][+-]?\d+)?$)");
      if (!std::regex_match(s, pattern)) return std::nullopt;
      auto const start = s.starts_with('+') ? s.data() + 1 : s.data();
      auto res = 0.0;
      auto const [end, ec] = std::from_chars(start, s.data() + s.size(), res);
      if (ec != std::errc() || end != s.data() + s.size()) return std::nullopt;
      return res;
    }

    // Where a node is referenced from: `node`'s `property` holds `{"@id": value}`.
    struct Usage {
      string graph;
      string node;
      string property;
      string value;
    };

    // A blank node with exactly one `rdf:first` and one `rdf:rest` and nothing else besides `@id` and `@type: [rdf:List]`.
    auto isListNode(Json const& node) -> bool {
      if (!core::isBlankNodeId(node["@id"].get_ref<string const&>())) return false;
      auto const single = [&](string const& key) { return node.contains(key) && node[key].size() == 1; };
      if (!single(vocab::rdfFirst) || !single(vocab::rdfRest)) return false;
      auto size = 3uz;
      if (node.contains("@type")) {
        if (node["@type"] != Json::array({vocab::rdfList})) return false;
        size++;
      }
      return node.size() == size;
    }

    class Builder {
    public:
      explicit Builder(Options const& opts):
        opts(opts) {}

      auto graph(string const& name, vector<Quad> const& quads) -> void;
      auto convertLists() -> void;
      auto result() const -> Json;

    private:
      Options const& opts;
      // Graph name -> node identifier -> node.
      std::map<string, Json> graphs = {{"@default", Json::object()}};
      // Blank nodes referenced exactly once so far, by identifier; an empty usage marks several references.
      std::map<string, std::optional<Usage>> referencedOnce;
      vector<Usage> nilUsages;

      auto nodeIn(string const& graph, string const& id) -> Json& {
        auto& node = graphs[graph][id];
        if (node.is_null()) node = Json{{"@id", id}};
        return node;
      }
    };

    auto Builder::graph(string const& name, vector<Quad> const& quads) -> void {
      if (name != "@default") nodeIn("@default", name);
      graphs[name];

      for (auto const& quad: quads) {
        auto const& subject = nodeValue(quad.subject);
        auto const& predicate = nodeValue(quad.predicate);
        nodeIn(name, subject);

        if (!isLiteral(quad.object)) {
          auto const& object = nodeValue(quad.object);
          nodeIn(name, object);
          if (predicate == vocab::rdfType && !opts.useRdfType) {
            core::mergeValue(nodeIn(name, subject), "@type", object);
            continue;
          }
        }

        core::mergeValue(nodeIn(name, subject), predicate, rdfToObject(quad.object, opts));

        if (isLiteral(quad.object)) continue;
        auto const& object = nodeValue(quad.object);
        auto usage = Usage{name, subject, predicate, object};
        if (object == vocab::rdfNil) nilUsages.push_back(std::move(usage));
        else if (referencedOnce.contains(object)) referencedOnce[object].reset();
        else if (isBlank(quad.object)) referencedOnce[object] = std::move(usage);
      }
    }

    auto Builder::convertLists() -> void {
      for (auto const& nilUsage: nilUsages) {
        auto& graph = graphs[nilUsage.graph];
        auto usage = nilUsage;
        auto items = Json::array();
        auto listNodes = vector<string>();

        while (usage.property == vocab::rdfRest) {
          auto const& node = graph[usage.node];
          auto const& id = usage.node;
          auto const it = referencedOnce.find(id);
          if (it == referencedOnce.end() || !it->second || it->second->graph != nilUsage.graph || !isListNode(node)) break;
          items.push_back(node[vocab::rdfFirst][0]);
          listNodes.push_back(id);
          usage = *it->second;
          if (!core::isBlankNodeId(usage.node)) break;
        }

        if (usage.property == vocab::rdfRest && core::isBlankNodeId(usage.node))
          opts.warn("leaving malformed list unfolded at " + usage.node);
        std::reverse(items.begin(), items.end());
        // Replaces the reference to the first list node (or to `rdf:nil` for an empty list) with the list.
        for (auto& value: graph[usage.node][usage.property]) {
          if (!value.is_object() || core::member(value, "@id") != usage.value) continue;
          value.erase("@id");
          value["@list"] = items;
          break;
        }
        for (auto const& id: listNodes) graph.erase(id);
      }
    }

    auto Builder::result() const -> Json {
      auto res = Json::array();
      for (auto const& [id, node]: graphs.at("@default").items()) {
        auto entry = node;
        if (auto const it = graphs.find(id); id != "@default" && it != graphs.end()) {
          auto& members = (entry["@graph"] = Json::array());
          for (auto const& [_, member]: it->second.items())
            if (!core::isSubjectReference(member)) members.push_back(member);
        }
        if (!core::isSubjectReference(entry)) res.push_back(std::move(entry));
      }
      return res;
    }

  }

  auto rdfToObject(Node const& node, Options const& opts) -> Json {
    if (!isLiteral(node)) return Json{{"@id", nodeValue(node)}};

    auto const& literal = std::get<Literal>(node);
    auto res = Json{{"@value", literal.value}};
    if (!literal.language.empty()) {
      res["@language"] = literal.language;
      return res;
    }

    auto const& datatype = literal.datatype;
    if (opts.useNativeTypes) {
      if (datatype == vocab::xsdString) return res;
      if (datatype == vocab::xsdBoolean) {
        if (literal.value == "true") return Json{{"@value", true}};
        if (literal.value == "false") return Json{{"@value", false}};
      } else if (datatype == vocab::xsdInteger) {
        if (auto const i = parseInteger(literal.value)) return Json{{"@value", *i}};
      } else if (datatype == vocab::xsdDouble) {
        if (auto const d = parseDouble(literal.value)) return Json{{"@value", *d}};
      }
    }

    if (datatype == vocab::rdfJson && opts.processingMode != core::ProcessingMode::jsonLd10) {
      try {
        return Json{{"@value", Json::parse(literal.value)}, {"@type", "@json"}};
      } catch (Json::parse_error& e) {
        throw JsonLdError(ErrorCode::invalidJsonLiteral, e.what());
      }
    }

    if (datatype != vocab::xsdString) res["@type"] = datatype;
    return res;
  }

  auto fromRdf(Dataset const& dataset, Options const& opts) -> Json {
    auto builder = Builder(opts);
    for (auto const& [name, quads]: dataset.graphs()) builder.graph(name, quads);
    builder.convertLists();
    return builder.result();
  }

#include "macros_close.hpp"
}
