#include "frame.hpp"
#include <map>
#include <optional>
#include <set>
#include <core/error.hpp>
#include <core/identifier_issuer.hpp>
#include <core/keyword.hpp>
#include <core/url.hpp>
#include <core/value.hpp>
#include "node_map.hpp"

using std::string;
using std::vector;

namespace ldmill::algo {
#include "macros_open.hpp"

  using namespace core;

  namespace {

    struct Flags {
      Embed embed;
      bool explicitInclusion;
      bool requireAll;
    };

    // Frame flags are arrays after expansion; a single element (or its `@value`) is the flag.
    auto flagValue(Json const& frame, string const& key) -> Json const* {
      if (!frame.is_object()) return nullptr;
      auto const it = frame.find(key);
      if (it == frame.end()) return nullptr;
      auto const* v = &*it;
      if (v->is_array()) {
        if (v->empty()) return nullptr;
        v = &v->front();
      }
      if (v->is_object() && v->contains("@value")) v = &v->at("@value");
      return v;
    }

    auto boolFlag(Json const& frame, string const& key, bool fallback) -> bool {
      auto const* v = flagValue(frame, key);
      if (!v) return fallback;
      if (v->is_boolean()) return v->get<bool>();
      if (*v == "true") return true;
      if (*v == "false") return false;
      throw JsonLdError(ErrorCode::invalidFrame, key + " must be a boolean, got " + v->dump());
    }

    auto embedFlag(Json const& frame, Embed fallback) -> Embed {
      auto const* v = flagValue(frame, "@embed");
      if (!v) return fallback;
      if (v->is_boolean()) return v->get<bool>() ? Embed::once : Embed::never;
      if (!v->is_string()) throw JsonLdError(ErrorCode::invalidEmbedValue, v->dump());
      return parseEmbed(v->get<string>());
    }

    auto validateFrame(Json const& frame) -> void {
      if (!frame.is_array() || frame.size() != 1 || !frame[0].is_object())
        throw JsonLdError(ErrorCode::invalidFrame, "a frame must be a single object");
      auto const& f = frame[0];
      for (auto const* key: {"@id", "@type"}) {
        if (!f.contains(key)) continue;
        for (auto const& v: arrayify(f[key])) {
          if (v.is_object()) continue;
          if (!v.is_string() || !isAbsoluteIri(v.get<string>()) || isBlankNodeId(v.get<string>()))
            throw JsonLdError(ErrorCode::invalidFrame, string("invalid ") + key + " in frame: " + v.dump());
        }
      }
    }

    auto implicitFrame(Flags const& flags) -> Json {
      auto frame = Json::object();
      frame["@embed"] = Json::array({string(embedName(flags.embed))});
      frame["@explicit"] = Json::array({flags.explicitInclusion});
      frame["@requireAll"] = Json::array({flags.requireAll});
      return Json::array({frame});
    }

    auto includes(Json const& arr, Json const& v) -> bool {
      return std::find(arr.begin(), arr.end(), v) != arr.end();
    }

    auto patternValues(Json const& pattern, string const& key) -> Json {
      if (!pattern.contains(key)) return Json::array();
      auto res = arrayify(pattern[key]);
      if (key == "@language")
        for (auto& l: res)
          if (l.is_string()) l = lowercase(l.get<string>());
      return res;
    }

    // A value matches a pattern if each of `@value`, `@type` and `@language` is absent from both,
    // listed in the pattern, or matched by a wildcard `{}`.
    auto valueMatch(Json const& pattern, Json const& value) -> bool {
      if (!pattern.is_object()) return false;
      auto const v2 = patternValues(pattern, "@value");
      auto const t2 = patternValues(pattern, "@type");
      auto const l2 = patternValues(pattern, "@language");
      if (v2.empty() && t2.empty() && l2.empty()) return true;

      auto const& v1 = member(value, "@value");
      auto const& t1 = member(value, "@type");
      auto const l1 = member(value, "@language").is_string() ? Json(lowercase(value["@language"].get<string>())) : Json();
      auto const wildcard = [](Json const& values) { return !values.empty() && isEmptyObject(values[0]); };

      if (!(includes(v2, v1) || wildcard(v2))) return false;
      if (!((t1.is_null() && t2.empty()) || includes(t2, t1) || (!t1.is_null() && wildcard(t2)))) return false;
      if (!((l1.is_null() && l2.empty()) || includes(l2, l1) || (!l1.is_null() && wildcard(l2)))) return false;
      return true;
    }

    class Framer {
    public:
      Framer(Json graphMap, string graph, Options const& opts):
        opts(opts),
        graphMap(std::move(graphMap)),
        topGraph(std::move(graph)) {}

      auto run(Json const& frame) -> Json;

    private:
      struct StackEntry {
        string id;
        string graph;
      };

      Options const& opts;
      Json graphMap;
      // The graph matched at the top level, used for node patterns and reverse properties.
      string topGraph;
      vector<StackEntry> subjectStack;
      // Graph name -> identifiers embedded so far
      std::map<string, std::set<string>> uniqueEmbeds;
      // Blank node identifier -> number of occurrences in the output
      std::map<string, size_t> bnodeCount;

      auto frame(string const& graph, bool embedded, vector<string> const& subjects, Json const& frame, Json& parent,
                 std::optional<string> const& property) -> void;
      auto filterSubject(Json const& subject, Json const& frame, Flags const& flags) -> bool;
      auto nodeMatch(Json const& pattern, Json const& value, Flags const& flags) -> bool;
      auto createsCircularReference(string const& id, string const& graph) const -> bool;
      auto cleanupPreserve(Json const& input, std::set<string> const& bnodesToClear) const -> Json;
    };

    auto addFrameOutput(Json& parent, std::optional<string> const& property, Json const& output) -> void {
      if (parent.is_object() && property) addValue(parent, *property, output, {.propertyIsArray = true});
      else parent.push_back(output);
    }

    auto Framer::run(Json const& frame) -> Json {
      auto framed = Json::array();
      auto subjects = keysOf(graphMap[topGraph]);
      this->frame(topGraph, false, subjects, frame, framed, std::nullopt);

      auto bnodesToClear = std::set<string>();
      if (opts.processingMode != ProcessingMode::jsonLd10)
        for (auto const& [id, count]: bnodeCount)
          if (count == 1) bnodesToClear.insert(id);
      return cleanupPreserve(framed, bnodesToClear);
    }

    auto Framer::frame(string const& graph, bool embedded, vector<string> const& subjects, Json const& frame, Json& parent,
                       std::optional<string> const& property) -> void {
      validateFrame(frame);
      auto const& f = frame[0];
      auto const flags = Flags{
        .embed = embedFlag(f, opts.embed),
        .explicitInclusion = boolFlag(f, "@explicit", opts.explicitInclusion),
        .requireAll = boolFlag(f, "@requireAll", opts.requireAll),
      };

      auto matches = vector<string>();
      for (auto const& id: subjects) {
        auto const& subject = member(graphMap[graph], id);
        if (subject.is_object() && filterSubject(subject, f, flags)) matches.push_back(id);
      }

      for (auto const& id: sorted(matches)) {
        auto const& subject = graphMap[graph][id];
        // Each top-level match is framed independently of the others
        if (!property) uniqueEmbeds.clear();
        auto& embeds = uniqueEmbeds[graph];

        auto output = Json{{"@id", id}};
        if (isBlankNodeId(id)) bnodeCount[id]++;

        // Already included in another node object of this graph
        if (!embedded && embeds.contains(id)) continue;

        if (embedded && (flags.embed == Embed::never || createsCircularReference(id, graph))) {
          addFrameOutput(parent, property, output);
          continue;
        }
        if (embedded && flags.embed == Embed::once && embeds.contains(id)) {
          addFrameOutput(parent, property, output);
          continue;
        }

        embeds.insert(id);
        subjectStack.push_back({id, graph});

        // The subject is also the name of a graph
        if (graphMap.contains(id)) {
          auto recurse = false;
          auto subframe = Json::object();
          if (!f.contains("@graph")) {
            recurse = graph != "@merged";
          } else {
            if (!f["@graph"].empty() && f["@graph"][0].is_object()) subframe = f["@graph"][0];
            recurse = id != "@merged" && id != "@default";
          }
          if (recurse) this->frame(id, false, keysOf(graphMap[id]), Json::array({subframe}), output, "@graph");
        }

        if (f.contains("@included")) this->frame(graph, false, subjects, f["@included"], output, "@included");

        for (auto const& [prop, values]: subject.items()) {
          if (isKeyword(prop)) {
            output[prop] = values;
            if (prop == "@type")
              for (auto const& t: values)
                if (t.is_string() && isBlankNodeId(t.get<string>())) bnodeCount[t.get<string>()]++;
            continue;
          }
          if (flags.explicitInclusion && !f.contains(prop)) continue;

          auto const subframe = f.contains(prop) ? f[prop] : implicitFrame(flags);
          for (auto const& o: values) {
            if (isList(o)) {
              auto const& framedList = subframe.empty() ? member(subframe, "@list") : member(subframe[0], "@list");
              auto const listFrame = framedList.is_null() ? implicitFrame(flags) : framedList;
              auto list = Json{{"@list", Json::array()}};
              for (auto const& item: o["@list"]) {
                if (isSubjectReference(item)) {
                  this->frame(graph, true, {item["@id"].get<string>()}, listFrame, list, "@list");
                } else {
                  addFrameOutput(list, "@list", item);
                }
              }
              addFrameOutput(output, prop, list);
            } else if (isSubjectReference(o)) {
              this->frame(graph, true, {o["@id"].get<string>()}, subframe, output, prop);
            } else if (!subframe.empty() && valueMatch(subframe[0], o)) {
              addFrameOutput(output, prop, o);
            }
          }
        }

        // Defaults for properties of the frame missing from the output
        for (auto const& [prop, propFrame]: f.items()) {
          if (prop == "@type") {
            if (propFrame.empty() || !propFrame[0].is_object() || !propFrame[0].contains("@default")) continue;
          } else if (isKeyword(prop)) {
            continue;
          }
          auto const next = propFrame.is_array() && !propFrame.empty() ? propFrame[0] : Json::object();
          if (boolFlag(next, "@omitDefault", opts.omitDefault) || output.contains(prop)) continue;
          auto preserve = next.is_object() && next.contains("@default") ? next["@default"] : Json("@null");
          output[prop] = Json::array({Json{{"@preserve", arrayify(preserve)}}});
        }

        // Embed the nodes referencing this subject through a reverse property
        if (f.contains("@reverse")) {
          for (auto const& [reverseProp, subframe]: f["@reverse"].items()) {
            for (auto const& [other, node]: graphMap[topGraph].items()) {
              auto const values = node.contains(reverseProp) ? arrayify(node[reverseProp]) : Json::array();
              auto const references = std::any_of(values.begin(), values.end(), [&](Json const& v) { return member(v, "@id") == id; });
              if (!references) continue;
              auto& reverse = output["@reverse"];
              if (!reverse.is_object()) reverse = Json::object();
              addValue(reverse, reverseProp, Json::array(), {.propertyIsArray = true});
              this->frame(graph, true, {other}, subframe, reverse[reverseProp], property);
            }
          }
        }

        addFrameOutput(parent, property, output);
        subjectStack.pop_back();
      }
    }

    auto Framer::filterSubject(Json const& subject, Json const& frame, Flags const& flags) -> bool {
      auto wildcard = true;
      auto matchesSome = false;

      for (auto const& [key, frameValues]: frame.items()) {
        auto matchThis = false;
        auto const nodeValues = subject.contains(key) ? arrayify(subject[key]) : Json::array();
        auto const isEmpty = frameValues.is_array() && frameValues.empty();

        if (key == "@id") {
          auto const ids = arrayify(frameValues);
          matchThis = (!ids.empty() && isEmptyObject(ids[0])) || (!nodeValues.empty() && includes(ids, nodeValues[0]));
          if (!flags.requireAll) return matchThis;
        } else if (key == "@type") {
          wildcard = false;
          if (isEmpty) {
            // Match none
            if (!nodeValues.empty()) return false;
            matchThis = true;
          } else if (frameValues.size() == 1 && isEmptyObject(frameValues[0])) {
            // Match any type
            matchThis = !nodeValues.empty();
          } else {
            for (auto const& type: frameValues) {
              if (type.is_object() && type.contains("@default")) matchThis = true;
              else matchThis = matchThis || includes(nodeValues, type);
            }
            if (!flags.requireAll) return matchThis;
          }
        } else if (isKeyword(key)) {
          continue;
        } else {
          auto const thisFrame = frameValues.is_array() && !frameValues.empty() ? frameValues[0] : Json();
          auto hasDefault = false;
          if (!thisFrame.is_null()) {
            validateFrame(Json::array({thisFrame}));
            hasDefault = thisFrame.contains("@default");
          }
          wildcard = false;

          // A missing property matches if the frame supplies a default
          if (nodeValues.empty() && hasDefault) continue;
          // Match none
          if (!nodeValues.empty() && isEmpty) return false;

          if (thisFrame.is_null()) {
            if (!nodeValues.empty()) return false;
            matchThis = true;
          } else if (isList(thisFrame)) {
            auto const& patterns = thisFrame["@list"];
            auto const listPattern = patterns.is_array() && !patterns.empty() ? patterns[0] : Json();
            if (!nodeValues.empty() && isList(nodeValues[0])) {
              auto const& items = nodeValues[0]["@list"];
              if (isValue(listPattern)) {
                matchThis = std::any_of(items.begin(), items.end(), [&](Json const& item) { return valueMatch(listPattern, item); });
              } else if (isSubject(listPattern) || isSubjectReference(listPattern)) {
                matchThis = std::any_of(items.begin(), items.end(), [&](Json const& item) { return nodeMatch(listPattern, item, flags); });
              }
            }
          } else if (isValue(thisFrame)) {
            matchThis = std::any_of(nodeValues.begin(), nodeValues.end(), [&](Json const& v) { return valueMatch(thisFrame, v); });
          } else if (isSubjectReference(thisFrame)) {
            matchThis = std::any_of(nodeValues.begin(), nodeValues.end(), [&](Json const& v) { return nodeMatch(thisFrame, v, flags); });
          } else {
            matchThis = !nodeValues.empty();
          }
        }

        // Every non-defaulted property must match under `@requireAll`
        if (!matchThis && flags.requireAll) return false;
        matchesSome = matchesSome || matchThis;
      }

      return wildcard || matchesSome;
    }

    auto Framer::nodeMatch(Json const& pattern, Json const& value, Flags const& flags) -> bool {
      auto const& id = member(value, "@id");
      if (!id.is_string()) return false;
      auto const& node = member(graphMap[topGraph], id.get<string>());
      return node.is_object() && filterSubject(node, pattern, flags);
    }

    auto Framer::createsCircularReference(string const& id, string const& graph) const -> bool {
      return std::ranges::any_of(subjectStack, [&](StackEntry const& e) { return e.graph == graph && e.id == id; });
    }

    // Unwraps `@preserve` entries and drops the identifiers of blank nodes that occur only once.
    auto Framer::cleanupPreserve(Json const& input, std::set<string> const& bnodesToClear) const -> Json {
      if (input.is_array()) {
        auto res = Json::array();
        for (auto const& item: input) res.push_back(cleanupPreserve(item, bnodesToClear));
        return res;
      }
      if (!input.is_object()) return input;
      if (input.contains("@preserve")) {
        auto const& preserved = input["@preserve"];
        return preserved.is_array() ? (preserved.empty() ? Json() : preserved[0]) : preserved;
      }
      if (isValue(input)) return input;
      if (isList(input)) {
        auto res = input;
        res["@list"] = cleanupPreserve(input["@list"], bnodesToClear);
        return res;
      }
      auto res = Json::object();
      for (auto const& [prop, value]: input.items()) {
        if (prop == "@id" && value.is_string() && bnodesToClear.contains(value.get<string>())) continue;
        res[prop] = cleanupPreserve(value, bnodesToClear);
      }
      return res;
    }

  }

  auto frame(Json const& input, Json const& frame, Options const& opts) -> Json {
    auto issuer = IdentifierIssuer("_:b");
    auto graphMap = createNodeMap(input, issuer);
    auto graph = string("@default");
    if (!opts.frameDefault) {
      graphMap["@merged"] = mergeNodeMaps(graphMap);
      graph = "@merged";
    }
    // A frame with nothing left after expansion matches every node
    if (frame.is_array() && frame.empty()) return Framer(std::move(graphMap), graph, opts).run(Json::array({Json::object()}));
    return Framer(std::move(graphMap), graph, opts).run(frame);
  }

  auto removeNullPlaceholders(Json const& element) -> Json {
    if (element.is_array()) {
      auto res = Json::array();
      for (auto const& item: element) {
        auto cleaned = removeNullPlaceholders(item);
        if (!cleaned.is_null()) res.push_back(std::move(cleaned));
      }
      return res;
    }
    if (element == "@null") return nullptr;
    if (element.is_object()) {
      auto res = Json::object();
      for (auto const& [key, value]: element.items()) res[key] = removeNullPlaceholders(value);
      return res;
    }
    return element;
  }

#include "macros_close.hpp"
}
