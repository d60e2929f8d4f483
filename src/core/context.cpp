#include "context.hpp"
#include <algorithm>
#include "error.hpp"
#include "keyword.hpp"
#include "url.hpp"
#include "value.hpp"

using std::string;
using std::string_view;
using std::vector;

namespace ldmill::core {
#include "macros_open.hpp"

  namespace {

    auto endsWithGenDelim(string const& s) -> bool {
      return !s.empty() && string_view(":/?#[]@").contains(s.back());
    }

    // A colon followed by something other than a colon, or a slash: the term looks like an IRI.
    auto looksLikeIri(string const& term) -> bool {
      if (term.contains('/')) return true;
      for (auto i = 0uz; i + 1 < term.size(); i++)
        if (term[i] == ':' && term[i + 1] != ':') return true;
      return false;
    }

    auto isValidContainer(std::set<string> const& c) -> bool {
      static auto const allowed = std::set<string>{"@graph", "@id", "@index", "@language", "@list", "@set", "@type"};
      if (c.empty()) return false;
      for (auto const& s: c)
        if (!allowed.contains(s)) return false;
      if (c.contains("@list")) return c.size() == 1;
      if (c.contains("@graph")) {
        for (auto const& s: c)
          if (s != "@graph" && s != "@id" && s != "@index" && s != "@set") return false;
        return !(c.contains("@id") && c.contains("@index"));
      }
      return c.size() <= (c.contains("@set") ? 2uz : 1uz);
    }

    auto containerKey(std::set<string> const& c) -> string {
      if (c.empty()) return "@none";
      auto res = string();
      for (auto const& s: c) res += s;
      return res;
    }

    auto isDirection(Json const& v) -> bool {
      return v == "ltr" || v == "rtl";
    }

    // `language_direction` as used in inverse context keys.
    auto languageDirection(Nullable const& language, string const& direction) -> string {
      return lowercase(language.value_or("") + "_" + direction);
    }

  }

  auto InverseEntry::select(string const& typeOrLanguage) const -> std::map<string, string> const& {
    if (typeOrLanguage == "@type") return type;
    if (typeOrLanguage == "@language") return language;
    return any;
  }

  // Term definition creation is carried out against one local context, remembering which terms are done.
  struct Context::Definer {
    Context& ctx;
    Json const& local;
    string const& baseUrl;
    bool isProtected;
    ParseFlags flags;
    vector<string> const& remoteContexts;
    DefinedMap defined;

    auto isDefined(string const& term) const -> bool {
      auto const it = defined.find(term);
      return it != defined.end() && it->second;
    }

    auto expandIri(string const& value, bool documentRelative, bool vocab) -> std::optional<string>;

    // See: https://www.w3.org/TR/json-ld11-api/#create-term-definition
    auto define(string const& term) -> void;
  };

  auto Context::Definer::expandIri(string const& value, bool documentRelative, bool vocab) -> std::optional<string> {
    if (!isKeyword(value) && !hasKeywordForm(value)) {
      if (local.contains(value) && !isDefined(value)) define(value);
      if (auto const colon = value.find(':'); colon != string::npos && colon > 0) {
        auto const prefix = value.substr(0, colon);
        auto const compact = prefix != "_" && !value.substr(colon + 1).starts_with("//");
        if (compact && local.contains(prefix) && !isDefined(prefix)) define(prefix);
      }
    }
    return ctx.expandIri(value, documentRelative, vocab);
  }

  auto Context::Definer::define(string const& term) -> void {
    if (auto const it = defined.find(term); it != defined.end()) {
      if (it->second) return;
      throw JsonLdError(ErrorCode::cyclicIriMapping, term);
    }
    if (term.empty()) throw JsonLdError(ErrorCode::invalidTermDefinition, "empty term");

    auto const legacy = ctx.isLegacyMode();
    auto value = local[term];

    if (term == "@type" && !legacy) {
      if (!value.is_object()) throw JsonLdError(ErrorCode::keywordRedefinition, term);
      for (auto const& [k, v]: value.items()) {
        if (k == "@container" && v == "@set") continue;
        if (k == "@protected") continue;
        throw JsonLdError(ErrorCode::keywordRedefinition, "@type may only be given @container: @set and @protected");
      }
    } else if (isKeyword(term)) {
      throw JsonLdError(ErrorCode::keywordRedefinition, term);
    } else if (hasKeywordForm(term)) {
      ctx.options().dropped("ignoring term with the form of a keyword: " + term);
      return;
    }
    defined[term] = false;

    auto& terms = ctx.mutableTerms();
    auto prev = std::optional<TermDefinition>();
    if (auto const it = terms.find(term); it != terms.end()) {
      prev = it->second;
      terms.erase(it);
    }

    auto simpleTerm = false;
    if (value.is_null()) value = Json{{"@id", nullptr}};
    else if (value.is_string()) {
      value = Json{{"@id", value}};
      simpleTerm = true;
    } else if (!value.is_object()) {
      throw JsonLdError(ErrorCode::invalidTermDefinition, term);
    }

    auto def = TermDefinition();

    if (value.contains("@protected")) {
      if (legacy) throw JsonLdError(ErrorCode::invalidTermDefinition, "@protected in JSON-LD 1.0 mode");
      if (!value["@protected"].is_boolean()) throw JsonLdError(ErrorCode::invalidProtectedValue, term);
      def.isProtected = value["@protected"].get<bool>();
    } else {
      def.isProtected = isProtected;
    }

    if (value.contains("@type")) {
      auto const& t = value["@type"];
      if (!t.is_string()) throw JsonLdError(ErrorCode::invalidTypeMapping, term);
      auto const type = expandIri(t.get<string>(), false, true);
      if (!type) throw JsonLdError(ErrorCode::invalidTypeMapping, t.get<string>());
      if (legacy && (*type == "@json" || *type == "@none"))
        throw JsonLdError(ErrorCode::invalidTypeMapping, *type + " in JSON-LD 1.0 mode");
      if (*type != "@id" && *type != "@vocab" && *type != "@json" && *type != "@none" && !isAbsoluteIri(*type))
        throw JsonLdError(ErrorCode::invalidTypeMapping, *type);
      def.type = *type;
    }

    if (value.contains("@reverse")) {
      if (value.contains("@id") || value.contains("@nest")) throw JsonLdError(ErrorCode::invalidReverseProperty, term);
      auto const& r = value["@reverse"];
      if (!r.is_string()) throw JsonLdError(ErrorCode::invalidIriMapping, term);
      if (hasKeywordForm(r.get<string>())) {
        ctx.options().dropped("ignoring reverse term mapped to a keyword-like value: " + term);
        return;
      }
      auto const id = expandIri(r.get<string>(), false, true);
      if (!id || !isAbsoluteIri(*id)) throw JsonLdError(ErrorCode::invalidIriMapping, r.get<string>());
      def.id = id;
      if (value.contains("@container")) {
        auto const& c = value["@container"];
        if (c == "@set" || c == "@index") def.container = {c.get<string>()};
        else if (!c.is_null()) throw JsonLdError(ErrorCode::invalidReverseProperty, "container must be @set or @index");
      }
      def.reverse = true;
    } else if (value.contains("@id") && value["@id"] != term) {
      auto const& idv = value["@id"];
      if (!idv.is_null()) {
        if (!idv.is_string()) throw JsonLdError(ErrorCode::invalidIriMapping, term);
        auto const& s = idv.get_ref<string const&>();
        if (!isKeyword(s) && hasKeywordForm(s)) {
          ctx.options().dropped("ignoring term mapped to a keyword-like value: " + term);
          return;
        }
        auto const id = expandIri(s, false, true);
        if (!id || (!isKeyword(*id) && !isAbsoluteIri(*id))) throw JsonLdError(ErrorCode::invalidIriMapping, s);
        if (*id == "@context" || *id == "@preserve") throw JsonLdError(ErrorCode::invalidKeywordAlias, term);
        def.id = id;

        if (looksLikeIri(term)) {
          defined[term] = true;
          auto const expanded = expandIri(term, false, true);
          defined[term] = false;
          if (expanded != id) throw JsonLdError(ErrorCode::invalidIriMapping, term + " does not expand to " + *id);
        }
        if (!term.contains(':') && !term.contains('/') && (simpleTerm || legacy) &&
            (endsWithGenDelim(*id) || isBlankNodeId(*id)))
          def.prefix = true;
      }
    } else if (auto const colon = term.find(':', 1); colon != string::npos) {
      auto const prefix = term.substr(0, colon);
      auto const suffix = term.substr(colon + 1);
      auto const compact = prefix != "_" && !suffix.starts_with("//");
      if (compact && local.contains(prefix)) define(prefix);
      if (auto const* p = ctx.termDefinition(prefix); compact && p) def.id = *p->id + suffix;
      else def.id = term;
    } else if (term.contains('/')) {
      auto const id = expandIri(term, false, true);
      if (!id || !isAbsoluteIri(*id)) throw JsonLdError(ErrorCode::invalidIriMapping, term);
      def.id = id;
    } else if (term == "@type") {
      def.id = "@type";
    } else if (ctx.vocabMapping) {
      def.id = *ctx.vocabMapping + term;
    } else {
      throw JsonLdError(ErrorCode::invalidIriMapping, "relative term definition without vocab mapping: " + term);
    }

    if (value.contains("@container") && !def.reverse) {
      auto const& c = value["@container"];
      if (legacy && (!c.is_string() || c == "@graph" || c == "@id" || c == "@type"))
        throw JsonLdError(ErrorCode::invalidContainerMapping, c.dump() + " in JSON-LD 1.0 mode");
      auto container = std::set<string>();
      for (auto const& item: arrayify(c)) {
        if (!item.is_string()) throw JsonLdError(ErrorCode::invalidContainerMapping, c.dump());
        container.insert(item.get<string>());
      }
      if (!isValidContainer(container)) throw JsonLdError(ErrorCode::invalidContainerMapping, c.dump());
      def.container = std::move(container);
      if (def.hasContainer("@type")) {
        if (!def.type) def.type = "@id";
        else if (*def.type != "@id" && *def.type != "@vocab")
          throw JsonLdError(ErrorCode::invalidTypeMapping, "type containers require @id or @vocab: " + term);
      }
    }

    if (value.contains("@index")) {
      if (legacy || !def.hasContainer("@index")) throw JsonLdError(ErrorCode::invalidTermDefinition, "@index without index container");
      auto const& ix = value["@index"];
      if (!ix.is_string() || ix.get_ref<string const&>().starts_with('@'))
        throw JsonLdError(ErrorCode::invalidTermDefinition, "invalid @index: " + ix.dump());
      auto const expanded = expandIri(ix.get<string>(), false, true);
      if (!expanded || !isAbsoluteIri(*expanded)) throw JsonLdError(ErrorCode::invalidTermDefinition, "invalid @index: " + ix.dump());
      def.index = ix.get<string>();
    }

    if (value.contains("@context")) {
      if (legacy) throw JsonLdError(ErrorCode::invalidTermDefinition, "scoped context in JSON-LD 1.0 mode");
      try {
        static_cast<void>(ctx.parseImpl(
          value["@context"], baseUrl, remoteContexts, {.overrideProtected = true, .validateScopedContext = false}
        ));
      } catch (JsonLdError& e) {
        throw JsonLdError(ErrorCode::invalidScopedContext, term + ": " + e.what());
      }
      def.context = value["@context"];
      def.contextBase = baseUrl;
    }

    if (value.contains("@language") && !value.contains("@type")) {
      auto const& l = value["@language"];
      if (l.is_null()) def.language = Nullable();
      else if (l.is_string()) def.language = lowercase(l.get<string>());
      else throw JsonLdError(ErrorCode::invalidLanguageMapping, term);
    }

    if (value.contains("@direction") && !value.contains("@type")) {
      auto const& d = value["@direction"];
      if (d.is_null()) def.direction = Nullable();
      else if (isDirection(d)) def.direction = d.get<string>();
      else throw JsonLdError(ErrorCode::invalidBaseDirection, term);
    }

    if (value.contains("@nest")) {
      if (legacy) throw JsonLdError(ErrorCode::invalidTermDefinition, "@nest in JSON-LD 1.0 mode");
      auto const& n = value["@nest"];
      if (!n.is_string() || (n != "@nest" && isKeyword(n.get<string>()))) throw JsonLdError(ErrorCode::invalidNestValue, term);
      def.nest = n.get<string>();
    }

    if (value.contains("@prefix")) {
      if (legacy || term.contains(':') || term.contains('/'))
        throw JsonLdError(ErrorCode::invalidTermDefinition, "@prefix not allowed on " + term);
      auto const& p = value["@prefix"];
      if (!p.is_boolean()) throw JsonLdError(ErrorCode::invalidPrefixValue, term);
      def.prefix = p.get<bool>();
      if (def.prefix && def.id && isKeyword(*def.id)) throw JsonLdError(ErrorCode::invalidTermDefinition, "keyword used as prefix");
    }

    static auto const allowedEntries = std::set<string>{
      "@id", "@reverse", "@container", "@context", "@direction", "@index",
      "@language", "@nest", "@prefix", "@protected", "@type"
    };
    for (auto const& [k, v]: value.items())
      if (!allowedEntries.contains(k)) throw JsonLdError(ErrorCode::invalidTermDefinition, term + " has entry " + k);

    if (!flags.overrideProtected && prev && prev->isProtected) {
      auto cmp = def;
      cmp.isProtected = true;
      cmp.contextBase = prev->contextBase;
      if (cmp != *prev) throw JsonLdError(ErrorCode::protectedTermRedefinition, term);
      def = *prev;
    }

    ctx.mutableTerms().insert_or_assign(term, std::move(def));
    defined[term] = true;
  }

  Context::Context(std::shared_ptr<Options const> options, std::shared_ptr<RemoteCache> cache):
    opts(std::move(options)),
    terms(std::make_shared<TermMap>()),
    remoteCache(cache ? std::move(cache) : std::make_shared<RemoteCache>()),
    mode(opts->processingMode) {
    if (!opts->base.empty()) baseIri = opts->base;
  }

  auto Context::mutableTerms() -> TermMap& {
    if (terms.use_count() > 1) terms = std::make_shared<TermMap>(*terms);
    inverseCache.reset();
    return *terms;
  }

  auto Context::reset() const -> Context {
    return Context(opts, remoteCache);
  }

  auto Context::dereference(string const& url) const -> std::pair<string, Json> const& {
    if (auto const it = remoteCache->find(url); it != remoteCache->end()) return it->second;
    if (!opts->documentLoader) throw JsonLdError(ErrorCode::loadingRemoteContextFailed, "no document loader for " + url);
    auto doc = RemoteDocument();
    try {
      doc = opts->documentLoader->load(url);
    } catch (JsonLdError& e) {
      throw JsonLdError(ErrorCode::loadingRemoteContextFailed, url + ": " + e.what());
    }
    if (!doc.document.is_object() || !doc.document.contains("@context"))
      throw JsonLdError(ErrorCode::invalidRemoteContext, "no @context in " + url);
    auto documentUrl = doc.documentUrl.empty() ? url : doc.documentUrl;
    return remoteCache->insert_or_assign(url, std::pair{std::move(documentUrl), doc.document["@context"]}).first->second;
  }

  auto Context::parse(Json const& localContext, string const& baseUrl, ParseFlags flags) const -> Context {
    return parseImpl(localContext, baseUrl, {}, flags);
  }

  auto Context::parseImpl(Json const& localContext, string const& baseUrl, vector<string> remoteContexts, ParseFlags flags) const
    -> Context {
    auto result = *this;
    result.inverseCache.reset();

    auto propagate = flags.propagate;
    if (localContext.is_object() && localContext.contains("@propagate")) {
      auto const& p = localContext["@propagate"];
      if (!p.is_boolean()) throw JsonLdError(ErrorCode::invalidPropagateValue, p.dump());
      propagate = p.get<bool>();
    }
    if (!propagate && !result.previous) result.previous = std::make_shared<Context const>(*this);

    for (auto const& item: arrayify(localContext)) {
      if (item.is_null()) {
        if (!flags.overrideProtected && result.hasProtectedTerms())
          throw JsonLdError(ErrorCode::invalidContextNullification, "context has protected terms");
        auto fresh = result.reset();
        if (!propagate) fresh.previous = std::make_shared<Context const>(result);
        result = std::move(fresh);
        continue;
      }

      if (item.is_string()) {
        auto const url = resolve(baseUrl, item.get<string>());
        if (std::ranges::find(remoteContexts, url) != remoteContexts.end()) {
          if (!flags.validateScopedContext) continue;
          throw JsonLdError(ErrorCode::recursiveContextInclusion, url);
        }
        auto const [documentUrl, loaded] = dereference(url);
        auto nested = remoteContexts;
        nested.push_back(url);
        result = result.parseImpl(
          loaded, documentUrl, std::move(nested),
          {.overrideProtected = flags.overrideProtected, .validateScopedContext = flags.validateScopedContext}
        );
        continue;
      }

      if (!item.is_object()) throw JsonLdError(ErrorCode::invalidLocalContext, item.dump());
      auto const legacy = result.isLegacyMode();
      auto local = item;

      if (local.contains("@version")) {
        auto const& v = local["@version"];
        if (!v.is_number_float() || v.get<double>() != 1.1) throw JsonLdError(ErrorCode::invalidVersionValue, v.dump());
        if (legacy) throw JsonLdError(ErrorCode::processingModeConflict, "@version 1.1 in JSON-LD 1.0 mode");
      }

      if (local.contains("@import")) {
        if (legacy) throw JsonLdError(ErrorCode::invalidContextEntry, "@import in JSON-LD 1.0 mode");
        auto const& i = local["@import"];
        if (!i.is_string()) throw JsonLdError(ErrorCode::invalidImportValue, i.dump());
        auto imported = dereference(resolve(baseUrl, i.get<string>())).second;
        if (!imported.is_object()) throw JsonLdError(ErrorCode::invalidRemoteContext, "imported context is not an object");
        if (imported.contains("@import")) throw JsonLdError(ErrorCode::invalidContextEntry, "imported context has @import");
        for (auto const& [k, v]: local.items()) imported[k] = v;
        local = std::move(imported);
      }

      if (local.contains("@base") && remoteContexts.empty()) {
        auto const& b = local["@base"];
        if (b.is_null()) result.baseIri.reset();
        else if (!b.is_string()) throw JsonLdError(ErrorCode::invalidBaseIri, b.dump());
        else if (isAbsoluteIri(b.get<string>())) result.baseIri = b.get<string>();
        else if (result.baseIri) result.baseIri = resolve(*result.baseIri, b.get<string>());
        else throw JsonLdError(ErrorCode::invalidBaseIri, "relative @base without base IRI: " + b.get<string>());
      }

      if (local.contains("@vocab")) {
        auto const& v = local["@vocab"];
        if (v.is_null()) result.vocabMapping.reset();
        else if (!v.is_string()) throw JsonLdError(ErrorCode::invalidVocabMapping, v.dump());
        else {
          if (legacy && !isAbsoluteIri(v.get<string>())) throw JsonLdError(ErrorCode::invalidVocabMapping, v.get<string>());
          auto const vocab = result.expandIri(v.get<string>(), true, true);
          if (!vocab || !isAbsoluteIri(*vocab)) throw JsonLdError(ErrorCode::invalidVocabMapping, v.get<string>());
          result.vocabMapping = vocab;
        }
      }

      if (local.contains("@language")) {
        auto const& l = local["@language"];
        if (l.is_null()) result.language.reset();
        else if (l.is_string()) result.language = lowercase(l.get<string>());
        else throw JsonLdError(ErrorCode::invalidDefaultLanguage, l.dump());
      }

      if (local.contains("@direction")) {
        if (legacy) throw JsonLdError(ErrorCode::invalidContextEntry, "@direction in JSON-LD 1.0 mode");
        auto const& d = local["@direction"];
        if (d.is_null()) result.direction.reset();
        else if (isDirection(d)) result.direction = d.get<string>();
        else throw JsonLdError(ErrorCode::invalidBaseDirection, d.dump());
      }

      if (local.contains("@propagate")) {
        if (legacy) throw JsonLdError(ErrorCode::invalidContextEntry, "@propagate in JSON-LD 1.0 mode");
        if (!local["@propagate"].is_boolean()) throw JsonLdError(ErrorCode::invalidPropagateValue, local["@propagate"].dump());
      }

      auto isProtected = false;
      if (local.contains("@protected")) {
        if (!local["@protected"].is_boolean()) throw JsonLdError(ErrorCode::invalidProtectedValue, local["@protected"].dump());
        isProtected = local["@protected"].get<bool>();
      }

      auto definer = Definer{result, local, baseUrl, isProtected, flags, remoteContexts, {}};
      static auto const contextEntries = std::set<string>{
        "@base", "@direction", "@import", "@language", "@propagate", "@protected", "@version", "@vocab"
      };
      for (auto const& [key, value]: local.items())
        if (!contextEntries.contains(key)) definer.define(key);
    }
    return result;
  }

  auto Context::expandIri(string const& value, bool documentRelative, bool vocab) const -> std::optional<string> {
    if (isKeyword(value)) return value;
    if (hasKeywordForm(value)) {
      opts->dropped("ignoring keyword-like value: " + value);
      return std::nullopt;
    }
    if (auto const it = terms->find(value); it != terms->end()) {
      auto const& id = it->second.id;
      if (id && isKeyword(*id)) return id;
      if (vocab) return id;
    }
    if (auto const colon = value.find(':'); colon != string::npos && colon > 0) {
      auto const prefix = value.substr(0, colon);
      auto const suffix = value.substr(colon + 1);
      if (prefix == "_" || suffix.starts_with("//")) return value;
      if (auto const* def = termDefinition(prefix); def && def->prefix) return *def->id + suffix;
      if (isAbsoluteIri(value)) return value;
    }
    if (vocab && vocabMapping) return *vocabMapping + value;
    if (documentRelative && baseIri) return resolve(*baseIri, value);
    return value;
  }

  auto Context::termDefinition(string const& term) const -> TermDefinition const* {
    auto const it = terms->find(term);
    if (it == terms->end() || !it->second.id) return nullptr;
    return &it->second;
  }

  auto Context::hasContainer(string const& term, string const& container) const -> bool {
    auto const* def = termDefinition(term);
    return def && def->hasContainer(container);
  }

  auto Context::isReverseProperty(string const& term) const -> bool {
    auto const* def = termDefinition(term);
    return def && def->reverse;
  }

  auto Context::typeMapping(string const& term) const -> std::optional<string> {
    auto const* def = termDefinition(term);
    return def ? def->type : std::nullopt;
  }

  auto Context::languageMapping(string const& term) const -> Nullable {
    auto const* def = termDefinition(term);
    return def && def->language ? *def->language : language;
  }

  auto Context::directionMapping(string const& term) const -> Nullable {
    auto const* def = termDefinition(term);
    return def && def->direction ? *def->direction : direction;
  }

  auto Context::hasProtectedTerms() const -> bool {
    return std::ranges::any_of(*terms, [](auto const& kv) { return kv.second.isProtected; });
  }

  auto Context::expandValue(string const& activeProperty, Json const& value) const -> Json {
    auto const type = typeMapping(activeProperty);
    if (value.is_string() && (type == "@id" || type == "@vocab")) {
      auto const id = expandIri(value.get<string>(), true, type == "@vocab");
      if (!id) return nullptr;
      return Json{{"@id", *id}};
    }
    auto res = Json{{"@value", value}};
    if (type && *type != "@id" && *type != "@vocab" && *type != "@none") res["@type"] = *type;
    else if (value.is_string()) {
      if (auto const lang = languageMapping(activeProperty)) res["@language"] = *lang;
      if (auto const dir = directionMapping(activeProperty)) res["@direction"] = *dir;
    }
    return res;
  }

  auto Context::inverse() const -> InverseContext const& {
    if (inverseCache) return *inverseCache;

    auto res = InverseContext();
    auto const defaultLanguage = language ? lowercase(*language) : string("@none");
    auto order = vector<string>();
    for (auto const& [term, def]: *terms)
      if (def.id) order.push_back(term);
    std::ranges::sort(order, compareShortestLeast);

    for (auto const& term: order) {
      auto const& def = terms->at(term);
      auto& entry = res[*def.id][containerKey(def.container)];
      entry.any.try_emplace("@none", term);

      if (def.reverse) {
        entry.type.try_emplace("@reverse", term);
      } else if (def.type == "@none") {
        entry.language.try_emplace("@any", term);
        entry.type.try_emplace("@any", term);
        entry.any.try_emplace("@any", term);
      } else if (def.type) {
        entry.type.try_emplace(*def.type, term);
      } else if (def.language && def.direction) {
        auto const& l = *def.language;
        auto const& d = *def.direction;
        auto key = string("@null");
        if (l && d) key = languageDirection(l, *d);
        else if (l) key = lowercase(*l);
        else if (d) key = "_" + *d;
        entry.language.try_emplace(key, term);
      } else if (def.language) {
        entry.language.try_emplace(def.language->has_value() ? lowercase(**def.language) : string("@null"), term);
      } else if (def.direction) {
        entry.language.try_emplace(def.direction->has_value() ? "_" + **def.direction : string("@none"), term);
      } else if (direction) {
        entry.language.try_emplace(languageDirection(language, *direction), term);
        entry.language.try_emplace("@none", term);
        entry.type.try_emplace("@none", term);
      } else {
        entry.language.try_emplace(defaultLanguage, term);
        entry.language.try_emplace("@none", term);
        entry.type.try_emplace("@none", term);
      }
    }

    inverseCache = std::make_shared<InverseContext const>(std::move(res));
    return *inverseCache;
  }

  auto Context::selectTerm(
    string const& iri, vector<string> const& containers, string const& typeOrLanguage, vector<string> const& preferredValues
  ) const -> std::optional<string> {
    auto const& inv = inverse();
    auto const it = inv.find(iri);
    if (it == inv.end()) return std::nullopt;
    for (auto const& container: containers) {
      auto const jt = it->second.find(container);
      if (jt == it->second.end()) continue;
      auto const& valueMap = jt->second.select(typeOrLanguage);
      for (auto const& item: preferredValues)
        if (auto const kt = valueMap.find(item); kt != valueMap.end()) return kt->second;
    }
    return std::nullopt;
  }

  auto Context::compactIri(string const& iri, Json const& value, bool vocab, bool reverse) const -> string {
    if (vocab && inverse().contains(iri)) {
      auto const defaultLanguage = direction ? languageDirection(language, *direction) : language.value_or("@none");
      auto v = value;
      if (v.is_object() && v.contains("@preserve")) v = arrayify(v["@preserve"]).at(0);

      auto containers = vector<string>();
      auto typeOrLanguage = string("@language");
      auto typeOrLanguageValue = string("@null");
      auto const hasIndex = v.is_object() && v.contains("@index");

      if (hasIndex && !isGraph(v)) containers.insert(containers.end(), {"@index", "@index@set"});

      if (reverse) {
        typeOrLanguage = "@type";
        typeOrLanguageValue = "@reverse";
        containers.emplace_back("@set");
      } else if (isList(v)) {
        if (!hasIndex) containers.emplace_back("@list");
        auto const& list = v["@list"];
        auto commonType = std::optional<string>();
        auto commonLanguage = std::optional<string>();
        if (list.empty()) commonLanguage = defaultLanguage;
        for (auto const& item: list) {
          auto itemLanguage = string("@none");
          auto itemType = string("@none");
          if (isValue(item)) {
            if (item.contains("@direction"))
              itemLanguage = languageDirection(item.value("@language", ""), item["@direction"].get<string>());
            else if (item.contains("@language")) itemLanguage = lowercase(item["@language"].get<string>());
            else if (item.contains("@type")) itemType = item["@type"].get<string>();
            else itemLanguage = "@null";
          } else {
            itemType = "@id";
          }
          if (!commonLanguage) commonLanguage = itemLanguage;
          else if (itemLanguage != *commonLanguage && isValue(item)) commonLanguage = "@none";
          if (!commonType) commonType = itemType;
          else if (itemType != *commonType) commonType = "@none";
          if (commonLanguage == "@none" && commonType == "@none") break;
        }
        if (!commonLanguage) commonLanguage = "@none";
        if (!commonType) commonType = "@none";
        if (*commonType != "@none") {
          typeOrLanguage = "@type";
          typeOrLanguageValue = *commonType;
        } else {
          typeOrLanguageValue = *commonLanguage;
        }
      } else if (isGraph(v)) {
        if (hasIndex) containers.insert(containers.end(), {"@graph@index", "@graph@index@set"});
        if (v.contains("@id")) containers.insert(containers.end(), {"@graph@id", "@graph@id@set"});
        containers.insert(containers.end(), {"@graph", "@graph@set", "@set"});
        if (!hasIndex) containers.insert(containers.end(), {"@graph@index", "@graph@index@set"});
        if (!v.contains("@id")) containers.insert(containers.end(), {"@graph@id", "@graph@id@set"});
        containers.insert(containers.end(), {"@index", "@index@set"});
        typeOrLanguage = "@type";
        typeOrLanguageValue = "@id";
      } else {
        if (isValue(v)) {
          if (v.contains("@direction") && !hasIndex) {
            typeOrLanguageValue = languageDirection(v.value("@language", ""), v["@direction"].get<string>());
            containers.insert(containers.end(), {"@language", "@language@set"});
          } else if (v.contains("@language") && !hasIndex) {
            typeOrLanguageValue = lowercase(v["@language"].get<string>());
            containers.insert(containers.end(), {"@language", "@language@set"});
          } else if (v.contains("@type")) {
            typeOrLanguage = "@type";
            typeOrLanguageValue = v["@type"].get<string>();
          }
        } else {
          typeOrLanguage = "@type";
          typeOrLanguageValue = "@id";
          containers.insert(containers.end(), {"@id", "@id@set", "@type", "@set@type"});
        }
        containers.emplace_back("@set");
      }

      containers.emplace_back("@none");
      if (!isLegacyMode()) {
        if (!hasIndex) containers.insert(containers.end(), {"@index", "@index@set"});
        if (v.is_object() && v.size() == 1 && v.contains("@value"))
          containers.insert(containers.end(), {"@language", "@language@set"});
      }

      auto preferred = vector<string>();
      if (typeOrLanguageValue == "@reverse") preferred.emplace_back("@reverse");
      if ((typeOrLanguageValue == "@id" || typeOrLanguageValue == "@reverse") && v.is_object() && v.contains("@id") &&
          v["@id"].is_string()) {
        auto const& id = v["@id"].get_ref<string const&>();
        auto const* def = termDefinition(compactIri(id, nullptr, true));
        if (def && def->id == id) preferred.insert(preferred.end(), {"@vocab", "@id", "@none"});
        else preferred.insert(preferred.end(), {"@id", "@vocab", "@none"});
      } else {
        preferred.insert(preferred.end(), {typeOrLanguageValue, "@none"});
        if (isList(v) && v["@list"].empty()) typeOrLanguage = "@any";
      }
      preferred.emplace_back("@any");
      for (auto i = 0uz, n = preferred.size(); i < n; i++)
        if (auto const u = preferred[i].find('_'); u != string::npos) preferred.push_back(preferred[i].substr(u));

      if (auto const term = selectTerm(iri, containers, typeOrLanguage, preferred)) return *term;
    }

    if (vocab && vocabMapping && iri.starts_with(*vocabMapping) && iri.size() > vocabMapping->size()) {
      auto const suffix = iri.substr(vocabMapping->size());
      if (!hasTerm(suffix)) return suffix;
    }

    auto best = std::optional<string>();
    for (auto const& [term, def]: *terms) {
      if (!def.id || *def.id == iri || !iri.starts_with(*def.id) || !def.prefix) continue;
      auto const candidate = term + ":" + iri.substr(def.id->size());
      if (best && !compareShortestLeast(candidate, *best)) continue;
      auto const it = terms->find(candidate);
      if (it == terms->end() || (it->second.id == iri && value.is_null())) best = candidate;
    }
    if (best) return *best;

    if (auto const url = Url::parse(iri); url.scheme && !url.authority && isAbsoluteIri(iri)) {
      if (auto const* def = termDefinition(*url.scheme); def && def->prefix)
        throw JsonLdError(ErrorCode::iriConfusedWithPrefix, iri);
    }

    if (!vocab && baseIri) return removeBase(*baseIri, iri);
    return iri;
  }

  auto Context::compactValue(string const& activeProperty, Json const& value) const -> Json {
    auto const type = typeMapping(activeProperty);
    auto const preserveIndex = value.contains("@index") && !hasContainer(activeProperty, "@index");

    if (value.contains("@id") && value["@id"].is_string() && (value.size() == 1 || (value.size() == 2 && value.contains("@index") && !preserveIndex))) {
      if (type == "@id") return compactIri(value["@id"].get<string>(), nullptr, false);
      if (type == "@vocab") return compactIri(value["@id"].get<string>(), nullptr, true);
    }
    if (!isValue(value)) return value;

    auto const& valueType = member(value, "@type");
    if (valueType.is_string() && type && valueType == *type) return value["@value"];

    auto const disabled = type == "@none" || (valueType.is_string() && (!type || valueType != *type));
    if (!disabled && !preserveIndex) {
      if (!value["@value"].is_string()) return value["@value"];
      auto const lang = languageMapping(activeProperty);
      auto const dir = directionMapping(activeProperty);
      auto const valueLang = value.contains("@language") ? Nullable(lowercase(value["@language"].get<string>())) : Nullable();
      auto const valueDir = value.contains("@direction") ? Nullable(value["@direction"].get<string>()) : Nullable();
      if (valueLang == (lang ? Nullable(lowercase(*lang)) : Nullable()) && valueDir == dir) return value["@value"];
    }

    auto res = Json::object();
    if (preserveIndex) res[compactIri("@index", nullptr, true)] = value["@index"];
    if (valueType.is_string()) res[compactIri("@type", nullptr, true)] = compactIri(valueType.get<string>(), nullptr, true);
    if (value.contains("@language")) res[compactIri("@language", nullptr, true)] = value["@language"];
    if (value.contains("@direction")) res[compactIri("@direction", nullptr, true)] = value["@direction"];
    res[compactIri("@value", nullptr, true)] = value["@value"];
    return res;
  }

  auto Context::serialize() const -> Json {
    auto res = Json::object();
    if (baseIri && *baseIri != opts->base) res["@base"] = *baseIri;
    if (vocabMapping) res["@vocab"] = *vocabMapping;
    if (language) res["@language"] = *language;
    if (direction) res["@direction"] = *direction;
    for (auto const& [term, def]: *terms) {
      if (!def.id) {
        res[term] = nullptr;
        continue;
      }
      auto entry = Json::object();
      entry[def.reverse ? "@reverse" : "@id"] = *def.id;
      if (def.type) entry["@type"] = *def.type;
      if (def.container.size() == 1) entry["@container"] = *def.container.begin();
      else if (!def.container.empty()) entry["@container"] = def.container;
      if (def.index) entry["@index"] = *def.index;
      if (def.context) entry["@context"] = *def.context;
      if (def.language) entry["@language"] = def.language->has_value() ? Json(**def.language) : Json(nullptr);
      if (def.direction) entry["@direction"] = def.direction->has_value() ? Json(**def.direction) : Json(nullptr);
      if (def.nest) entry["@nest"] = *def.nest;
      if (def.isProtected) entry["@protected"] = true;
      if (entry.size() == 1 && !def.reverse) res[term] = *def.id;
      else res[term] = std::move(entry);
    }
    return res;
  }

#include "macros_close.hpp"
}
