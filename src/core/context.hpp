#ifndef LDMILL_CORE_CONTEXT_HPP
#define LDMILL_CORE_CONTEXT_HPP

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <common.hpp>
#include "options.hpp"

namespace ldmill::core {
#include "macros_open.hpp"

  // A string value that may be explicitly set to null (e.g. `"@language": null` in a term definition).
  using Nullable = std::optional<std::string>;

  // See: https://www.w3.org/TR/json-ld11-api/#dfn-term-definition
  struct TermDefinition {
    // IRI mapping (absolute IRI, blank node identifier or keyword); unset for `"@id": null`.
    Nullable id;
    bool reverse = false;
    // Type mapping: `@id`, `@vocab`, `@json`, `@none` or an absolute IRI.
    std::optional<std::string> type;
    std::set<std::string> container;
    std::optional<std::string> index;
    // Scoped (property- or type-) context, kept unprocessed, and the base URL it was defined against.
    std::optional<Json> context;
    std::string contextBase;
    std::optional<Nullable> language;
    std::optional<Nullable> direction;
    std::optional<std::string> nest;
    // Whether the term may be used as the prefix of a compact IRI.
    bool prefix = false;
    bool isProtected = false;

    auto hasContainer(std::string const& c) const -> bool {
      return container.contains(c);
    }

    auto operator==(TermDefinition const&) const -> bool = default;
  };

  // The value stored for one container/type-or-language combination in an inverse context.
  struct InverseEntry {
    std::map<std::string, std::string> language, type, any;
    auto select(std::string const& typeOrLanguage) const -> std::map<std::string, std::string> const&;
  };

  // IRI -> container key -> entry.
  // See: https://www.w3.org/TR/json-ld11-api/#inverse-context-creation
  using InverseContext = std::map<std::string, std::map<std::string, InverseEntry>>;

  // An active context.
  // A context is a value: processing a local context returns a new context and never modifies the one it was derived
  // from, so nested scopes and sibling branches can hold on to theirs freely. The term map is shared between derived
  // contexts until one of them defines a term.
  class Context {
  public:
    struct ParseFlags {
      bool overrideProtected = false;
      bool propagate = true;
      bool validateScopedContext = true;
    };

    // Remote contexts dereferenced during one top-level call: URL -> (document URL, `@context` value).
    using RemoteCache = std::unordered_map<std::string, std::pair<std::string, Json>>;

    // An empty context taking its base IRI, processing mode and document loader from `options`.
    // Contexts sharing `cache` fetch each remote context at most once.
    explicit Context(std::shared_ptr<Options const> options, std::shared_ptr<RemoteCache> cache = nullptr);

    // Context processing algorithm.
    // `baseUrl` is the location of the document holding `localContext`; relative context references resolve against it.
    // See: https://www.w3.org/TR/json-ld11-api/#context-processing-algorithm
    auto parse(Json const& localContext, std::string const& baseUrl, ParseFlags flags) const -> Context;
    auto parse(Json const& localContext) const -> Context {
      return parse(localContext, options().base, {});
    }

    // IRI expansion. Returns `nullopt` if the value is mapped to null or looks like an unknown keyword.
    // See: https://www.w3.org/TR/json-ld11-api/#iri-expansion
    auto expandIri(std::string const& value, bool documentRelative, bool vocab) const -> std::optional<std::string>;

    // IRI compaction. `value` is the (expanded) value the compacted IRI will be used with, or null.
    // See: https://www.w3.org/TR/json-ld11-api/#iri-compaction
    auto compactIri(std::string const& iri, Json const& value = nullptr, bool vocab = false, bool reverse = false) const
      -> std::string;

    // Value expansion and compaction.
    // See: https://www.w3.org/TR/json-ld11-api/#value-expansion
    // See: https://www.w3.org/TR/json-ld11-api/#value-compaction
    auto expandValue(std::string const& activeProperty, Json const& value) const -> Json;
    auto compactValue(std::string const& activeProperty, Json const& value) const -> Json;

    // Term selection over the inverse context.
    auto selectTerm(
      std::string const& iri, std::vector<std::string> const& containers, std::string const& typeOrLanguage,
      std::vector<std::string> const& preferredValues
    ) const -> std::optional<std::string>;

    auto inverse() const -> InverseContext const&;

    // Returns null for undefined terms and for terms explicitly mapped to null.
    auto termDefinition(std::string const& term) const -> TermDefinition const*;
    // Includes terms mapped to null.
    auto hasTerm(std::string const& term) const -> bool {
      return terms->contains(term);
    }
    auto hasContainer(std::string const& term, std::string const& container) const -> bool;
    auto isReverseProperty(std::string const& term) const -> bool;
    auto typeMapping(std::string const& term) const -> std::optional<std::string>;
    auto languageMapping(std::string const& term) const -> Nullable;
    auto directionMapping(std::string const& term) const -> Nullable;
    auto hasProtectedTerms() const -> bool;

    auto base() const -> Nullable const& {
      return baseIri;
    }
    auto vocab() const -> Nullable const& {
      return vocabMapping;
    }
    auto defaultLanguage() const -> Nullable const& {
      return language;
    }
    auto defaultDirection() const -> Nullable const& {
      return direction;
    }
    auto processingMode() const -> ProcessingMode {
      return mode;
    }
    auto isLegacyMode() const -> bool {
      return mode == ProcessingMode::jsonLd10;
    }
    auto options() const -> Options const& {
      return *opts;
    }
    auto sharedOptions() const -> std::shared_ptr<Options const> const& {
      return opts;
    }

    // The context a type-scoped context was applied on top of, if any.
    auto previousContext() const -> Context const* {
      return previous.get();
    }

    // Renders the active context as a `@context` value.
    auto serialize() const -> Json;

  private:
    // Terms mapped to null are kept, with no IRI mapping, so that redefinitions can be checked.
    using TermMap = std::map<std::string, TermDefinition>;
    using DefinedMap = std::unordered_map<std::string, bool>;
    std::shared_ptr<Options const> opts;
    std::shared_ptr<TermMap> terms;
    mutable std::shared_ptr<InverseContext const> inverseCache;
    std::shared_ptr<Context const> previous;
    std::shared_ptr<RemoteCache> remoteCache;
    Nullable baseIri, vocabMapping, language, direction;
    ProcessingMode mode;

    struct Definer;

    auto mutableTerms() -> TermMap&;
    auto dereference(std::string const& url) const -> std::pair<std::string, Json> const&;
    auto parseImpl(
      Json const& localContext, std::string const& baseUrl, std::vector<std::string> remoteContexts, ParseFlags flags
    ) const -> Context;
    auto reset() const -> Context;
  };

#include "macros_close.hpp"
}

#endif // LDMILL_CORE_CONTEXT_HPP
