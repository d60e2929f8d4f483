#ifndef LDMILL_PROCESSOR_HPP
#define LDMILL_PROCESSOR_HPP

#include <string>
#include <memory>
#include <variant>
#include <common.hpp>
#include <core/context.hpp>
#include <core/document_loader.hpp>
#include <core/options.hpp>
#include <rdf/dataset.hpp>

namespace ldmill {
#include "macros_open.hpp"

  // A dataset, or its N-Quads serialization when the `format` option asks for one.
  using RdfDocument = std::variant<rdf::Dataset, std::string>;

  // The JSON-LD API entry points.
  // A string `input` (or context, or frame) is an IRI, fetched through `Options::documentLoader`; anything else is the
  // document itself. Each call works on its own copy of the options, with `base` defaulting to the document URL.
  // See: https://www.w3.org/TR/json-ld11-api/#the-jsonldprocessor-interface
  class Processor {
  public:
    explicit Processor(core::Options opts = {}):
      opts(std::move(opts)) {}

    auto options() const -> core::Options const& {
      return opts;
    }

    auto expand(Json const& input) const -> Json;
    auto compact(Json const& input, Json const& context) const -> Json;
    // Without a context, returns the flattened node array.
    auto flatten(Json const& input, Json const& context = nullptr) const -> Json;
    auto frame(Json const& input, Json const& frame) const -> Json;

    auto toRdf(Json const& input) const -> RdfDocument;
    // N-Quads text is accepted unless `inputFormat` names another format.
    auto fromRdf(RdfDocument const& input) const -> Json;

    // Canonical form of a JSON-LD document, or of N-Quads text when `inputFormat` is N-Quads.
    auto normalize(Json const& input) const -> RdfDocument;
    auto normalize(rdf::Dataset const& dataset) const -> RdfDocument;

  private:
    using RemoteCache = std::shared_ptr<core::Context::RemoteCache>;

    core::Options opts;

    auto load(Json const& input) const -> core::RemoteDocument;
    // `cache` holds the remote contexts fetched so far in the current call.
    auto expandDocument(
      core::RemoteDocument const& doc, core::Options const& callOpts, RemoteCache const& cache, bool frameExpansion
    ) const -> Json;
    auto compactExpanded(
      Json const& expanded, Json const& context, core::Options const& callOpts, RemoteCache const& cache, bool forceGraph
    ) const -> Json;
    auto output(rdf::Dataset dataset) const -> RdfDocument;
  };

#include "macros_close.hpp"
}

#endif // LDMILL_PROCESSOR_HPP
