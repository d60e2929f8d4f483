#include "processor.hpp"
#include <memory>
#include <core/context.hpp>
#include <core/error.hpp>
#include <core/value.hpp>
#include <algo/compact.hpp>
#include <algo/expand.hpp>
#include <algo/flatten.hpp>
#include <algo/frame.hpp>
#include <rdf/canonicalize.hpp>
#include <rdf/from_rdf.hpp>
#include <rdf/nquads.hpp>
#include <rdf/to_rdf.hpp>

using std::string;

namespace ldmill {
#include "macros_open.hpp"

  using core::Context;
  using core::ErrorCode;
  using core::JsonLdError;
  using core::Options;
  using core::RemoteDocument;

  namespace {

    // The `@context` value of a context argument, which may be a document holding one.
    auto contextValue(Json const& context) -> Json {
      if (context.is_object() && context.contains("@context")) return context["@context"];
      return context;
    }

    // The context to put in a compacted document, or null if it carries no definitions.
    auto outputContext(Json const& context) -> Json {
      auto res = Json::array();
      for (auto const& c: core::arrayify(contextValue(context)))
        if (!c.is_null() && !core::isEmptyObject(c)) res.push_back(c);
      if (res.empty()) return nullptr;
      if (res.size() == 1) return res[0];
      return res;
    }

    auto newCache() -> std::shared_ptr<Context::RemoteCache> {
      return std::make_shared<Context::RemoteCache>();
    }

    auto withDocumentBase(Options opts, RemoteDocument const& doc) -> Options {
      if (opts.base.empty()) opts.base = doc.documentUrl;
      return opts;
    }

  }

  auto Processor::load(Json const& input) const -> RemoteDocument {
    if (!input.is_string()) return RemoteDocument{.document = input};
    if (!opts.documentLoader)
      throw JsonLdError(ErrorCode::loadingDocumentFailed, "no document loader for " + input.get<string>());
    return opts.documentLoader->load(input.get<string>());
  }

  auto Processor::expandDocument(
    RemoteDocument const& doc, Options const& callOpts, RemoteCache const& cache, bool frameExpansion
  ) const -> Json {
    auto ctx = Context(std::make_shared<Options const>(callOpts), cache);
    if (!callOpts.expandContext.is_null()) ctx = ctx.parse(contextValue(callOpts.expandContext));
    if (!doc.contextUrl.empty()) ctx = ctx.parse(Json(doc.contextUrl), doc.documentUrl, {});
    return algo::expand(ctx, doc.document, callOpts.base, frameExpansion);
  }

  auto Processor::compactExpanded(
    Json const& expanded, Json const& context, Options const& callOpts, RemoteCache const& cache, bool forceGraph
  ) const -> Json {
    auto const ctx = Context(std::make_shared<Options const>(callOpts), cache).parse(contextValue(context));
    auto compacted = algo::compact(ctx, "", expanded, callOpts.compactArrays);

    if (callOpts.compactArrays && !forceGraph && compacted.is_array()) {
      if (compacted.size() == 1) compacted = Json(compacted[0]);
      else if (compacted.empty()) compacted = Json::object();
    } else if (forceGraph && compacted.is_object()) {
      compacted = Json::array({std::move(compacted)});
    }
    if (compacted.is_array()) compacted = Json{{ctx.compactIri("@graph", nullptr, true), std::move(compacted)}};

    if (auto c = outputContext(context); !c.is_null()) compacted["@context"] = std::move(c);
    return compacted;
  }

  auto Processor::expand(Json const& input) const -> Json {
    auto const doc = load(input);
    return expandDocument(doc, withDocumentBase(opts, doc), newCache(), false);
  }

  auto Processor::compact(Json const& input, Json const& context) const -> Json {
    if (context.is_null()) throw JsonLdError(ErrorCode::invalidLocalContext, "compaction requires a context");
    auto const doc = load(input);
    auto const callOpts = withDocumentBase(opts, doc);
    auto const cache = newCache();
    return compactExpanded(expandDocument(doc, callOpts, cache, false), load(context).document, callOpts, cache, false);
  }

  auto Processor::flatten(Json const& input, Json const& context) const -> Json {
    auto const doc = load(input);
    auto const callOpts = withDocumentBase(opts, doc);
    auto const cache = newCache();
    auto flattened = algo::flatten(expandDocument(doc, callOpts, cache, false));
    if (context.is_null()) return flattened;
    return compactExpanded(flattened, load(context).document, callOpts, cache, true);
  }

  auto Processor::frame(Json const& input, Json const& frame) const -> Json {
    auto const doc = load(input);
    auto const frameDoc = load(frame);
    if (!frameDoc.document.is_object() && !frameDoc.document.is_array())
      throw JsonLdError(ErrorCode::invalidFrame, "frame must be an object");

    auto callOpts = withDocumentBase(opts, doc);
    auto context = frameDoc.document.is_object() && frameDoc.document.contains("@context")
                   ? frameDoc.document["@context"]
                   : Json::object();
    if (!frameDoc.contextUrl.empty()) context = Json::array({context, frameDoc.contextUrl});

    auto const cache = newCache();
    // A top-level key expanding to `@graph` selects the default graph instead of the merged one.
    auto const frameCtx = Context(std::make_shared<Options const>(callOpts), cache).parse(context);
    if (frameDoc.document.is_object())
      for (auto const& [key, _]: frameDoc.document.items())
        if (frameCtx.expandIri(key, false, true) == "@graph") callOpts.frameDefault = true;

    auto const expanded = expandDocument(doc, callOpts, cache, false);
    auto const expandedFrame = expandDocument(frameDoc, withDocumentBase(callOpts, frameDoc), cache, true);

    auto const framed = algo::frame(expanded, expandedFrame, callOpts);
    auto const omitGraph = callOpts.omitGraph.value_or(callOpts.processingMode != core::ProcessingMode::jsonLd10);
    return algo::removeNullPlaceholders(compactExpanded(framed, Json{{"@context", context}}, callOpts, cache, !omitGraph));
  }

  auto Processor::output(rdf::Dataset dataset) const -> RdfDocument {
    if (opts.format.empty()) return dataset;
    if (core::isNQuadsFormat(opts.format)) return rdf::toNQuads(dataset);
    throw JsonLdError(ErrorCode::unknownFormat, opts.format);
  }

  auto Processor::toRdf(Json const& input) const -> RdfDocument {
    auto const doc = load(input);
    auto const callOpts = withDocumentBase(opts, doc);
    return output(rdf::toRdf(expandDocument(doc, callOpts, newCache(), false), callOpts));
  }

  auto Processor::fromRdf(RdfDocument const& input) const -> Json {
    auto const parse = [&](string const& text) {
      if (!opts.inputFormat.empty() && !core::isNQuadsFormat(opts.inputFormat))
        throw JsonLdError(ErrorCode::unknownFormat, opts.inputFormat);
      return rdf::parseNQuads(text);
    };
    auto const dataset = match(
      input,
      [&](rdf::Dataset const& d) { return d; },
      [&](string const& text) { return parse(text); }
    );
    return rdf::fromRdf(dataset, opts);
  }

  auto Processor::normalize(Json const& input) const -> RdfDocument {
    if (!opts.inputFormat.empty()) {
      if (!core::isNQuadsFormat(opts.inputFormat)) throw JsonLdError(ErrorCode::unknownFormat, opts.inputFormat);
      if (!input.is_string()) throw JsonLdError(ErrorCode::invalidInput, "N-Quads input must be a string");
      return normalize(rdf::parseNQuads(input.get<string>()));
    }
    auto const doc = load(input);
    auto const callOpts = withDocumentBase(opts, doc);
    return normalize(rdf::toRdf(expandDocument(doc, callOpts, newCache(), false), callOpts));
  }

  auto Processor::normalize(rdf::Dataset const& dataset) const -> RdfDocument {
    auto const quads = rdf::canonicalize(dataset, opts);
    if (opts.format.empty()) {
      auto res = rdf::Dataset();
      for (auto const& quad: quads) res.add(quad);
      return res;
    }
    if (!core::isNQuadsFormat(opts.format)) throw JsonLdError(ErrorCode::unknownFormat, opts.format);
    auto res = string();
    for (auto const& quad: quads) res += rdf::toNQuad(quad);
    return res;
  }

#include "macros_close.hpp"
}
