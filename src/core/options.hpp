#ifndef LDMILL_CORE_OPTIONS_HPP
#define LDMILL_CORE_OPTIONS_HPP

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <common.hpp>
#include "document_loader.hpp"

namespace ldmill::core {
#include "macros_open.hpp"

  enum class ProcessingMode : uint8_t { jsonLd10, jsonLd11 };
  enum class Embed : uint8_t { once, always, never };
  enum class Algorithm : uint8_t { urdna2015, urgna2012 };

  auto processingModeName(ProcessingMode mode) -> std::string_view;
  auto embedName(Embed embed) -> std::string_view;
  auto algorithmName(Algorithm algorithm) -> std::string_view;

  // Parsers for the textual forms; unknown values throw `JsonLdError`.
  auto parseProcessingMode(std::string_view s) -> ProcessingMode;
  auto parseEmbed(std::string_view s) -> Embed;
  auto parseAlgorithm(std::string_view s) -> Algorithm;

  // The N-Quads media type, as accepted by the `format` and `inputFormat` options.
  constexpr std::string_view nquadsFormat = "application/n-quads";
  auto isNQuadsFormat(std::string_view s) -> bool;

  // Options recognised by every entry point.
  // See: https://www.w3.org/TR/json-ld11-api/#the-jsonldoptions-type
  struct Options {
    std::string base;
    bool compactArrays = true;
    // A context applied before processing the input (for expansion only).
    Json expandContext = nullptr;
    ProcessingMode processingMode = ProcessingMode::jsonLd11;
    std::shared_ptr<DocumentLoader> documentLoader;
    // Object keys are always processed in lexicographic order; the flag is accepted for compatibility.
    bool ordered = true;

    // Framing
    Embed embed = Embed::once;
    bool explicitInclusion = false;
    bool requireAll = false;
    bool frameDefault = false;
    bool omitDefault = false;
    // Unset means: omit the top-level `@graph` when in 1.1 mode.
    std::optional<bool> omitGraph;

    // RDF conversion
    bool useRdfType = false;
    bool useNativeTypes = false;
    bool produceGeneralizedRdf = false;
    std::string inputFormat;
    std::string format;

    // Canonicalization
    Algorithm algorithm = Algorithm::urdna2015;
    // Upper bound on N-degree hash steps; zero selects a bound proportional to the number of blank nodes.
    size_t complexityLimit = 0;

    // Raise errors for content that would otherwise be silently dropped.
    bool safeMode = false;

    // Diagnostics sink; nothing is written when null.
    std::ostream* log = nullptr;

    auto warn(std::string_view msg) const -> void;
    // Reports content that is being dropped: a warning, or an `invalidInput` error in safe mode.
    auto dropped(std::string_view msg) const -> void;
  };

  // Reads options from a JSON object using the JSON-LD option names ("base", "compactArrays", ...).
  void from_json(Json const& j, Options& opts);

#include "macros_close.hpp"
}

#endif // LDMILL_CORE_OPTIONS_HPP
