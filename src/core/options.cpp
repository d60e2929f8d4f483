#include "options.hpp"
#include <ostream>
#include "error.hpp"

namespace ldmill::core {
#include "macros_open.hpp"

  auto processingModeName(ProcessingMode mode) -> std::string_view {
    switch (mode) {
      case ProcessingMode::jsonLd10: return "json-ld-1.0";
      case ProcessingMode::jsonLd11: return "json-ld-1.1";
    }
    unreachable;
  }

  auto embedName(Embed embed) -> std::string_view {
    switch (embed) {
      case Embed::once: return "@once";
      case Embed::always: return "@always";
      case Embed::never: return "@never";
    }
    unreachable;
  }

  auto algorithmName(Algorithm algorithm) -> std::string_view {
    switch (algorithm) {
      case Algorithm::urdna2015: return "URDNA2015";
      case Algorithm::urgna2012: return "URGNA2012";
    }
    unreachable;
  }

  auto parseProcessingMode(std::string_view s) -> ProcessingMode {
    if (s == "json-ld-1.0") return ProcessingMode::jsonLd10;
    if (s == "json-ld-1.1") return ProcessingMode::jsonLd11;
    throw JsonLdError(ErrorCode::invalidInput, "unknown processing mode: " + std::string(s));
  }

  auto parseEmbed(std::string_view s) -> Embed {
    for (auto e: {Embed::once, Embed::always, Embed::never})
      if (embedName(e) == s) return e;
    throw JsonLdError(ErrorCode::invalidEmbedValue, std::string(s));
  }

  auto parseAlgorithm(std::string_view s) -> Algorithm {
    if (s == "URDNA2015" || s == "RDFC-1.0") return Algorithm::urdna2015;
    if (s == "URGNA2012") return Algorithm::urgna2012;
    throw JsonLdError(ErrorCode::invalidInput, "unknown normalization algorithm: " + std::string(s));
  }

  auto isNQuadsFormat(std::string_view s) -> bool {
    return s == nquadsFormat || s == "application/nquads";
  }

  auto Options::warn(std::string_view msg) const -> void {
    if (log) *log << "warning: " << msg << std::endl;
  }

  auto Options::dropped(std::string_view msg) const -> void {
    if (safeMode) throw JsonLdError(ErrorCode::invalidInput, std::string(msg));
    warn(msg);
  }

  void from_json(Json const& j, Options& opts) {
    if (!j.is_object()) throw JsonLdError(ErrorCode::invalidInput, "options must be an object");
    // clang-format off
    auto flag = [&](char const* key, bool& field) { if (j.contains(key)) field = j.at(key).get<bool>(); };
    auto text = [&](char const* key, std::string& field) { if (j.contains(key)) field = j.at(key).get<std::string>(); };
    // clang-format on
    try {
      text("base", opts.base);
      flag("compactArrays", opts.compactArrays);
      if (j.contains("expandContext")) opts.expandContext = j.at("expandContext");
      if (j.contains("processingMode")) opts.processingMode = parseProcessingMode(j.at("processingMode").get<std::string>());
      flag("ordered", opts.ordered);
      if (j.contains("embed")) {
        auto const& e = j.at("embed");
        // Boolean values from JSON-LD 1.0 frames
        if (e.is_boolean()) opts.embed = e.get<bool>() ? Embed::once : Embed::never;
        else opts.embed = parseEmbed(e.get<std::string>());
      }
      flag("explicit", opts.explicitInclusion);
      flag("requireAll", opts.requireAll);
      flag("frameDefault", opts.frameDefault);
      flag("omitDefault", opts.omitDefault);
      if (j.contains("omitGraph")) opts.omitGraph = j.at("omitGraph").get<bool>();
      flag("useRdfType", opts.useRdfType);
      flag("useNativeTypes", opts.useNativeTypes);
      flag("produceGeneralizedRdf", opts.produceGeneralizedRdf);
      text("inputFormat", opts.inputFormat);
      text("format", opts.format);
      if (j.contains("algorithm")) opts.algorithm = parseAlgorithm(j.at("algorithm").get<std::string>());
      if (j.contains("complexityLimit")) opts.complexityLimit = j.at("complexityLimit").get<size_t>();
      flag("safeMode", opts.safeMode);
    } catch (Json::type_error& e) {
      throw JsonLdError(ErrorCode::invalidInput, e.what());
    }
  }

#include "macros_close.hpp"
}
