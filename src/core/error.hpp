#ifndef LDMILL_CORE_ERROR_HPP
#define LDMILL_CORE_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <common.hpp>

namespace ldmill::core {
#include "macros_open.hpp"

  // JSON-LD 1.1 API error codes, followed by processor-specific ones.
  // See: https://www.w3.org/TR/json-ld11-api/#jsonlderrorcode
  enum class ErrorCode : uint8_t {
    collidingKeywords,
    compactionToListOfLists,
    conflictingIndexes,
    cyclicIriMapping,
    invalidBaseDirection,
    invalidBaseIri,
    invalidContainerMapping,
    invalidContextEntry,
    invalidContextNullification,
    invalidDefaultLanguage,
    invalidEmbedValue,
    invalidFrame,
    invalidIdValue,
    invalidImportValue,
    invalidIncludedValue,
    invalidIndexValue,
    invalidIriMapping,
    invalidKeywordAlias,
    invalidLanguageMapValue,
    invalidLanguageMapping,
    invalidLanguageTaggedString,
    invalidLanguageTaggedValue,
    invalidLocalContext,
    invalidNestValue,
    invalidPrefixValue,
    invalidPropagateValue,
    invalidProtectedValue,
    invalidRemoteContext,
    invalidReverseProperty,
    invalidReversePropertyMap,
    invalidReversePropertyValue,
    invalidReverseValue,
    invalidScopedContext,
    invalidSetOrListObject,
    invalidTermDefinition,
    invalidTypeMapping,
    invalidTypeValue,
    invalidTypedValue,
    invalidValueObject,
    invalidValueObjectValue,
    invalidVersionValue,
    invalidVocabMapping,
    iriConfusedWithPrefix,
    keywordRedefinition,
    loadingDocumentFailed,
    loadingRemoteContextFailed,
    multipleContextLinkHeaders,
    processingModeConflict,
    protectedTermRedefinition,
    recursiveContextInclusion,
    listOfLists,
    // Processor-specific
    syntaxError,
    unknownFormat,
    invalidInput,
    parseError,
    ioError,
    canonicalizationComplexityExceeded,
    invalidNumberFormat,
    invalidJsonLiteral
  };

  // Returns the error code as it appears in the JSON-LD test suites (e.g. "invalid @id value").
  auto errorCodeName(ErrorCode code) -> std::string_view;

  // All errors raised by the processor.
  // `what()` gives "<code>: <details>", or just "<code>" if there are no details.
  struct JsonLdError: std::runtime_error {
    ErrorCode code;
    std::string details;
    explicit JsonLdError(ErrorCode code, std::string const& details = ""):
      std::runtime_error(details.empty() ? std::string(errorCodeName(code)) : std::string(errorCodeName(code)) + ": " + details),
      code(code),
      details(details) {}
  };

#include "macros_close.hpp"
}

#endif // LDMILL_CORE_ERROR_HPP
