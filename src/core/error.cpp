#include "error.hpp"

namespace ldmill::core {
#include "macros_open.hpp"

  auto errorCodeName(ErrorCode code) -> std::string_view {
    using enum ErrorCode;
    switch (code) {
      case collidingKeywords: return "colliding keywords";
      case compactionToListOfLists: return "compaction to list of lists";
      case conflictingIndexes: return "conflicting indexes";
      case cyclicIriMapping: return "cyclic IRI mapping";
      case invalidBaseDirection: return "invalid base direction";
      case invalidBaseIri: return "invalid base IRI";
      case invalidContainerMapping: return "invalid container mapping";
      case invalidContextEntry: return "invalid context entry";
      case invalidContextNullification: return "invalid context nullification";
      case invalidDefaultLanguage: return "invalid default language";
      case invalidEmbedValue: return "invalid @embed value";
      case invalidFrame: return "invalid frame";
      case invalidIdValue: return "invalid @id value";
      case invalidImportValue: return "invalid @import value";
      case invalidIncludedValue: return "invalid @included value";
      case invalidIndexValue: return "invalid @index value";
      case invalidIriMapping: return "invalid IRI mapping";
      case invalidKeywordAlias: return "invalid keyword alias";
      case invalidLanguageMapValue: return "invalid language map value";
      case invalidLanguageMapping: return "invalid language mapping";
      case invalidLanguageTaggedString: return "invalid language-tagged string";
      case invalidLanguageTaggedValue: return "invalid language-tagged value";
      case invalidLocalContext: return "invalid local context";
      case invalidNestValue: return "invalid @nest value";
      case invalidPrefixValue: return "invalid @prefix value";
      case invalidPropagateValue: return "invalid @propagate value";
      case invalidProtectedValue: return "invalid @protected value";
      case invalidRemoteContext: return "invalid remote context";
      case invalidReverseProperty: return "invalid reverse property";
      case invalidReversePropertyMap: return "invalid reverse property map";
      case invalidReversePropertyValue: return "invalid reverse property value";
      case invalidReverseValue: return "invalid @reverse value";
      case invalidScopedContext: return "invalid scoped context";
      case invalidSetOrListObject: return "invalid set or list object";
      case invalidTermDefinition: return "invalid term definition";
      case invalidTypeMapping: return "invalid type mapping";
      case invalidTypeValue: return "invalid type value";
      case invalidTypedValue: return "invalid typed value";
      case invalidValueObject: return "invalid value object";
      case invalidValueObjectValue: return "invalid value object value";
      case invalidVersionValue: return "invalid @version value";
      case invalidVocabMapping: return "invalid vocab mapping";
      case iriConfusedWithPrefix: return "IRI confused with prefix";
      case keywordRedefinition: return "keyword redefinition";
      case loadingDocumentFailed: return "loading document failed";
      case loadingRemoteContextFailed: return "loading remote context failed";
      case multipleContextLinkHeaders: return "multiple context link headers";
      case processingModeConflict: return "processing mode conflict";
      case protectedTermRedefinition: return "protected term redefinition";
      case recursiveContextInclusion: return "recursive context inclusion";
      case listOfLists: return "list of lists";
      case syntaxError: return "syntax error";
      case unknownFormat: return "unknown format";
      case invalidInput: return "invalid input";
      case parseError: return "parse error";
      case ioError: return "io error";
      case canonicalizationComplexityExceeded: return "canonicalization complexity exceeded";
      case invalidJsonLiteral: return "invalid JSON literal";
      case invalidNumberFormat: return "invalid number format";
    }
    unreachable;
  }

#include "macros_close.hpp"
}
