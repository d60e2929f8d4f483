#ifndef LDMILL_CORE_DOCUMENT_LOADER_HPP
#define LDMILL_CORE_DOCUMENT_LOADER_HPP

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <common.hpp>

namespace ldmill::core {
#include "macros_open.hpp"

  // A document retrieved by a loader.
  // `contextUrl` is the target of an HTTP Link header with rel="http://www.w3.org/ns/json-ld#context", if any.
  struct RemoteDocument {
    std::string documentUrl;
    Json document;
    std::string contextUrl;
    std::string contentType;
  };

  // Maps a URL to a parsed document. Failures throw `JsonLdError` with `loadingDocumentFailed`.
  // Retrieval policy (timeouts, retries, redirects) belongs to implementations, never to the algorithms.
  class DocumentLoader {
    interface(DocumentLoader);
    virtual auto load(std::string const& url) -> RemoteDocument required;
  };

  // Loads local files, given as plain paths or `file:` URLs. Other schemes are rejected.
  class FileDocumentLoader: public DocumentLoader {
  public:
    auto load(std::string const& url) -> RemoteDocument override;
  };

  // Remembers every document loaded through the next loader. May be preloaded with documents,
  // which is how offline contexts and tests supply remote documents.
  // Not synchronised: concurrent processing calls should use separate instances.
  class CachingDocumentLoader: public DocumentLoader {
  public:
    explicit CachingDocumentLoader(std::shared_ptr<DocumentLoader> next = nullptr):
      next(std::move(next)) {}

    auto load(std::string const& url) -> RemoteDocument override;

    auto addDocument(std::string const& url, Json document) -> void;

    // Loads each mapped location (e.g. a local file) through the next loader and caches it under the source URL.
    auto preloadWithMapping(std::map<std::string, std::string> const& urlMap) -> void;

  private:
    std::shared_ptr<DocumentLoader> next;
    std::unordered_map<std::string, RemoteDocument> cache;
  };

  // Parses an HTTP Link header; entries are keyed by their "rel" parameter.
  // Each entry holds "target" and the other parameters, e.g. for
  //   Link: <http://json-ld.org/contexts/person.jsonld>; rel="http://www.w3.org/ns/json-ld#context"
  // the result is {"http://www.w3.org/ns/json-ld#context": [{"target": "http://json-ld.org/...", "rel": "..."}]}.
  auto parseLinkHeader(std::string const& header) -> std::map<std::string, std::vector<std::map<std::string, std::string>>>;

#include "macros_close.hpp"
}

#endif // LDMILL_CORE_DOCUMENT_LOADER_HPP
