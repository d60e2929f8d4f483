#include "document_loader.hpp"
#include <fstream>
#include <regex>
#include <sstream>
#include "error.hpp"
#include "url.hpp"

namespace ldmill::core {
#include "macros_open.hpp"

  auto FileDocumentLoader::load(std::string const& url) -> RemoteDocument {
    auto path = url;
    auto const parsed = Url::parse(url);
    if (parsed.scheme && parsed.scheme->size() > 1) {
      if (*parsed.scheme != "file") throw JsonLdError(ErrorCode::loadingDocumentFailed, "unsupported scheme: " + url);
      path = parsed.path;
    }

    auto in = std::ifstream(path);
    if (!in) throw JsonLdError(ErrorCode::loadingDocumentFailed, "cannot open " + path);
    auto ss = std::stringstream();
    ss << in.rdbuf();

    auto res = RemoteDocument{.documentUrl = url, .contentType = "application/ld+json"};
    try {
      res.document = Json::parse(ss.str());
    } catch (Json::parse_error& e) {
      throw JsonLdError(ErrorCode::loadingDocumentFailed, e.what());
    }
    return res;
  }

  auto CachingDocumentLoader::load(std::string const& url) -> RemoteDocument {
    if (auto const it = cache.find(url); it != cache.end()) return it->second;
    if (!next) throw JsonLdError(ErrorCode::loadingDocumentFailed, "no document available for " + url);
    auto doc = next->load(url);
    cache.emplace(url, doc);
    return doc;
  }

  auto CachingDocumentLoader::addDocument(std::string const& url, Json document) -> void {
    cache.insert_or_assign(url, RemoteDocument{.documentUrl = url, .document = std::move(document)});
  }

  auto CachingDocumentLoader::preloadWithMapping(std::map<std::string, std::string> const& urlMap) -> void {
    if (!next) throw JsonLdError(ErrorCode::loadingDocumentFailed, "no loader to preload documents with");
    for (auto const& [src, mapped]: urlMap) cache.insert_or_assign(src, next->load(mapped));
  }

  auto parseLinkHeader(std::string const& header) -> std::map<std::string, std::vector<std::map<std::string, std::string>>> {
    static auto const splitOnComma = std::regex(R"((?:<[^>]*?>|"[^"]*?"|[^,])+)");
    static auto const linkPattern = std::regex(R"(\s*<([^>]*?)>\s*(?:;\s*(.*))?)");
    static auto const paramPattern = std::regex(R"rx((.*?)=(?:(?:"([^"]*?)")|([^"]*?))\s*(?:(?:;\s*)|$))rx");

    auto res = std::map<std::string, std::vector<std::map<std::string, std::string>>>();
    for (auto it = std::sregex_iterator(header.begin(), header.end(), splitOnComma); it != std::sregex_iterator(); ++it) {
      auto const entry = it->str();
      auto m = std::smatch();
      if (!std::regex_match(entry, m, linkPattern)) continue;

      auto result = std::map<std::string, std::string>{{"target", m[1].str()}};
      auto const params = m[2].str();
      for (auto p = std::sregex_iterator(params.begin(), params.end(), paramPattern); p != std::sregex_iterator(); ++p) {
        auto const& pm = *p;
        if (pm[1].length() == 0) continue;
        auto key = pm[1].str();
        while (!key.empty() && key.front() == ' ') key.erase(0, 1);
        result[key] = pm[2].matched ? pm[2].str() : pm[3].str();
      }
      res[result["rel"]].push_back(std::move(result));
    }
    return res;
  }

#include "macros_close.hpp"
}
