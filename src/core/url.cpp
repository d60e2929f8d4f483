#include "url.hpp"
#include <cctype>
#include <regex>
#include "keyword.hpp"

namespace ldmill::core {
#include "macros_open.hpp"

  namespace {
    // See: https://www.rfc-editor.org/rfc/rfc3986#appendix-B
    auto const uriPattern = std::regex(R"(^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\?([^#]*))?(#(.*))?)");

    auto split(std::string const& s, char sep) -> std::vector<std::string> {
      auto res = std::vector<std::string>();
      auto start = 0uz;
      while (true) {
        auto const p = s.find(sep, start);
        if (p == std::string::npos) {
          res.push_back(s.substr(start));
          break;
        }
        res.push_back(s.substr(start, p - start));
        start = p + 1;
      }
      return res;
    }

    // Path normalisation used for relativisation: drops "." and empty segments (except the last one),
    // keeps leading ".." segments of a relative path without authority.
    auto normalizePath(std::string const& path, bool hasAuthority) -> std::string {
      auto res = std::string(path.starts_with('/') ? "/" : "");
      auto const input = split(path, '/');
      auto output = std::vector<std::string>();
      for (auto i = 0uz; i < input.size(); i++) {
        if (input[i] == "." || (input[i].empty() && input.size() - i > 1)) continue;
        if (input[i] == "..") {
          if (hasAuthority || (!output.empty() && output.back() != "..")) {
            if (!output.empty()) output.pop_back();
          } else {
            output.push_back("..");
          }
          continue;
        }
        output.push_back(input[i]);
      }
      for (auto i = 0uz; i < output.size(); i++) {
        if (i > 0) res += '/';
        res += output[i];
      }
      return res;
    }
  }

  auto Url::parse(std::string const& s) -> Url {
    auto m = std::smatch();
    auto res = Url();
    if (!std::regex_match(s, m, uriPattern)) {
      res.path = s;
      return res;
    }
    if (m[2].matched) res.scheme = m[2].str();
    if (m[4].matched) res.authority = m[4].str();
    res.path = m[5].str();
    if (m[7].matched) res.query = m[7].str();
    if (m[9].matched) res.fragment = m[9].str();
    return res;
  }

  // See: https://www.rfc-editor.org/rfc/rfc3986#section-5.3
  auto Url::toString() const -> std::string {
    auto res = std::string();
    if (scheme) res += *scheme + ":";
    if (authority) res += "//" + *authority;
    res += path;
    if (query) res += "?" + *query;
    if (fragment) res += "#" + *fragment;
    return res;
  }

  auto removeDotSegments(std::string const& path) -> std::string {
    auto in = path;
    auto out = std::string();
    while (!in.empty()) {
      if (in.starts_with("../")) in.erase(0, 3);
      else if (in.starts_with("./")) in.erase(0, 2);
      else if (in.starts_with("/./")) in.erase(0, 2);
      else if (in == "/.") in = "/";
      else if (in.starts_with("/../") || in == "/..") {
        in = in.size() == 3 ? "/" : in.substr(3);
        auto const p = out.rfind('/');
        out.erase(p == std::string::npos ? 0 : p);
      } else if (in == "." || in == "..") in.clear();
      else {
        auto const p = in.find('/', in.starts_with('/') ? 1 : 0);
        auto const n = p == std::string::npos ? in.size() : p;
        out += in.substr(0, n);
        in.erase(0, n);
      }
    }
    return out;
  }

  auto resolve(std::string const& base, std::string const& iri) -> std::string {
    if (base.empty()) return iri;
    auto const b = Url::parse(base);
    auto const r = Url::parse(iri);
    auto t = Url();
    if (r.scheme) {
      t = r;
      t.path = removeDotSegments(r.path);
    } else {
      t.scheme = b.scheme;
      if (r.authority) {
        t.authority = r.authority;
        t.path = removeDotSegments(r.path);
        t.query = r.query;
      } else {
        t.authority = b.authority;
        if (r.path.empty()) {
          t.path = b.path;
          t.query = r.query ? r.query : b.query;
        } else {
          if (r.path.starts_with('/')) {
            t.path = removeDotSegments(r.path);
          } else {
            // Merge paths (section 5.2.3)
            auto merged = std::string();
            if (b.authority && b.path.empty()) merged = "/" + r.path;
            else {
              auto const p = b.path.rfind('/');
              merged = (p == std::string::npos ? "" : b.path.substr(0, p + 1)) + r.path;
            }
            t.path = removeDotSegments(merged);
          }
          t.query = r.query;
        }
      }
      t.fragment = r.fragment;
    }
    return t.toString();
  }

  auto removeBase(std::string const& base, std::string const& iri) -> std::string {
    if (base.empty()) return iri;
    auto const b = Url::parse(base);

    // Establish base root
    auto root = std::string();
    if (b.scheme) root += *b.scheme + ":";
    root += "//" + b.authority.value_or("");

    // IRI not relative to base
    if (!iri.starts_with(root)) return iri;

    // Remove root from IRI and parse remainder
    auto const rel = Url::parse(iri.substr(root.size()));
    auto const basePath = normalizePath(b.path.empty() && b.authority ? "/" : b.path, b.authority.has_value());
    auto baseSegments = split(basePath, '/');
    auto iriSegments = split(normalizePath(rel.path, false), '/');

    auto const hasQuery = rel.query && !rel.query->empty();
    auto const hasFragment = rel.fragment && !rel.fragment->empty();
    auto const last = (hasQuery || hasFragment) ? 0uz : 1uz;

    // Remove path segments that match
    auto bi = 0uz, ii = 0uz;
    while (bi < baseSegments.size() && iriSegments.size() - ii > last && baseSegments[bi] == iriSegments[ii]) {
      bi++;
      ii++;
    }
    baseSegments.erase(baseSegments.begin(), baseSegments.begin() + static_cast<ptrdiff_t>(bi));
    iriSegments.erase(iriSegments.begin(), iriSegments.begin() + static_cast<ptrdiff_t>(ii));

    // Use "../" for each non-matching base segment
    auto res = std::string();
    if (!baseSegments.empty()) {
      // Don't count the last segment if it isn't a path (doesn't end in '/'),
      // or an empty first segment which means base began with '/'
      if (!basePath.ends_with('/') || baseSegments[0].empty()) baseSegments.pop_back();
      for (auto i = 0uz; i < baseSegments.size(); i++) res += "../";
    }

    // Prepend remaining segments
    for (auto i = 0uz; i < iriSegments.size(); i++) {
      if (i > 0) res += '/';
      res += iriSegments[i];
    }

    if (hasQuery) res += "?" + *rel.query;
    if (hasFragment) res += "#" + *rel.fragment;
    if (res.empty()) res = "./";
    return res;
  }

  auto isAbsoluteIri(std::string_view s) -> bool {
    if (isBlankNodeId(s)) return true;
    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    for (auto i = 1uz; i < s.size(); i++) {
      auto const c = static_cast<unsigned char>(s[i]);
      if (c == ':') return true;
      if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return false;
  }

  auto isRelativeIri(std::string_view s) -> bool {
    return !(isKeyword(s) || isAbsoluteIri(s));
  }

#include "macros_close.hpp"
}
