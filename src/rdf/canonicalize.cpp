#include "canonicalize.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <openssl/evp.h>
#include <core/error.hpp>
#include <core/identifier_issuer.hpp>
#include "nquads.hpp"

using std::string;
using std::vector;

namespace ldmill::rdf {
#include "macros_open.hpp"

  using core::Algorithm;
  using core::ErrorCode;
  using core::IdentifierIssuer;
  using core::JsonLdError;
  using core::Options;

  Permutator::Permutator(vector<string> list):
    list(sorted(std::move(list))),
    left(this->list.size(), true) {}

  auto Permutator::next() -> vector<string> {
    auto res = list;

    // Largest mobile element: one greater than the neighbour it is looking at.
    auto const n = list.size();
    auto k = std::optional<size_t>();
    for (auto i = 0uz; i < n; i++) {
      auto const mobile = left[i] ? (i > 0 && list[i] > list[i - 1]) : (i + 1 < n && list[i] > list[i + 1]);
      if (mobile && (!k || list[i] > list[*k])) k = i;
    }

    if (!k) {
      done = true;
      return res;
    }

    auto const pos = *k;
    auto const swap = left[pos] ? pos - 1 : pos + 1;
    auto const largest = list[pos];
    std::swap(list[pos], list[swap]);
    decltype(left)::swap(left[pos], left[swap]);
    for (auto i = 0uz; i < n; i++)
      if (list[i] > largest) left[i] = !left[i];
    return res;
  }

  namespace {

    auto checkDigest(int status) -> void {
      if (status != 1) throw JsonLdError(ErrorCode::invalidInput, "message digest failed");
    }

    // Incremental message digest, rendered as lowercase hex.
    class Digest {
    public:
      explicit Digest(Algorithm algorithm):
        ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        auto const* md = algorithm == Algorithm::urdna2015 ? EVP_sha256() : EVP_sha1();
        if (!ctx) throw JsonLdError(ErrorCode::invalidInput, "message digest failed");
        checkDigest(EVP_DigestInit_ex(ctx.get(), md, nullptr));
      }

      auto update(std::string_view data) -> Digest& {
        checkDigest(EVP_DigestUpdate(ctx.get(), data.data(), data.size()));
        return *this;
      }

      auto hex() -> string {
        static constexpr char digits[] = "0123456789abcdef";
        unsigned char buf[EVP_MAX_MD_SIZE];
        auto len = 0u;
        checkDigest(EVP_DigestFinal_ex(ctx.get(), buf, &len));
        auto res = string();
        res.reserve(len * 2);
        for (auto i = 0u; i < len; i++) {
          res += digits[buf[i] >> 4];
          res += digits[buf[i] & 0xF];
        }
        return res;
      }

    private:
      std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx;
    };

    class Canonicalizer {
    public:
      Canonicalizer(Dataset const& dataset, Options const& opts);

      auto run() -> vector<Quad>;

    private:
      struct BlankNodeInfo {
        vector<size_t> quads;
        std::optional<string> hash;
      };

      Algorithm algorithm;
      vector<Quad> quads;
      std::map<string, BlankNodeInfo> blankNodes;
      IdentifierIssuer canonicalIssuer = IdentifierIssuer("_:c14n");
      size_t steps = 0;
      size_t limit;

      auto tick() -> void {
        if (++steps > limit)
          throw JsonLdError(ErrorCode::canonicalizationComplexityExceeded, std::to_string(limit) + " N-degree hash steps");
      }

      auto hashFirstDegree(string const& id) -> string;
      auto hashRelated(string const& related, Quad const& quad, IdentifierIssuer const& issuer, char position) -> string;
      auto hashToRelated(string const& id, IdentifierIssuer const& issuer) -> std::map<string, vector<string>>;
      auto hashNDegree(string const& id, IdentifierIssuer issuer) -> std::pair<string, IdentifierIssuer>;
      auto relabel(Node const& node, string const& id, bool isGraph) const -> Node;
    };

    auto blankLabel(Node const& node) -> string const* {
      if (auto const* blank = std::get_if<BlankNode>(&node)) return &blank->label;
      return nullptr;
    }

    Canonicalizer::Canonicalizer(Dataset const& dataset, Options const& opts):
      algorithm(opts.algorithm),
      quads(dataset.allQuads()) {
      for (auto i = 0uz; i < quads.size(); i++) {
        auto const& quad = quads[i];
        for (auto const* node: {&quad.subject, &quad.object, quad.graph ? &*quad.graph : nullptr})
          if (auto const* label = node ? blankLabel(*node) : nullptr) {
            auto& info = blankNodes[*label].quads;
            if (info.empty() || info.back() != i) info.push_back(i);
          }
      }
      limit = opts.complexityLimit != 0 ? opts.complexityLimit : 4096 * blankNodes.size() + 65536;
    }

    // Blank nodes become `_:a` (the reference node) or `_:z`; URGNA2012 labels graph names `_:g`.
    auto Canonicalizer::relabel(Node const& node, string const& id, bool isGraph) const -> Node {
      auto const* label = blankLabel(node);
      if (!label) return node;
      if (algorithm == Algorithm::urgna2012 && isGraph) return BlankNode{"_:g"};
      return BlankNode{*label == id ? "_:a" : "_:z"};
    }

    auto Canonicalizer::hashFirstDegree(string const& id) -> string {
      auto& info = blankNodes.at(id);
      if (info.hash) return *info.hash;

      auto nquads = vector<string>();
      for (auto const i: info.quads) {
        auto const& quad = quads[i];
        auto graph = quad.graph ? std::optional<Node>(relabel(*quad.graph, id, true)) : std::nullopt;
        nquads.push_back(toNQuad(Quad{relabel(quad.subject, id, false), quad.predicate, relabel(quad.object, id, false), graph}));
      }
      auto digest = Digest(algorithm);
      for (auto const& line: sorted(nquads)) digest.update(line);
      info.hash = digest.hex();
      return *info.hash;
    }

    auto Canonicalizer::hashRelated(string const& related, Quad const& quad, IdentifierIssuer const& issuer, char position)
      -> string {
      auto id = canonicalIssuer.issued(related);
      if (!id) id = issuer.issued(related);
      if (!id) id = hashFirstDegree(related);

      auto digest = Digest(algorithm);
      digest.update(string(1, position));
      if (position != 'g') {
        auto const& predicate = nodeValue(quad.predicate);
        digest.update(algorithm == Algorithm::urdna2015 ? "<" + predicate + ">" : predicate);
      }
      return digest.update(*id).hex();
    }

    auto Canonicalizer::hashToRelated(string const& id, IdentifierIssuer const& issuer) -> std::map<string, vector<string>> {
      auto res = std::map<string, vector<string>>();
      for (auto const i: blankNodes.at(id).quads) {
        auto const& quad = quads[i];
        if (algorithm == Algorithm::urdna2015) {
          auto const components = {
            std::pair{&quad.subject, 's'}, std::pair{&quad.object, 'o'}, std::pair{quad.graph ? &*quad.graph : nullptr, 'g'}
          };
          for (auto const& [node, position]: components) {
            auto const* label = node ? blankLabel(*node) : nullptr;
            if (label && *label != id) res[hashRelated(*label, quad, issuer, position)].push_back(*label);
          }
        } else {
          auto const* subject = blankLabel(quad.subject);
          auto const* object = blankLabel(quad.object);
          if (subject && *subject != id) res[hashRelated(*subject, quad, issuer, 'p')].push_back(*subject);
          else if (object && *object != id) res[hashRelated(*object, quad, issuer, 'r')].push_back(*object);
        }
      }
      return res;
    }

    auto Canonicalizer::hashNDegree(string const& id, IdentifierIssuer issuer) -> std::pair<string, IdentifierIssuer> {
      tick();
      auto digest = Digest(algorithm);

      for (auto const& [hash, related]: hashToRelated(id, issuer)) {
        digest.update(hash);
        auto chosenPath = string();
        auto chosenIssuer = std::optional<IdentifierIssuer>();

        for (auto permutator = Permutator(related); permutator.hasNext();) {
          auto const permutation = permutator.next();
          tick();
          auto issuerCopy = issuer;
          auto path = string();
          auto recursion = vector<string>();
          auto const worse = [&] { return !chosenPath.empty() && path.size() >= chosenPath.size() && path > chosenPath; };

          auto skip = false;
          for (auto const& node: permutation) {
            if (canonicalIssuer.hasId(node)) path += canonicalIssuer.getId(node);
            else {
              if (!issuerCopy.hasId(node)) recursion.push_back(node);
              path += issuerCopy.getId(node);
            }
            if ((skip = worse())) break;
          }
          if (skip) continue;

          for (auto const& node: recursion) {
            auto [resultHash, resultIssuer] = hashNDegree(node, issuerCopy);
            path += issuerCopy.getId(node);
            path += "<" + resultHash + ">";
            issuerCopy = std::move(resultIssuer);
            if ((skip = worse())) break;
          }
          if (skip) continue;

          if (chosenPath.empty() || path < chosenPath) {
            chosenPath = std::move(path);
            chosenIssuer = std::move(issuerCopy);
          }
        }

        digest.update(chosenPath);
        if (chosenIssuer) issuer = std::move(*chosenIssuer);
      }
      return {digest.hex(), std::move(issuer)};
    }

    auto Canonicalizer::run() -> vector<Quad> {
      auto nonNormalized = std::set<string>();
      for (auto const& [id, _]: blankNodes) nonNormalized.insert(id);

      // Issue identifiers for blank nodes with unique first-degree hashes, until none are left.
      auto hashToBlankNodes = std::map<string, vector<string>>();
      for (auto simple = true; simple;) {
        simple = false;
        hashToBlankNodes.clear();
        for (auto const& id: nonNormalized) hashToBlankNodes[hashFirstDegree(id)].push_back(id);
        for (auto it = hashToBlankNodes.begin(); it != hashToBlankNodes.end();) {
          if (it->second.size() > 1) {
            ++it;
            continue;
          }
          canonicalIssuer.getId(it->second[0]);
          nonNormalized.erase(it->second[0]);
          it = hashToBlankNodes.erase(it);
          simple = true;
        }
      }

      // Disambiguate the remaining ones by N-degree hashes.
      for (auto const& [_, ids]: hashToBlankNodes) {
        auto hashPaths = std::map<string, vector<IdentifierIssuer>>();
        for (auto const& id: ids) {
          if (canonicalIssuer.hasId(id)) continue;
          auto issuer = IdentifierIssuer("_:b");
          issuer.getId(id);
          auto [hash, resultIssuer] = hashNDegree(id, std::move(issuer));
          hashPaths[hash].push_back(std::move(resultIssuer));
        }
        for (auto const& [_, issuers]: hashPaths)
          for (auto const& issuer: issuers)
            for (auto const& existing: issuer.issuedOrder()) canonicalIssuer.getId(existing);
      }

      auto lines = vector<std::pair<string, Quad>>();
      for (auto const& quad: quads) {
        auto const relabelled = [&](Node const& node) -> Node {
          if (auto const* label = blankLabel(node)) return BlankNode{canonicalIssuer.getId(*label)};
          return node;
        };
        auto copy = Quad{relabelled(quad.subject), quad.predicate, relabelled(quad.object),
                         quad.graph ? std::optional<Node>(relabelled(*quad.graph)) : std::nullopt};
        lines.emplace_back(toNQuad(copy), std::move(copy));
      }
      std::sort(lines.begin(), lines.end(), [](auto const& a, auto const& b) { return a.first < b.first; });

      auto res = vector<Quad>();
      for (auto& [_, quad]: lines) res.push_back(std::move(quad));
      return res;
    }

  }

  auto canonicalize(Dataset const& dataset, Options const& opts) -> vector<Quad> {
    return Canonicalizer(dataset, opts).run();
  }

  auto canonicalNQuads(Dataset const& dataset, Options const& opts) -> string {
    auto res = string();
    for (auto const& quad: canonicalize(dataset, opts)) res += toNQuad(quad);
    return res;
  }

#include "macros_close.hpp"
}
