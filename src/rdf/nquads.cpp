#include "nquads.hpp"
#include <core/error.hpp>

using std::string;
using std::string_view;

namespace ldmill::rdf {
#include "macros_open.hpp"

  using core::ErrorCode;
  using core::JsonLdError;

  namespace {

    auto escapeLiteral(string const& s) -> string {
      auto res = string();
      res.reserve(s.size());
      for (auto const c: s) {
        switch (c) {
          case '"': res += "\\\""; break;
          case '\\': res += "\\\\"; break;
          case '\n': res += "\\n"; break;
          case '\r': res += "\\r"; break;
          case '\t': res += "\\t"; break;
          default: res += c;
        }
      }
      return res;
    }

    auto writeTerm(Node const& node, string& out) -> void {
      if (auto const* iri = std::get_if<Iri>(&node)) {
        out += '<';
        out += iri->value;
        out += '>';
      } else if (auto const* blank = std::get_if<BlankNode>(&node)) {
        out += blank->label;
      } else {
        auto const& literal = std::get<Literal>(node);
        out += '"';
        out += escapeLiteral(literal.value);
        out += '"';
        if (literal.datatype == vocab::rdfLangString) {
          out += '@';
          out += literal.language;
        } else if (literal.datatype != vocab::xsdString) {
          out += "^^<";
          out += literal.datatype;
          out += '>';
        }
      }
    }

    auto appendUtf8(string& out, uint32_t cp) -> void {
      if (cp < 0x80) {
        out += static_cast<char>(cp);
      } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      }
    }

    // Recursive descent over a single line.
    class LineParser {
    public:
      LineParser(string_view line, size_t lineNumber):
        line(line),
        lineNumber(lineNumber) {}

      // Returns nothing for blank and comment-only lines.
      auto parse() -> std::optional<Quad>;

    private:
      string_view line;
      size_t lineNumber;
      size_t pos = 0;

      [[noreturn]] auto fail(string const& msg) const -> void {
        throw JsonLdError(ErrorCode::syntaxError, "line " + std::to_string(lineNumber) + ": " + msg);
      }

      auto skipSpaces() -> void {
        while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) pos++;
      }
      auto atEnd() const -> bool {
        return pos >= line.size() || line[pos] == '#';
      }
      auto peek() const -> char {
        return pos < line.size() ? line[pos] : '\0';
      }

      auto hexEscape(size_t digits) -> uint32_t;
      auto iri() -> string;
      auto blankNode() -> string;
      auto literal() -> Literal;
      auto resourceTerm(char const* what) -> Node;
    };

    auto LineParser::hexEscape(size_t digits) -> uint32_t {
      if (pos + digits > line.size()) fail("truncated escape sequence");
      auto res = uint32_t{0};
      for (auto i = 0uz; i < digits; i++) {
        auto const c = line[pos++];
        res <<= 4;
        if (c >= '0' && c <= '9') res |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') res |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') res |= static_cast<uint32_t>(c - 'A' + 10);
        else fail("invalid hexadecimal digit in escape sequence");
      }
      return res;
    }

    auto LineParser::iri() -> string {
      // Opening '<'
      pos++;
      auto res = string();
      while (true) {
        if (pos >= line.size()) fail("unterminated IRI");
        auto const c = line[pos++];
        if (c == '>') break;
        if (c == ' ' || c == '<' || c == '"') fail("invalid character in IRI");
        if (c == '\\') {
          auto const kind = peek();
          pos++;
          if (kind == 'u') appendUtf8(res, hexEscape(4));
          else if (kind == 'U') appendUtf8(res, hexEscape(8));
          else fail("invalid escape sequence in IRI");
          continue;
        }
        res += c;
      }
      if (res.find(':') == string::npos) fail("relative IRI <" + res + ">");
      return res;
    }

    auto LineParser::blankNode() -> string {
      auto const start = pos;
      pos += 2;
      while (pos < line.size() && line[pos] != ' ' && line[pos] != '\t' && line[pos] != '<' && line[pos] != '"') pos++;
      // A label never ends with '.'
      while (pos > start + 2 && line[pos - 1] == '.') pos--;
      if (pos == start + 2) fail("empty blank node label");
      return string(line.substr(start, pos - start));
    }

    auto LineParser::literal() -> Literal {
      // Opening '"'
      pos++;
      auto res = Literal{};
      while (true) {
        if (pos >= line.size()) fail("unterminated literal");
        auto const c = line[pos++];
        if (c == '"') break;
        if (c != '\\') {
          res.value += c;
          continue;
        }
        if (pos >= line.size()) fail("unterminated literal");
        switch (auto const e = line[pos++]) {
          case 't': res.value += '\t'; break;
          case 'b': res.value += '\b'; break;
          case 'n': res.value += '\n'; break;
          case 'r': res.value += '\r'; break;
          case 'f': res.value += '\f'; break;
          case '"': res.value += '"'; break;
          case '\'': res.value += '\''; break;
          case '\\': res.value += '\\'; break;
          case 'u': appendUtf8(res.value, hexEscape(4)); break;
          case 'U': appendUtf8(res.value, hexEscape(8)); break;
          default: fail(string("invalid escape sequence \\") + e);
        }
      }
      if (peek() == '@') {
        pos++;
        auto const start = pos;
        while (pos < line.size() && (std::isalnum(static_cast<unsigned char>(line[pos])) || line[pos] == '-')) pos++;
        if (pos == start) fail("empty language tag");
        res.language = string(line.substr(start, pos - start));
        res.datatype = vocab::rdfLangString;
      } else if (line.substr(pos).starts_with("^^")) {
        pos += 2;
        if (peek() != '<') fail("expected datatype IRI");
        res.datatype = iri();
      }
      return res;
    }

    auto LineParser::resourceTerm(char const* what) -> Node {
      skipSpaces();
      if (peek() == '<') return Iri{iri()};
      if (line.substr(pos).starts_with("_:")) return BlankNode{blankNode()};
      fail(string("expected ") + what);
    }

    auto LineParser::parse() -> std::optional<Quad> {
      skipSpaces();
      if (atEnd()) return std::nullopt;

      auto subject = resourceTerm("subject");
      skipSpaces();
      if (peek() != '<') fail("expected predicate IRI");
      auto predicate = Node(Iri{iri()});

      skipSpaces();
      auto object = Node();
      if (peek() == '"') object = literal();
      else object = resourceTerm("object");

      skipSpaces();
      auto graph = std::optional<Node>();
      if (peek() != '.') graph = resourceTerm("graph name or '.'");

      skipSpaces();
      if (peek() != '.') fail("expected '.'");
      pos++;
      skipSpaces();
      if (!atEnd()) fail("unexpected content after '.'");

      return Quad{std::move(subject), std::move(predicate), std::move(object), std::move(graph)};
    }

  }

  auto toNQuad(Quad const& quad) -> string {
    auto res = string();
    writeTerm(quad.subject, res);
    res += ' ';
    writeTerm(quad.predicate, res);
    res += ' ';
    writeTerm(quad.object, res);
    if (quad.graph) {
      res += ' ';
      writeTerm(*quad.graph, res);
    }
    res += " .\n";
    return res;
  }

  auto toNQuads(Dataset const& dataset) -> string {
    auto res = string();
    for (auto const& [_, quads]: dataset.graphs())
      for (auto const& quad: quads) res += toNQuad(quad);
    return res;
  }

  auto parseNQuads(string_view input) -> Dataset {
    auto res = Dataset();
    auto lineNumber = 0uz;
    while (!input.empty()) {
      auto const end = input.find_first_of("\r\n");
      auto const line = input.substr(0, end);
      auto const skip = end != string_view::npos && input.substr(end).starts_with("\r\n") ? 2uz : 1uz;
      input = end == string_view::npos ? string_view() : input.substr(end + skip);
      lineNumber++;
      if (auto quad = LineParser(line, lineNumber).parse()) res.add(std::move(*quad));
    }
    return res;
  }

#include "macros_close.hpp"
}
