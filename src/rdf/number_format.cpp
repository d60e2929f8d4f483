#include "number_format.hpp"
#include <charconv>
#include <cmath>
#include <cstdio>
#include <core/error.hpp>

using std::string;

namespace ldmill::rdf {
#include "macros_open.hpp"

  using core::ErrorCode;
  using core::JsonLdError;

  namespace {

    // Decodes UTF-8 into UTF-16 code units; bytes that do not form a sequence are taken as code points.
    auto toUtf16(string const& s) -> std::u16string {
      auto res = std::u16string();
      for (auto i = 0uz; i < s.size();) {
        auto const c = static_cast<unsigned char>(s[i]);
        auto len = c < 0x80 ? 1uz : (c >> 5) == 0x6 ? 2uz : (c >> 4) == 0xE ? 3uz : (c >> 3) == 0x1E ? 4uz : 1uz;
        if (i + len > s.size()) len = 1;
        auto cp = static_cast<uint32_t>(len == 1 ? c : len == 2 ? c & 0x1F : len == 3 ? c & 0x0F : c & 0x07);
        for (auto j = 1uz; j < len; j++) cp = (cp << 6) | (static_cast<unsigned char>(s[i + j]) & 0x3F);
        if (cp >= 0x10000) {
          cp -= 0x10000;
          res += static_cast<char16_t>(0xD800 + (cp >> 10));
          res += static_cast<char16_t>(0xDC00 + (cp & 0x3FF));
        } else {
          res += static_cast<char16_t>(cp);
        }
        i += len;
      }
      return res;
    }

    auto writeString(string const& s, string& out) -> void {
      static constexpr auto hex = "0123456789abcdef";
      out += '"';
      for (auto const ch: s) {
        auto const c = static_cast<unsigned char>(ch);
        switch (c) {
          case '"': out += "\\\""; break;
          case '\\': out += "\\\\"; break;
          case '\b': out += "\\b"; break;
          case '\f': out += "\\f"; break;
          case '\n': out += "\\n"; break;
          case '\r': out += "\\r"; break;
          case '\t': out += "\\t"; break;
          default:
            if (c < 0x20) {
              out += "\\u00";
              out += hex[c >> 4];
              out += hex[c & 0xF];
            } else {
              out += ch;
            }
        }
      }
      out += '"';
    }

    auto writeCanonical(Json const& value, string& out) -> void {
      switch (value.type()) {
        case Json::value_t::null: out += "null"; break;
        case Json::value_t::boolean: out += value.get<bool>() ? "true" : "false"; break;
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float: out += formatNumber(value.get<double>()); break;
        case Json::value_t::string: writeString(value.get_ref<string const&>(), out); break;
        case Json::value_t::array: {
          out += '[';
          auto first = true;
          for (auto const& item: value) {
            if (!first) out += ',';
            first = false;
            writeCanonical(item, out);
          }
          out += ']';
          break;
        }
        case Json::value_t::object: {
          auto keys = std::vector<std::pair<std::u16string, string>>();
          for (auto const& [k, _]: value.items()) keys.emplace_back(toUtf16(k), k);
          std::sort(keys.begin(), keys.end());
          out += '{';
          auto first = true;
          for (auto const& [_, k]: keys) {
            if (!first) out += ',';
            first = false;
            writeString(k, out);
            out += ':';
            writeCanonical(value[k], out);
          }
          out += '}';
          break;
        }
        case Json::value_t::binary:
        case Json::value_t::discarded: throw JsonLdError(ErrorCode::invalidInput, "value has no JSON representation");
      }
    }

  }

  auto formatNumber(double value) -> string {
    if (!std::isfinite(value)) throw JsonLdError(ErrorCode::invalidNumberFormat, std::to_string(value));
    if (value == 0) return "0";

    // Shortest round-trip digits in scientific form: "d[.ddd]e±XX"
    char buf[64];
    auto const [end, ec] = std::to_chars(buf, buf + sizeof(buf), std::fabs(value), std::chars_format::scientific);
    if (ec != std::errc()) throw JsonLdError(ErrorCode::invalidNumberFormat, std::to_string(value));
    auto const sci = string(buf, end);
    auto const e = sci.find('e');
    auto digits = sci.substr(0, 1);
    if (e > 1) digits += sci.substr(2, e - 2);
    auto const k = static_cast<int>(digits.size());
    auto const n = std::stoi(sci.substr(e + 1)) + 1;

    auto res = string(value < 0 ? "-" : "");
    if (k <= n && n <= 21) {
      res += digits + string(static_cast<size_t>(n - k), '0');
    } else if (0 < n && n <= 21) {
      res += digits.substr(0, static_cast<size_t>(n)) + "." + digits.substr(static_cast<size_t>(n));
    } else if (-6 < n && n <= 0) {
      res += "0." + string(static_cast<size_t>(-n), '0') + digits;
    } else {
      res += digits.substr(0, 1);
      if (k > 1) res += "." + digits.substr(1);
      res += n - 1 < 0 ? "e-" : "e+";
      res += std::to_string(std::abs(n - 1));
    }
    return res;
  }

  auto formatXsdDouble(double value) -> string {
    if (!std::isfinite(value)) throw JsonLdError(ErrorCode::invalidNumberFormat, std::to_string(value));
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%1.15E", value);
    auto const s = string(buf);
    auto const e = s.find('E');
    auto mantissa = s.substr(0, e);
    while (mantissa.ends_with('0') && mantissa[mantissa.size() - 2] != '.') mantissa.pop_back();
    return mantissa + "E" + std::to_string(std::stoi(s.substr(e + 1)));
  }

  auto canonicalJson(Json const& value) -> string {
    auto res = string();
    writeCanonical(value, res);
    return res;
  }

#include "macros_close.hpp"
}
