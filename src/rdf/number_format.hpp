#ifndef LDMILL_RDF_NUMBER_FORMAT_HPP
#define LDMILL_RDF_NUMBER_FORMAT_HPP

#include <string>
#include <common.hpp>

namespace ldmill::rdf {
#include "macros_open.hpp"

  // Formats a double the way ECMAScript's `Number.prototype.toString` does: the shortest digit string that
  // reads back as the same double, in fixed notation for magnitudes in [1e-6, 1e21) and as `d[.ddd]e±n`
  // otherwise. Negative zero gives "0"; NaN and infinities throw `JsonLdError` with `invalidNumberFormat`.
  auto formatNumber(double value) -> std::string;

  // Canonical lexical form of an `xsd:double`, e.g. "1.1E0", "5.3E-1".
  auto formatXsdDouble(double value) -> std::string;

  // JSON Canonicalization Scheme (RFC 8785): no whitespace, object keys ordered by UTF-16 code units,
  // numbers through `formatNumber`, minimal string escapes.
  auto canonicalJson(Json const& value) -> std::string;

#include "macros_close.hpp"
}

#endif // LDMILL_RDF_NUMBER_FORMAT_HPP
