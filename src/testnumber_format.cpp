#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <random>
#include <set>
#include <string>
#include <gtest/gtest.h>
#include <core/error.hpp>
#include <rdf/number_format.hpp>

using std::string;
using namespace ldmill;
using rdf::formatNumber;

TEST(NumberFormat, FixedNotation) {
  EXPECT_EQ(formatNumber(1.0), "1");
  EXPECT_EQ(formatNumber(-1.0), "-1");
  EXPECT_EQ(formatNumber(0.1), "0.1");
  EXPECT_EQ(formatNumber(1.5), "1.5");
  EXPECT_EQ(formatNumber(100.0), "100");
  EXPECT_EQ(formatNumber(123.456), "123.456");
  EXPECT_EQ(formatNumber(0.000001), "0.000001");
  EXPECT_EQ(formatNumber(0.0000015), "0.0000015");
  EXPECT_EQ(formatNumber(1e20), "100000000000000000000");
  EXPECT_EQ(formatNumber(123456789012345680000.0), "123456789012345680000");
  EXPECT_EQ(formatNumber(9007199254740992.0), "9007199254740992");
}

TEST(NumberFormat, ExponentNotation) {
  EXPECT_EQ(formatNumber(1e21), "1e+21");
  EXPECT_EQ(formatNumber(1e-7), "1e-7");
  EXPECT_EQ(formatNumber(-1.5e-7), "-1.5e-7");
  EXPECT_EQ(formatNumber(1.2345e25), "1.2345e+25");
  EXPECT_EQ(formatNumber(5e-324), "5e-324");
  EXPECT_EQ(formatNumber(std::numeric_limits<double>::max()), "1.7976931348623157e+308");
}

TEST(NumberFormat, ShortestDigits) {
  EXPECT_EQ(formatNumber(0.1 + 0.2), "0.30000000000000004");
  EXPECT_EQ(formatNumber(1.0 / 3.0), "0.3333333333333333");
  EXPECT_EQ(formatNumber(333333333.33333329), "333333333.3333333");
}

TEST(NumberFormat, Zero) {
  EXPECT_EQ(formatNumber(0.0), "0");
  EXPECT_EQ(formatNumber(-0.0), "0");
}

TEST(NumberFormat, NonFiniteFails) {
  for (auto const v: {std::nan(""), std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity()}) {
    try {
      formatNumber(v);
      FAIL() << "expected an error";
    } catch (core::JsonLdError& e) {
      EXPECT_EQ(e.code, core::ErrorCode::invalidNumberFormat);
    }
  }
}

TEST(NumberFormat, RandomBitPatternsRoundTrip) {
  auto rng = std::mt19937_64(20240611);
  auto seen = std::set<string>();
  auto count = 0uz;
  while (count < 10000) {
    auto const bits = rng();
    auto value = 0.0;
    std::memcpy(&value, &bits, sizeof(value));
    if (!std::isfinite(value) || value == 0) continue;
    auto const s = formatNumber(value);
    EXPECT_EQ(std::strtod(s.c_str(), nullptr), value) << s;
    // Distinct doubles never share a rendering.
    EXPECT_TRUE(seen.insert(s).second) << s;
    count++;
  }
}

TEST(NumberFormat, XsdDouble) {
  EXPECT_EQ(rdf::formatXsdDouble(1.1), "1.1E0");
  EXPECT_EQ(rdf::formatXsdDouble(0.53), "5.3E-1");
  EXPECT_EQ(rdf::formatXsdDouble(10.0), "1.0E1");
  EXPECT_EQ(rdf::formatXsdDouble(-2.5e30), "-2.5E30");
  EXPECT_EQ(rdf::formatXsdDouble(0.0), "0.0E0");
}

TEST(NumberFormat, CanonicalJson) {
  auto const value = Json::parse(R"({"b": [1.0, true, null], "a": {"z": "x\ny", "é": 1e21}, "😀": 0})");
  EXPECT_EQ(rdf::canonicalJson(value), "{\"a\":{\"z\":\"x\\ny\",\"é\":1e+21},\"b\":[1,true,null],\"\U0001F600\":0}");
}

TEST(NumberFormat, CanonicalJsonKeyOrderUsesUtf16) {
  // U+FB01 comes before U+1F600 by code point, after it by UTF-16 code units.
  auto const value = Json{{"\U0001F600", 1}, {"ﬁ", 2}};
  EXPECT_EQ(rdf::canonicalJson(value), "{\"\U0001F600\":1,\"ﬁ\":2}");
}
