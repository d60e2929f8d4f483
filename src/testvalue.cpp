#include <string>
#include <gtest/gtest.h>
#include <core/identifier_issuer.hpp>
#include <core/keyword.hpp>
#include <core/value.hpp>

using std::string;
using namespace ldmill;
using namespace ldmill::core;

TEST(Value, ShapePredicates) {
  EXPECT_TRUE(isValue(Json{{"@value", 1}}));
  EXPECT_TRUE(isList(Json{{"@list", Json::array()}}));
  EXPECT_TRUE(isGraph(Json{{"@graph", Json::array()}, {"@id", "http://g"}}));
  EXPECT_FALSE(isSimpleGraph(Json{{"@graph", Json::array()}, {"@id", "http://g"}}));
  EXPECT_TRUE(isSimpleGraph(Json{{"@graph", Json::array()}, {"@index", "i"}}));
  EXPECT_FALSE(isGraph(Json{{"@graph", Json::array()}, {"http://p", 1}}));

  EXPECT_TRUE(isSubjectReference(Json{{"@id", "http://x"}}));
  EXPECT_FALSE(isSubject(Json{{"@id", "http://x"}}));
  EXPECT_TRUE(isSubject(Json{{"@id", "http://x"}, {"http://p", 1}}));
  EXPECT_TRUE(isBlankNode(Json{{"@id", "_:b0"}}));
  EXPECT_TRUE(isBlankNode(Json::object()));
  EXPECT_FALSE(isBlankNode(Json{{"@id", "http://x"}}));
  EXPECT_FALSE(isBlankNode(Json{{"@value", "x"}}));
}

TEST(Value, Arrayify) {
  EXPECT_EQ(arrayify(1), Json::array({1}));
  EXPECT_EQ(arrayify(Json::array({1, 2})), Json::array({1, 2}));
  EXPECT_EQ(arrayify(nullptr), Json::array({nullptr}));
}

TEST(Value, MemberOfMissingKeyIsNull) {
  auto const obj = Json{{"a", 1}};
  EXPECT_EQ(member(obj, "a"), 1);
  EXPECT_TRUE(member(obj, "b").is_null());
  EXPECT_TRUE(member(Json::array({1}), "a").is_null());
}

TEST(Value, DeepCompare) {
  auto const a = Json::parse(R"({"x": [1, 2, {"y": [3, 4]}]})");
  auto const b = Json::parse(R"({"x": [{"y": [4, 3]}, 2, 1]})");
  EXPECT_TRUE(deepCompare(a, b, false));
  EXPECT_FALSE(deepCompare(a, b, true));
  EXPECT_FALSE(deepCompare(Json::array({1, 1, 2}), Json::array({1, 2, 2}), false));
}

TEST(Value, AddValue) {
  auto subject = Json::object();
  addValue(subject, "p", 1);
  EXPECT_EQ(subject["p"], 1);
  addValue(subject, "p", 2);
  EXPECT_EQ(subject["p"], Json::array({1, 2}));
  addValue(subject, "p", 2, {.allowDuplicate = false});
  EXPECT_EQ(subject["p"], Json::array({1, 2}));
  addValue(subject, "p", 2);
  EXPECT_EQ(subject["p"], Json::array({1, 2, 2}));

  addValue(subject, "q", Json::array(), {.propertyIsArray = true});
  EXPECT_EQ(subject["q"], Json::array());
  addValue(subject, "r", "x", {.propertyIsArray = true});
  EXPECT_EQ(subject["r"], Json::array({"x"}));
}

TEST(Value, AddValueComparesNodesById) {
  auto subject = Json::object();
  addValue(subject, "p", Json{{"@id", "http://x"}, {"http://q", 1}}, {.allowDuplicate = false});
  addValue(subject, "p", Json{{"@id", "http://x"}}, {.allowDuplicate = false});
  EXPECT_TRUE(subject["p"].is_object());
  EXPECT_TRUE(hasValue(subject, "p", Json{{"@id", "http://x"}}));
  EXPECT_FALSE(hasValue(subject, "p", Json{{"@id", "http://y"}}));
}

TEST(Value, MergeValue) {
  auto node = Json::object();
  mergeValue(node, "p", Json{{"@value", "a"}});
  mergeValue(node, "p", Json{{"@value", "a"}});
  mergeValue(node, "p", Json{{"@value", "a"}, {"@language", "en"}});
  EXPECT_EQ(node["p"].size(), 2u);
  mergeValue(node, "l", Json{{"@list", Json::array()}});
  mergeValue(node, "l", Json{{"@list", Json::array()}});
  EXPECT_EQ(node["l"].size(), 2u);
}

TEST(Value, CompareShortestLeast) {
  EXPECT_TRUE(compareShortestLeast("b", "aa"));
  EXPECT_TRUE(compareShortestLeast("aa", "ab"));
  EXPECT_FALSE(compareShortestLeast("ab", "ab"));
}

TEST(Keyword, Recognition) {
  EXPECT_TRUE(isKeyword("@id"));
  EXPECT_TRUE(isKeyword("@included"));
  EXPECT_FALSE(isKeyword("@foo"));
  EXPECT_FALSE(isKeyword("id"));
  EXPECT_TRUE(hasKeywordForm("@foo"));
  EXPECT_FALSE(hasKeywordForm("@foo1"));
  EXPECT_FALSE(hasKeywordForm("@"));
  EXPECT_EQ(parseKeyword("@type"), Keyword::atType);
  EXPECT_EQ(keywordName(Keyword::atVocab), "@vocab");
}

TEST(IdentifierIssuer, IssuesInOrder) {
  auto issuer = IdentifierIssuer("_:b");
  EXPECT_EQ(issuer.getId("_:x"), "_:b0");
  EXPECT_EQ(issuer.getId("_:y"), "_:b1");
  EXPECT_EQ(issuer.getId("_:x"), "_:b0");
  EXPECT_EQ(issuer.getId(), "_:b2");
  EXPECT_TRUE(issuer.hasId("_:y"));
  EXPECT_FALSE(issuer.hasId("_:z"));
  EXPECT_EQ(issuer.issued("_:y"), "_:b1");
  EXPECT_EQ(issuer.issuedOrder(), (std::vector<string>{"_:x", "_:y"}));
}

TEST(IdentifierIssuer, CopiesAreIndependent) {
  auto issuer = IdentifierIssuer("_:c14n");
  issuer.getId("_:a");
  auto copy = issuer;
  EXPECT_EQ(copy.getId("_:b"), "_:c14n1");
  EXPECT_FALSE(issuer.hasId("_:b"));
  EXPECT_EQ(issuer.getId("_:c"), "_:c14n1");
}
