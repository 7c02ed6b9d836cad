#include <gtest/gtest.h>
#include <sstream>

#include <jsondoc/parser/json.h>

using namespace jsondoc;
using namespace jsondoc::json;
using namespace jsondoc::json::impl;

using Adapter = parse::StringStreamAdapter<std::string_view>;

TEST(Json, ParseNull) {
    Parser parser{Adapter{"null"sv}};
    ASSERT_TRUE(parser.parse_document());
    EXPECT_TRUE(parser.m_curr == nil);
}

TEST(Json, ParseBoolTrue) {
    Parser parser{Adapter{"true"sv}};
    ASSERT_TRUE(parser.parse_document());
    EXPECT_TRUE(parser.m_curr.is_bool());
    EXPECT_EQ(parser.m_curr, true);
}

TEST(Json, ParseBoolFalse) {
    Parser parser{Adapter{" false "sv}};
    ASSERT_TRUE(parser.parse_document());
    EXPECT_EQ(parser.m_curr, false);
}

TEST(Json, ParseInvalidLiteral) {
    Parser parser{Adapter{"tru"sv}};
    EXPECT_FALSE(parser.parse_document());
    EXPECT_EQ(parser.m_error_message, "Invalid literal");
}

TEST(Json, ParseNumberSignedInt) {
  Parser parser{Adapter{"-37"sv}};
  ASSERT_TRUE(parser.parse_number());
  EXPECT_EQ(parser.m_curr.as<Int>(), -37);
}

TEST(Json, ParseNumberUnsignedInt) {
  UInt value = 0xFFFFFFFFFFFFFFFFULL;
  auto text = std::to_string(value);
  Parser parser{Adapter{text}};
  ASSERT_TRUE(parser.parse_number());
  EXPECT_EQ(parser.m_curr.as<UInt>(), value);
}

TEST(Json, ParseNumberWiderThan64Bits) {
  Parser parser{Adapter{"1000000000000000000000"sv}};
  ASSERT_TRUE(parser.parse_number());
  EXPECT_TRUE(parser.m_curr.is_decimal());
  EXPECT_EQ(parser.m_curr.to_json(), "1000000000000000000000");
  EXPECT_EQ(parser.m_curr, Value{Decimal{"1e21"}});
}

TEST(Json, ParseNumberNegativeWiderThan64Bits) {
  Parser parser{Adapter{"-1000000000000000000000"sv}};
  ASSERT_TRUE(parser.parse_number());
  EXPECT_TRUE(parser.m_curr.is_decimal());
  EXPECT_EQ(parser.m_curr.to_json(), "-1000000000000000000000");
}

TEST(Json, ParseNumberFloat) {
  Parser parser{Adapter{"3.14159"sv}};
  EXPECT_TRUE(parser.parse_number());
  EXPECT_TRUE(parser.m_curr.is_decimal());
  EXPECT_EQ(parser.m_curr.as<Decimal>().str(), "3.14159");
  EXPECT_EQ(parser.m_curr.to_float(), 3.14159);
}

TEST(Json, ParseNumberExponent) {
  Parser parser{Adapter{"1e3"sv}};
  EXPECT_TRUE(parser.parse_number());
  EXPECT_TRUE(parser.m_curr.is_decimal());
  EXPECT_EQ(parser.m_curr.to_float(), 1000.0);
  EXPECT_EQ(parser.m_curr, 1000);
}

TEST(Json, ParseNumberKeepsLiteral) {
  EXPECT_EQ(json::parse("1.10").to_json(), "1.10");
  EXPECT_EQ(json::parse("0.1").to_json(), "0.1");
  EXPECT_EQ(json::parse("[2.50, 1E-7]").to_json(), "[2.50, 1E-7]");
  EXPECT_EQ(json::parse("12345678901234567890.123456789").to_json(), "12345678901234567890.123456789");
}

TEST(Json, ParseNumberDecimalEquality) {
  EXPECT_EQ(json::parse("1.10"), json::parse("1.1"));
  EXPECT_EQ(json::parse("1.10"), json::parse("11e-1"));
  EXPECT_EQ(json::parse("2.0"), 2);
  EXPECT_EQ(json::parse("-0.0"), json::parse("0"));
  EXPECT_EQ(json::parse("0.5"), 0.5);
  EXPECT_FALSE(json::parse("0.1") == json::parse("0.10000000000000001"));
  EXPECT_FALSE(json::parse("1.5") == 1);
}

TEST(Json, ParseNumberBadDecimal) {
  EXPECT_THROW(json::parse("1.2.3"), parse::SyntaxError);
  EXPECT_THROW(json::parse("1e"), parse::SyntaxError);
  EXPECT_THROW(json::parse("1e+-2"), parse::SyntaxError);
}

TEST(Json, ParseNumberSyntaxError) {
  Parser parser{Adapter{"1-2"sv}};
  EXPECT_FALSE(parser.parse_number());
  EXPECT_EQ(parser.m_error_message, "Numeric syntax error");
}

TEST(Json, ParseString) {
  EXPECT_EQ(json::parse("\"tea\""), "tea");
  EXPECT_EQ(json::parse("'tea'"), "tea");
  EXPECT_EQ(json::parse("'say \"hi\"'"), "say \"hi\"");
}

TEST(Json, ParseStringEscapes) {
  EXPECT_EQ(json::parse(R"("a\"b")"), "a\"b");
  EXPECT_EQ(json::parse(R"("a\\b")"), "a\\b");
  EXPECT_EQ(json::parse(R"("a\/b")"), "a/b");
  EXPECT_EQ(json::parse(R"("line\nbreak\ttab")"), "line\nbreak\ttab");
  EXPECT_EQ(json::parse(R"("\u0041\u00e9\u20AC")"), "A\xC3\xA9\xE2\x82\xAC");
}

TEST(Json, ParseStringSurrogatePair) {
  EXPECT_EQ(json::parse(R"("\uD83D\uDE00")"), "\xF0\x9F\x98\x80");
  EXPECT_EQ(json::parse(R"("x\ud834\udd1ey")"), "x\xF0\x9D\x84\x9Ey");
}

TEST(Json, ParseStringUnpairedSurrogate) {
  EXPECT_THROW(json::parse(R"("\uD83D")"), parse::SyntaxError);
  EXPECT_THROW(json::parse(R"("\uD83Dx")"), parse::SyntaxError);
  EXPECT_THROW(json::parse(R"("\uD83D\u0041")"), parse::SyntaxError);
  EXPECT_THROW(json::parse(R"("\uDE00")"), parse::SyntaxError);
}

TEST(Json, ParseNonAsciiText) {
  EXPECT_EQ(json::parse("{\"caf\xC3\xA9\": \"\xE2\x82\xAC\"}").get("caf\xC3\xA9"), "\xE2\x82\xAC");
  EXPECT_THROW(json::parse("\xC3\xA9"), parse::SyntaxError);
}

TEST(Json, ParseStringBadUnicodeEscape) {
  EXPECT_THROW(json::parse(R"("\u00g1")"), parse::SyntaxError);
}

TEST(Json, ParseUnterminatedString) {
  std::optional<Error> error;
  json::parse("'abc", error);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->error_message, "Unterminated string");
}

TEST(Json, ParseArray) {
  auto value = json::parse("[1, 'two', 3.0, [true], {}]");
  ASSERT_TRUE(value.is_array());
  EXPECT_EQ(value.size(), 5UL);
  EXPECT_EQ(value.get(1), "two");
  EXPECT_TRUE(value.get(3).is_array());
  EXPECT_TRUE(value.get(4).is_map());
}

TEST(Json, ParseEmptyContainers) {
  EXPECT_EQ(json::parse("[]").size(), 0UL);
  EXPECT_EQ(json::parse("[ ]").size(), 0UL);
  EXPECT_EQ(json::parse("{}").size(), 0UL);
  EXPECT_EQ(json::parse("{ \n}").size(), 0UL);
}

TEST(Json, ParseObject) {
  auto value = json::parse("{'name': 'joe', \"age\": 32, 'tags': ['a', 'b'], 'inner': {'x': null}}");
  ASSERT_TRUE(value.is_map());
  EXPECT_EQ(value.keys(), (KeyList{"name", "age", "tags", "inner"}));
  EXPECT_EQ(value.get("age"), 32);
  EXPECT_TRUE(value.get("inner").get("x").is_nil());
}

TEST(Json, ParseObjectDuplicateKey) {
  auto value = json::parse("{'x': 1, 'x': 2}");
  EXPECT_EQ(value.size(), 1UL);
  EXPECT_EQ(value.get("x"), 2);
}

TEST(Json, ParseErrors) {
  EXPECT_THROW(json::parse(""), parse::SyntaxError);
  EXPECT_THROW(json::parse("[1, 2"), parse::SyntaxError);
  EXPECT_THROW(json::parse("[1 2]"), parse::SyntaxError);
  EXPECT_THROW(json::parse("[1,]"), parse::SyntaxError);
  EXPECT_THROW(json::parse("{'x' 1}"), parse::SyntaxError);
  EXPECT_THROW(json::parse("{1: 1}"), parse::SyntaxError);
  EXPECT_THROW(json::parse("{'x': 1"), parse::SyntaxError);
  EXPECT_THROW(json::parse("1 2"), parse::SyntaxError);
  EXPECT_THROW(json::parse("@"), parse::SyntaxError);
}

TEST(Json, ParseErrorOffset) {
  try {
    json::parse("[1, 2, @]");
    FAIL();
  } catch (const parse::SyntaxError& err) {
    EXPECT_EQ(err.offset(), 7);
  }
}

TEST(Json, ParseErrorMessage) {
  std::optional<Error> error;
  json::parse("{'x': }", error);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->to_str(), "JSON parse error at 6: Expected object value");
}

TEST(Json, Literal) {
  auto value = "{'a': [1, 2]}"_json;
  EXPECT_EQ(value.to_json(), "{\"a\": [1, 2]}");
}

TEST(Json, RoundTripText) {
  std::string text = "{\"a\": [1, -2, 3.5, \"x\\ny\"], \"b\": {\"c\": null, \"d\": false}}";
  EXPECT_EQ(json::parse(text).to_json(), text);
}
