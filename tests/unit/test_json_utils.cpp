#include <gtest/gtest.h>
#include "utils/json_utils.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace livetranslate::utils;

TEST(JsonParserTest, ParsesObject) {
    auto value = JsonParser::parse(R"({"type": "translate", "text": "Bonjour", "n": 3, "ok": true, "x": null})");

    ASSERT_TRUE(value.isObject());
    EXPECT_EQ(value.getString("type", ""), "translate");
    EXPECT_EQ(value.getString("text", ""), "Bonjour");
    EXPECT_DOUBLE_EQ(value.getNumber("n", 0), 3.0);
    EXPECT_TRUE(value.getBool("ok", false));
    EXPECT_TRUE(value.getProperty("x").isNull());
    EXPECT_TRUE(value.getProperty("missing").isNull());
}

TEST(JsonParserTest, DecodesUnicodeEscapes) {
    auto value = JsonParser::parse(R"({"text": "tr\u00e8s \ud83d\ude00"})");

    EXPECT_EQ(value.getString("text", ""), "tr\xC3\xA8s \xF0\x9F\x98\x80");
}

TEST(JsonParserTest, KeepsRawUtf8) {
    auto value = JsonParser::parse("{\"text\": \"\xC3\xA7\x61 va\"}");

    EXPECT_EQ(value.getString("text", ""), "\xC3\xA7\x61 va");
}

TEST(JsonParserTest, ParsesNestedArrays) {
    auto value = JsonParser::parse(R"([1, [2, 3], {"a": -4.5e1}])");

    ASSERT_EQ(value.getType(), JsonType::ARRAY);
    ASSERT_EQ(value.asArray().size(), 3u);
    EXPECT_EQ(value.asArray()[1].asArray().size(), 2u);
    EXPECT_DOUBLE_EQ(value.asArray()[2].getNumber("a", 0), -45.0);
}

TEST(JsonParserTest, RejectsMalformedInput) {
    EXPECT_THROW(JsonParser::parse(""), std::runtime_error);
    EXPECT_THROW(JsonParser::parse("{"), std::runtime_error);
    EXPECT_THROW(JsonParser::parse(R"({"a" 1})"), std::runtime_error);
    EXPECT_THROW(JsonParser::parse(R"({"a": 1} extra)"), std::runtime_error);
    EXPECT_THROW(JsonParser::parse(R"("unterminated)"), std::runtime_error);
    EXPECT_THROW(JsonParser::parse(R"("\ud83d")"), std::runtime_error);
    EXPECT_THROW(JsonParser::parse("tru"), std::runtime_error);
}

TEST(JsonParserTest, RejectsDeepNesting) {
    std::string deep(1000, '[');
    deep += std::string(1000, ']');

    EXPECT_THROW(JsonParser::parse(deep), std::runtime_error);
}

TEST(JsonParserTest, StringifyEscapes) {
    JsonValue value("line\n\"quoted\"\\\x01");

    EXPECT_EQ(JsonParser::stringify(value), "\"line\\n\\\"quoted\\\"\\\\\\u0001\"");
}

TEST(JsonParserTest, StringifyObjectSortsKeys) {
    JsonValue obj;
    obj.setObject();
    obj.setObjectProperty("type", JsonValue("error"));
    obj.setObjectProperty("message", JsonValue("boom"));

    EXPECT_EQ(JsonParser::stringify(obj), R"({"message":"boom","type":"error"})");
}

TEST(JsonParserTest, StringifyNumbers) {
    EXPECT_EQ(JsonParser::stringify(JsonValue(0.75)), "0.75");
    EXPECT_EQ(JsonParser::stringify(JsonValue(42.0)), "42");
    EXPECT_EQ(JsonParser::stringify(JsonValue(std::numeric_limits<double>::quiet_NaN())), "null");
}

TEST(JsonParserTest, StringifyThenParsePreservesText) {
    JsonValue obj;
    obj.setObject();
    obj.setObjectProperty("text", JsonValue("Je suis tr\xC3\xA8s content\t!"));

    auto parsed = JsonParser::parse(JsonParser::stringify(obj));
    EXPECT_EQ(parsed.getString("text", ""), "Je suis tr\xC3\xA8s content\t!");
}
