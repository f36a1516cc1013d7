// Tests for core/json_parser.h -- flat-object parsing.

#include "core/json_parser.h"

#include <gtest/gtest.h>

#include <limits>

namespace vitals {
namespace {

// ---------------------------------------------------------------------------
// Accepted input
// ---------------------------------------------------------------------------

TEST(JsonParserTest, EmptyObject) {
  JsonParseResult result = parseJsonObject("{}");
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.values.empty());
}

TEST(JsonParserTest, ScalarTypes) {
  JsonParseResult result = parseJsonObject(
      R"({"debounce_ms": 250, "verbose": true, "name": "night", "ratio": -0.5, "x": null})");
  ASSERT_TRUE(result.success) << result.error_message;
  ASSERT_EQ(result.values.size(), 5u);

  EXPECT_TRUE(result.values["debounce_ms"].isNumber());
  EXPECT_EQ(result.values["debounce_ms"].asInt64(), 250);
  EXPECT_TRUE(result.values["verbose"].asBool());
  EXPECT_EQ(result.values["name"].asString(), "night");
  EXPECT_DOUBLE_EQ(result.values["ratio"].asDouble(), -0.5);
  EXPECT_EQ(result.values["x"].type, JsonValue::Null);
}

TEST(JsonParserTest, ExponentNumbers) {
  JsonParseResult result = parseJsonObject(R"({"a": 1.5e3, "b": 2E-2})");
  ASSERT_TRUE(result.success);
  EXPECT_DOUBLE_EQ(result.values["a"].asDouble(), 1500.0);
  EXPECT_DOUBLE_EQ(result.values["b"].asDouble(), 0.02);
}

TEST(JsonParserTest, EscapedStrings) {
  JsonParseResult result = parseJsonObject(R"({"s": "a\"b\\c\nd"})");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.values["s"].asString(), "a\"b\\c\nd");
}

TEST(JsonParserTest, NestedContainersAreSkipped) {
  JsonParseResult result =
      parseJsonObject(R"({"a": 1, "nested": {"b": [1, "}", 2]}, "list": [3, 4], "c": 2})");
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.values.count("nested"), 0u);
  EXPECT_EQ(result.values.count("list"), 0u);
  EXPECT_EQ(result.values["a"].asInt64(), 1);
  EXPECT_EQ(result.values["c"].asInt64(), 2);
}

TEST(JsonParserTest, WhitespaceEverywhere) {
  JsonParseResult result = parseJsonObject("  \n{ \"a\" :\t1 ,\n \"b\":2 }  \n");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.values.size(), 2u);
}

TEST(JsonParserTest, DefaultsOnTypeMismatch) {
  JsonParseResult result = parseJsonObject(R"({"s": "text"})");
  ASSERT_TRUE(result.success);
  EXPECT_DOUBLE_EQ(result.values["s"].asDouble(7.0), 7.0);
  EXPECT_FALSE(result.values["s"].asBool(false));
}

// ---------------------------------------------------------------------------
// Rejected input
// ---------------------------------------------------------------------------

TEST(JsonParserTest, RejectsNonObject) {
  JsonParseResult result = parseJsonObject("[1, 2]");
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error_message.empty());
}

TEST(JsonParserTest, RejectsEmptyInput) {
  EXPECT_FALSE(parseJsonObject("").success);
}

TEST(JsonParserTest, RejectsUnterminatedObject) {
  JsonParseResult result = parseJsonObject(R"({"a": 1)");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.values.empty());
}

TEST(JsonParserTest, RejectsMissingColon) {
  EXPECT_FALSE(parseJsonObject(R"({"a" 1})").success);
}

TEST(JsonParserTest, RejectsMissingComma) {
  EXPECT_FALSE(parseJsonObject(R"({"a": 1 "b": 2})").success);
}

TEST(JsonParserTest, RejectsMalformedNumber) {
  JsonParseResult result = parseJsonObject(R"({"a": 1.2.3})");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error_message.find("malformed number"), std::string::npos);
}

TEST(JsonParserTest, AsInt64OutsideRangeUsesDefault) {
  JsonParseResult result =
      parseJsonObject(R"({"huge": 1e300, "tiny": -1e19, "edge": -9223372036854775808})");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.values["huge"].asInt64(7), 7);
  EXPECT_EQ(result.values["tiny"].asInt64(7), 7);
  EXPECT_EQ(result.values["edge"].asInt64(7), std::numeric_limits<int64_t>::min());
}

TEST(JsonParserTest, FitsInt64Bounds) {
  EXPECT_TRUE(fitsInt64(0.0));
  EXPECT_TRUE(fitsInt64(-9223372036854775808.0));
  EXPECT_FALSE(fitsInt64(9223372036854775808.0));
  EXPECT_FALSE(fitsInt64(1e300));
  EXPECT_FALSE(fitsInt64(std::numeric_limits<double>::infinity()));
}

TEST(JsonParserTest, RejectsBareWord) {
  EXPECT_FALSE(parseJsonObject(R"({"a": yes})").success);
}

TEST(JsonParserTest, RejectsTrailingCharacters) {
  EXPECT_FALSE(parseJsonObject(R"({"a": 1} extra)").success);
}

TEST(JsonParserTest, RejectsUnterminatedString) {
  EXPECT_FALSE(parseJsonObject(R"({"a": "open})").success);
}

}  // namespace
}  // namespace vitals
