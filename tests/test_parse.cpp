/**
 * @file test_parse.cpp
 * @brief Unit tests for scalar and value typing (GoogleTest)
 *
 * Typing rules:
 * - Only "true"/"false" (any case) are booleans
 * - Only "null" (any case) is null
 * - Integers need digits only; floats need a fraction part
 * - JSON arrays/objects and double-quoted strings go through the JSON parser
 * - Everything else stays a raw string
 */

#include <gtest/gtest.h>
#include "graft/Parse.hpp"
#include "graft/Value.hpp"

using namespace graft;

// ============================================================================
// parse_scalar
// ============================================================================

TEST(ParseScalar, Booleans) {
    EXPECT_EQ(parse_scalar("true"), Scalar(true));
    EXPECT_EQ(parse_scalar("TRUE"), Scalar(true));
    EXPECT_EQ(parse_scalar("False"), Scalar(false));
    EXPECT_EQ(parse_scalar("yes"), Scalar("yes"));
}

TEST(ParseScalar, Null) {
    EXPECT_TRUE(parse_scalar("null").is_null());
    EXPECT_TRUE(parse_scalar("NULL").is_null());
    EXPECT_EQ(parse_scalar("none"), Scalar("none"));
}

TEST(ParseScalar, Integers) {
    EXPECT_EQ(parse_scalar("0").kind(), ScalarKind::Integer);
    EXPECT_EQ(parse_scalar("-42"), Scalar(-42));
    EXPECT_EQ(parse_scalar("9223372036854775807").as_integer(), INT64_MAX);
}

TEST(ParseScalar, IntegerOverflowIsString) {
    EXPECT_TRUE(parse_scalar("99999999999999999999").is_string());
}

TEST(ParseScalar, Floats) {
    EXPECT_DOUBLE_EQ(parse_scalar("3.14").as_float(), 3.14);
    EXPECT_DOUBLE_EQ(parse_scalar("-0.5").as_float(), -0.5);
    EXPECT_DOUBLE_EQ(parse_scalar("1.5e-3").as_float(), 1.5e-3);
    EXPECT_EQ(parse_scalar("2.0").kind(), ScalarKind::Float);
}

TEST(ParseScalar, NumberLikeStrings) {
    EXPECT_TRUE(parse_scalar("1e10").is_string());
    EXPECT_TRUE(parse_scalar("123abc").is_string());
    EXPECT_TRUE(parse_scalar("12.12.12.10").is_string());
    EXPECT_TRUE(parse_scalar(".5").is_string());
    EXPECT_TRUE(parse_scalar("").is_string());
}

// ============================================================================
// parse_value
// ============================================================================

TEST(ParseValue, ScalarsMatchParseScalar) {
    EXPECT_EQ(parse_value("42"), Node(42));
    EXPECT_EQ(parse_value("false"), Node(false));
    EXPECT_TRUE(parse_value("null").is_null());
}

TEST(ParseValue, JsonArraysAndObjects) {
    EXPECT_EQ(parse_value("[1, 2, 3]"), Node::list({1, 2, 3}));
    Node obj = parse_value(R"({"outer": {"inner": 42}, "arr": ["a"]})");
    EXPECT_EQ(obj.at("outer").at("inner"), Node(42));
    EXPECT_EQ(obj.at("arr"), Node::list({"a"}));
}

TEST(ParseValue, JsonObjectKeepsKeyOrder) {
    Node obj = parse_value(R"({"z": 1, "a": 2})");
    EXPECT_EQ(obj.as_map().key_at(0), "z");
}

TEST(ParseValue, DoubleQuotedStrings) {
    EXPECT_EQ(parse_value("\"hello world\""), Node("hello world"));
    EXPECT_EQ(parse_value("\"42\""), Node("42"));
    EXPECT_EQ(parse_value("\"tab\\there\""), Node("tab\there"));
    EXPECT_EQ(parse_value("\"\""), Node(""));
}

TEST(ParseValue, SingleQuotesAreRaw) {
    EXPECT_EQ(parse_value("'hello'"), Node("'hello'"));
}

TEST(ParseValue, RawStrings) {
    EXPECT_EQ(parse_value("path/to/file"), Node("path/to/file"));
    EXPECT_EQ(parse_value("hello world"), Node("hello world"));
    EXPECT_EQ(parse_value("[incomplete"), Node("[incomplete"));
    EXPECT_EQ(parse_value("{bad:json}"), Node("{bad:json}"));
    EXPECT_EQ(parse_value(""), Node(""));
}

// ============================================================================
// float_text
// ============================================================================

TEST(FloatText, AlwaysShowsFraction) {
    EXPECT_EQ(float_text(2.0), "2.0");
    EXPECT_EQ(float_text(-3.0), "-3.0");
    EXPECT_EQ(float_text(0.25), "0.25");
}

TEST(FloatText, ExponentKeepsFraction) {
    const std::string text = float_text(1e20);
    EXPECT_EQ(text, "1.0e+20");
    EXPECT_EQ(parse_scalar(text).kind(), ScalarKind::Float);
}

TEST(FloatText, ReadsBackAsSameFloat) {
    for (double d : {0.1, 2.5, 1234.0, 6.02e23, -1e-7}) {
        const Scalar back = parse_scalar(float_text(d));
        EXPECT_TRUE(back.is_float()) << float_text(d);
        EXPECT_DOUBLE_EQ(back.as_float(), d);
    }
}
