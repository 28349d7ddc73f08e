/**
 * @file test_json_helpers.cpp
 * @brief Unit tests for the internal JSON reader and writer
 */

#include <gtest/gtest.h>

#include "core/json_helpers.h"

#include <string>

namespace transfer_queue::test {

using namespace transfer_queue::detail;

class JsonHelpersTest : public ::testing::Test {};

TEST_F(JsonHelpersTest, ParseScalars) {
    auto parsed = parse_json_object(
        R"({"name": "queue", "count": 12, "offset": -3, "on": true, "off": false, "gone": null})");
    ASSERT_TRUE(parsed) << parsed.error().message;
    const auto& obj = parsed.value();

    EXPECT_EQ(json_string(obj, "name"), "queue");
    EXPECT_EQ(json_uint(obj, "count"), 12u);
    EXPECT_EQ(json_int(obj, "offset"), -3);
    EXPECT_FALSE(json_uint(obj, "offset").has_value());
    EXPECT_EQ(json_bool(obj, "on"), true);
    EXPECT_EQ(json_bool(obj, "off"), false);
    EXPECT_TRUE(json_is_null(obj, "gone"));
    EXPECT_TRUE(json_is_null(obj, "missing"));
    EXPECT_FALSE(json_is_null(obj, "count"));
}

TEST_F(JsonHelpersTest, TypeMismatchYieldsNullopt) {
    auto parsed = parse_json_object(R"({"n": "12", "s": 5})");
    ASSERT_TRUE(parsed);
    EXPECT_FALSE(json_uint(parsed.value(), "n").has_value());
    EXPECT_FALSE(json_string(parsed.value(), "s").has_value());
}

TEST_F(JsonHelpersTest, NestedContainersKeepRawText) {
    auto parsed = parse_json_object(R"({"records": [{"id": 1}, {"id": 2, "p": "a]b"}], "v": 1})");
    ASSERT_TRUE(parsed) << parsed.error().message;

    const auto& records = parsed.value().at("records");
    EXPECT_EQ(records.type, json_value::kind::array);

    auto items = parse_json_array(records.text);
    ASSERT_TRUE(items);
    ASSERT_EQ(items.value().size(), 2u);
    EXPECT_EQ(items.value()[1].type, json_value::kind::object);

    auto second = parse_json_object(items.value()[1].text);
    ASSERT_TRUE(second);
    EXPECT_EQ(json_string(second.value(), "p"), "a]b");
}

TEST_F(JsonHelpersTest, EscapesRoundTrip) {
    std::string original = "quote\" backslash\\ newline\n tab\t ctrl\x01";
    auto document = "{\"s\": \"" + escape_json_string(original) + "\"}";

    auto parsed = parse_json_object(document);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(json_string(parsed.value(), "s"), original);
}

TEST_F(JsonHelpersTest, UnicodeEscapes) {
    auto parsed = parse_json_object(R"({"s": "caf\u00e9 \ud83d\ude00"})");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(json_string(parsed.value(), "s"), "caf\xc3\xa9 \xf0\x9f\x98\x80");
}

TEST_F(JsonHelpersTest, MalformedDocumentsRejected) {
    for (const char* text : {"", "[]", "{", R"({"a" 1})", R"({"a": 1,})", R"({"a": 1} x)",
                             R"({"a": "unterminated})", R"({"a": [1, 2})"}) {
        auto parsed = parse_json_object(text);
        ASSERT_FALSE(parsed) << text;
        EXPECT_EQ(parsed.error().code, error_code::config_parse_error) << text;
    }
}

TEST_F(JsonHelpersTest, EmptyContainers) {
    auto obj = parse_json_object("  { }  ");
    ASSERT_TRUE(obj);
    EXPECT_TRUE(obj.value().empty());

    auto arr = parse_json_array("[ ]");
    ASSERT_TRUE(arr);
    EXPECT_TRUE(arr.value().empty());
}

}  // namespace transfer_queue::test
