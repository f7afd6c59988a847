// PYTHCLIENT - JSON Value Tests
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include <gtest/gtest.h>

#include "pythclient/util/json.h"

#include <stdexcept>

namespace pythclient {
namespace util {
namespace test {

TEST(JSONValueTest, DefaultIsNull) {
    JSONValue value;
    EXPECT_TRUE(value.IsNull());
    EXPECT_EQ(value.ToJSON(), "null");
}

TEST(JSONValueTest, Scalars) {
    EXPECT_EQ(JSONValue(true).ToJSON(), "true");
    EXPECT_EQ(JSONValue(int64_t{-42}).ToJSON(), "-42");
    EXPECT_EQ(JSONValue(uint64_t{7}).GetInt(), 7);
    EXPECT_EQ(JSONValue("abc").ToJSON(), "\"abc\"");
    EXPECT_DOUBLE_EQ(JSONValue(1.5).GetDouble(), 1.5);
    EXPECT_DOUBLE_EQ(JSONValue(3).GetDouble(), 3.0);
}

TEST(JSONValueTest, GettersFallBackToDefaults) {
    JSONValue str("text");
    EXPECT_EQ(str.GetInt(9), 9);
    EXPECT_FALSE(str.GetBool());
    EXPECT_TRUE(str.GetArray().empty());
    EXPECT_EQ(JSONValue(5).GetString(), "");
}

TEST(JSONValueTest, ObjectAccess) {
    JSONValue obj(JSONValue::Object{});
    obj["slot"] = int64_t{123};
    obj["name"] = "Crypto.BTC/USD";

    EXPECT_TRUE(obj.HasKey("slot"));
    EXPECT_FALSE(obj.HasKey("missing"));
    EXPECT_EQ(obj["slot"].GetInt(), 123);

    const JSONValue& view = obj;
    EXPECT_TRUE(view["missing"].IsNull());
    EXPECT_EQ(view.Size(), 2);
}

TEST(JSONValueTest, ArrayAccess) {
    JSONValue arr(JSONValue::Array{});
    arr.Push("a");
    arr.Push(2);

    const JSONValue& view = arr;
    ASSERT_EQ(view.Size(), 2);
    EXPECT_EQ(view[0].GetString(), "a");
    EXPECT_EQ(view[1].GetInt(), 2);
    EXPECT_TRUE(view[5].IsNull());
    EXPECT_EQ(arr.ToJSON(), "[\"a\",2]");
}

TEST(JSONValueTest, ObjectKeysSerializeSorted) {
    JSONValue obj(JSONValue::Object{});
    obj["b"] = 1;
    obj["a"] = nullptr;
    EXPECT_EQ(obj.ToJSON(), "{\"a\":null,\"b\":1}");
}

TEST(JSONValueTest, PrettyPrinting) {
    JSONValue obj(JSONValue::Object{});
    obj["k"] = JSONValue(JSONValue::Array{JSONValue(1)});
    EXPECT_EQ(obj.ToJSON(true), "{\n  \"k\": [\n    1\n  ]\n}");
}

TEST(JSONValueTest, EscapesControlCharacters) {
    JSONValue value(std::string("a\"b\\c\n\x01"));
    EXPECT_EQ(value.ToJSON(), "\"a\\\"b\\\\c\\n\\u0001\"");
}

// ============================================================================
// Parsing
// ============================================================================

TEST(JSONParseTest, ParsesRpcAccountValue) {
    auto value = JSONValue::Parse(
        R"({"context": {"slot": 250}, "value": {"data": ["1qY=", "base64"], "owner": null}})");

    EXPECT_EQ(value["context"]["slot"].GetInt(), 250);
    const JSONValue& data = value["value"]["data"];
    ASSERT_TRUE(data.IsArray());
    EXPECT_EQ(data[0].GetString(), "1qY=");
    EXPECT_EQ(data[1].GetString(), "base64");
    EXPECT_TRUE(value["value"]["owner"].IsNull());
}

TEST(JSONParseTest, Numbers) {
    EXPECT_EQ(JSONValue::Parse("-17").GetInt(), -17);
    EXPECT_TRUE(JSONValue::Parse("2.5").GetType() == JSONValue::Type::Double);
    EXPECT_DOUBLE_EQ(JSONValue::Parse("1e3").GetDouble(), 1000.0);
    EXPECT_EQ(JSONValue::Parse("9223372036854775807").GetInt(), INT64_MAX);
}

TEST(JSONParseTest, StringEscapes) {
    EXPECT_EQ(JSONValue::Parse(R"("a\/b\tc")").GetString(), "a/b\tc");
    EXPECT_EQ(JSONValue::Parse(R"("\u00e9")").GetString(), "\xC3\xA9");
    EXPECT_EQ(JSONValue::Parse(R"("\u20ac")").GetString(), "\xE2\x82\xAC");
}

TEST(JSONParseTest, RoundTripThroughText) {
    std::string text = R"({"accounts":{"k":{"data":["","base64"]}},"slot":5})";
    EXPECT_EQ(JSONValue::Parse(text).ToJSON(), text);
}

TEST(JSONParseTest, RejectsMalformedDocuments) {
    EXPECT_FALSE(JSONValue::TryParse("").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1,]").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{\"a\" 1}").has_value());
    EXPECT_FALSE(JSONValue::TryParse("\"unterminated").has_value());
    EXPECT_FALSE(JSONValue::TryParse("nul").has_value());
    EXPECT_FALSE(JSONValue::TryParse("1 2").has_value());
    EXPECT_FALSE(JSONValue::TryParse("\"\\q\"").has_value());
    EXPECT_THROW(JSONValue::Parse("{]"), std::runtime_error);
}

TEST(JSONParseTest, RejectsExcessiveNesting) {
    std::string deep(100, '[');
    deep += std::string(100, ']');
    EXPECT_FALSE(JSONValue::TryParse(deep).has_value());

    std::string shallow(10, '[');
    shallow += std::string(10, ']');
    EXPECT_TRUE(JSONValue::TryParse(shallow).has_value());
}

} // namespace test
} // namespace util
} // namespace pythclient
