//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_json.cpp
// Purpose: GoogleTests for the minimal JSON reader/writer used by token responses
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>

#include "oidc/JSONValue.h"

using namespace oidc;

TEST(JSON, ParsesNestedDocument) {
    auto v = ParseJSON(R"({"a":"x","n":-12,"f":1.5,"b":true,"z":null,"arr":[1,"two"],"o":{"k":"v"}})");
    const auto& obj = std::get<JSONValue::Object>(v.value);
    EXPECT_EQ(GetStringMember(v, "a"), "x");
    EXPECT_EQ(std::get<int64_t>(obj.at("n")->value), -12);
    EXPECT_DOUBLE_EQ(std::get<double>(obj.at("f")->value), 1.5);
    EXPECT_TRUE(std::get<bool>(obj.at("b")->value));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(obj.at("z")->value));
    EXPECT_EQ(std::get<JSONValue::Array>(obj.at("arr")->value).size(), 2u);
    EXPECT_EQ(GetStringMember(*obj.at("o"), "k"), "v");
}

TEST(JSON, EscapesControlAndQuoteCharacters) {
    JSONValue s(std::string("he said \"hi\"\n\x01"));
    const std::string text = SerializeJSON(s);
    EXPECT_EQ(text, "\"he said \\\"hi\\\"\\n\\u0001\"");
    EXPECT_EQ(std::get<std::string>(ParseJSON(text).value), "he said \"hi\"\n\x01");
}

TEST(JSON, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("{\"a\":}"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":1} x"), std::runtime_error);
    EXPECT_THROW(ParseJSON("\"unterminated"), std::runtime_error);
}

TEST(JSON, GetStringMemberIsLenient) {
    EXPECT_EQ(GetStringMember(ParseJSON("[1]"), "a"), "");
    EXPECT_EQ(GetStringMember(ParseJSON("{\"a\":1}"), "a"), "");
    EXPECT_EQ(GetStringMember(ParseJSON("{}"), "a"), "");
}
