//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: Tests for the JSON parser, serializer and JSON-RPC envelopes
//==========================================================================================================

#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "micromcp/JSONRPCTypes.h"

using namespace micromcp;

TEST(JSONParser, ParsesNestedDocument) {
    JSONValue v;
    std::string err;
    ASSERT_TRUE(ParseJSON(R"({"a":[1,2.5,"x",true,null],"b":{"c":-3}})", v, err)) << err;
    const JSONValue* a = FindMember(v, "a");
    ASSERT_NE(a, nullptr);
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(arr[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(arr[1]->value), 2.5);
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "x");
    EXPECT_TRUE(std::get<bool>(arr[3]->value));
    EXPECT_TRUE(arr[4]->IsNull());
    const JSONValue* b = FindMember(v, "b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(std::get<int64_t>(FindMember(*b, "c")->value), -3);
}

TEST(JSONParser, RejectsMalformedInput) {
    JSONValue v;
    std::string err;
    EXPECT_FALSE(ParseJSON("{bad", v, err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(ParseJSON("", v, err));
    EXPECT_FALSE(ParseJSON("{} {}", v, err));
    EXPECT_FALSE(ParseJSON("[1,]", v, err));
    EXPECT_FALSE(ParseJSON("01x", v, err));
}

TEST(JSONParser, FailedParseLeavesOutputUntouched) {
    JSONValue v(std::string("keep"));
    std::string err;
    EXPECT_FALSE(ParseJSON("[", v, err));
    ASSERT_TRUE(v.IsString());
    EXPECT_EQ(std::get<std::string>(v.value), "keep");
}

TEST(JSONParser, RejectsExcessiveNesting) {
    std::string deep(100, '[');
    deep += std::string(100, ']');
    JSONValue v;
    std::string err;
    EXPECT_FALSE(ParseJSON(deep, v, err));
}

TEST(JSONParser, DecodesUnicodeEscapesIncludingSurrogatePairs) {
    JSONValue v;
    std::string err;
    ASSERT_TRUE(ParseJSON(R"("\u00e9\ud83d\ude00")", v, err)) << err;
    EXPECT_EQ(std::get<std::string>(v.value), "\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JSONParser, HugeIntegerDegradesToDouble) {
    JSONValue v;
    std::string err;
    ASSERT_TRUE(ParseJSON("123456789012345678901234567890", v, err)) << err;
    EXPECT_TRUE(std::holds_alternative<double>(v.value));
}

TEST(JSONSerializer, EscapesControlCharactersAndQuotes) {
    JSONValue v(std::string("a\"b\\c\n\x01"));
    EXPECT_EQ(SerializeJSON(v), R"("a\"b\\c\n\u0001")");
}

TEST(JSONSerializer, OutputReparsesToEqualValue) {
    JSONValue v;
    std::string err;
    ASSERT_TRUE(ParseJSON(R"({"name":"echo","arguments":{"message":"hi","n":[1,2,{"x":0.25}]}})", v, err));
    JSONValue again;
    ASSERT_TRUE(ParseJSON(SerializeJSON(v), again, err)) << err;
    EXPECT_EQ(v, again);
}

TEST(JSONSerializer, NonFiniteDoubleBecomesNull) {
    JSONValue v(std::numeric_limits<double>::infinity());
    EXPECT_EQ(SerializeJSON(v), "null");
}

TEST(JSONRPCRequest, MissingIdAndParamsTakeDefaults) {
    JSONValue v;
    std::string err;
    ASSERT_TRUE(ParseJSON(R"({"jsonrpc":"2.0","method":"initialized"})", v, err));
    JSONRPCRequest req;
    ASSERT_TRUE(req.FromValue(v));
    EXPECT_EQ(req.method, "initialized");
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(req.id));
    EXPECT_TRUE(req.params.IsObject());
}

TEST(JSONRPCRequest, NullParamsDefaultToEmptyObject) {
    JSONValue v;
    std::string err;
    ASSERT_TRUE(ParseJSON(R"({"id":1,"method":"ping","params":null})", v, err));
    JSONRPCRequest req;
    ASSERT_TRUE(req.FromValue(v));
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_TRUE(req.params.IsObject());
}

TEST(JSONRPCRequest, FractionalIdIsKeptAsDouble) {
    JSONValue v;
    std::string err;
    ASSERT_TRUE(ParseJSON(R"({"id":1.5,"method":"ping"})", v, err));
    JSONRPCRequest req;
    ASSERT_TRUE(req.FromValue(v));
    ASSERT_TRUE(std::holds_alternative<double>(req.id));
    EXPECT_DOUBLE_EQ(std::get<double>(req.id), 1.5);
    EXPECT_EQ(IdToValue(req.id), JSONValue(1.5));
}

TEST(JSONRPCRequest, StructuredIdMapsToNull) {
    JSONValue v;
    std::string err;
    ASSERT_TRUE(ParseJSON(R"({"id":[1],"method":"ping"})", v, err));
    JSONRPCRequest req;
    ASSERT_TRUE(req.FromValue(v));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(req.id));
}

TEST(JSONRPCResponse, ErrorResponseCarriesNullIdAndNoResult) {
    auto resp = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error");
    JSONValue v;
    std::string err;
    ASSERT_TRUE(ParseJSON(resp->Serialize(), v, err)) << err;
    const JSONValue* id = FindMember(v, "id");
    ASSERT_NE(id, nullptr);
    EXPECT_TRUE(id->IsNull());
    EXPECT_EQ(FindMember(v, "result"), nullptr);
    const JSONValue* e = FindMember(v, "error");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(std::get<int64_t>(FindMember(*e, "code")->value), -32700);
    EXPECT_EQ(GetStringMember(v, "jsonrpc").value_or(""), "2.0");
}
