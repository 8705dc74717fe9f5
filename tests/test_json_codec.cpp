//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_codec.cpp
// Purpose: JSON parser/serializer and JSON-RPC message codec tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <variant>

#include "mcpe/JSONRPCTypes.h"
#include "mcpe/MessageCodec.h"
#include "mcpe/Protocol.h"

using namespace mcpe;

TEST(JSONParser, ParsesScalarsAndStructures) {
    auto v = parseJSON(R"({"a":1,"b":[true,null,"x"],"c":{"d":2.5},"e":-7})");
    ASSERT_TRUE(v.isObject());
    EXPECT_EQ(std::get<int64_t>(v.find("a")->value), 1);
    EXPECT_EQ(std::get<int64_t>(v.find("e")->value), -7);
    EXPECT_DOUBLE_EQ(std::get<double>(v.find("c")->find("d")->value), 2.5);
    const auto& arr = std::get<JSONValue::Array>(v.find("b")->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_TRUE(std::get<bool>(arr[0]->value));
    EXPECT_TRUE(arr[1]->isNull());
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "x");
}

TEST(JSONParser, DecodesEscapesAndSurrogatePairs) {
    auto v = parseJSON(R"("tab\there \"q\" \u00e9 \ud83d\ude00")");
    EXPECT_EQ(std::get<std::string>(v.value), "tab\there \"q\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(parseJSON(R"({"jsonrpc":)"), JSONParseError);
    EXPECT_THROW(parseJSON("{} trailing"), JSONParseError);
    EXPECT_THROW(parseJSON(R"("unterminated)"), JSONParseError);
    EXPECT_THROW(parseJSON("[1,]"), JSONParseError);
    EXPECT_THROW(parseJSON("-"), JSONParseError);
    EXPECT_THROW(parseJSON(""), JSONParseError);
}

TEST(JSONParser, ExtremeExponentsStayValid) {
    auto tiny = parseJSON("1e-400");
    ASSERT_TRUE(std::holds_alternative<double>(tiny.value));
    EXPECT_EQ(std::get<double>(tiny.value), 0.0);

    auto denormal = parseJSON("4e-320");
    EXPECT_GT(std::get<double>(denormal.value), 0.0);

    auto huge = parseJSON("-1e400");
    EXPECT_EQ(std::get<double>(huge.value), -std::numeric_limits<double>::max());

    // Integers beyond int64 degrade to double
    auto wide = parseJSON("123456789012345678901234567890");
    EXPECT_TRUE(std::holds_alternative<double>(wide.value));
}

TEST(JSONParser, RejectsExcessiveNesting) {
    std::string deep(300, '[');
    deep += std::string(300, ']');
    EXPECT_THROW(parseJSON(deep), JSONParseError);
}

TEST(JSONParser, SerializeEscapesControlCharacters) {
    JSONValue v(std::string("a\"b\\c\nd"));
    EXPECT_EQ(serializeJSONValue(v), R"("a\"b\\c\nd")");
    EXPECT_EQ(parseJSON(serializeJSONValue(v)), v);
}

TEST(JSONValueEquality, ObjectMemberOrderIsIrrelevant) {
    EXPECT_EQ(parseJSON(R"({"x":1,"y":[1,2]})"), parseJSON(R"({"y":[1,2],"x":1})"));
    EXPECT_FALSE(parseJSON(R"({"x":1})") == parseJSON(R"({"x":2})"));
}

TEST(MessageCodec, DecodeValidRequestKeepsIdAndParams) {
    auto decoded = codec::Decode(R"({"jsonrpc":"2.0","id":"abc","method":"tools/call","params":{"name":"echo"},"extra":true})");
    ASSERT_TRUE(std::holds_alternative<JSONRPCRequest>(decoded));
    const auto& req = std::get<JSONRPCRequest>(decoded);
    ASSERT_TRUE(req.id.has_value());
    EXPECT_EQ(std::get<std::string>(*req.id), "abc");
    EXPECT_EQ(req.method, "tools/call");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(std::get<std::string>(req.params->find("name")->value), "echo");
}

TEST(MessageCodec, DecodeDistinguishesAbsentAndNullId) {
    auto absent = codec::Decode(R"({"jsonrpc":"2.0","method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<JSONRPCRequest>(absent));
    EXPECT_FALSE(std::get<JSONRPCRequest>(absent).id.has_value());

    auto explicitNull = codec::Decode(R"({"jsonrpc":"2.0","id":null,"method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<JSONRPCRequest>(explicitNull));
    const auto& id = std::get<JSONRPCRequest>(explicitNull).id;
    ASSERT_TRUE(id.has_value());
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(*id));
}

TEST(MessageCodec, MalformedBytesYieldParseErrorWithNullId) {
    auto decoded = codec::Decode(R"({"jsonrpc":)");
    ASSERT_TRUE(std::holds_alternative<codec::DecodeError>(decoded));
    const auto& err = std::get<codec::DecodeError>(decoded);
    EXPECT_EQ(err.error.code, JSONRPCErrorCodes::ParseError);
    ASSERT_TRUE(err.id.has_value());
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(*err.id));

    auto wire = codec::EncodeError(err.id, err.error);
    auto doc = parseJSON(wire);
    EXPECT_TRUE(doc.find("id")->isNull());
    EXPECT_EQ(std::get<int64_t>(doc.find("error")->find("code")->value), -32700);
}

TEST(MessageCodec, UnderflowingNumberKeepsRequestValid) {
    auto decoded = codec::Decode(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{"x":1e-400}})");
    ASSERT_TRUE(std::holds_alternative<JSONRPCRequest>(decoded));
    const auto& req = std::get<JSONRPCRequest>(decoded);
    EXPECT_EQ(std::get<int64_t>(*req.id), 1);
    EXPECT_EQ(std::get<double>(req.params->find("x")->value), 0.0);
}

TEST(MessageCodec, WrongVersionIsInvalidRequestEchoingId) {
    auto decoded = codec::Decode(R"({"jsonrpc":"1.0","id":7,"method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<codec::DecodeError>(decoded));
    const auto& err = std::get<codec::DecodeError>(decoded);
    EXPECT_EQ(err.error.code, JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(err.error.message, "Invalid JSON-RPC version");
    ASSERT_TRUE(err.id.has_value());
    EXPECT_EQ(std::get<int64_t>(*err.id), 7);
}

TEST(MessageCodec, MissingVersionOrMethodIsInvalidRequest) {
    auto noVersion = codec::Decode(R"({"id":1,"method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<codec::DecodeError>(noVersion));
    EXPECT_EQ(std::get<codec::DecodeError>(noVersion).error.code, JSONRPCErrorCodes::InvalidRequest);

    auto noMethod = codec::Decode(R"({"jsonrpc":"2.0","id":1})");
    ASSERT_TRUE(std::holds_alternative<codec::DecodeError>(noMethod));
    EXPECT_EQ(std::get<codec::DecodeError>(noMethod).error.code, JSONRPCErrorCodes::InvalidRequest);

    auto notObject = codec::Decode("[1,2,3]");
    ASSERT_TRUE(std::holds_alternative<codec::DecodeError>(notObject));
    EXPECT_EQ(std::get<codec::DecodeError>(notObject).error.code, JSONRPCErrorCodes::InvalidRequest);
}

TEST(MessageCodec, NonScalarIdIsInvalidRequest) {
    auto decoded = codec::Decode(R"({"jsonrpc":"2.0","id":{"x":1},"method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<codec::DecodeError>(decoded));
    const auto& err = std::get<codec::DecodeError>(decoded);
    EXPECT_EQ(err.error.code, JSONRPCErrorCodes::InvalidRequest);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(*err.id));
}

TEST(MessageCodec, EncodeResultMatchesWireFormat) {
    EXPECT_EQ(codec::EncodeResult(JSONRPCId{int64_t{1}}, JSONValue(JSONValue::Object{})),
              R"({"jsonrpc":"2.0","id":1,"result":{}})");
    // Absent id stays absent
    EXPECT_EQ(codec::EncodeResult(std::nullopt, JSONValue(JSONValue::Object{})),
              R"({"jsonrpc":"2.0","result":{}})");
    EXPECT_EQ(codec::EncodeResult(JSONRPCId{std::string("r-1")}, JSONValue(true)),
              R"({"jsonrpc":"2.0","id":"r-1","result":true})");
}

TEST(MessageCodec, EncodeNotificationCarriesNoId) {
    Notification n;
    n.method = Methods::ToolsListChanged;
    auto wire = codec::EncodeNotification(n);
    EXPECT_EQ(wire, R"({"jsonrpc":"2.0","method":"tools/list/changed","params":{}})");
}

TEST(MessageCodec, ClassifyMessages) {
    EXPECT_EQ(codec::Classify(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"), codec::MessageKind::Request);
    EXPECT_EQ(codec::Classify(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"), codec::MessageKind::Notification);
    EXPECT_EQ(codec::Classify(R"({"jsonrpc":"2.0","id":1,"result":{}})"), codec::MessageKind::Response);
    EXPECT_EQ(codec::Classify(R"({"jsonrpc":"2.0","id":1})"), codec::MessageKind::Unknown);
    EXPECT_EQ(codec::Classify("{"), codec::MessageKind::Unknown);
}

TEST(JSONRPCMessages, OneWayOnlyForIdlessNotificationsPrefix) {
    JSONRPCRequest note(std::nullopt, "notifications/initialized");
    EXPECT_TRUE(note.IsOneWay());
    JSONRPCRequest withId(JSONRPCId{int64_t{3}}, "notifications/initialized");
    EXPECT_FALSE(withId.IsOneWay());
    JSONRPCRequest idlessCall(std::nullopt, "ping");
    EXPECT_FALSE(idlessCall.IsOneWay());
}
