//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: test_message_codec.cpp
// Purpose: JSON-RPC envelope encode/decode and classification
//==========================================================================================================

#include <gtest/gtest.h>
#include <string>

#include "deepr/JSONRPCTypes.h"

using namespace deepr;

TEST(MessageCodec, DecodesRequestWithIntegerId) {
    Message m = DecodeMessage(R"({"jsonrpc":"2.0","id":7,"method":"ping","params":{}})");
    EXPECT_TRUE(m.IsRequest());
    EXPECT_FALSE(m.IsNotification());
    EXPECT_FALSE(m.IsResponse());
    ASSERT_TRUE(m.id.has_value());
    EXPECT_EQ(std::get<int64_t>(*m.id), 7);
    EXPECT_EQ(m.method.value(), "ping");
    ASSERT_TRUE(m.params.has_value());
    EXPECT_TRUE(m.params->IsObject());
}

TEST(MessageCodec, DecodesStringIdAndKeepsIt) {
    Message m = DecodeMessage(R"({"jsonrpc":"2.0","id":"abc-1","method":"tools/list"})");
    ASSERT_TRUE(m.id.has_value());
    EXPECT_EQ(std::get<std::string>(*m.id), "abc-1");
    EXPECT_EQ(JSONRPCIdToString(*m.id), "abc-1");
}

TEST(MessageCodec, NotificationHasNoId) {
    Message m = DecodeMessage(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_TRUE(m.IsNotification());
    EXPECT_FALSE(m.IsRequest());
    EXPECT_FALSE(m.id.has_value());
}

TEST(MessageCodec, NullIdWithMethodIsNotARequest) {
    Message m = DecodeMessage(R"({"jsonrpc":"2.0","id":null,"method":"ping"})");
    EXPECT_TRUE(m.IsNotification());
    EXPECT_FALSE(m.IsRequest());
}

TEST(MessageCodec, DecodesResultAndErrorResponses) {
    Message ok = DecodeMessage(R"({"jsonrpc":"2.0","id":1,"result":{"ok":true}})");
    EXPECT_TRUE(ok.IsResponse());
    EXPECT_FALSE(ok.IsError());
    EXPECT_EQ(GetBoolMember(*ok.result, "ok").value_or(false), true);

    Message err = DecodeMessage(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found: x"}})");
    EXPECT_TRUE(err.IsResponse());
    EXPECT_TRUE(err.IsError());
    EXPECT_EQ(err.ErrorCode().value_or(0), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(err.ErrorMessage().value_or(""), "Method not found: x");
}

TEST(MessageCodec, ErrorResponseMayCarryNullId) {
    Message err = DecodeMessage(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})");
    EXPECT_TRUE(err.IsError());
    ASSERT_TRUE(err.id.has_value());
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(*err.id));
}

TEST(MessageCodec, EncodeDecodePreservesRequest) {
    JSONValue::Object params;
    SetMember(params, "query", JSONValue("research"));
    SetMember(params, "limit", JSONValue(int64_t{3}));
    Message original = Message::Request(int64_t{42}, "tools/call", JSONValue(params));

    const std::string wire = EncodeMessage(original);
    EXPECT_EQ(wire.find('\n'), std::string::npos);
    Message decoded = DecodeMessage(wire);
    EXPECT_EQ(decoded, original);
}

TEST(MessageCodec, EncodedErrorCarriesCodeMessageAndData) {
    JSONValue::Object data;
    SetMember(data, "detail", JSONValue("bad"));
    Message m = Message::ErrorResponse(std::string("r1"), JSONRPCErrorCodes::InvalidParams, "Invalid params",
                                       JSONValue(data));
    JSONValue parsed = ParseJSON(EncodeMessage(m));
    EXPECT_EQ(GetStringMember(parsed, "jsonrpc").value_or(""), "2.0");
    EXPECT_EQ(GetStringMember(parsed, "id").value_or(""), "r1");
    const JSONValue* error = FindMember(parsed, "error");
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(GetIntMember(*error, "code").value_or(0), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(GetStringMember(*error, "message").value_or(""), "Invalid params");
    const JSONValue* d = FindMember(*error, "data");
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(GetStringMember(*d, "detail").value_or(""), "bad");
    EXPECT_EQ(FindMember(parsed, "result"), nullptr);
}

TEST(MessageCodec, EncodeOmitsAbsentMembers) {
    JSONValue parsed = ParseJSON(EncodeMessage(Message::Notification("notifications/initialized")));
    EXPECT_EQ(FindMember(parsed, "id"), nullptr);
    EXPECT_EQ(FindMember(parsed, "params"), nullptr);
    EXPECT_EQ(GetStringMember(parsed, "method").value_or(""), "notifications/initialized");
}

TEST(MessageCodec, MalformedJsonIsParseError) {
    try {
        (void)DecodeMessage("not json");
        FAIL() << "expected MessageDecodeError";
    } catch (const MessageDecodeError& e) {
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::ParseError);
    }
}

TEST(MessageCodec, NonObjectIsRejected) {
    try {
        (void)DecodeMessage("[1,2,3]");
        FAIL() << "expected MessageDecodeError";
    } catch (const MessageDecodeError& e) {
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::ParseError);
    }
}

TEST(MessageCodec, StructurallyInvalidEnvelopesAreInvalidRequest) {
    const char* cases[] = {
        R"({"jsonrpc":"1.0","id":1,"method":"ping"})",
        R"({"jsonrpc":"2.0","id":1,"method":42})",
        R"({"jsonrpc":"2.0","id":{"x":1},"method":"ping"})",
        R"({"jsonrpc":"2.0","id":1,"method":"ping","result":{}})",
        R"({"jsonrpc":"2.0","id":1})",
        R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})",
        R"({"jsonrpc":"2.0","result":{}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"message":"no code"}})",
    };
    for (const char* c : cases) {
        try {
            (void)DecodeMessage(c);
            ADD_FAILURE() << "accepted: " << c;
        } catch (const MessageDecodeError& e) {
            EXPECT_EQ(e.Code(), JSONRPCErrorCodes::InvalidRequest) << c;
        }
    }
}

TEST(MessageCodec, UnicodeAndEscapesSurviveEncoding) {
    JSONValue::Object params;
    SetMember(params, "text", JSONValue(std::string("line1\nline2 \"quoted\" caf\xC3\xA9")));
    Message m = Message::Request(int64_t{1}, "echo", JSONValue(params));
    Message back = DecodeMessage(EncodeMessage(m));
    EXPECT_EQ(GetStringMember(*back.params, "text").value_or(""), "line1\nline2 \"quoted\" caf\xC3\xA9");
}
