//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: test_tool_service.cpp
// Purpose: initialize, tools/list and tools/call through the dispatcher with the gateway as the only tool
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "deepr/Server.h"
#include "deepr/ToolService.h"
#include "deepr/errors/Errors.h"
#include "deepr/search/ToolRegistry.h"

using namespace deepr;

namespace {

JSONValue callParams(const std::string& name, const JSONValue& arguments) {
    JSONValue::Object o;
    SetMember(o, "name", JSONValue(name));
    SetMember(o, "arguments", arguments);
    return JSONValue(std::move(o));
}

JSONValue queryArgs(const std::string& query) {
    JSONValue::Object o;
    SetMember(o, "query", JSONValue(query));
    return JSONValue(std::move(o));
}

class ToolServiceTest : public ::testing::Test {
protected:
    ToolServiceTest() : registry(search::CreateDefaultRegistry()), service(*registry) {
        RegisterGatewayMethods(server, service);
    }

    std::unique_ptr<search::ToolRegistry> registry;
    ToolService service;
    Server server;
};

} // namespace

TEST_F(ToolServiceTest, InitializeReportsProtocolAndCapabilities) {
    JSONValue::Object params;
    SetMember(params, "protocolVersion", JSONValue(PROTOCOL_VERSION));
    auto reply = server.HandleMessage(Message::Request(int64_t{1}, Methods::Initialize, JSONValue(params)));
    ASSERT_TRUE(reply.has_value());
    ASSERT_TRUE(reply->result.has_value());
    const JSONValue& result = *reply->result;
    EXPECT_EQ(GetStringMember(result, "protocolVersion").value_or(""), PROTOCOL_VERSION);
    const JSONValue* info = FindMember(result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetStringMember(*info, "name").value_or(""), "deepr-mcp");
    const JSONValue* caps = FindMember(result, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_NE(FindMember(*caps, "tools"), nullptr);
}

TEST_F(ToolServiceTest, InitializedNotificationAndPing) {
    EXPECT_FALSE(server.HandleMessage(Message::Notification(Methods::Initialized)).has_value());
    auto pong = server.HandleMessage(Message::Request(int64_t{2}, Methods::Ping));
    ASSERT_TRUE(pong.has_value());
    EXPECT_TRUE(pong->result->IsObject());
}

TEST_F(ToolServiceTest, ListToolsAdvertisesOnlyGateway) {
    auto reply = server.HandleMessage(Message::Request(int64_t{3}, Methods::ListTools));
    ASSERT_TRUE(reply.has_value());
    const auto& tools = std::get<JSONValue::Array>(FindMember(*reply->result, "tools")->value);
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(GetStringMember(*tools[0], "name").value_or(""), search::GatewayTool::kToolName);
}

TEST_F(ToolServiceTest, GatewayCallReturnsMatchingTools) {
    auto reply = server.HandleMessage(Message::Request(int64_t{4}, Methods::CallTool,
                                                       callParams(search::GatewayTool::kToolName, queryArgs("expert"))));
    ASSERT_TRUE(reply.has_value());
    ASSERT_FALSE(reply->IsError());
    const JSONValue& result = *reply->result;
    EXPECT_EQ(GetBoolMember(result, "isError").value_or(true), false);

    const JSONValue* structured = FindMember(result, "structuredContent");
    ASSERT_NE(structured, nullptr);
    EXPECT_GE(GetIntMember(*structured, "count").value_or(0), 1);
    EXPECT_EQ(GetIntMember(*structured, "total_available").value_or(0), 7);

    // The text block is the serialized structured result
    const auto& content = std::get<JSONValue::Array>(FindMember(result, "content")->value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(GetStringMember(*content[0], "type").value_or(""), "text");
    EXPECT_EQ(ParseJSON(GetStringMember(*content[0], "text").value_or("")), *structured);
}

TEST_F(ToolServiceTest, EmptyGatewayQueryIsToolLevelError) {
    JSONValue result = service.CallTool(callParams(search::GatewayTool::kToolName, queryArgs("")));
    EXPECT_EQ(GetBoolMember(result, "isError").value_or(false), true);
    EXPECT_EQ(GetStringMember(*FindMember(result, "structuredContent"), "error").value_or(""), "Query cannot be empty");
}

TEST_F(ToolServiceTest, UnknownToolIsToolNotFound) {
    auto reply = server.HandleMessage(Message::Request(int64_t{5}, Methods::CallTool,
                                                       callParams("deepr_research", queryArgs("x"))));
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->ErrorCode().value_or(0), JSONRPCErrorCodes::ToolNotFound);

    reply = server.HandleMessage(Message::Request(int64_t{6}, Methods::CallTool,
                                                  callParams("no_such_tool", JSONValue(JSONValue::Object{}))));
    EXPECT_EQ(reply->ErrorCode().value_or(0), JSONRPCErrorCodes::ToolNotFound);
    EXPECT_NE(reply->ErrorMessage().value_or("").find("no_such_tool"), std::string::npos);
}

TEST_F(ToolServiceTest, MalformedCallParamsAreInvalidParams) {
    auto reply = server.HandleMessage(Message::Request(int64_t{7}, Methods::CallTool, JSONValue(JSONValue::Object{})));
    EXPECT_EQ(reply->ErrorCode().value_or(0), JSONRPCErrorCodes::InvalidParams);

    reply = server.HandleMessage(Message::Request(int64_t{8}, Methods::CallTool,
                                                  callParams(search::GatewayTool::kToolName, JSONValue("text"))));
    EXPECT_EQ(reply->ErrorCode().value_or(0), JSONRPCErrorCodes::InvalidParams);

    reply = server.HandleMessage(Message::Request(int64_t{9}, Methods::CallTool,
                                                  callParams(search::GatewayTool::kToolName, JSONValue(JSONValue::Object{}))));
    EXPECT_EQ(reply->ErrorCode().value_or(0), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(ToolServiceTest, RegisteredHandlerExecutesTool) {
    service.RegisterToolHandler("deepr_list_experts", [](const JSONValue&) {
        JSONValue::Object o;
        SetMember(o, "experts", JSONValue(JSONValue::Array{}));
        return JSONValue(std::move(o));
    });
    EXPECT_TRUE(service.HasToolHandler("deepr_list_experts"));

    auto reply = server.HandleMessage(Message::Request(int64_t{10}, Methods::CallTool,
                                                       callParams("deepr_list_experts", JSONValue(JSONValue::Object{}))));
    ASSERT_TRUE(reply.has_value());
    ASSERT_FALSE(reply->IsError());
    EXPECT_EQ(GetBoolMember(*reply->result, "isError").value_or(true), false);
    EXPECT_NE(FindMember(*FindMember(*reply->result, "structuredContent"), "experts"), nullptr);
}

TEST_F(ToolServiceTest, HandlerFailureIsReportedInResult) {
    service.RegisterToolHandler("deepr_check_status", [](const JSONValue&) -> JSONValue {
        throw std::runtime_error("job store unavailable");
    });
    JSONValue result = service.CallTool(callParams("deepr_check_status", JSONValue(JSONValue::Object{})));
    EXPECT_EQ(GetBoolMember(result, "isError").value_or(false), true);
    EXPECT_EQ(GetStringMember(*FindMember(result, "structuredContent"), "error").value_or(""), "job store unavailable");
}

TEST_F(ToolServiceTest, HandlerRegistrationIsValidated) {
    auto noop = [](const JSONValue&) { return JSONValue(JSONValue::Object{}); };
    EXPECT_THROW(service.RegisterToolHandler(search::GatewayTool::kToolName, noop), std::invalid_argument);
    EXPECT_THROW(service.RegisterToolHandler("unregistered", noop), std::invalid_argument);
    EXPECT_FALSE(service.HasToolHandler("unregistered"));
}
