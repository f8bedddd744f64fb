//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: test_gateway.cpp
// Purpose: Discovery gateway search results, limit clamping and context savings
//==========================================================================================================

#include <gtest/gtest.h>
#include <string>

#include "deepr/errors/Errors.h"
#include "deepr/search/GatewayTool.h"
#include "deepr/search/ToolRegistry.h"

using namespace deepr;
using namespace deepr::search;

namespace {

void fillWidgets(ToolRegistry& registry, int count) {
    std::vector<ToolSchema> tools;
    for (int i = 0; i < count; ++i) {
        tools.emplace_back("widget_" + std::to_string(i), "Builds a widget variant",
                           ParseJSON(R"({"type":"object"})"), "widgets", "low");
    }
    registry.RegisterMany(std::move(tools));
}

JSONValue argsOf(const std::string& query) {
    JSONValue::Object o;
    SetMember(o, "query", JSONValue(query));
    return JSONValue(std::move(o));
}

} // namespace

TEST(GatewayTool, SchemaAdvertisesQueryAndLimit) {
    JSONValue schema = GatewayTool::GatewaySchema();
    EXPECT_EQ(GetStringMember(schema, "name").value_or(""), "deepr_tool_search");
    const JSONValue* input = FindMember(schema, "inputSchema");
    ASSERT_NE(input, nullptr);
    const JSONValue* props = FindMember(*input, "properties");
    ASSERT_NE(props, nullptr);
    ASSERT_NE(FindMember(*props, "query"), nullptr);
    const JSONValue* limit = FindMember(*props, "limit");
    ASSERT_NE(limit, nullptr);
    EXPECT_EQ(GetIntMember(*limit, "default").value_or(0), 3);
    EXPECT_EQ(GetIntMember(*limit, "minimum").value_or(0), 1);
    EXPECT_EQ(GetIntMember(*limit, "maximum").value_or(0), 10);
}

TEST(GatewayTool, DefaultLimitIsThree) {
    ToolRegistry registry;
    fillWidgets(registry, 12);
    GatewayTool gateway(registry);
    GatewaySearchResult r = gateway.Search("widget");
    EXPECT_FALSE(r.IsError());
    EXPECT_EQ(r.Count(), 3u);
    EXPECT_EQ(r.totalAvailable, 12u);
    EXPECT_EQ(r.query, "widget");
}

TEST(GatewayTool, LimitIsClampedToRange) {
    ToolRegistry registry;
    fillWidgets(registry, 12);
    GatewayTool gateway(registry);
    EXPECT_EQ(gateway.Search("widget", 0).Count(), 1u);
    EXPECT_EQ(gateway.Search("widget", -5).Count(), 1u);
    EXPECT_EQ(gateway.Search("widget", 50).Count(), 10u);
    EXPECT_EQ(gateway.Search("widget", 7).Count(), 7u);
}

TEST(GatewayTool, EmptyQueryIsReportedNotThrown) {
    ToolRegistry registry;
    fillWidgets(registry, 2);
    GatewayTool gateway(registry);
    GatewaySearchResult r = gateway.Search("   ");
    ASSERT_TRUE(r.IsError());
    EXPECT_EQ(*r.error, "Query cannot be empty");

    JSONValue wire = r.ToJSON();
    EXPECT_EQ(GetStringMember(wire, "error").value_or(""), "Query cannot be empty");
    EXPECT_EQ(GetIntMember(wire, "total_available").value_or(-1), 2);
    const JSONValue* tools = FindMember(wire, "tools");
    ASSERT_NE(tools, nullptr);
    EXPECT_TRUE(std::get<JSONValue::Array>(tools->value).empty());
}

TEST(GatewayTool, MessagesDependOnMatchCount) {
    ToolRegistry registry;
    registry.Register(ToolSchema("solo_tool", "Unique capability", ParseJSON("{}")));
    fillWidgets(registry, 2);
    GatewayTool gateway(registry);

    GatewaySearchResult none = gateway.Search("nonexistent");
    EXPECT_EQ(none.Count(), 0u);
    EXPECT_NE(none.message.find("No tools found"), std::string::npos);

    GatewaySearchResult one = gateway.Search("unique");
    EXPECT_EQ(one.Count(), 1u);
    EXPECT_NE(one.message.find("Found 1 tool"), std::string::npos);

    GatewaySearchResult many = gateway.Search("widget");
    EXPECT_EQ(many.Count(), 2u);
    EXPECT_NE(many.message.find("Found 2 tools"), std::string::npos);
}

TEST(GatewayTool, ResultJsonCarriesFullDescriptors) {
    ToolRegistry registry;
    fillWidgets(registry, 1);
    GatewayTool gateway(registry);
    JSONValue wire = gateway.Search("widget").ToJSON();
    EXPECT_EQ(GetIntMember(wire, "count").value_or(0), 1);
    EXPECT_EQ(GetIntMember(wire, "total_available").value_or(0), 1);
    EXPECT_EQ(GetStringMember(wire, "query").value_or(""), "widget");
    const auto& tools = std::get<JSONValue::Array>(FindMember(wire, "tools")->value);
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(GetStringMember(*tools[0], "name").value_or(""), "widget_0");
    EXPECT_EQ(GetStringMember(*tools[0], "category").value_or(""), "widgets");
    EXPECT_EQ(GetStringMember(*tools[0], "cost_tier").value_or(""), "low");
    EXPECT_NE(FindMember(*tools[0], "inputSchema"), nullptr);
}

TEST(GatewayTool, ArgumentsAreValidated) {
    ToolRegistry registry;
    fillWidgets(registry, 4);
    GatewayTool gateway(registry);

    EXPECT_EQ(gateway.SearchFromArguments(argsOf("widget")).Count(), 3u);

    JSONValue::Object withLimit;
    SetMember(withLimit, "query", JSONValue("widget"));
    SetMember(withLimit, "limit", JSONValue(int64_t{2}));
    EXPECT_EQ(gateway.SearchFromArguments(JSONValue(withLimit)).Count(), 2u);

    JSONValue::Object badLimit;
    SetMember(badLimit, "query", JSONValue("widget"));
    SetMember(badLimit, "limit", JSONValue("two"));
    EXPECT_THROW(gateway.SearchFromArguments(JSONValue(badLimit)), errors::RpcError);

    try {
        gateway.SearchFromArguments(JSONValue(JSONValue::Object{}));
        FAIL() << "expected RpcError";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::InvalidParams);
    }
}

TEST(GatewayTool, ContextSavingsAgainstDefaultRegistry) {
    auto registry = CreateDefaultRegistry();
    GatewayTool gateway(*registry);
    ContextSavings s = gateway.EstimateContextSavings();
    EXPECT_GT(s.allToolsTokens, 0u);
    EXPECT_GT(s.gatewayOnlyTokens, 0u);
    EXPECT_EQ(s.totalWithGateway, s.gatewayOnlyTokens + s.typicalSearchTokens);
    EXPECT_LT(s.totalWithGateway, s.allToolsTokens);
    EXPECT_GT(s.savingsPercentage, 0.0);
    EXPECT_LE(s.savingsPercentage, 100.0);

    JSONValue wire = s.ToJSON();
    EXPECT_NE(FindMember(wire, "savings_percentage"), nullptr);
    EXPECT_EQ(GetIntMember(wire, "all_tools_tokens").value_or(0), static_cast<int64_t>(s.allToolsTokens));
}
