//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: GatewayTool.cpp
// Purpose: Discovery gateway implementation
//==========================================================================================================

#include <algorithm>
#include <cmath>

#include "deepr/search/GatewayTool.h"
#include "deepr/errors/Errors.h"
#include "logging/Logger.h"

namespace deepr {
namespace search {

namespace {

std::string hintMessage(std::size_t count, const std::string& query) {
    if (count == 0) {
        return "No tools found matching '" + query + "'. "
               "Try broader terms like 'research', 'expert', or 'agentic'.";
    }
    if (count == 1) {
        return "Found 1 tool matching '" + query + "'. Use it directly with the schema provided.";
    }
    return "Found " + std::to_string(count) + " tools matching '" + query + "'. "
           "Review the descriptions and choose the most appropriate one.";
}

} // namespace

JSONValue GatewaySearchResult::ToJSON() const {
    JSONValue::Object o;
    if (error.has_value()) {
        SetMember(o, "error", JSONValue(*error));
        SetMember(o, "tools", JSONValue(JSONValue::Array{}));
        SetMember(o, "total_available", JSONValue(static_cast<int64_t>(totalAvailable)));
        return JSONValue(std::move(o));
    }
    JSONValue::Array arr;
    for (const auto& tool : tools) {
        JSONValue::Object t;
        SetMember(t, "name", JSONValue(tool->Name()));
        SetMember(t, "description", JSONValue(tool->Description()));
        SetMember(t, "inputSchema", tool->InputSchema());
        SetMember(t, "category", JSONValue(tool->Category()));
        SetMember(t, "cost_tier", JSONValue(tool->CostTier()));
        arr.push_back(std::make_shared<JSONValue>(JSONValue(std::move(t))));
    }
    SetMember(o, "tools", JSONValue(std::move(arr)));
    SetMember(o, "count", JSONValue(static_cast<int64_t>(tools.size())));
    SetMember(o, "total_available", JSONValue(static_cast<int64_t>(totalAvailable)));
    SetMember(o, "query", JSONValue(query));
    SetMember(o, "message", JSONValue(message));
    return JSONValue(std::move(o));
}

JSONValue ContextSavings::ToJSON() const {
    JSONValue::Object o;
    SetMember(o, "all_tools_tokens", JSONValue(static_cast<int64_t>(allToolsTokens)));
    SetMember(o, "gateway_only_tokens", JSONValue(static_cast<int64_t>(gatewayOnlyTokens)));
    SetMember(o, "typical_search_tokens", JSONValue(static_cast<int64_t>(typicalSearchTokens)));
    SetMember(o, "total_with_gateway", JSONValue(static_cast<int64_t>(totalWithGateway)));
    SetMember(o, "savings_percentage", JSONValue(savingsPercentage));
    return JSONValue(std::move(o));
}

GatewayTool::GatewayTool(const ToolRegistry& registry) : registry_(registry) {}

const ToolSchema& GatewayTool::Schema() {
    static const ToolSchema schema(
        kToolName,
        "Search Deepr capabilities by natural language query. "
        "Returns relevant tool schemas for research, experts, and agentic workflows. "
        "Use this to discover what Deepr can do before calling specific tools.",
        ParseJSON(R"({
            "type": "object",
            "properties": {
                "query": {
                    "type": "string",
                    "description": "Natural language description of desired capability"
                },
                "limit": {
                    "type": "integer",
                    "default": 3,
                    "minimum": 1,
                    "maximum": 10,
                    "description": "Maximum number of tools to return"
                }
            },
            "required": ["query"]
        })"),
        "discovery",
        "free");
    return schema;
}

JSONValue GatewayTool::GatewaySchema() {
    return Schema().ToMcpFormat();
}

GatewaySearchResult GatewayTool::Search(const std::string& query, int64_t limit) const {
    GatewaySearchResult result;
    result.totalAvailable = registry_.Count();
    if (query.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
        result.error = "Query cannot be empty";
        return result;
    }
    const int64_t clamped = std::clamp(limit, kMinLimit, kMaxLimit);
    result.query = query;
    result.tools = registry_.Search(query, static_cast<std::size_t>(clamped));
    result.message = hintMessage(result.tools.size(), query);
    LOG_DEBUG("GatewayTool: query='{}' limit={} matches={}", query, clamped, result.tools.size());
    return result;
}

GatewaySearchResult GatewayTool::SearchFromArguments(const JSONValue& arguments) const {
    const JSONValue* q = FindMember(arguments, "query");
    if (!q || !q->IsString()) {
        throw errors::RpcError(JSONRPCErrorCodes::InvalidParams, "deepr_tool_search requires a string 'query'");
    }
    int64_t limit = kDefaultLimit;
    if (const JSONValue* l = FindMember(arguments, "limit")) {
        auto parsed = GetIntMember(arguments, "limit");
        if (!parsed.has_value()) {
            if (!l->IsNull()) {
                throw errors::RpcError(JSONRPCErrorCodes::InvalidParams, "'limit' must be an integer");
            }
        } else {
            limit = *parsed;
        }
    }
    return Search(std::get<std::string>(q->value), limit);
}

ContextSavings GatewayTool::EstimateContextSavings() const {
    ContextSavings s;
    s.allToolsTokens = registry_.EstimateTokens();
    s.gatewayOnlyTokens = ToolRegistry::EstimateTokens({std::make_shared<const ToolSchema>(Schema())});
    s.typicalSearchTokens = ToolRegistry::EstimateTokens(registry_.Search("research", 3));
    s.totalWithGateway = s.gatewayOnlyTokens + s.typicalSearchTokens;
    const double all = static_cast<double>(s.allToolsTokens);
    const double savings = (all - static_cast<double>(s.totalWithGateway)) / std::max(all, 1.0);
    s.savingsPercentage = std::round(savings * 1000.0) / 10.0;
    return s;
}

} // namespace search
} // namespace deepr
