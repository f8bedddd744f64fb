//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: GatewayTool.h
// Purpose: The single discovery tool advertised by default; fronts ToolRegistry search
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "deepr/JSONRPCTypes.h"
#include "deepr/search/ToolRegistry.h"

namespace deepr {
namespace search {

//==========================================================================================================
// GatewaySearchResult
// Purpose: Outcome of GatewayTool::Search. An empty query yields error set and no tools; this is a normal
//          return value, never an exception.
//==========================================================================================================
struct GatewaySearchResult {
    std::vector<ToolPtr> tools;
    std::size_t totalAvailable{0};
    std::string query;
    std::string message;
    std::optional<std::string> error;

    bool IsError() const { return error.has_value(); }
    std::size_t Count() const { return tools.size(); }

    //==========================================================================================================
    // ToJSON
    // Returns:
    //   Error:   { error, tools: [], total_available }
    //   Success: { tools: [{name, description, inputSchema, category, cost_tier}], count, total_available,
    //              query, message }
    //==========================================================================================================
    JSONValue ToJSON() const;
};

// Token estimates comparing the full catalog against the gateway plus one typical search.
struct ContextSavings {
    std::size_t allToolsTokens{0};
    std::size_t gatewayOnlyTokens{0};
    std::size_t typicalSearchTokens{0};
    std::size_t totalWithGateway{0};
    double savingsPercentage{0.0};

    JSONValue ToJSON() const;
};

//==========================================================================================================
// GatewayTool
// Purpose: Discovery entry point. The registry is borrowed and must outlive the gateway.
//==========================================================================================================
class GatewayTool {
public:
    static constexpr const char* kToolName = "deepr_tool_search";
    static constexpr int64_t kDefaultLimit = 3;
    static constexpr int64_t kMinLimit = 1;
    static constexpr int64_t kMaxLimit = 10;

    explicit GatewayTool(const ToolRegistry& registry);

    // The constant descriptor of the gateway tool itself.
    static const ToolSchema& Schema();
    // Schema().ToMcpFormat()
    static JSONValue GatewaySchema();

    //==========================================================================================================
    // Search
    // Purpose: Rejects a blank query, clamps limit to [kMinLimit, kMaxLimit], and returns ranked tools with a
    //          hint message.
    //==========================================================================================================
    GatewaySearchResult Search(const std::string& query, int64_t limit = kDefaultLimit) const;

    //==========================================================================================================
    // SearchFromArguments
    // Purpose: Tool-call entry: reads "query" (string) and optional "limit" (integer) from call arguments.
    // Throws:
    //   errors::RpcError(InvalidParams) when query is missing or not a string, or limit is not an integer.
    //==========================================================================================================
    GatewaySearchResult SearchFromArguments(const JSONValue& arguments) const;

    ContextSavings EstimateContextSavings() const;

private:
    const ToolRegistry& registry_;
};

} // namespace search
} // namespace deepr
