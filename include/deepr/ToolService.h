//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: ToolService.h
// Purpose: MCP protocol surface over the tool registry: initialize, ping, tools/list and tools/call, with
//          the discovery gateway as the only advertised tool.
//==========================================================================================================
#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "deepr/JSONRPCTypes.h"
#include "deepr/Server.h"
#include "deepr/search/GatewayTool.h"
#include "deepr/search/ToolRegistry.h"

namespace deepr {

// Protocol version reported by initialize.
constexpr const char* PROTOCOL_VERSION = "2025-11-25";

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

//==========================================================================================================
// ToolService
// Purpose: Answers the MCP tool methods. tools/list advertises only the gateway; tools/call routes the
//          gateway name to the gateway and every other name to a handler registered by a collaborator.
// Notes:
//   - The registry is borrowed and must outlive the service.
//   - Tool execution failures are reported inside the result (isError=true); unknown tools and malformed
//     call params are JSON-RPC errors.
//==========================================================================================================
class ToolService {
public:
    // Receives the call arguments (an empty object when absent) and returns the structured result.
    using ToolHandler = std::function<JSONValue(const JSONValue& arguments)>;

    explicit ToolService(const search::ToolRegistry& registry, std::string serverName = "deepr-mcp");

    //==========================================================================================================
    // RegisterToolHandler
    // Purpose: Binds the executor for one registered tool, replacing any previous binding.
    // Throws:
    //   std::invalid_argument when the tool is not in the registry or is the gateway itself.
    //==========================================================================================================
    void RegisterToolHandler(const std::string& toolName, ToolHandler handler);
    bool HasToolHandler(const std::string& toolName) const;

    JSONValue Initialize(const JSONValue& params) const;
    JSONValue ListTools() const;

    //==========================================================================================================
    // CallTool
    // Purpose: Executes a tools/call request ({"name": string, "arguments"?: object}).
    // Throws:
    //   errors::RpcError(InvalidParams) on malformed params; errors::RpcError(ToolNotFound) for unknown names.
    //==========================================================================================================
    JSONValue CallTool(const JSONValue& params) const;

    const search::GatewayTool& Gateway() const { return gateway_; }

    // {content:[{type:"text", text:<serialized structured>}], structuredContent, isError}
    static JSONValue MakeToolResult(const JSONValue& structured, bool isError);

private:
    const search::ToolRegistry& registry_;
    search::GatewayTool gateway_;
    std::string serverName_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolHandler> handlers_;
};

//==========================================================================================================
// RegisterGatewayMethods
// Purpose: Registers initialize, notifications/initialized, ping, tools/list and tools/call on a dispatcher.
//          The service must outlive the server.
//==========================================================================================================
void RegisterGatewayMethods(Server& server, ToolService& service);

} // namespace deepr
