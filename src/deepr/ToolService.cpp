//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: ToolService.cpp
// Purpose: MCP tool methods backed by the registry and the discovery gateway
//==========================================================================================================

#include "deepr/ToolService.h"

#include <future>
#include <stdexcept>
#include <utility>

#include "deepr/errors/Errors.h"
#include "deepr/version.h"
#include "logging/Logger.h"

namespace deepr {

namespace {

std::future<JSONValue> ready(JSONValue value) {
    std::promise<JSONValue> p;
    p.set_value(std::move(value));
    return p.get_future();
}

} // namespace

ToolService::ToolService(const search::ToolRegistry& registry, std::string serverName)
    : registry_(registry), gateway_(registry), serverName_(std::move(serverName)) {}

void ToolService::RegisterToolHandler(const std::string& toolName, ToolHandler handler) {
    if (toolName == search::GatewayTool::kToolName) {
        throw std::invalid_argument("ToolService: the gateway tool is built in");
    }
    if (!registry_.Get(toolName)) {
        throw std::invalid_argument("ToolService: tool is not registered: " + toolName);
    }
    std::lock_guard<std::mutex> lk(mutex_);
    handlers_[toolName] = std::move(handler);
    LOG_DEBUG("ToolService: handler bound for {}", toolName);
}

bool ToolService::HasToolHandler(const std::string& toolName) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return handlers_.find(toolName) != handlers_.end();
}

JSONValue ToolService::Initialize(const JSONValue& params) const {
    auto clientVersion = GetStringMember(params, "protocolVersion");
    const JSONValue* clientInfo = FindMember(params, "clientInfo");
    LOG_INFO("ToolService: initialize from {} (protocol {})",
             clientInfo ? GetStringMember(*clientInfo, "name").value_or("unknown") : std::string("unknown"),
             clientVersion.value_or("unspecified"));

    JSONValue::Object tools;
    SetMember(tools, "listChanged", JSONValue(false));
    JSONValue::Object capabilities;
    SetMember(capabilities, "tools", JSONValue(std::move(tools)));

    JSONValue::Object serverInfo;
    SetMember(serverInfo, "name", JSONValue(serverName_));
    SetMember(serverInfo, "version", JSONValue(getVersionString()));

    JSONValue::Object result;
    SetMember(result, "protocolVersion", JSONValue(PROTOCOL_VERSION));
    SetMember(result, "capabilities", JSONValue(std::move(capabilities)));
    SetMember(result, "serverInfo", JSONValue(std::move(serverInfo)));
    SetMember(result, "instructions", JSONValue(
        std::string("Call ") + search::GatewayTool::kToolName +
        " with a short description of the task to discover the tools available for it."));
    return JSONValue(std::move(result));
}

JSONValue ToolService::ListTools() const {
    JSONValue::Array tools;
    tools.push_back(std::make_shared<JSONValue>(search::GatewayTool::GatewaySchema()));
    JSONValue::Object result;
    SetMember(result, "tools", JSONValue(std::move(tools)));
    return JSONValue(std::move(result));
}

JSONValue ToolService::CallTool(const JSONValue& params) const {
    auto name = GetStringMember(params, "name");
    if (!name.has_value() || name->empty()) {
        throw errors::RpcError(JSONRPCErrorCodes::InvalidParams, "tools/call requires a string 'name'");
    }
    JSONValue arguments{JSONValue::Object{}};
    if (const JSONValue* args = FindMember(params, "arguments")) {
        if (args->IsObject()) {
            arguments = *args;
        } else if (!args->IsNull()) {
            throw errors::RpcError(JSONRPCErrorCodes::InvalidParams, "tools/call 'arguments' must be an object");
        }
    }

    if (*name == search::GatewayTool::kToolName) {
        const search::GatewaySearchResult found = gateway_.SearchFromArguments(arguments);
        LOG_DEBUG("ToolService: gateway query '{}' returned {} tools", found.query, found.Count());
        return MakeToolResult(found.ToJSON(), found.IsError());
    }

    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = handlers_.find(*name);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        throw errors::RpcError(JSONRPCErrorCodes::ToolNotFound, "Tool not found: " + *name);
    }

    try {
        return MakeToolResult(handler(arguments), false);
    } catch (const errors::RpcError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_WARN("ToolService: tool {} failed: {}", *name, e.what());
        JSONValue::Object err;
        SetMember(err, "error", JSONValue(std::string(e.what())));
        return MakeToolResult(JSONValue(std::move(err)), true);
    }
}

JSONValue ToolService::MakeToolResult(const JSONValue& structured, bool isError) {
    JSONValue::Object text;
    SetMember(text, "type", JSONValue("text"));
    SetMember(text, "text", JSONValue(SerializeJSONValue(structured)));
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(JSONValue(std::move(text))));

    JSONValue::Object result;
    SetMember(result, "content", JSONValue(std::move(content)));
    SetMember(result, "structuredContent", structured);
    SetMember(result, "isError", JSONValue(isError));
    return JSONValue(std::move(result));
}

void RegisterGatewayMethods(Server& server, ToolService& service) {
    server.RegisterMethod(Methods::Initialize, [&service](const JSONValue& params) {
        return ready(service.Initialize(params));
    });
    server.RegisterMethod(Methods::Initialized, [](const JSONValue&) {
        LOG_DEBUG("ToolService: client initialized");
        return ready(JSONValue(JSONValue::Object{}));
    });
    server.RegisterMethod(Methods::Ping, [](const JSONValue&) {
        return ready(JSONValue(JSONValue::Object{}));
    });
    server.RegisterMethod(Methods::ListTools, [&service](const JSONValue&) {
        return ready(service.ListTools());
    });
    server.RegisterMethod(Methods::CallTool, [&service](const JSONValue& params) {
        return ready(service.CallTool(params));
    });
}

} // namespace deepr
