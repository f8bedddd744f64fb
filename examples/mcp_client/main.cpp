//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: main.cpp
// Purpose: deepr_mcp_client: talks to a streaming deepr_mcp_server, runs a gateway search and prints pushed
//          notifications
//==========================================================================================================

#include "logging/Logger.h"
#include "deepr/StreamingHTTPClient.hpp"
#include "deepr/ToolService.h"
#include "deepr/errors/Errors.h"
#include "deepr/search/GatewayTool.h"
#include "env/EnvVars.h"

#include <chrono>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>

using namespace deepr;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--url")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

static JSONValue objectOf(std::initializer_list<std::pair<const char*, JSONValue>> members) {
    JSONValue::Object o;
    for (const auto& [k, v] : members) {
        SetMember(o, k, v);
    }
    return JSONValue(std::move(o));
}

static bool printResponse(const char* label, const std::optional<Message>& response) {
    if (!response.has_value()) {
        LOG_INFO("{}: no content", label);
        return true;
    }
    if (response->IsError()) {
        LOG_ERROR("{} failed: [{}] {}", label, response->ErrorCode().value_or(0), response->ErrorMessage().value_or(""));
        return false;
    }
    std::cout << SerializeJSONValue(response->result.value_or(JSONValue())) << std::endl;
    return true;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevelFromString(GetEnvOrDefault("DEEPR_LOG_LEVEL", "INFO"));

    const std::string url = getArgValue(argc, argv, "--url")
        .value_or(GetEnvOrDefault("DEEPR_MCP_LISTEN", "http://127.0.0.1:8765/mcp"));
    const std::optional<std::string> query = getArgValue(argc, argv, "--query");
    const std::optional<std::string> subscriber = getArgValue(argc, argv, "--subscriber");
    const unsigned long waitMs = std::stoul(getArgValue(argc, argv, "--wait_ms").value_or("5000"));

    StreamingHTTPClient client(url);
    client.SetErrorHandler([](const std::string& err){ LOG_WARN("client: {}", err); });
    client.OnNotification([](const JSONValue& n) {
        std::cout << "notification: " << SerializeJSONValue(n) << std::endl;
    });
    client.Connect();

    int rc = 0;
    try {
        auto init = client.Send(Message::Request(int64_t{1}, Methods::Initialize, objectOf({
            {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
            {"clientInfo", objectOf({{"name", JSONValue("deepr_mcp_client")}, {"version", JSONValue("0.1.0")}})},
        }))).get();
        if (!printResponse("initialize", init)) {
            rc = 1;
        }
        (void)client.Send(Message::Notification(Methods::Initialized)).get();

        if (rc == 0 && query.has_value()) {
            auto found = client.Send(Message::Request(int64_t{2}, Methods::CallTool, objectOf({
                {"name", JSONValue(search::GatewayTool::kToolName)},
                {"arguments", objectOf({{"query", JSONValue(*query)}})},
            }))).get();
            if (!printResponse("tools/call", found)) {
                rc = 1;
            }
        }

        if (rc == 0 && subscriber.has_value()) {
            client.Subscribe(*subscriber);
            LOG_INFO("Listening for notifications as '{}' for {} ms", *subscriber, waitMs);
            std::this_thread::sleep_for(std::chrono::milliseconds(waitMs));
            client.Unsubscribe();
        }
    } catch (const errors::TransportError& e) {
        LOG_ERROR("Transport failure talking to {}: {}", url, e.what());
        rc = 1;
    }

    client.Disconnect();
    return rc;
}
