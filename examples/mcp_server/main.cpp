//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: main.cpp
// Purpose: deepr_mcp_server: serves the default tool registry through the discovery gateway over stdio or
//          the streaming HTTP transport
//==========================================================================================================

#include "logging/Logger.h"
#include "deepr/Server.h"
#include "deepr/StdioTransport.hpp"
#include "deepr/StreamingHTTPServer.hpp"
#include "deepr/ToolService.h"
#include "deepr/search/ToolRegistry.h"
#include "deepr/version.h"
#include "env/EnvVars.h"

#include <csignal>
#include <cstddef>
#include <optional>
#include <pthread.h>
#include <string>

using namespace deepr;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--transport")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static int runStdio(Server& server) {
    StdioTransportFactory tFactory;
    auto transport = tFactory.CreateTransport("stdio");
    server.Attach(*transport);
    transport->SetErrorHandler([](const std::string& err) {
        LOG_WARN("stdio transport: {}", err);
    });
    transport->Start().get();
    static_cast<StdioTransport&>(*transport).WaitUntilStopped();
    const TransportStats stats = transport->GetStats();
    LOG_INFO("Server stopped: received={} sent={} errors={}", stats.messagesReceived, stats.messagesSent, stats.errors);
    return 0;
}

static int runHttp(Server& server, const std::string& listen) {
    StreamingHTTPServer::Options opts = StreamingHTTPServerFactory::ParseOptions(listen);
    // Environment fills in what the listen URL leaves unspecified.
    if (listen.find("keepalive_ms=") == std::string::npos) {
        opts.keepaliveInterval = std::chrono::milliseconds(GetEnvUnsignedOrDefault("DEEPR_MCP_KEEPALIVE_MS", 30000));
    }
    if (listen.find("queue=") == std::string::npos) {
        opts.queueCapacity = GetEnvUnsignedOrDefault("DEEPR_MCP_QUEUE_CAPACITY", 1024);
    }

    // Block termination signals before any thread starts so sigwait below receives them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    StreamingHTTPServer acceptor(opts);
    server.Attach(acceptor);
    acceptor.SetErrorHandler([](const std::string& e) {
        LOG_ERROR("StreamingHTTPServer error: {}", e);
    });
    try {
        acceptor.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start streaming transport on {}: {}", listen, e.what());
        return 1;
    }
    LOG_INFO("Serving MCP at {} (stream: {}/stream, health: {}/health)", acceptor.Url(), acceptor.Url(), acceptor.Url());

    int sig = 0;
    sigwait(&signals, &sig);
    LOG_INFO("Received signal {}; shutting down", sig);
    acceptor.Stop().get();
    const TransportStats stats = acceptor.GetStats();
    LOG_INFO("Server stopped: requests={} responses={} notifications={} errors={}",
             stats.requestsReceived, stats.responsesSent, stats.notificationsSent, stats.errors);
    return 0;
}

int main(int argc, char** argv) {
    Logger::setLogLevelFromString(GetEnvOrDefault("DEEPR_LOG_LEVEL", "INFO"));
    const std::string logFile = GetEnvOrDefault("DEEPR_LOG_FILE", "");
    if (!logFile.empty()) {
        Logger::setLogFile(logFile);
    }
    std::signal(SIGPIPE, SIG_IGN);

    const std::string transportKind = getArgValue(argc, argv, "--transport")
        .value_or(GetEnvOrDefault("DEEPR_MCP_TRANSPORT", "stdio"));
    if (transportKind == "stdio") {
        // stdout carries JSON-RPC lines from here on
        Logger::setStdioMode(true);
    }
    FUNC_SCOPE();

    auto registry = search::CreateDefaultRegistry();
    ToolService service(*registry);
    Server server;
    RegisterGatewayMethods(server, service);

    const search::ContextSavings savings = service.Gateway().EstimateContextSavings();
    LOG_INFO("deepr-mcp {}: {} tools behind {} (~{}% context saved)", getVersionString(), registry->Count(),
             search::GatewayTool::kToolName, savings.savingsPercentage);

    LOG_INFO("Server starting with transport={}", transportKind);

    if (transportKind == "stdio") {
        return runStdio(server);
    }
    if (transportKind == "http") {
        std::string listen = getArgValue(argc, argv, "--listen")
            .value_or(GetEnvOrDefault("DEEPR_MCP_LISTEN", "http://127.0.0.1:8765/mcp"));
        return runHttp(server, listen);
    }
    LOG_ERROR("Unknown --transport option: {} (expected stdio|http)", transportKind);
    return 2;
}
