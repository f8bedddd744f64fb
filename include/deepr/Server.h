//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: Server.h
// Purpose: Method dispatch server binding JSON-RPC method names to collaborator handlers
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "deepr/JSONRPCTypes.h"
#include "deepr/Transport.h"
#include "deepr/StdioTransport.hpp"

namespace deepr {

//==========================================================================================================
// Server
// Purpose: Maps method names to asynchronous handlers and turns inbound Messages into responses.
// Notes:
//   - Unknown methods answer -32601 "Method not found: <name>".
//   - A handler throwing errors::RpcError answers with that error's code; any other exception answers -32603
//     with the exception text.
//   - Notifications run their handler (when one is registered) but never produce a response.
//   - Inbound responses are ignored.
//==========================================================================================================
class Server {
public:
    // Handler receives the request params (an empty object when params are absent).
    using MethodHandler = std::function<std::future<JSONValue>(const JSONValue& params)>;

    Server();
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //==========================================================================================================
    // RegisterMethod
    // Purpose: Binds a handler to a method name, replacing any previous binding.
    // Args:
    //   method: JSON-RPC method name.
    //   handler: Callable returning a future for the result payload.
    //==========================================================================================================
    void RegisterMethod(const std::string& method, MethodHandler handler);

    bool HasMethod(const std::string& method) const;
    std::vector<std::string> MethodNames() const;

    //==========================================================================================================
    // HandleMessage
    // Purpose: Dispatches one inbound Message.
    // Returns:
    //   The response for requests; std::nullopt for notifications and responses.
    //==========================================================================================================
    std::optional<Message> HandleMessage(const Message& message);

    // Installs HandleMessage as the transport's message handler.
    void Attach(ITransport& transport);
    void Attach(ITransportAcceptor& acceptor);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, MethodHandler> handlers_;
};

//==========================================================================================================
// StdioServer
// Purpose: Convenience pairing of a StdioTransport and a Server.
//==========================================================================================================
class StdioServer {
public:
    StdioServer();
    StdioServer(int inFd, int outFd);
    ~StdioServer();

    void RegisterMethod(const std::string& method, Server::MethodHandler handler);

    // Starts the transport and blocks until end of input or Stop().
    void Run();
    void Stop();

    TransportStats GetStats() const;
    Server& Dispatcher() { return *server_; }
    ITransport& Transport() { return *transport_; }

private:
    std::unique_ptr<Server> server_;
    std::unique_ptr<StdioTransport> transport_;
};

} // namespace deepr
