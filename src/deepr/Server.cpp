//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: Server.cpp
// Purpose: Method dispatch and the stdio server pairing
//==========================================================================================================

#include "deepr/Server.h"
#include "deepr/errors/Errors.h"
#include "logging/Logger.h"

namespace deepr {

Server::Server() {
    FUNC_SCOPE();
}

Server::~Server() {
    FUNC_SCOPE();
}

void Server::RegisterMethod(const std::string& method, MethodHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(mutex_);
    handlers_[method] = std::move(handler);
    LOG_DEBUG("Server: registered method {}", method);
}

bool Server::HasMethod(const std::string& method) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return handlers_.find(method) != handlers_.end();
}

std::vector<std::string> Server::MethodNames() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

std::optional<Message> Server::HandleMessage(const Message& message) {
    FUNC_SCOPE();
    if (!message.method.has_value()) {
        LOG_DEBUG("Server: ignoring inbound response id={}",
                  message.id ? JSONRPCIdToString(*message.id) : std::string("<none>"));
        return std::nullopt;
    }
    const std::string& method = *message.method;
    const bool isRequest = message.IsRequest();

    MethodHandler handler;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = handlers_.find(method);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        if (!isRequest) {
            LOG_DEBUG("Server: no handler for notification {}", method);
            return std::nullopt;
        }
        errors::McpError e;
        e.code = JSONRPCErrorCodes::MethodNotFound;
        e.message = "Method not found: " + method;
        return errors::makeErrorMessage(*message.id, e);
    }

    const JSONValue params = message.params.value_or(JSONValue{JSONValue::Object{}});
    try {
        JSONValue result = handler(params).get();
        if (!isRequest) {
            return std::nullopt;
        }
        return Message::Response(*message.id, std::move(result));
    } catch (const errors::RpcError& e) {
        LOG_WARN("Server: method {} failed with code {}: {}", method, e.Code(), e.what());
        if (!isRequest) return std::nullopt;
        return errors::makeErrorMessage(*message.id, e.ToMcpError());
    } catch (const std::exception& e) {
        LOG_ERROR("Server: method {} threw: {}", method, e.what());
        if (!isRequest) return std::nullopt;
        errors::McpError err;
        err.code = JSONRPCErrorCodes::InternalError;
        err.message = e.what();
        return errors::makeErrorMessage(*message.id, err);
    }
}

void Server::Attach(ITransport& transport) {
    transport.SetMessageHandler([this](const Message& m) { return this->HandleMessage(m); });
}

void Server::Attach(ITransportAcceptor& acceptor) {
    acceptor.SetMessageHandler([this](const Message& m) { return this->HandleMessage(m); });
}

//==========================================================================================================
// StdioServer
//==========================================================================================================
StdioServer::StdioServer()
    : server_(std::make_unique<Server>()), transport_(std::make_unique<StdioTransport>()) {
    server_->Attach(*transport_);
}

StdioServer::StdioServer(int inFd, int outFd)
    : server_(std::make_unique<Server>()), transport_(std::make_unique<StdioTransport>(inFd, outFd)) {
    server_->Attach(*transport_);
}

StdioServer::~StdioServer() {
    transport_->Stop().get();
}

void StdioServer::RegisterMethod(const std::string& method, Server::MethodHandler handler) {
    server_->RegisterMethod(method, std::move(handler));
}

void StdioServer::Run() {
    FUNC_SCOPE();
    transport_->Start().get();
    transport_->WaitUntilStopped();
    LOG_INFO("StdioServer: stopped");
}

void StdioServer::Stop() {
    transport_->Stop().get();
}

TransportStats StdioServer::GetStats() const {
    return transport_->GetStats();
}

} // namespace deepr
