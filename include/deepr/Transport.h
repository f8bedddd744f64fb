//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: Transport.h
// Purpose: Transport interfaces, shared statistics, and factories for JSON-RPC message exchange.
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "deepr/JSONRPCTypes.h"

namespace deepr {

//==========================================================================================================
// TransportStats
// Purpose: Point-in-time snapshot of a transport's counters.
// Fields:
//   messagesSent/messagesReceived: Every encoded Message written or successfully read.
//   requestsReceived: Inbound messages on the network POST endpoint.
//   responsesSent: POST responses carrying a body.
//   notificationsSent: Server-push frames successfully queued for subscribers.
//   bytesSent/bytesReceived: Payload bytes, framing excluded.
//   errors: Framing, handler, and write failures.
//   activeStreams: Currently open push subscriptions (network transport only).
//   startedAt: Time the transport instance was created.
//==========================================================================================================
struct TransportStats {
    uint64_t messagesSent{0};
    uint64_t messagesReceived{0};
    uint64_t requestsReceived{0};
    uint64_t responsesSent{0};
    uint64_t notificationsSent{0};
    uint64_t bytesSent{0};
    uint64_t bytesReceived{0};
    uint64_t errors{0};
    uint64_t activeStreams{0};
    std::chrono::system_clock::time_point startedAt{};

    double UptimeSeconds() const {
        auto elapsed = std::chrono::system_clock::now() - startedAt;
        return std::chrono::duration<double>(elapsed).count();
    }
};

//==========================================================================================================
// TransportCounters
// Purpose: Increment-only counters owned by one transport instance. Writers are the transport's own
//          I/O contexts; Snapshot() may be called from any thread.
//==========================================================================================================
class TransportCounters {
public:
    TransportCounters() : startedAt_(std::chrono::system_clock::now()) {}

    void RecordSent(std::size_t bytes) {
        messagesSent_.fetch_add(1, std::memory_order_relaxed);
        bytesSent_.fetch_add(bytes, std::memory_order_relaxed);
    }
    void RecordReceived(std::size_t bytes) {
        messagesReceived_.fetch_add(1, std::memory_order_relaxed);
        bytesReceived_.fetch_add(bytes, std::memory_order_relaxed);
    }
    void RecordRequest() { requestsReceived_.fetch_add(1, std::memory_order_relaxed); }
    void RecordResponse() { responsesSent_.fetch_add(1, std::memory_order_relaxed); }
    void RecordNotification() { notificationsSent_.fetch_add(1, std::memory_order_relaxed); }
    void RecordError() { errors_.fetch_add(1, std::memory_order_relaxed); }
    void StreamOpened() { activeStreams_.fetch_add(1, std::memory_order_relaxed); }
    void StreamClosed() { activeStreams_.fetch_sub(1, std::memory_order_relaxed); }

    uint64_t ActiveStreams() const { return activeStreams_.load(std::memory_order_relaxed); }

    TransportStats Snapshot() const {
        TransportStats s;
        s.messagesSent = messagesSent_.load(std::memory_order_relaxed);
        s.messagesReceived = messagesReceived_.load(std::memory_order_relaxed);
        s.requestsReceived = requestsReceived_.load(std::memory_order_relaxed);
        s.responsesSent = responsesSent_.load(std::memory_order_relaxed);
        s.notificationsSent = notificationsSent_.load(std::memory_order_relaxed);
        s.bytesSent = bytesSent_.load(std::memory_order_relaxed);
        s.bytesReceived = bytesReceived_.load(std::memory_order_relaxed);
        s.errors = errors_.load(std::memory_order_relaxed);
        s.activeStreams = activeStreams_.load(std::memory_order_relaxed);
        s.startedAt = startedAt_;
        return s;
    }

private:
    std::atomic<uint64_t> messagesSent_{0};
    std::atomic<uint64_t> messagesReceived_{0};
    std::atomic<uint64_t> requestsReceived_{0};
    std::atomic<uint64_t> responsesSent_{0};
    std::atomic<uint64_t> notificationsSent_{0};
    std::atomic<uint64_t> bytesSent_{0};
    std::atomic<uint64_t> bytesReceived_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<uint64_t> activeStreams_{0};
    std::chrono::system_clock::time_point startedAt_;
};

//==========================================================================================================
// ITransport
// Purpose: A single bidirectional message channel (one peer).
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    //==========================================================================================================
    // Handler invoked for every decoded inbound Message. Returning a Message sends it back to the peer;
    // returning std::nullopt sends nothing. Throwing produces an internal-error response when the inbound
    // Message carried an id.
    //==========================================================================================================
    using MessageHandler = std::function<std::optional<Message>(const Message&)>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the read loop. Idempotent while running.
    // Returns:
    //   A future that completes when the loop is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the read loop and waits for it to exit.
    // Returns:
    //   A future that completes when the transport is stopped.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    virtual bool IsRunning() const = 0;

    // True for transports bound to the local process (stdio); false for network transports.
    virtual bool IsLocal() const = 0;

    /////////////////////////////////////////// Messaging ///////////////////////////////////////////
    //==========================================================================================================
    // Encodes and writes one Message. Safe to call concurrently with the read loop.
    // Returns:
    //   true when the full frame was written; false on write failure (counted and reported).
    //==========================================================================================================
    virtual bool Send(const Message& message) = 0;

    virtual void SetMessageHandler(MessageHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    virtual TransportStats GetStats() const = 0;
};

//==========================================================================================================
// ITransportAcceptor
// Purpose: Server-side network endpoint that accepts many peers and dispatches each inbound Message to a
//          single handler. Implementations bind in Start() and tear down every session in Stop().
//==========================================================================================================
class ITransportAcceptor {
public:
    virtual ~ITransportAcceptor() = default;

    virtual std::future<void> Start() = 0;
    virtual std::future<void> Stop() = 0;
    virtual bool IsRunning() const = 0;
    virtual bool IsLocal() const = 0;

    virtual void SetMessageHandler(ITransport::MessageHandler handler) = 0;
    virtual void SetErrorHandler(ITransport::ErrorHandler handler) = 0;

    virtual TransportStats GetStats() const = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

//==========================================================================================================
// Transport acceptor factory interface
// Purpose: Factory for creating server-side acceptors from configuration strings.
//==========================================================================================================
class ITransportAcceptorFactory {
public:
    virtual ~ITransportAcceptorFactory() = default;

    //==========================================================================================================
    // Creates a server-side acceptor instance using the provided configuration.
    // Args:
    //   config: URI-style configuration, e.g. "http://0.0.0.0:8765/mcp?keepalive_ms=15000".
    //==========================================================================================================
    virtual std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) = 0;
};

} // namespace deepr
