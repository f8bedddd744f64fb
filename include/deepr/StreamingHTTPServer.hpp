//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: StreamingHTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS JSON-RPC endpoint with a server-sent-event push channel, built on
//          Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "deepr/JSONRPCTypes.h"
#include "deepr/Transport.h"

namespace deepr {

//==========================================================================================================
// StreamingHTTPServer
// Purpose: Network acceptor serving three routes under one base path:
//            POST <path>                          one encoded Message in, one response out (204 when none)
//            GET  <path>/stream?subscriber_id=<id> long-lived text/event-stream push channel
//            GET  <path>/health                   {"status","uptime_seconds","active_streams"}
// Notes:
//   - Each subscriber owns a bounded queue that lives exactly as long as its stream connection.
//   - Idle streams receive ": keepalive" comment frames every keepaliveInterval.
//   - Stop() pushes a close sentinel into every queue before the listener goes away.
//==========================================================================================================
class StreamingHTTPServer : public ITransportAcceptor {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8765, "0" binds an ephemeral port)
    //   path: Base path for all routes (default: /mcp)
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   keepaliveInterval: Idle time before a keepalive frame is written to a stream
    //   queueCapacity: Maximum pending frames per subscriber
    //   maxBodyBytes: Upper bound for one POST body
    //   handlerThreads: Worker threads running the message handler off the I/O thread
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8765"};
        std::string path{"/mcp"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::chrono::milliseconds keepaliveInterval{30000};
        std::size_t queueCapacity{1024};
        std::size_t maxBodyBytes{4u * 1024u * 1024u};
        std::size_t handlerThreads{4};
    };

    StreamingHTTPServer();
    explicit StreamingHTTPServer(const Options& opts);
    ~StreamingHTTPServer() override;

    StreamingHTTPServer(const StreamingHTTPServer&) = delete;
    StreamingHTTPServer& operator=(const StreamingHTTPServer&) = delete;

    //==========================================================================================================
    // Binds the listener on the calling thread and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the listener is bound. Bind failures are stored in the future.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes every subscriber stream, closes the listener, stops the I/O context and joins its thread.
    //==========================================================================================================
    std::future<void> Stop() override;

    bool IsRunning() const override;
    bool IsLocal() const override { return false; }

    void SetMessageHandler(ITransport::MessageHandler handler) override;
    void SetErrorHandler(ITransport::ErrorHandler handler) override;
    TransportStats GetStats() const override;

    ///////////////////////////////////////////// Push /////////////////////////////////////////////
    //==========================================================================================================
    // Broadcast
    // Purpose: Queues one notification frame for every live subscriber.
    // Returns:
    //   Number of subscribers the frame was queued for. Subscribers with a full queue are skipped.
    //==========================================================================================================
    std::size_t Broadcast(const JSONValue& notification);
    std::size_t Broadcast(const Message& notification);

    //==========================================================================================================
    // SendTo
    // Purpose: Queues one notification frame for a single subscriber.
    // Returns:
    //   true when the subscriber exists and the frame was queued.
    //==========================================================================================================
    bool SendTo(const std::string& subscriberId, const JSONValue& notification);
    bool SendTo(const std::string& subscriberId, const Message& notification);

    // Ids of the currently connected subscribers.
    std::vector<std::string> SubscriberIds() const;

    ////////////////////////////////////////// Addressing //////////////////////////////////////////
    // <scheme>://<address>:<port><path>, using the bound port once started.
    std::string Url() const;

    // Port the listener is bound to; 0 before Start().
    uint16_t BoundPort() const;

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StreamingHTTPServerFactory
// Purpose: Creates streaming acceptors from a URI-style configuration string:
//            - "http://<address>:<port>/<path>" (e.g., http://127.0.0.1:0/mcp)
//            - "https://<address>:<port>/<path>?cert=<pem>&key=<pem>"
//          Query parameters keepalive_ms and queue override the keepalive interval and per-subscriber
//          queue capacity. Unknown parameters are ignored. If scheme is omitted, defaults to http.
//==========================================================================================================
class StreamingHTTPServerFactory : public ITransportAcceptorFactory {
public:
    std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) override;

    // Same parsing as CreateTransportAcceptor, exposed for callers that need the options directly.
    static StreamingHTTPServer::Options ParseOptions(const std::string& config);
};

} // namespace deepr
