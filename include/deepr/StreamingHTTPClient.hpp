//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: StreamingHTTPClient.hpp
// Purpose: Coroutine-based client for StreamingHTTPServer: POST exchange plus a background server-sent-event
//          subscription, using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "deepr/JSONRPCTypes.h"
#include "deepr/Transport.h"

namespace deepr {

//==========================================================================================================
// StreamingHTTPClient
// Purpose: Talks to a remote streaming endpoint. Send() performs one POST per Message; Subscribe() keeps a
//          GET <path>/stream connection open on the I/O thread and hands every "data:" event to the
//          notification handler.
// Notes:
//   - Send() and Subscribe() throw errors::TransportError(NotConnected) before Connect().
//   - Network failures surface as errors::TransportError(Network) through the returned future.
//   - Notification handlers run on the client's I/O thread.
//==========================================================================================================
class StreamingHTTPClient {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   scheme: "http" or "https"
    //   host/port: Server address
    //   path: Base path of the server routes (POST target; "/stream" is appended for the push channel)
    //   serverName: TLS SNI and hostname verification name (defaults to host)
    //   caFile/caPath: Optional trust store for https
    //   connectTimeoutMs: Connect timeout in milliseconds
    //   readTimeoutMs: Per-POST request/response timeout in milliseconds (not applied to the push channel)
    //==========================================================================================================
    struct Options {
        std::string scheme{"http"};
        std::string host{"127.0.0.1"};
        std::string port{"8765"};
        std::string path{"/mcp"};
        std::string serverName;
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
    };

    using NotificationHandler = std::function<void(const JSONValue& notification)>;

    explicit StreamingHTTPClient(const Options& opts);

    //==========================================================================================================
    // Builds options from a base URL such as "http://127.0.0.1:8765/mcp". Trailing slashes are dropped.
    // Args:
    //   baseUrl: Server URL including the base path.
    //   timeout: Applied to both connect and read timeouts.
    //==========================================================================================================
    explicit StreamingHTTPClient(const std::string& baseUrl,
                                 std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
    ~StreamingHTTPClient();

    StreamingHTTPClient(const StreamingHTTPClient&) = delete;
    StreamingHTTPClient& operator=(const StreamingHTTPClient&) = delete;

    static Options ParseBaseUrl(const std::string& baseUrl);

    ////////////////////////////////////////// Session //////////////////////////////////////////
    // Starts the I/O thread. Idempotent.
    void Connect();

    // Ends any subscription (waiting for it to finish), then stops the I/O thread. Idempotent.
    void Disconnect();

    bool IsConnected() const;

    ///////////////////////////////////////// Exchange /////////////////////////////////////////
    //==========================================================================================================
    // Send
    // Purpose: POSTs one encoded Message.
    // Returns:
    //   Future holding the decoded response, or std::nullopt when the server answered 204.
    // Throws:
    //   errors::TransportError(NotConnected) when called before Connect().
    //==========================================================================================================
    std::future<std::optional<Message>> Send(const Message& message);

    ////////////////////////////////////////// Push //////////////////////////////////////////
    void OnNotification(NotificationHandler handler);

    //==========================================================================================================
    // Subscribe
    // Purpose: Opens the push channel in the background, replacing any previous subscription.
    // Args:
    //   subscriberId: Identifier the server files this subscriber under; generated server-side when absent.
    // Throws:
    //   errors::TransportError(NotConnected) when called before Connect().
    //==========================================================================================================
    void Subscribe(const std::optional<std::string>& subscriberId = std::nullopt);

    // Cancels the push channel and waits for its task to finish. No-op without a subscription.
    void Unsubscribe();

    // True while the background push-channel task is running.
    bool IsSubscribed() const;

    void SetErrorHandler(ITransport::ErrorHandler handler);

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace deepr
