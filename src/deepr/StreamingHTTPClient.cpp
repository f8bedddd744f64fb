//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: src/deepr/StreamingHTTPClient.cpp
// Purpose: HTTP/HTTPS client for the streaming JSON-RPC endpoint using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "logging/Logger.h"
#include "deepr/JSONRPCTypes.h"
#include "deepr/StreamingHTTPClient.hpp"
#include "deepr/errors/Errors.h"

#include <openssl/ssl.h>

namespace deepr {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;
using errors::TransportError;

namespace {

struct HttpReply {
    unsigned status{0};
    std::string body;
};

std::string urlEncode(const std::string& s) {
    std::ostringstream oss;
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            const char* hex = "0123456789ABCDEF";
            oss << '%' << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string trimLine(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
    std::size_t start = 0;
    while (start < line.size() && (line[start] == ' ' || line[start] == '\t')) {
        ++start;
    }
    return line.substr(start);
}

} // namespace

class StreamingHTTPClient::Impl {
public:
    StreamingHTTPClient::Options opts;
    std::atomic<bool> connected{false};
    std::atomic<bool> subscribed{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx; // present when https
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;

    std::mutex handlerMutex;
    NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;

    // In-flight POSTs. A promise is fulfilled by whoever removes it from the map first: the POST completion
    // or Disconnect().
    using SendPromise = std::shared_ptr<std::promise<std::optional<Message>>>;
    std::mutex pendingMutex;
    std::unordered_map<std::uint64_t, SendPromise> pendingSends;
    std::uint64_t nextSendId{0};

    // I/O thread only: per-POST cancel hooks, and whether Disconnect() is tearing the session down.
    std::unordered_map<std::uint64_t, std::function<void()>> sendCancels;
    bool closing{false};

    // Push-channel state. cancelStream/streamStopRequested are only touched on the I/O thread.
    std::function<void()> cancelStream;
    bool streamStopRequested{false};
    std::mutex streamMutex;
    std::future<void> streamDone;

    explicit Impl(const StreamingHTTPClient::Options& o) : opts(o) {
        if (opts.serverName.empty()) {
            opts.serverName = opts.host;
        }
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            if (!opts.caFile.empty() || !opts.caPath.empty()) {
                if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
            } else {
                boost::system::error_code ec;
                sslCtx->set_default_verify_paths(ec);
                if (ec) {
                    LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", ec.message());
                }
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        } else if (opts.scheme != "http") {
            throw std::invalid_argument("StreamingHTTPClient: unsupported scheme: " + opts.scheme);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        ITransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = errorHandler;
        }
        if (handler) { handler(msg); }
    }

    std::uint64_t trackSend(SendPromise promise) {
        std::lock_guard<std::mutex> lock(pendingMutex);
        const std::uint64_t id = ++nextSendId;
        pendingSends.emplace(id, std::move(promise));
        return id;
    }

    SendPromise claimSend(std::uint64_t id) {
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto it = pendingSends.find(id);
        if (it == pendingSends.end()) {
            return nullptr;
        }
        SendPromise promise = std::move(it->second);
        pendingSends.erase(it);
        return promise;
    }

    std::size_t failPendingSends(const std::string& reason) {
        std::unordered_map<std::uint64_t, SendPromise> abandoned;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            abandoned.swap(pendingSends);
        }
        for (auto& [id, promise] : abandoned) {
            promise->set_exception(std::make_exception_ptr(
                TransportError(TransportError::Kind::SessionClosed, reason)));
        }
        return abandoned.size();
    }

    // Registers how to abort POST `id` at its current step; throws once the session is closing.
    void armCancel(std::uint64_t id, std::function<void()> cancel) {
        if (closing) {
            throw TransportError(TransportError::Kind::SessionClosed, "client disconnected");
        }
        sendCancels[id] = std::move(cancel);
    }

    void cancelAllSends() {
        closing = true;
        auto cancels = std::move(sendCancels);
        sendCancels.clear();
        for (auto& [id, cancel] : cancels) {
            if (cancel) { cancel(); }
        }
    }

    struct SendCancelScope {
        Impl& impl;
        std::uint64_t id;
        ~SendCancelScope() { impl.sendCancels.erase(id); }
    };

    std::string hostHeader() const {
        return opts.serverName + ":" + opts.port;
    }

    std::string streamTarget(const std::optional<std::string>& subscriberId) const {
        std::string target = (opts.path == "/" ? std::string() : opts.path) + "/stream";
        if (subscriberId.has_value() && !subscriberId->empty()) {
            target += "?subscriber_id=" + urlEncode(*subscriberId);
        }
        return target;
    }

    void prepareTls(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream) {
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), opts.serverName.c_str())) {
            setError("HTTPS: failed to set SNI hostname");
        }
        (void)::SSL_set1_host(stream.native_handle(), opts.serverName.c_str());
    }

    ////////////////////////////////////////////// POST //////////////////////////////////////////////

    template <class Stream>
    net::awaitable<HttpReply> exchange(Stream& stream, boost::beast::tcp_stream& transport, const std::string& body) {
        http::request<http::string_body> req{http::verb::post, opts.path, 11};
        req.set(http::field::host, hostHeader());
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.body() = body;
        req.prepare_payload();

        transport.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
        co_await http::async_write(stream, req, net::use_awaitable);
        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        transport.expires_never();

        HttpReply reply;
        reply.status = res.result_int();
        reply.body = std::move(res.body());
        co_return reply;
    }

    // Coroutine: POST JSON and return status plus body
    net::awaitable<HttpReply> coPostJson(std::uint64_t sendId, const std::string body) {
        SendCancelScope scope{*this, sendId};
        tcp::resolver resolver(co_await net::this_coro::executor);
        armCancel(sendId, [&resolver]() { resolver.cancel(); });
        auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);

        if (sslCtx) {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            armCancel(sendId, [&stream]() { boost::system::error_code ec; stream.next_layer().socket().close(ec); });
            prepareTls(stream);
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            HttpReply reply = co_await exchange(stream, stream.next_layer(), body);
            boost::system::error_code ec;
            stream.next_layer().socket().shutdown(tcp::socket::shutdown_both, ec);
            co_return reply;
        }

        boost::beast::tcp_stream stream(co_await net::this_coro::executor);
        armCancel(sendId, [&stream]() { boost::system::error_code ec; stream.socket().close(ec); });
        stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
        co_await stream.async_connect(results, net::use_awaitable);
        HttpReply reply = co_await exchange(stream, stream, body);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return reply;
    }

    /////////////////////////////////////////// Push channel ///////////////////////////////////////////

    void deliver(const std::string& line) {
        if (line.rfind("data: ", 0) != 0) {
            return; // comments (keepalive) and other SSE fields
        }
        JSONValue payload;
        try {
            payload = ParseJSON(line.substr(6));
        } catch (const JSONParseError& e) {
            LOG_WARN("StreamingHTTPClient: dropping malformed event: {}", e.what());
            return;
        }
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = notificationHandler;
        }
        if (!handler) {
            return;
        }
        try {
            handler(payload);
        } catch (const std::exception& e) {
            LOG_ERROR("StreamingHTTPClient: notification handler failed: {}", e.what());
            setError(std::string("StreamingHTTPClient notification handler error: ") + e.what());
        }
    }

    template <class Stream>
    net::awaitable<void> readEvents(Stream& stream, const std::string& target) {
        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, hostHeader());
        req.set(http::field::accept, "text/event-stream");
        req.set(http::field::cache_control, "no-cache");
        co_await http::async_write(stream, req, net::use_awaitable);

        boost::beast::flat_buffer buffer;
        http::response_parser<http::empty_body> parser;
        co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);
        const unsigned status = parser.get().result_int();
        if (status != 200) {
            throw TransportError(TransportError::Kind::Protocol,
                                 "push channel rejected with HTTP " + std::to_string(status));
        }
        LOG_DEBUG("StreamingHTTPClient: push channel open at {}", target);

        // The body is an unbounded event stream delimited by connection close; read it raw.
        std::string pending(static_cast<const char*>(buffer.data().data()), buffer.size());
        buffer.consume(buffer.size());
        char chunk[4096];
        for (;;) {
            std::size_t nl;
            while ((nl = pending.find('\n')) != std::string::npos) {
                std::string line = trimLine(pending.substr(0, nl));
                pending.erase(0, nl + 1);
                if (!line.empty()) {
                    deliver(line);
                }
            }
            const std::size_t n = co_await stream.async_read_some(net::buffer(chunk), net::use_awaitable);
            pending.append(chunk, n);
        }
    }

    net::awaitable<void> coStream(const std::string target) {
        streamStopRequested = false;
        try {
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);
            if (streamStopRequested) {
                co_return;
            }
            if (sslCtx) {
                boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
                cancelStream = [&stream]() { boost::system::error_code ec; stream.next_layer().socket().close(ec); };
                prepareTls(stream);
                stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
                co_await stream.next_layer().async_connect(results, net::use_awaitable);
                co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
                stream.next_layer().expires_never();
                if (!streamStopRequested) {
                    co_await readEvents(stream, target);
                }
            } else {
                boost::beast::tcp_stream stream(co_await net::this_coro::executor);
                cancelStream = [&stream]() { boost::system::error_code ec; stream.socket().close(ec); };
                stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
                co_await stream.async_connect(results, net::use_awaitable);
                stream.expires_never();
                if (!streamStopRequested) {
                    co_await readEvents(stream, target);
                }
            }
        } catch (const std::exception& e) {
            cancelStream = nullptr;
            if (streamStopRequested) {
                LOG_DEBUG("StreamingHTTPClient: push channel cancelled");
            } else {
                LOG_WARN("StreamingHTTPClient: push channel ended: {}", e.what());
                setError(std::string("StreamingHTTPClient push channel ended: ") + e.what());
            }
        }
        cancelStream = nullptr;
        co_return;
    }
};

StreamingHTTPClient::StreamingHTTPClient(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

StreamingHTTPClient::StreamingHTTPClient(const std::string& baseUrl, std::chrono::milliseconds timeout)
    : pImpl(nullptr) {
    Options opts = ParseBaseUrl(baseUrl);
    opts.connectTimeoutMs = static_cast<unsigned int>(timeout.count());
    opts.readTimeoutMs = static_cast<unsigned int>(timeout.count());
    pImpl = std::make_unique<Impl>(opts);
}

StreamingHTTPClient::~StreamingHTTPClient() {
    Disconnect();
}

StreamingHTTPClient::Options StreamingHTTPClient::ParseBaseUrl(const std::string& baseUrl) {
    Options parts;
    std::string url = baseUrl;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    }

    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = std::string("/");
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
    }

    if (!hostPort.empty() && hostPort.front() == '[') {
        auto rb = hostPort.find(']');
        if (rb == std::string::npos) {
            throw std::invalid_argument("StreamingHTTPClient: malformed URL: " + baseUrl);
        }
        parts.host = hostPort.substr(1, rb - 1);
        if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
            parts.port = hostPort.substr(rb + 2);
        } else {
            parts.port = parts.scheme == "https" ? "443" : "80";
        }
    } else {
        std::size_t colon = hostPort.rfind(':');
        if (colon == std::string::npos) {
            parts.host = hostPort;
            parts.port = parts.scheme == "https" ? "443" : "80";
        } else {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
        }
    }
    if (parts.host.empty()) {
        throw std::invalid_argument("StreamingHTTPClient: no host in URL: " + baseUrl);
    }
    parts.serverName = parts.host;
    return parts;
}

void StreamingHTTPClient::Connect() {
    FUNC_SCOPE();
    if (pImpl->connected.exchange(true)) {
        return;
    }
    pImpl->ioc.restart();
    pImpl->closing = false;
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("StreamingHTTPClient: I/O loop failed: {}", e.what());
            pImpl->setError(e.what());
        }
    });
    LOG_DEBUG("StreamingHTTPClient: connected to {}://{}:{}{}", pImpl->opts.scheme, pImpl->opts.host,
              pImpl->opts.port, pImpl->opts.path);
}

void StreamingHTTPClient::Disconnect() {
    FUNC_SCOPE();
    if (!pImpl->connected.load()) {
        return;
    }
    Unsubscribe();
    pImpl->connected.store(false);

    // Callers waiting on Send() learn about the disconnect now; the POSTs themselves are aborted on the
    // I/O thread and the loop drains before returning, so nothing is left queued for a later Connect().
    const std::size_t abandoned = pImpl->failPendingSends("Disconnected before the response arrived");
    net::post(pImpl->ioc, [impl = pImpl.get()]() { impl->cancelAllSends(); });
    if (pImpl->workGuard) {
        pImpl->workGuard->reset(); pImpl->workGuard.reset();
    }
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    // A Send() racing this call may have registered after the first sweep.
    const std::size_t late = pImpl->failPendingSends("Disconnected before the request was sent");
    LOG_DEBUG("StreamingHTTPClient: disconnected ({} requests abandoned)", abandoned + late);
}

bool StreamingHTTPClient::IsConnected() const {
    return pImpl->connected.load();
}

std::future<std::optional<Message>> StreamingHTTPClient::Send(const Message& message) {
    FUNC_SCOPE();
    if (!pImpl->connected.load()) {
        throw TransportError(TransportError::Kind::NotConnected, "Not connected. Call Connect() first.");
    }
    auto tracked = std::make_shared<std::promise<std::optional<Message>>>();
    auto fut = tracked->get_future();
    std::string payload = EncodeMessage(message);
    const std::uint64_t sendId = pImpl->trackSend(tracked);

    net::co_spawn(pImpl->ioc, pImpl->coPostJson(sendId, std::move(payload)),
        [impl = pImpl.get(), sendId](std::exception_ptr eptr, HttpReply reply) {
            auto promise = impl->claimSend(sendId);
            if (!promise) {
                return; // already failed by Disconnect()
            }
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const TransportError&) {
                    promise->set_exception(std::current_exception());
                } catch (const std::exception& e) {
                    LOG_WARN("StreamingHTTPClient: POST failed: {}", e.what());
                    promise->set_exception(std::make_exception_ptr(
                        TransportError(TransportError::Kind::Network, std::string("POST failed: ") + e.what())));
                }
                return;
            }
            if (reply.status == 204) {
                promise->set_value(std::nullopt);
                return;
            }
            try {
                promise->set_value(DecodeMessage(reply.body));
            } catch (const MessageDecodeError& e) {
                promise->set_exception(std::make_exception_ptr(TransportError(
                    TransportError::Kind::Protocol,
                    "HTTP " + std::to_string(reply.status) + " with undecodable body: " + e.what())));
            }
        });
    return fut;
}

void StreamingHTTPClient::OnNotification(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

void StreamingHTTPClient::Subscribe(const std::optional<std::string>& subscriberId) {
    FUNC_SCOPE();
    if (!pImpl->connected.load()) {
        throw TransportError(TransportError::Kind::NotConnected, "Not connected. Call Connect() first.");
    }
    Unsubscribe();

    auto done = std::make_shared<std::promise<void>>();
    {
        std::lock_guard<std::mutex> lock(pImpl->streamMutex);
        pImpl->streamDone = done->get_future();
    }
    pImpl->subscribed.store(true);
    net::co_spawn(pImpl->ioc, pImpl->coStream(pImpl->streamTarget(subscriberId)),
        [this, done](std::exception_ptr eptr) {
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    LOG_WARN("StreamingHTTPClient: push channel task failed: {}", e.what());
                }
            }
            pImpl->subscribed.store(false);
            done->set_value();
        });
}

void StreamingHTTPClient::Unsubscribe() {
    FUNC_SCOPE();
    std::future<void> done;
    {
        std::lock_guard<std::mutex> lock(pImpl->streamMutex);
        if (!pImpl->streamDone.valid()) {
            return;
        }
        done = std::move(pImpl->streamDone);
    }
    net::post(pImpl->ioc, [impl = pImpl.get()]() {
        impl->streamStopRequested = true;
        if (impl->cancelStream) {
            impl->cancelStream();
        }
    });
    if (done.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        LOG_WARN("StreamingHTTPClient: push channel did not stop within 5s");
    }
}

bool StreamingHTTPClient::IsSubscribed() const {
    return pImpl->subscribed.load();
}

void StreamingHTTPClient::SetErrorHandler(ITransport::ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

const StreamingHTTPClient::Options& StreamingHTTPClient::GetOptions() const {
    return pImpl->opts;
}

} // namespace deepr
