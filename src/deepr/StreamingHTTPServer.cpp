//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: src/deepr/StreamingHTTPServer.cpp
// Purpose: HTTP/HTTPS JSON-RPC endpoint plus server-sent-event push channel using Boost.Beast
//          (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "logging/Logger.h"
#include "deepr/JSONRPCTypes.h"
#include "deepr/StreamingHTTPServer.hpp"

#include <openssl/ssl.h>

namespace deepr {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kKeepaliveFrame = ": keepalive\n\n";

// One connected push-channel client. frames/closed are guarded by mutex; timer is only touched on the
// I/O thread.
struct Subscriber {
    Subscriber(std::string subscriberId, net::io_context& ioc)
        : id(std::move(subscriberId)), timer(ioc) {}

    std::string id;
    std::mutex mutex;
    std::deque<std::string> frames;
    bool closed{false};
    net::steady_timer timer;
};

std::string percentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < in.size() &&
                   std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string queryParam(const std::string& query, const std::string& name) {
    std::stringstream ss(query);
    std::string kv;
    while (std::getline(ss, kv, '&')) {
        auto eq = kv.find('=');
        std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
        if (percentDecode(key) == name) {
            return (eq == std::string::npos) ? std::string() : percentDecode(kv.substr(eq + 1));
        }
    }
    return std::string();
}

// Normalizes the configured base path: leading slash, no trailing slash (except for "/").
std::string normalizeBasePath(std::string path) {
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::string encodeFrame(const JSONValue& notification) {
    return "data: " + SerializeJSONValue(notification) + "\n\n";
}

net::awaitable<void> closeStream(boost::beast::tcp_stream& stream) {
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream.socket().close(ec);
    co_return;
}

net::awaitable<void> closeStream(ssl::stream<tcp::socket>& stream) {
    boost::system::error_code ec;
    co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    stream.lowest_layer().close(ec);
}

// Parameters are copied into the coroutine frame, so the handler and message outlive the spawn call.
net::awaitable<std::optional<Message>> runHandler(ITransport::MessageHandler handler, Message inbound) {
    co_return handler(inbound);
}

} // namespace

class StreamingHTTPServer::Impl {
public:
    StreamingHTTPServer::Options opts;
    std::string rpcPath;
    std::string streamPath;
    std::string healthPath;

    std::atomic<bool> running{false};
    std::atomic<uint16_t> boundPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::unique_ptr<net::thread_pool> handlerPool;
    std::thread ioThread;

    mutable std::mutex handlerMutex;
    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;

    mutable std::mutex subscribersMutex;
    std::unordered_map<std::string, std::shared_ptr<Subscriber>> subscribers;
    std::atomic<uint64_t> nextSubscriberSerial{0};

    TransportCounters counters;

    explicit Impl(const StreamingHTTPServer::Options& o) : opts(o) {
        rpcPath = normalizeBasePath(opts.path);
        const std::string prefix = rpcPath == "/" ? std::string() : rpcPath;
        streamPath = prefix + "/stream";
        healthPath = prefix + "/health";
        if (opts.queueCapacity == 0) {
            opts.queueCapacity = 1;
        }
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("StreamingHTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw std::invalid_argument("StreamingHTTPServer: unsupported scheme: " + opts.scheme);
        }
    }

    ~Impl() {
        stop();
    }

    void setError(const std::string& msg) {
        ITransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = errorHandler;
        }
        if (handler) { handler(msg); }
    }

    void reportSessionError(const char* where, const std::exception& e) {
        if (!running.load()) {
            // Suppress shutdown-related errors; log at DEBUG only in debug builds
#ifdef _DEBUG
            LOG_DEBUG("StreamingHTTPServer {} suppressed during shutdown: {}", where, e.what());
#endif
            return;
        }
        counters.RecordError();
        LOG_WARN("StreamingHTTPServer {} error: {}", where, e.what());
        setError(std::string("StreamingHTTPServer ") + where + " error: " + e.what());
    }

    /////////////////////////////////////////// Listener ///////////////////////////////////////////

    void bindListener() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty()) {
            throw std::invalid_argument("StreamingHTTPServer invalid port: empty");
        }
        bool allDigits = std::all_of(opts.port.begin(), opts.port.end(),
                                     [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("StreamingHTTPServer invalid port: " + opts.port);
        }

        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (sslCtx) {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            reportSessionError("accept", e);
        }
        co_return;
    }

    /////////////////////////////////////////// Sessions ///////////////////////////////////////////

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serve(stream);
            co_await closeStream(stream);
        } catch (const std::exception& e) {
            reportSessionError("plain session", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(tls);
            co_await closeStream(tls);
        } catch (const std::exception& e) {
            reportSessionError("TLS session", e);
        }
        co_return;
    }

    // Reads one request and routes it. Connections carry a single exchange, or one push stream.
    template <class Stream>
    net::awaitable<void> serve(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(opts.maxBodyBytes);

        boost::system::error_code ec;
        co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
        if (ec == http::error::body_limit) {
            counters.RecordError();
            auto res = makeJson(11, http::status::payload_too_large, R"({"error":"Payload too large"})");
            co_await http::async_write(stream, res, net::use_awaitable);
            co_return;
        }
        if (ec) {
            throw boost::system::system_error(ec);
        }
        http::request<http::string_body> req = parser.release();

        const std::string target(req.target());
        const auto qpos = target.find('?');
        const std::string path = target.substr(0, qpos);
        const std::string query = (qpos == std::string::npos) ? std::string() : target.substr(qpos + 1);

        if (path == rpcPath) {
            if (req.method() != http::verb::post) {
                auto res = makeMethodNotAllowed(req.version(), "POST");
                co_await http::async_write(stream, res, net::use_awaitable);
                co_return;
            }
            auto res = co_await handlePost(req);
            co_await http::async_write(stream, res, net::use_awaitable);
            co_return;
        }

        if (path == streamPath) {
            if (req.method() != http::verb::get) {
                auto res = makeMethodNotAllowed(req.version(), "GET");
                co_await http::async_write(stream, res, net::use_awaitable);
                co_return;
            }
            co_await streamEvents(stream, req.version(), queryParam(query, "subscriber_id"));
            co_return;
        }

        if (path == healthPath) {
            if (req.method() != http::verb::get) {
                auto res = makeMethodNotAllowed(req.version(), "GET");
                co_await http::async_write(stream, res, net::use_awaitable);
                co_return;
            }
            auto res = makeJson(req.version(), http::status::ok, healthBody());
            co_await http::async_write(stream, res, net::use_awaitable);
            co_return;
        }

        auto res = makeJson(req.version(), http::status::not_found, R"({"error":"Not found"})");
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    /////////////////////////////////////////// Responses ///////////////////////////////////////////

    static http::response<http::string_body> makeJson(unsigned version, http::status status, std::string body) {
        http::response<http::string_body> res{status, version};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    static http::response<http::string_body> makeMethodNotAllowed(unsigned version, const char* allow) {
        auto res = makeJson(version, http::status::method_not_allowed, R"({"error":"Method not allowed"})");
        res.set(http::field::allow, allow);
        return res;
    }

    static http::response<http::string_body> makeNoContent(unsigned version) {
        http::response<http::string_body> res{http::status::no_content, version};
        res.keep_alive(false);
        res.prepare_payload();
        return res;
    }

    std::string healthBody() const {
        JSONValue::Object o;
        SetMember(o, "status", JSONValue("healthy"));
        SetMember(o, "uptime_seconds", JSONValue(counters.Snapshot().UptimeSeconds()));
        SetMember(o, "active_streams", JSONValue(static_cast<int64_t>(counters.ActiveStreams())));
        return SerializeJSONValue(JSONValue(std::move(o)));
    }

    //==========================================================================================================
    // handlePost
    // Purpose: Decodes one Message and runs the handler on the worker pool.
    //   400 + -32700/-32600 when the body is not a valid Message, 500 + -32603 when the handler throws,
    //   204 when there is nothing to send back, 200 + encoded response otherwise.
    //==========================================================================================================
    net::awaitable<http::response<http::string_body>> handlePost(const http::request<http::string_body>& req) {
        const std::string& body = req.body();
        counters.RecordRequest();
        counters.RecordReceived(body.size());

        Message inbound;
        std::optional<Message> rejection;
        try {
            inbound = DecodeMessage(body);
        } catch (const MessageDecodeError& e) {
            counters.RecordError();
            LOG_WARN("StreamingHTTPServer: rejected POST body: {}", e.what());
            const std::string text = (e.Code() == JSONRPCErrorCodes::ParseError)
                ? std::string("Parse error")
                : std::string("Invalid Request: ") + e.what();
            rejection = Message::ErrorResponse(JSONRPCId(nullptr), e.Code(), text);
        }
        if (rejection.has_value()) {
            co_return makeJson(req.version(), http::status::bad_request, EncodeMessage(*rejection));
        }

        ITransport::MessageHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = messageHandler;
        }
        if (!handler) {
            LOG_DEBUG("StreamingHTTPServer: no handler registered; dropping message");
            co_return makeNoContent(req.version());
        }

        std::optional<Message> reply;
        std::string failure;
        bool failed = false;
        try {
            reply = co_await net::co_spawn(handlerPool->get_executor(), runHandler(handler, inbound),
                                           net::use_awaitable);
        } catch (const std::exception& e) {
            failed = true;
            failure = e.what();
        } catch (...) {
            failed = true;
            failure = "unknown exception";
        }

        if (failed) {
            counters.RecordError();
            LOG_ERROR("StreamingHTTPServer: handler failed: {}", failure);
            setError("StreamingHTTPServer handler error: " + failure);
            JSONRPCId id = (inbound.id.has_value() && inbound.method.has_value()) ? *inbound.id : JSONRPCId(nullptr);
            co_return makeJson(req.version(), http::status::internal_server_error,
                               EncodeMessage(Message::ErrorResponse(id, JSONRPCErrorCodes::InternalError,
                                                                    "Internal error: " + failure)));
        }

        if (!reply.has_value()) {
            co_return makeNoContent(req.version());
        }
        std::string encoded = EncodeMessage(*reply);
        counters.RecordSent(encoded.size());
        counters.RecordResponse();
        co_return makeJson(req.version(), http::status::ok, std::move(encoded));
    }

    ///////////////////////////////////////// Push channel /////////////////////////////////////////

    std::shared_ptr<Subscriber> registerSubscriber(std::string id) {
        if (id.empty()) {
            id = "sub-" + std::to_string(++nextSubscriberSerial);
        }
        auto sub = std::make_shared<Subscriber>(id, ioc);
        std::shared_ptr<Subscriber> replaced;
        {
            std::lock_guard<std::mutex> lock(subscribersMutex);
            auto it = subscribers.find(id);
            if (it != subscribers.end()) {
                replaced = it->second;
            }
            subscribers[id] = sub;
        }
        if (replaced) {
            LOG_INFO("StreamingHTTPServer: subscriber {} reconnected; closing previous stream", id);
            closeSubscriber(replaced);
        }
        counters.StreamOpened();
        LOG_DEBUG("StreamingHTTPServer: subscriber {} connected", id);
        return sub;
    }

    void unregisterSubscriber(const std::shared_ptr<Subscriber>& sub) {
        {
            std::lock_guard<std::mutex> lock(subscribersMutex);
            auto it = subscribers.find(sub->id);
            if (it != subscribers.end() && it->second == sub) {
                subscribers.erase(it);
            }
        }
        counters.StreamClosed();
        LOG_DEBUG("StreamingHTTPServer: subscriber {} disconnected", sub->id);
    }

    void wake(const std::shared_ptr<Subscriber>& sub) {
        net::post(ioc, [sub]() { sub->timer.cancel(); });
    }

    void closeSubscriber(const std::shared_ptr<Subscriber>& sub) {
        {
            std::lock_guard<std::mutex> lock(sub->mutex);
            sub->closed = true;
        }
        wake(sub);
    }

    bool enqueue(const std::shared_ptr<Subscriber>& sub, const std::string& frame) {
        {
            std::lock_guard<std::mutex> lock(sub->mutex);
            if (sub->closed) {
                return false;
            }
            if (sub->frames.size() >= opts.queueCapacity) {
                counters.RecordError();
                LOG_WARN("StreamingHTTPServer: queue full for subscriber {}; dropping notification", sub->id);
                return false;
            }
            sub->frames.push_back(frame);
        }
        counters.RecordNotification();
        wake(sub);
        return true;
    }

    std::vector<std::shared_ptr<Subscriber>> snapshotSubscribers() const {
        std::vector<std::shared_ptr<Subscriber>> out;
        std::lock_guard<std::mutex> lock(subscribersMutex);
        out.reserve(subscribers.size());
        for (const auto& kv : subscribers) {
            out.push_back(kv.second);
        }
        return out;
    }

    std::size_t broadcast(const JSONValue& notification) {
        const std::string frame = encodeFrame(notification);
        std::size_t reached = 0;
        for (const auto& sub : snapshotSubscribers()) {
            if (enqueue(sub, frame)) {
                ++reached;
            }
        }
        return reached;
    }

    bool sendTo(const std::string& subscriberId, const JSONValue& notification) {
        std::shared_ptr<Subscriber> sub;
        {
            std::lock_guard<std::mutex> lock(subscribersMutex);
            auto it = subscribers.find(subscriberId);
            if (it == subscribers.end()) {
                return false;
            }
            sub = it->second;
        }
        return enqueue(sub, encodeFrame(notification));
    }

    template <class Stream>
    net::awaitable<void> streamEvents(Stream& stream, unsigned version, std::string subscriberId) {
        // Registered before the header goes out so a client that has seen the header is reachable.
        auto sub = registerSubscriber(std::move(subscriberId));
        std::exception_ptr failure;
        try {
            http::response<http::empty_body> res{http::status::ok, version};
            res.set(http::field::content_type, "text/event-stream");
            res.set(http::field::cache_control, "no-cache");
            res.set(http::field::connection, "keep-alive");
            res.set("X-Accel-Buffering", "no");
            http::response_serializer<http::empty_body> sr{res};
            co_await http::async_write_header(stream, sr, net::use_awaitable);
            co_await pump(stream, sub);
        } catch (const boost::system::system_error& e) {
            // Peer went away; the next write after a disconnect is where it surfaces.
            LOG_DEBUG("StreamingHTTPServer: subscriber {} stream ended: {}", sub->id, e.what());
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        unregisterSubscriber(sub);
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    // Writes queued frames until the subscriber is closed; idle waits end in a keepalive frame.
    template <class Stream>
    net::awaitable<void> pump(Stream& stream, const std::shared_ptr<Subscriber>& sub) {
        for (;;) {
            std::optional<std::string> frame;
            bool closed = false;
            {
                std::lock_guard<std::mutex> lock(sub->mutex);
                if (!sub->frames.empty()) {
                    frame = std::move(sub->frames.front());
                    sub->frames.pop_front();
                }
                closed = sub->closed;
            }
            if (frame.has_value()) {
                co_await net::async_write(stream, net::buffer(*frame), net::use_awaitable);
                counters.RecordSent(frame->size());
                continue;
            }
            if (closed || !running.load()) {
                co_return;
            }

            sub->timer.expires_after(opts.keepaliveInterval);
            boost::system::error_code ec;
            co_await sub->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (!ec) {
                co_await net::async_write(stream, net::buffer(kKeepaliveFrame, std::char_traits<char>::length(kKeepaliveFrame)),
                                          net::use_awaitable);
            }
            // operation_aborted: woken by enqueue or close; loop re-checks the queue.
        }
    }

    ////////////////////////////////////////// Lifecycle //////////////////////////////////////////

    void stop() {
        const bool wasRunning = running.exchange(false);
        if (wasRunning) {
            for (const auto& sub : snapshotSubscribers()) {
                closeSubscriber(sub);
            }
            net::post(ioc, [this]() {
                if (acceptor) {
                    boost::system::error_code ec;
                    acceptor->close(ec);
                }
            });
            // Give open streams a moment to flush and close before the context goes away.
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (counters.ActiveStreams() > 0 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
        if (handlerPool) {
            handlerPool->stop();
            handlerPool->join();
            handlerPool.reset();
        }
        {
            std::lock_guard<std::mutex> lock(subscribersMutex);
            subscribers.clear();
        }
        if (wasRunning) {
            LOG_INFO("StreamingHTTPServer: stopped");
        }
    }
};

StreamingHTTPServer::StreamingHTTPServer()
    : pImpl(std::make_unique<Impl>(Options{})) {}

StreamingHTTPServer::StreamingHTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

StreamingHTTPServer::~StreamingHTTPServer() = default;

std::future<void> StreamingHTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->running.load()) {
        ready.set_value();
        return fut;
    }
    try {
        pImpl->ioc.restart();
        pImpl->bindListener();
    } catch (const std::exception& e) {
        LOG_ERROR("StreamingHTTPServer: failed to bind {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        pImpl->setError(std::string("StreamingHTTPServer bind error: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }

    pImpl->running.store(true);
    pImpl->handlerPool = std::make_unique<net::thread_pool>(std::max<std::size_t>(1, pImpl->opts.handlerThreads));
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("StreamingHTTPServer: I/O loop failed: {}", e.what());
            pImpl->setError(std::string("StreamingHTTPServer I/O loop error: ") + e.what());
        }
    });
    LOG_INFO("StreamingHTTPServer: listening on {}", Url());
    ready.set_value();
    return fut;
}

std::future<void> StreamingHTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->stop();
    done.set_value();
    return fut;
}

bool StreamingHTTPServer::IsRunning() const {
    return pImpl->running.load();
}

void StreamingHTTPServer::SetMessageHandler(ITransport::MessageHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->messageHandler = std::move(handler);
}

void StreamingHTTPServer::SetErrorHandler(ITransport::ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

TransportStats StreamingHTTPServer::GetStats() const {
    return pImpl->counters.Snapshot();
}

std::size_t StreamingHTTPServer::Broadcast(const JSONValue& notification) {
    return pImpl->broadcast(notification);
}

std::size_t StreamingHTTPServer::Broadcast(const Message& notification) {
    return pImpl->broadcast(MessageToJSON(notification));
}

bool StreamingHTTPServer::SendTo(const std::string& subscriberId, const JSONValue& notification) {
    return pImpl->sendTo(subscriberId, notification);
}

bool StreamingHTTPServer::SendTo(const std::string& subscriberId, const Message& notification) {
    return pImpl->sendTo(subscriberId, MessageToJSON(notification));
}

std::vector<std::string> StreamingHTTPServer::SubscriberIds() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(pImpl->subscribersMutex);
    ids.reserve(pImpl->subscribers.size());
    for (const auto& kv : pImpl->subscribers) {
        ids.push_back(kv.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::string StreamingHTTPServer::Url() const {
    const uint16_t port = pImpl->boundPort.load();
    const std::string portText = port != 0 ? std::to_string(port) : pImpl->opts.port;
    const std::string& host = pImpl->opts.address;
    const bool v6 = host.find(':') != std::string::npos;
    return pImpl->opts.scheme + "://" + (v6 ? "[" + host + "]" : host) + ":" + portText + pImpl->rpcPath;
}

uint16_t StreamingHTTPServer::BoundPort() const {
    return pImpl->boundPort.load();
}

const StreamingHTTPServer::Options& StreamingHTTPServer::GetOptions() const {
    return pImpl->opts;
}

StreamingHTTPServer::Options StreamingHTTPServerFactory::ParseOptions(const std::string& config) {
    StreamingHTTPServer::Options opts;

    std::string cfg = config;
    // Trim leading/trailing spaces
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    // Detect scheme
    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    // Split query params
    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    // Split path component
    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        opts.path = hostPortPath.substr(slash);
    }
    trim(hostPort);

    // Parse host[:port] including IPv4/IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "8765"; // default
    }

    // Parse query parameters: cert, key, keepalive_ms, queue
    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : percentDecode(kv.substr(eq + 1));
            if (key == "cert") {
                opts.certFile = val;
            } else if (key == "key") {
                opts.keyFile = val;
            } else if (key == "keepalive_ms" || key == "queue") {
                const bool numeric = !val.empty() && val.size() <= 9 &&
                    std::all_of(val.begin(), val.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
                if (!numeric) {
                    LOG_WARN("StreamingHTTPServerFactory: ignoring non-numeric {}={}", key, val);
                    continue;
                }
                const unsigned long n = std::stoul(val);
                if (key == "keepalive_ms" && n > 0) {
                    opts.keepaliveInterval = std::chrono::milliseconds(n);
                } else if (key == "queue" && n > 0) {
                    opts.queueCapacity = static_cast<std::size_t>(n);
                }
            }
        }
    }
    return opts;
}

std::unique_ptr<ITransportAcceptor> StreamingHTTPServerFactory::CreateTransportAcceptor(const std::string& config) {
    return std::unique_ptr<ITransportAcceptor>(new StreamingHTTPServer(ParseOptions(config)));
}

} // namespace deepr
