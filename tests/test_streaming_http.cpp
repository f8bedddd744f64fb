//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: test_streaming_http.cpp
// Purpose: Streaming HTTP transport: POST dispatch, SSE push channel, health and routing errors
//==========================================================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/socket.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "deepr/Server.h"
#include "deepr/StreamingHTTPServer.hpp"

using namespace deepr;
using namespace std::chrono_literals;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

StreamingHTTPServer::Options localOptions() {
    StreamingHTTPServer::Options opts;
    opts.address = "127.0.0.1";
    opts.port = "0";
    opts.path = "/mcp";
    opts.keepaliveInterval = 200ms;
    return opts;
}

std::optional<Message> pingHandler(const Message& m) {
    if (m.IsRequest() && m.method == std::string("ping")) {
        return Message::Response(*m.id, JSONValue(JSONValue::Object{}));
    }
    if (m.IsRequest() && m.method == std::string("explode")) {
        throw std::runtime_error("handler blew up");
    }
    if (m.IsRequest() && m.method == std::string("throw_int")) {
        throw 42;
    }
    return std::nullopt;
}

http::response<http::string_body> roundTrip(uint16_t port, http::verb verb, const std::string& target,
                                            const std::string& body = {}) {
    net::io_context ioc;
    tcp::socket socket(ioc);
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();
    http::write(socket, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

// Reads from a raw socket until `needle` has arrived or the timeout elapses.
bool readUntil(tcp::socket& socket, std::string& received, const std::string& needle,
               std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (received.find(needle) == std::string::npos) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return false;
        pollfd pfd{socket.native_handle(), POLLIN, 0};
        if (::poll(&pfd, 1, static_cast<int>(left.count())) <= 0) return false;
        char buf[1024];
        ssize_t n = ::recv(socket.native_handle(), buf, sizeof(buf), 0);
        if (n <= 0) return false;
        received.append(buf, static_cast<std::size_t>(n));
    }
    return true;
}

template <class Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

class StreamingHTTPServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_unique<StreamingHTTPServer>(localOptions());
        server->SetMessageHandler(pingHandler);
        server->Start().get();
        port = server->BoundPort();
        ASSERT_NE(port, 0);
    }
    void TearDown() override {
        server->Stop().get();
    }

    std::unique_ptr<StreamingHTTPServer> server;
    uint16_t port{0};
};

} // namespace

TEST_F(StreamingHTTPServerTest, PostRequestReturnsResponse) {
    auto res = roundTrip(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_NE(std::string(res[http::field::content_type]).find("application/json"), std::string::npos);
    Message m = DecodeMessage(res.body());
    EXPECT_EQ(std::get<int64_t>(*m.id), 1);
    EXPECT_TRUE(m.result->IsObject());

    TransportStats stats = server->GetStats();
    EXPECT_EQ(stats.requestsReceived, 1u);
    EXPECT_EQ(stats.responsesSent, 1u);
}

TEST_F(StreamingHTTPServerTest, PostNotificationIsNoContent) {
    auto res = roundTrip(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_TRUE(res.body().empty());
}

TEST_F(StreamingHTTPServerTest, MalformedBodyIsBadRequestWithParseError) {
    auto res = roundTrip(port, http::verb::post, "/mcp", "not json");
    EXPECT_EQ(res.result(), http::status::bad_request);
    Message m = DecodeMessage(res.body());
    EXPECT_EQ(m.ErrorCode().value_or(0), JSONRPCErrorCodes::ParseError);
    ASSERT_TRUE(m.id.has_value());
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(*m.id));

    res = roundTrip(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":2,"method":5})");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(DecodeMessage(res.body()).ErrorCode().value_or(0), JSONRPCErrorCodes::InvalidRequest);
}

TEST_F(StreamingHTTPServerTest, HandlerFailureIsInternalError) {
    auto res = roundTrip(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":9,"method":"explode"})");
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    Message m = DecodeMessage(res.body());
    EXPECT_EQ(m.ErrorCode().value_or(0), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(std::get<int64_t>(*m.id), 9);
    EXPECT_NE(m.ErrorMessage().value_or("").find("handler blew up"), std::string::npos);
}

TEST_F(StreamingHTTPServerTest, ConsecutiveRequestsAreEachAnswered) {
    for (int64_t i = 1; i <= 50; ++i) {
        const std::string body = R"({"jsonrpc":"2.0","id":)" + std::to_string(i) + R"(,"method":"ping","params":{"seq":)" +
                                 std::to_string(i) + "}}";
        auto res = roundTrip(port, http::verb::post, "/mcp", body);
        ASSERT_EQ(res.result(), http::status::ok) << "request " << i;
        Message m = DecodeMessage(res.body());
        EXPECT_EQ(std::get<int64_t>(*m.id), i);
    }
    TransportStats stats = server->GetStats();
    EXPECT_EQ(stats.requestsReceived, 50u);
    EXPECT_EQ(stats.responsesSent, 50u);
}

TEST_F(StreamingHTTPServerTest, ConcurrentRequestsAreEachAnswered) {
    std::vector<std::future<bool>> clients;
    for (int64_t i = 1; i <= 8; ++i) {
        clients.push_back(std::async(std::launch::async, [this, i]() {
            const std::string body = R"({"jsonrpc":"2.0","id":)" + std::to_string(i) + R"(,"method":"ping"})";
            auto res = roundTrip(port, http::verb::post, "/mcp", body);
            Message m = DecodeMessage(res.body());
            return res.result() == http::status::ok && std::get<int64_t>(*m.id) == i;
        }));
    }
    for (auto& c : clients) {
        EXPECT_TRUE(c.get());
    }
}

TEST_F(StreamingHTTPServerTest, NonStandardExceptionIsInternalError) {
    auto res = roundTrip(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":9,"method":"throw_int"})");
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    Message m = DecodeMessage(res.body());
    EXPECT_EQ(m.ErrorCode().value_or(0), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(std::get<int64_t>(*m.id), 9);

    // The server keeps serving after the failure.
    auto ok = roundTrip(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":10,"method":"ping"})");
    EXPECT_EQ(ok.result(), http::status::ok);
}

TEST_F(StreamingHTTPServerTest, HealthReportsStatus) {
    auto res = roundTrip(port, http::verb::get, "/mcp/health");
    EXPECT_EQ(res.result(), http::status::ok);
    JSONValue body = ParseJSON(res.body());
    EXPECT_EQ(GetStringMember(body, "status").value_or(""), "healthy");
    EXPECT_EQ(GetIntMember(body, "active_streams").value_or(-1), 0);
    EXPECT_NE(FindMember(body, "uptime_seconds"), nullptr);
}

TEST_F(StreamingHTTPServerTest, RoutingErrors) {
    auto res = roundTrip(port, http::verb::get, "/elsewhere");
    EXPECT_EQ(res.result(), http::status::not_found);

    res = roundTrip(port, http::verb::get, "/mcp");
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(std::string(res[http::field::allow]), "POST");

    res = roundTrip(port, http::verb::post, "/mcp/health", "{}");
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
}

TEST_F(StreamingHTTPServerTest, BroadcastWithoutSubscribersReachesNobody) {
    JSONValue::Object n;
    SetMember(n, "x", JSONValue(int64_t{1}));
    EXPECT_EQ(server->Broadcast(JSONValue(n)), 0u);
    EXPECT_FALSE(server->SendTo("nobody", JSONValue(n)));
    EXPECT_TRUE(server->SubscriberIds().empty());
}

TEST_F(StreamingHTTPServerTest, SubscriberReceivesPushedFramesAndKeepalives) {
    net::io_context ioc;
    tcp::socket socket(ioc);
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    const std::string get = "GET /mcp/stream?subscriber_id=tester HTTP/1.1\r\nHost: 127.0.0.1\r\n"
                            "Accept: text/event-stream\r\n\r\n";
    net::write(socket, net::buffer(get));

    std::string received;
    ASSERT_TRUE(readUntil(socket, received, "\r\n\r\n"));
    EXPECT_NE(received.find("200"), std::string::npos);
    EXPECT_NE(received.find("text/event-stream"), std::string::npos);
    ASSERT_TRUE(eventually([&] { return server->GetStats().activeStreams == 1; }));
    EXPECT_EQ(server->SubscriberIds(), std::vector<std::string>{"tester"});

    JSONValue::Object n;
    SetMember(n, "x", JSONValue(int64_t{1}));
    EXPECT_EQ(server->Broadcast(JSONValue(n)), 1u);
    EXPECT_TRUE(readUntil(socket, received, "data: {\"x\":1}\n\n"));

    EXPECT_TRUE(server->SendTo("tester", Message::Notification("notifications/message")));
    EXPECT_TRUE(readUntil(socket, received, "notifications/message"));
    EXPECT_FALSE(server->SendTo("ghost", Message::Notification("notifications/message")));

    // Idle stream gets a comment frame each keepalive interval
    EXPECT_TRUE(readUntil(socket, received, ": keepalive\n\n"));
    EXPECT_GE(server->GetStats().notificationsSent, 2u);

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
    // The disconnect surfaces on the next keepalive write
    EXPECT_TRUE(eventually([&] { return server->GetStats().activeStreams == 0; }));
    EXPECT_TRUE(server->SubscriberIds().empty());
}

TEST_F(StreamingHTTPServerTest, GeneratedSubscriberIdsAreDistinct) {
    net::io_context ioc;
    tcp::socket a(ioc);
    tcp::socket b(ioc);
    const std::string get = "GET /mcp/stream HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n";
    std::string ra;
    std::string rb;
    a.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    net::write(a, net::buffer(get));
    ASSERT_TRUE(readUntil(a, ra, "\r\n\r\n"));
    b.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    net::write(b, net::buffer(get));
    ASSERT_TRUE(readUntil(b, rb, "\r\n\r\n"));

    ASSERT_TRUE(eventually([&] { return server->SubscriberIds().size() == 2; }));
    auto ids = server->SubscriberIds();
    EXPECT_NE(ids[0], ids[1]);

    JSONValue::Object n;
    SetMember(n, "seq", JSONValue(int64_t{1}));
    EXPECT_EQ(server->Broadcast(JSONValue(n)), 2u);
    EXPECT_TRUE(readUntil(a, ra, "\"seq\":1"));
    EXPECT_TRUE(readUntil(b, rb, "\"seq\":1"));
}

TEST_F(StreamingHTTPServerTest, StopClosesOpenStreams) {
    net::io_context ioc;
    tcp::socket socket(ioc);
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    net::write(socket, net::buffer(std::string("GET /mcp/stream?subscriber_id=s1 HTTP/1.1\r\nHost: x\r\n\r\n")));
    std::string received;
    ASSERT_TRUE(readUntil(socket, received, "\r\n\r\n"));

    server->Stop().get();
    EXPECT_FALSE(server->IsRunning());
    EXPECT_EQ(server->GetStats().activeStreams, 0u);
    EXPECT_EQ(server->Broadcast(Message::Notification("late")), 0u);
}

TEST(StreamingHTTPServerOptions, ParsesListenUrl) {
    auto opts = StreamingHTTPServerFactory::ParseOptions("http://127.0.0.1:9000/rpc?keepalive_ms=1500&queue=16");
    EXPECT_EQ(opts.scheme, "http");
    EXPECT_EQ(opts.address, "127.0.0.1");
    EXPECT_EQ(opts.port, "9000");
    EXPECT_EQ(opts.path, "/rpc");
    EXPECT_EQ(opts.keepaliveInterval, 1500ms);
    EXPECT_EQ(opts.queueCapacity, 16u);

    auto v6 = StreamingHTTPServerFactory::ParseOptions("https://[::1]:8443/mcp?cert=%2Ftmp%2Fc.pem&key=k.pem");
    EXPECT_EQ(v6.scheme, "https");
    EXPECT_EQ(v6.address, "::1");
    EXPECT_EQ(v6.port, "8443");
    EXPECT_EQ(v6.certFile, "/tmp/c.pem");
    EXPECT_EQ(v6.keyFile, "k.pem");

    auto bad = StreamingHTTPServerFactory::ParseOptions("http://0.0.0.0/mcp?keepalive_ms=abc&queue=0");
    EXPECT_EQ(bad.port, "8765");
    EXPECT_EQ(bad.keepaliveInterval, 30000ms);
    EXPECT_EQ(bad.queueCapacity, 1024u);
}

TEST(StreamingHTTPServerOptions, StartFailsOnInvalidPort) {
    StreamingHTTPServer::Options opts = localOptions();
    opts.port = "99999";
    StreamingHTTPServer server(opts);
    EXPECT_THROW(server.Start().get(), std::exception);
    EXPECT_FALSE(server.IsRunning());

    StreamingHTTPServer::Options ftp = localOptions();
    ftp.scheme = "ftp";
    EXPECT_THROW({ StreamingHTTPServer rejected(ftp); }, std::invalid_argument);
}

TEST(StreamingHTTPServerOptions, AttachedDispatcherServesPost) {
    Server dispatcher;
    dispatcher.RegisterMethod("ping", [](const JSONValue&) {
        std::promise<JSONValue> p;
        p.set_value(JSONValue(JSONValue::Object{}));
        return p.get_future();
    });
    StreamingHTTPServer server(localOptions());
    dispatcher.Attach(server);
    server.Start().get();
    auto res = roundTrip(server.BoundPort(), http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":"a","method":"ping"})");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(std::get<std::string>(*DecodeMessage(res.body()).id), "a");

    res = roundTrip(server.BoundPort(), http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":"b","method":"missing"})");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(DecodeMessage(res.body()).ErrorCode().value_or(0), JSONRPCErrorCodes::MethodNotFound);
    server.Stop().get();
}
