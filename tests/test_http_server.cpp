//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_http_server.cpp
// Purpose: Loopback end-to-end tests of the sequential listener with a Boost.Beast client
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "TestHelpers.h"
#include "micromcp/HTTPServer.hpp"
#include "micromcp/Server.h"

using namespace micromcp;
using namespace micromcp::test;
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

Response exchange(uint16_t port, http::verb verb, const std::string& target, const std::string& body,
                  const std::string& sessionId = "") {
    net::io_context ioc;
    tcp::socket sock(ioc);
    sock.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::accept, "application/json, text/event-stream");
    if (!sessionId.empty()) {
        req.set(SESSION_HEADER, sessionId);
    }
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();
    http::write(sock, req);

    boost::beast::flat_buffer buffer;
    Response res;
    http::read(sock, buffer, res);
    boost::system::error_code ec;
    sock.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

class LoopbackTest : public ::testing::Test {
protected:
    LoopbackTest() : server(Implementation{"loopback", "1.0.0"}, "6c6f6f70") {
        JSONValue::Object schema;
        SetMember(schema, "type", JSONValue("object"));
        server.RegisterTool("echo", "Echo a message", JSONValue{schema},
            [](const JSONValue::Object& args) -> Result<JSONValue> {
                JSONValue::Object out;
                auto it = args.find("message");
                SetMember(out, "echo", it != args.end() ? *it->second : JSONValue{});
                return JSONValue{out};
            });
        HTTPServer::Options opts;
        opts.address = "127.0.0.1";
        opts.port = 0;
        listener = std::make_unique<HTTPServer>(opts, server.Handler());
        listener->Bind();
    }

    // Serves exactly n connections on a background thread
    std::thread serve(int n) {
        return std::thread([this, n]() {
            for (int i = 0; i < n; ++i) {
                listener->AcceptOne();
            }
        });
    }

    Server server;
    std::unique_ptr<HTTPServer> listener;
};

} // namespace

TEST_F(LoopbackTest, BindsEphemeralPort) {
    EXPECT_NE(listener->LocalPort(), 0);
}

TEST(HTTPServer, AcceptBackoffGrowsAndCaps) {
    using std::chrono::milliseconds;
    EXPECT_EQ(HTTPServer::AcceptBackoff(0), milliseconds(0));
    EXPECT_EQ(HTTPServer::AcceptBackoff(1), milliseconds(100));
    EXPECT_EQ(HTTPServer::AcceptBackoff(2), milliseconds(200));
    EXPECT_EQ(HTTPServer::AcceptBackoff(4), milliseconds(800));
    EXPECT_EQ(HTTPServer::AcceptBackoff(5), milliseconds(1000));
    EXPECT_EQ(HTTPServer::AcceptBackoff(1000000), milliseconds(1000));
}

TEST_F(LoopbackTest, EchoScenarioEndToEnd) {
    const uint16_t port = listener->LocalPort();
    std::thread worker = serve(4);

    Response init = exchange(port, http::verb::post, "/mcp",
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26"}})");
    ASSERT_EQ(init.result(), http::status::ok);
    const std::string sid(init[SESSION_HEADER]);
    ASSERT_FALSE(sid.empty());
    EXPECT_EQ(AsString(Path(ParseBody(init.body()), {"result", "_meta", "sessionId"})), sid);

    Response note = exchange(port, http::verb::post, "/mcp",
        R"({"jsonrpc":"2.0","method":"initialized"})", sid);
    EXPECT_EQ(note.result(), http::status::no_content);

    Response call = exchange(port, http::verb::post, "/mcp",
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hello device"}}})",
        sid);
    ASSERT_EQ(call.result(), http::status::ok);
    EXPECT_EQ(std::string(call[SESSION_HEADER]), sid);
    JSONValue body = ParseBody(call.body());
    EXPECT_EQ(AsInt(FindMember(body, "id")), 2);
    const auto& content = AsArray(*Path(body, {"result", "content"}));
    ASSERT_EQ(content.size(), 1u);
    JSONValue payload = ParseBody(AsString(FindMember(*content[0], "text")));
    EXPECT_EQ(AsString(FindMember(payload, "echo")), "hello device");

    Response del = exchange(port, http::verb::delete_, "/mcp", "", sid);
    EXPECT_EQ(del.result(), http::status::ok);

    worker.join();
    EXPECT_FALSE(server.Sessions().CurrentToken().has_value());
}

TEST_F(LoopbackTest, SilentClientDoesNotStopTheLoop) {
    const uint16_t port = listener->LocalPort();
    std::thread worker = serve(2);
    {
        net::io_context ioc;
        tcp::socket sock(ioc);
        sock.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
        boost::system::error_code ec;
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }
    Response ping = exchange(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":"p","method":"ping"})");
    EXPECT_EQ(ping.result(), http::status::ok);
    EXPECT_EQ(AsString(FindMember(ParseBody(ping.body()), "id")), "p");
    worker.join();
}
