//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/micromcp/ConnectionHandler.cpp
// Purpose: HTTP routing and response serialization (Boost.Beast) for one connection
//==========================================================================================================

#include <sstream>
#include <utility>

#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "micromcp/ConnectionHandler.h"
#include "micromcp/StatusPage.h"

namespace micromcp {
namespace http = boost::beast::http;

namespace {
// Closes the borrowed connection once when the handler returns or unwinds
class CloseGuard {
public:
    explicit CloseGuard(IConnection& c) : conn(c) {}
    ~CloseGuard() { conn.Close(); }
    CloseGuard(const CloseGuard&) = delete;
    CloseGuard& operator=(const CloseGuard&) = delete;

private:
    IConnection& conn;
};

std::string errorBody(const std::string& message) {
    JSONValue::Object obj;
    SetMember(obj, "error", JSONValue(message));
    return SerializeJSON(JSONValue{obj});
}

std::string describeHeaders(const HTTPRequestFrame& frame) {
    std::string out;
    for (const auto& [k, v] : frame.headers) {
        if (!out.empty()) {
            out += ", ";
        }
        out += k + "=" + v;
    }
    return out;
}

constexpr std::size_t kBodyLogPrefix = 200;
} // namespace

ConnectionHandler::ConnectionHandler(MethodDispatcher& dispatcher,
                                     SessionManager& sessions,
                                     const ToolRegistry& tools,
                                     const ResourceRegistry& resources,
                                     FramerOptions framerOptions)
    : dispatcher(dispatcher), sessions(sessions), tools(tools), resources(resources),
      framerOptions(framerOptions) {}

void ConnectionHandler::Handle(IConnection& conn) {
    CloseGuard guard(conn);
    try {
        std::optional<HTTPRequestFrame> frame = ReadHTTPRequest(conn, framerOptions);
        if (!frame) {
            LOG_WARN("No request framed from {}; closing without reply", conn.Peer());
            return;
        }
        LOG_DEBUG("{} {} from {}", frame->method, frame->path, conn.Peer());
        LOG_DEBUG("Headers: {}", describeHeaders(*frame));
        LOG_DEBUG("Body ({} bytes): {}", frame->body.size(), frame->body.substr(0, kBodyLogPrefix));

        std::optional<Reply> reply = route(*frame);
        if (!reply) {
            return;
        }
        send(conn, *reply);
    } catch (const std::exception& e) {
        LOG_ERROR("Connection {} failed: {}", conn.Peer(), e.what());
        try {
            send(conn, Reply{500, "application/json", errorBody(e.what())});
        } catch (const std::exception& sendErr) {
            LOG_ERROR("Unable to send 500 to {}: {}", conn.Peer(), sendErr.what());
        }
    }
}

std::optional<ConnectionHandler::Reply> ConnectionHandler::route(const HTTPRequestFrame& frame) {
    if (frame.method == "OPTIONS") {
        return Reply{204, "text/plain", std::string()};
    }
    if (frame.path == MCP_ENDPOINT) {
        if (frame.method == "DELETE") {
            return handleDelete(frame);
        }
        if (frame.method == "POST") {
            return handlePost(frame);
        }
        if (frame.method == "GET") {
            return Reply{501, "application/json",
                         errorBody("Server-sent event streaming is not supported; use POST " + std::string(MCP_ENDPOINT))};
        }
    }
    if (frame.method == "GET" && frame.path == "/") {
        StatusSnapshot snapshot{dispatcher.ServerInfo(), dispatcher.ProtocolVersion(),
                                sessions.CurrentToken(), &tools, &resources};
        return Reply{200, "text/html; charset=utf-8", RenderStatusPage(snapshot)};
    }
    LOG_DEBUG("No route for {} {}", frame.method, frame.path);
    return Reply{404, "text/plain", "Not Found"};
}

ConnectionHandler::Reply ConnectionHandler::handleDelete(const HTTPRequestFrame& frame) {
    std::optional<std::string> presented = frame.Header(SESSION_HEADER_LOWER);
    if (presented && sessions.Validate(*presented)) {
        LOG_INFO("Session {} terminated by client", *presented);
        sessions.ClearSession();
        return Reply{200, "application/json", "{}"};
    }
    LOG_WARN("DELETE for unknown session '{}'", presented.value_or(""));
    return Reply{404, "application/json", errorBody("Session not found")};
}

std::optional<ConnectionHandler::Reply> ConnectionHandler::handlePost(const HTTPRequestFrame& frame) {
    LOG_DEBUG("Accept: {}", frame.Header("accept").value_or("<none>"));

    // Known quirk: an empty POST body gets no reply at all
    if (frame.body.empty()) {
        LOG_WARN("Empty POST body; dropping request without a response");
        return std::nullopt;
    }

    JSONValue parsed;
    std::string parseError;
    if (!ParseJSON(frame.body, parsed, parseError)) {
        LOG_WARN("JSON parse error: {}", parseError);
        auto err = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error: " + parseError);
        return Reply{400, "application/json", err->Serialize()};
    }

    if (parsed.IsArray()) {
        const auto& items = std::get<JSONValue::Array>(parsed.value);
        LOG_DEBUG("Batch of {} requests", items.size());
        JSONValue::Array replies;
        for (const auto& item : items) {
            std::unique_ptr<JSONRPCResponse> r = item ? dispatcher.Dispatch(*item) : dispatcher.Dispatch(JSONValue{});
            if (r) {
                replies.push_back(std::make_shared<JSONValue>(r->ToValue()));
            }
        }
        return Reply{200, "application/json", SerializeJSON(JSONValue{replies})};
    }

    std::unique_ptr<JSONRPCResponse> r = dispatcher.Dispatch(parsed);
    if (!r) {
        return Reply{204, "application/json", std::string()};
    }
    return Reply{200, "application/json", r->Serialize()};
}

void ConnectionHandler::send(IConnection& conn, const Reply& reply) const {
    http::response<http::string_body> res{static_cast<http::status>(reply.status), 11};
    res.set(http::field::content_type, reply.contentType);
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "POST, GET, OPTIONS, DELETE");
    res.set(http::field::access_control_allow_headers, "Content-Type, Mcp-Session-Id");
    if (auto token = sessions.CurrentToken()) {
        res.set(SESSION_HEADER, *token);
    }
    res.keep_alive(false);
    res.body() = reply.body;
    res.content_length(reply.body.size());

    std::ostringstream oss;
    oss << res;
    LOG_DEBUG("Responding {} ({} bytes) to {}", reply.status, reply.body.size(), conn.Peer());
    conn.WriteAll(oss.str());
}

} // namespace micromcp
