//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionHandler.h
// Purpose: Serves one accepted connection end-to-end (frame, route, respond, close)
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "micromcp/Connection.h"
#include "micromcp/HTTPFramer.h"
#include "micromcp/MethodDispatcher.h"
#include "micromcp/Registry.h"
#include "micromcp/SessionManager.h"

namespace micromcp {

//==========================================================================================================
// ConnectionHandler
// Purpose: HTTP routing for the MCP endpoint, the status page and CORS preflight.
// Notes:
//   - Exactly one request per connection; the connection is closed exactly once on every exit path.
//   - Never throws. Failures are logged and, when possible, answered with 500.
//   - Every response carries CORS headers and, while a session exists, the Mcp-Session-Id header.
//==========================================================================================================
class ConnectionHandler {
public:
    ConnectionHandler(MethodDispatcher& dispatcher,
                      SessionManager& sessions,
                      const ToolRegistry& tools,
                      const ResourceRegistry& resources,
                      FramerOptions framerOptions = FramerOptions{});

    //==========================================================================================================
    // Reads one request from conn, answers it and closes conn.
    // Args:
    //   conn: Accepted connection; borrowed for the duration of the call.
    //==========================================================================================================
    void Handle(IConnection& conn);

private:
    // Status, content type and body of a reply before HTTP serialization
    struct Reply {
        unsigned status{200};
        std::string contentType{"application/json"};
        std::string body;
    };

    // Empty optional: send nothing (empty POST body)
    std::optional<Reply> route(const HTTPRequestFrame& frame);
    std::optional<Reply> handlePost(const HTTPRequestFrame& frame);
    Reply handleDelete(const HTTPRequestFrame& frame);
    void send(IConnection& conn, const Reply& reply) const;

    MethodDispatcher& dispatcher;
    SessionManager& sessions;
    const ToolRegistry& tools;
    const ResourceRegistry& resources;
    FramerOptions framerOptions;
};

} // namespace micromcp
