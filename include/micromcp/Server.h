//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: MCP server facade owning registries, session slot, dispatcher and connection handler
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "micromcp/ConnectionHandler.h"
#include "micromcp/HTTPFramer.h"
#include "micromcp/HTTPServer.hpp"
#include "micromcp/MethodDispatcher.h"
#include "micromcp/Protocol.h"
#include "micromcp/Registry.h"
#include "micromcp/SessionManager.h"

namespace micromcp {

//==========================================================================================================
// Server
// Purpose: Single owner of all protocol state. Register tools and resources, then call Run().
// Notes:
//   - Not copyable or movable; the dispatcher and handler hold references into this object.
//   - Single-threaded: registration must finish before Run().
//==========================================================================================================
class Server {
public:
    //==========================================================================================================
    // Constructs a server.
    // Args:
    //   serverInfo: Name and version reported by initialize and the status page.
    //   deviceId: Prefix of minted session tokens.
    //   protocolVersion: Protocol revision reported by initialize.
    //   framerOptions: Request framing limits.
    //==========================================================================================================
    Server(Implementation serverInfo,
           std::string deviceId,
           std::string protocolVersion = PROTOCOL_VERSION,
           FramerOptions framerOptions = FramerOptions{});

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    ///////////////////////////////////////// Registration ///////////////////////////////////////////
    void RegisterTool(Tool tool);
    void RegisterTool(const std::string& name, const std::string& description,
                      JSONValue inputSchema, ToolFunction fn);

    void RegisterResource(Resource resource);
    void RegisterResource(const std::string& uri, const std::string& name, const std::string& description,
                          const std::string& mimeType, ResourceFunction fn);

    ///////////////////////////////////////// Accessors ///////////////////////////////////////////
    const ToolRegistry& Tools() const { return tools; }
    const ResourceRegistry& Resources() const { return resources; }
    SessionManager& Sessions() { return sessions; }
    MethodDispatcher& Dispatcher() { return dispatcher; }
    ConnectionHandler& Handler() { return handler; }

    //==========================================================================================================
    // Logs the startup banner, binds and serves connections sequentially forever.
    // Throws:
    //   boost::system::system_error when binding fails.
    //==========================================================================================================
    [[noreturn]] void Run(const HTTPServer::Options& opts);

    void LogBanner(const std::string& address, uint16_t port) const;

private:
    ToolRegistry tools;
    ResourceRegistry resources;
    SessionManager sessions;
    MethodDispatcher dispatcher;
    ConnectionHandler handler;
};

} // namespace micromcp
