//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/micromcp/Server.cpp
// Purpose: MCP server facade implementation
//==========================================================================================================

#include <utility>

#include "logging/Logger.h"
#include "micromcp/Server.h"

namespace micromcp {

Server::Server(Implementation serverInfo,
               std::string deviceId,
               std::string protocolVersion,
               FramerOptions framerOptions)
    : sessions(std::move(deviceId)),
      dispatcher(tools, resources, sessions, std::move(serverInfo), std::move(protocolVersion)),
      handler(dispatcher, sessions, tools, resources, framerOptions) {}

void Server::RegisterTool(Tool tool) {
    LOG_DEBUG("Registering tool: {}", tool.name);
    tools.Register(std::move(tool));
}

void Server::RegisterTool(const std::string& name, const std::string& description,
                          JSONValue inputSchema, ToolFunction fn) {
    RegisterTool(Tool{name, description, std::move(inputSchema),
                      std::make_shared<FunctionToolHandler>(std::move(fn))});
}

void Server::RegisterResource(Resource resource) {
    LOG_DEBUG("Registering resource: {}", resource.uri);
    resources.Register(std::move(resource));
}

void Server::RegisterResource(const std::string& uri, const std::string& name, const std::string& description,
                              const std::string& mimeType, ResourceFunction fn) {
    RegisterResource(Resource{uri, name, description, mimeType,
                              std::make_shared<FunctionResourceHandler>(std::move(fn))});
}

void Server::LogBanner(const std::string& address, uint16_t port) const {
    const Implementation& info = dispatcher.ServerInfo();
    LOG_INFO("{} v{} (MCP protocol {})", info.name, info.version, dispatcher.ProtocolVersion());
    LOG_INFO("Endpoint: http://{}:{}{}", address, port, MCP_ENDPOINT);
    LOG_INFO("Tools: {}  Resources: {}", tools.Size(), resources.Size());
    for (const auto& t : tools.List()) {
        LOG_DEBUG("  tool {}", t.name);
    }
    for (const auto& r : resources.List()) {
        LOG_DEBUG("  resource {}", r.uri);
    }
}

void Server::Run(const HTTPServer::Options& opts) {
    HTTPServer listener(opts, handler);
    listener.Bind();
    LogBanner(opts.address, listener.LocalPort());
    listener.Run();
}

} // namespace micromcp
