//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodDispatcher.h
// Purpose: JSON-RPC method dispatch over the tool/resource registries and the session slot
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "micromcp/JSONRPCTypes.h"
#include "micromcp/Protocol.h"
#include "micromcp/Registry.h"
#include "micromcp/SessionManager.h"

namespace micromcp {

//==========================================================================================================
// MethodDispatcher
// Purpose: Interprets one JSON-RPC request object and produces its response.
// Notes:
//   - Non-owning references; the owning Server outlives the dispatcher.
//   - No state is kept between calls other than what SessionManager holds.
//==========================================================================================================
class MethodDispatcher {
public:
    MethodDispatcher(const ToolRegistry& tools,
                     const ResourceRegistry& resources,
                     SessionManager& sessions,
                     Implementation serverInfo,
                     std::string protocolVersion = PROTOCOL_VERSION);

    //==========================================================================================================
    // Dispatches a parsed JSON-RPC request.
    // Args:
    //   request: Parsed JSON value (expected to be an object).
    // Returns:
    //   The response to send, or nullptr for notifications that take no reply.
    //   Never throws: unexpected failures become -32603 error responses.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> Dispatch(const JSONValue& request);

    const Implementation& ServerInfo() const { return serverInfo; }
    const std::string& ProtocolVersion() const { return protocolVersion; }

private:
    std::unique_ptr<JSONRPCResponse> dispatchRequest(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleResourcesList(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleResourcesRead(const JSONRPCRequest& req);

    // Runs a tool and returns the payload to embed (handler value or {"error": ...}).
    // name is empty when params.name is absent or not a string; displayName is used in messages.
    JSONValue executeTool(const std::optional<std::string>& name, const std::string& displayName,
                          const JSONValue& arguments);
    // Reads a resource; errors carry the -32602 message text
    Result<std::string> executeResource(const Resource* resource, const std::string& uri);

    JSONValue capabilities() const;

    const ToolRegistry& tools;
    const ResourceRegistry& resources;
    SessionManager& sessions;
    Implementation serverInfo;
    std::string protocolVersion;
};

} // namespace micromcp
