//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, handler capabilities and constants
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include "errors/Errors.h"
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace micromcp {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, handler interfaces, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version (Streamable HTTP transport revision)
constexpr const char* PROTOCOL_VERSION = "2025-03-26";

// HTTP endpoint carrying JSON-RPC traffic
constexpr const char* MCP_ENDPOINT = "/mcp";

// Session header name as sent on the wire; request header lookups use the lowercased form
constexpr const char* SESSION_HEADER = "Mcp-Session-Id";
constexpr const char* SESSION_HEADER_LOWER = "mcp-session-id";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Handler capabilities ///////////////////////////////////////////
//==========================================================================================================
// IToolHandler
// Purpose: Invokable tool capability. Arguments arrive as the JSON-RPC "arguments" object.
// Returns:
//   Result holding the JSON value to report, or an McpError describing the failure.
// Notes:
//   Implementations may also throw; the dispatcher reports both forms as tool failures.
//==========================================================================================================
class IToolHandler {
public:
    virtual ~IToolHandler() = default;
    virtual Result<JSONValue> Invoke(const JSONValue::Object& arguments) = 0;
};

//==========================================================================================================
// IResourceHandler
// Purpose: Zero-argument readable resource capability returning text content.
//==========================================================================================================
class IResourceHandler {
public:
    virtual ~IResourceHandler() = default;
    virtual Result<std::string> Read() = 0;
};

using ToolFunction = std::function<Result<JSONValue>(const JSONValue::Object&)>;
using ResourceFunction = std::function<Result<std::string>()>;

// Adapts a plain callable to IToolHandler
class FunctionToolHandler : public IToolHandler {
public:
    explicit FunctionToolHandler(ToolFunction fn) : fn(std::move(fn)) {}
    Result<JSONValue> Invoke(const JSONValue::Object& arguments) override { return fn(arguments); }

private:
    ToolFunction fn;
};

// Adapts a plain callable to IResourceHandler
class FunctionResourceHandler : public IResourceHandler {
public:
    explicit FunctionResourceHandler(ResourceFunction fn) : fn(std::move(fn)) {}
    Result<std::string> Read() override { return fn(); }

private:
    ResourceFunction fn;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool descriptor; inputSchema is passed through verbatim
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;
    std::shared_ptr<IToolHandler> handler;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema,
         std::shared_ptr<IToolHandler> handler)
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)), handler(std::move(handler)) {}

    // tools/list entry: { name, description, inputSchema }
    JSONValue ToSchema() const;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
// Resource descriptor
struct Resource {
    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType{"text/plain"};
    std::shared_ptr<IResourceHandler> handler;

    Resource() = default;
    Resource(std::string uri, std::string name, std::string description, std::string mimeType,
             std::shared_ptr<IResourceHandler> handler)
        : uri(std::move(uri)), name(std::move(name)), description(std::move(description)),
          mimeType(std::move(mimeType)), handler(std::move(handler)) {}

    // resources/list entry: { uri, name, description, mimeType }
    JSONValue ToSchema() const;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
// MCP method names
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* Ping = "ping";
}

} // namespace micromcp
