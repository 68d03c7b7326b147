//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/micromcp/MethodDispatcher.cpp
// Purpose: JSON-RPC method dispatch (initialize, tools/*, resources/*, ping)
//==========================================================================================================

#include <optional>
#include <stdexcept>
#include <utility>

#include "logging/Logger.h"
#include "micromcp/MethodDispatcher.h"
#include "micromcp/errors/Errors.h"

namespace micromcp {

namespace {
std::unique_ptr<JSONRPCResponse> makeResult(const JSONRPCRequest& req, JSONValue result) {
    auto resp = std::make_unique<JSONRPCResponse>();
    resp->id = req.id;
    resp->result = std::move(result);
    return resp;
}

// Text rendering of a possibly missing / non-string param, for diagnostics
std::string describeParam(const JSONValue& params, const std::string& key) {
    const JSONValue* v = FindMember(params, key);
    if (v == nullptr) {
        return "null";
    }
    if (v->IsString()) {
        return std::get<std::string>(v->value);
    }
    return SerializeJSON(*v);
}

JSONValue toolErrorPayload(const std::string& message) {
    JSONValue::Object obj;
    SetMember(obj, "error", JSONValue(message));
    return JSONValue{obj};
}
} // namespace

MethodDispatcher::MethodDispatcher(const ToolRegistry& tools,
                                   const ResourceRegistry& resources,
                                   SessionManager& sessions,
                                   Implementation serverInfo,
                                   std::string protocolVersion)
    : tools(tools), resources(resources), sessions(sessions),
      serverInfo(std::move(serverInfo)), protocolVersion(std::move(protocolVersion)) {}

std::unique_ptr<JSONRPCResponse> MethodDispatcher::Dispatch(const JSONValue& request) {
    FUNC_SCOPE();
    // Best-effort id for the -32603 path
    const JSONRPCId fallbackId = IdFromValue(FindMember(request, "id"));
    try {
        JSONRPCRequest req;
        if (!req.FromValue(request)) {
            throw std::invalid_argument("request must be a JSON object");
        }
        LOG_DEBUG("JSON-RPC method: {} id: {} params: {}", req.method, IdToString(req.id), SerializeJSON(req.params));
        return dispatchRequest(req);
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatch failed: {}", e.what());
        return CreateErrorResponse(fallbackId, JSONRPCErrorCodes::InternalError,
                                   std::string("Internal error: ") + e.what());
    }
}

std::unique_ptr<JSONRPCResponse> MethodDispatcher::dispatchRequest(const JSONRPCRequest& req) {
    if (req.method == Methods::Initialize) {
        return handleInitialize(req);
    }
    if (req.method == Methods::Initialized) {
        LOG_INFO("Client confirmed initialization");
        return nullptr;
    }
    if (req.method == Methods::ListTools) {
        return handleToolsList(req);
    }
    if (req.method == Methods::CallTool) {
        return handleToolsCall(req);
    }
    if (req.method == Methods::ListResources) {
        return handleResourcesList(req);
    }
    if (req.method == Methods::ReadResource) {
        return handleResourcesRead(req);
    }
    if (req.method == Methods::Ping) {
        return makeResult(req, JSONValue{JSONValue::Object{}});
    }
    LOG_WARN("Method not found: {}", req.method);
    return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
}

JSONValue MethodDispatcher::capabilities() const {
    JSONValue::Object caps;
    SetMember(caps, "tools", JSONValue{JSONValue::Object{}});
    return JSONValue{caps};
}

std::unique_ptr<JSONRPCResponse> MethodDispatcher::handleInitialize(const JSONRPCRequest& req) {
    const std::string sessionId = sessions.CreateSession();
    LOG_INFO("Initialize: new session {}", sessionId);

    JSONValue::Object info;
    SetMember(info, "name", JSONValue(serverInfo.name));
    SetMember(info, "version", JSONValue(serverInfo.version));

    JSONValue::Object meta;
    SetMember(meta, "sessionId", JSONValue(sessionId));

    JSONValue::Object result;
    SetMember(result, "protocolVersion", JSONValue(protocolVersion));
    SetMember(result, "capabilities", capabilities());
    SetMember(result, "serverInfo", JSONValue{info});
    SetMember(result, "_meta", JSONValue{meta});
    return makeResult(req, JSONValue{result});
}

std::unique_ptr<JSONRPCResponse> MethodDispatcher::handleToolsList(const JSONRPCRequest& req) {
    LOG_DEBUG("Handling tools/list request ({} tools)", tools.Size());
    JSONValue::Object result;
    SetMember(result, "tools", tools.ListSchemas());
    return makeResult(req, JSONValue{result});
}

JSONValue MethodDispatcher::executeTool(const std::optional<std::string>& name, const std::string& displayName,
                                        const JSONValue& arguments) {
    // Only a string name can select a tool
    const Tool* tool = name ? tools.Find(*name) : nullptr;
    if (tool == nullptr || !tool->handler) {
        return toolErrorPayload("Tool not found: " + displayName);
    }
    if (!arguments.IsObject()) {
        return toolErrorPayload("Tool execution failed: arguments must be an object");
    }
    try {
        Result<JSONValue> r = tool->handler->Invoke(std::get<JSONValue::Object>(arguments.value));
        if (!r.ok()) {
            return toolErrorPayload("Tool execution failed: " + r.error().message);
        }
        return r.value();
    } catch (const std::exception& e) {
        LOG_WARN("Tool '{}' threw: {}", displayName, e.what());
        return toolErrorPayload(std::string("Tool execution failed: ") + e.what());
    }
}

std::unique_ptr<JSONRPCResponse> MethodDispatcher::handleToolsCall(const JSONRPCRequest& req) {
    LOG_DEBUG("Handling tools/call request");
    const std::optional<std::string> name = GetStringMember(req.params, "name");
    const JSONValue* args = FindMember(req.params, "arguments");
    const JSONValue arguments = (args != nullptr) ? *args : JSONValue{JSONValue::Object{}};

    // Tool failures are reported as content, never as JSON-RPC errors
    JSONValue payload = executeTool(name, describeParam(req.params, "name"), arguments);

    JSONValue::Object item;
    SetMember(item, "type", JSONValue("text"));
    SetMember(item, "text", JSONValue(SerializeJSON(payload)));
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(JSONValue{item}));

    JSONValue::Object result;
    SetMember(result, "content", JSONValue{content});
    return makeResult(req, JSONValue{result});
}

std::unique_ptr<JSONRPCResponse> MethodDispatcher::handleResourcesList(const JSONRPCRequest& req) {
    LOG_DEBUG("Handling resources/list request ({} resources)", resources.Size());
    JSONValue::Object result;
    SetMember(result, "resources", resources.ListSchemas());
    return makeResult(req, JSONValue{result});
}

Result<std::string> MethodDispatcher::executeResource(const Resource* resource, const std::string& uri) {
    if (resource == nullptr || !resource->handler) {
        return Result<std::string>::Failure(JSONRPCErrorCodes::InvalidParams, "Resource not found: " + uri);
    }
    try {
        Result<std::string> r = resource->handler->Read();
        if (!r.ok()) {
            return Result<std::string>::Failure(JSONRPCErrorCodes::InvalidParams,
                                                "Resource fetch failed: " + r.error().message);
        }
        return r;
    } catch (const std::exception& e) {
        LOG_WARN("Resource '{}' threw: {}", uri, e.what());
        return Result<std::string>::Failure(JSONRPCErrorCodes::InvalidParams,
                                            std::string("Resource fetch failed: ") + e.what());
    }
}

std::unique_ptr<JSONRPCResponse> MethodDispatcher::handleResourcesRead(const JSONRPCRequest& req) {
    LOG_DEBUG("Handling resources/read request");
    const std::optional<std::string> requested = GetStringMember(req.params, "uri");
    const std::string uri = requested ? *requested : describeParam(req.params, "uri");
    const Resource* resource = requested ? resources.Find(*requested) : nullptr;

    Result<std::string> content = executeResource(resource, uri);
    if (!content.ok()) {
        return errors::makeErrorResponse(req.id, content.error());
    }

    JSONValue::Object entry;
    SetMember(entry, "uri", JSONValue(uri));
    SetMember(entry, "mimeType", JSONValue(resource->mimeType));
    SetMember(entry, "text", JSONValue(content.value()));
    JSONValue::Array contents;
    contents.push_back(std::make_shared<JSONValue>(JSONValue{entry}));

    JSONValue::Object result;
    SetMember(result, "contents", JSONValue{contents});
    return makeResult(req, JSONValue{result});
}

} // namespace micromcp
