//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Example device server exposing demo tools and resources over MCP Streamable HTTP
//==========================================================================================================

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/system/system_error.hpp>

#include "logging/Logger.h"
#include "micromcp/Config.h"
#include "micromcp/Server.h"
#include "micromcp/version.h"

using namespace micromcp;

namespace {

JSONValue property(const std::string& type, const std::string& description) {
    JSONValue::Object p;
    SetMember(p, "type", JSONValue(type));
    SetMember(p, "description", JSONValue(description));
    return JSONValue{p};
}

JSONValue objectSchema(JSONValue::Object props, const std::vector<std::string>& required) {
    JSONValue::Object schema;
    SetMember(schema, "type", JSONValue("object"));
    SetMember(schema, "properties", JSONValue{std::move(props)});
    if (!required.empty()) {
        JSONValue::Array req;
        for (const auto& r : required) {
            req.push_back(std::make_shared<JSONValue>(r));
        }
        SetMember(schema, "required", JSONValue{req});
    }
    return JSONValue{schema};
}

// Numeric argument as double; integers and doubles are both accepted
std::optional<double> numberArg(const JSONValue::Object& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || !it->second) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(it->second->value)) {
        return static_cast<double>(std::get<int64_t>(it->second->value));
    }
    if (std::holds_alternative<double>(it->second->value)) {
        return std::get<double>(it->second->value);
    }
    return std::nullopt;
}

void registerDemoTools(Server& server, const ServerConfig& cfg, std::chrono::steady_clock::time_point started) {
    {
        JSONValue::Object props;
        SetMember(props, "message", property("string", "Text to echo back"));
        server.RegisterTool("echo", "Echo a message back to the caller", objectSchema(props, {"message"}),
            [](const JSONValue::Object& args) -> Result<JSONValue> {
                auto it = args.find("message");
                if (it == args.end() || !it->second || !it->second->IsString()) {
                    return Result<JSONValue>::Failure(JSONRPCErrorCodes::InvalidParams, "message must be a string");
                }
                JSONValue::Object out;
                SetMember(out, "echo", *it->second);
                return JSONValue{out};
            });
    }
    {
        JSONValue::Object props;
        SetMember(props, "a", property("number", "First addend"));
        SetMember(props, "b", property("number", "Second addend"));
        server.RegisterTool("add", "Add two numbers", objectSchema(props, {"a", "b"}),
            [](const JSONValue::Object& args) -> Result<JSONValue> {
                auto a = numberArg(args, "a");
                auto b = numberArg(args, "b");
                if (!a || !b) {
                    return Result<JSONValue>::Failure(JSONRPCErrorCodes::InvalidParams, "a and b must be numbers");
                }
                JSONValue::Object out;
                SetMember(out, "sum", JSONValue(*a + *b));
                return JSONValue{out};
            });
    }
    server.RegisterTool("uptime", "Milliseconds since the server started", objectSchema({}, {}),
        [started, deviceId = cfg.deviceId](const JSONValue::Object&) -> Result<JSONValue> {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
            JSONValue::Object out;
            SetMember(out, "device_id", JSONValue(deviceId));
            SetMember(out, "uptime_ms", JSONValue(static_cast<int64_t>(ms)));
            return JSONValue{out};
        });
}

void registerDemoResources(Server& server, const ServerConfig& cfg) {
    server.RegisterResource("device://info", "Device Info", "Static device identity", "application/json",
        [cfg]() -> Result<std::string> {
            JSONValue::Object info;
            SetMember(info, "name", JSONValue(cfg.name));
            SetMember(info, "version", JSONValue(cfg.version));
            SetMember(info, "device_id", JSONValue(cfg.deviceId));
            SetMember(info, "library_version", JSONValue(getVersionString()));
            return SerializeJSON(JSONValue{info});
        });
    server.RegisterResource("device://config", "Device Config", "Effective server configuration", "application/json",
        [cfg]() -> Result<std::string> {
            JSONValue::Object c;
            SetMember(c, "address", JSONValue(cfg.address));
            SetMember(c, "port", JSONValue(static_cast<int64_t>(cfg.port)));
            SetMember(c, "protocol_version", JSONValue(cfg.protocolVersion));
            SetMember(c, "max_content_length", JSONValue(static_cast<int64_t>(cfg.maxContentLength)));
            SetMember(c, "log_level", JSONValue(cfg.logLevel));
            return SerializeJSON(JSONValue{c});
        });
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    const auto started = std::chrono::steady_clock::now();

    Result<ServerConfig> loaded = LoadConfig(argc, argv);
    if (!loaded) {
        std::cerr << "micromcp_device_server: " << loaded.error().message << std::endl;
        return 2;
    }
    const ServerConfig& cfg = loaded.value();
    ApplyLoggingConfig(cfg);

    FramerOptions framing;
    framing.maxContentLength = cfg.maxContentLength;
    Server server(Implementation{cfg.name, cfg.version}, cfg.deviceId, cfg.protocolVersion, framing);
    registerDemoTools(server, cfg, started);
    registerDemoResources(server, cfg);

    HTTPServer::Options opts;
    opts.address = cfg.address;
    opts.port = cfg.port;
    try {
        server.Run(opts);
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Unable to listen on {}:{}: {}", cfg.address, cfg.port, e.what());
        return EXIT_FAILURE;
    }
}
