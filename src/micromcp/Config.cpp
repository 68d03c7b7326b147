//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/micromcp/Config.cpp
// Purpose: Server configuration loading
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <system_error>

#include <boost/asio/ip/host_name.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/format.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "micromcp/Config.h"
#include "micromcp/Protocol.h"
#include "micromcp/version.h"

namespace micromcp {

namespace {
// Strict unsigned parse: digits only, no sign, no surrounding text
std::optional<unsigned long long> parseUnsigned(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
        return std::nullopt;
    }
    unsigned long long v = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return v;
}

errors::McpError invalidOption(const std::string& option, const std::string& value, const std::string& why) {
    return errors::makeError(JSONRPCErrorCodes::InvalidParams,
                             fmt::format("Invalid value for {}: '{}' ({})", option, value, why));
}

struct Source {
    const char* envName;
    const char* argName;
};

// Environment first, then the command line on top
std::optional<std::pair<std::string, std::string>> lookup(const Source& src, int argc, const char* const* argv,
                                                          const EnvLookup& env) {
    std::optional<std::pair<std::string, std::string>> found;
    if (auto v = env(src.envName)) {
        found = std::make_pair(std::string(src.envName), *v);
    }
    if (auto v = GetArgValue(argc, argv, src.argName)) {
        found = std::make_pair(std::string(src.argName), *v);
    }
    return found;
}
} // namespace

std::optional<std::string> GetArgValue(int argc, const char* const* argv, const std::string& key) {
    std::optional<std::string> result;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            result = a.substr(eq + 1);
        }
    }
    return result;
}

std::string HexEncode(const std::string& text) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(text.size() * 2);
    for (unsigned char c : text) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0f]);
    }
    return out;
}

std::string DefaultDeviceId() {
    try {
        std::string host = boost::asio::ip::host_name();
        if (!host.empty()) {
            return HexEncode(host);
        }
    } catch (const boost::system::system_error& e) {
        LOG_WARN("host_name() failed: {}", e.what());
    }
    return HexEncode("micromcp");
}

Result<ServerConfig> LoadConfig(int argc, const char* const* argv, const EnvLookup& envIn) {
    const EnvLookup env = envIn ? envIn : EnvLookup([](const char* name) { return GetEnvOptional(name); });

    ServerConfig cfg;
    cfg.version = getVersionString();
    cfg.protocolVersion = PROTOCOL_VERSION;

    if (auto v = lookup({"MICROMCP_ADDRESS", "--address"}, argc, argv, env)) {
        cfg.address = v->second;
    }
    if (auto v = lookup({"MICROMCP_PORT", "--port"}, argc, argv, env)) {
        auto n = parseUnsigned(v->second);
        if (!n) {
            return invalidOption(v->first, v->second, "not a number");
        }
        if (*n > std::numeric_limits<uint16_t>::max()) {
            return invalidOption(v->first, v->second, "out of range 0-65535");
        }
        cfg.port = static_cast<uint16_t>(*n);
    }
    if (auto v = lookup({"MICROMCP_SERVER_NAME", "--name"}, argc, argv, env)) {
        cfg.name = v->second;
    }
    if (auto v = lookup({"MICROMCP_DEVICE_ID", "--device-id"}, argc, argv, env)) {
        cfg.deviceId = v->second;
    }
    if (auto v = lookup({"MICROMCP_MAX_CONTENT_LENGTH", "--max-content-length"}, argc, argv, env)) {
        auto n = parseUnsigned(v->second);
        if (!n || *n == 0) {
            return invalidOption(v->first, v->second, "expected a positive integer");
        }
        if (*n > std::numeric_limits<std::size_t>::max()) {
            return invalidOption(v->first, v->second, "too large");
        }
        cfg.maxContentLength = static_cast<std::size_t>(*n);
    }
    if (auto v = lookup({"MICROMCP_LOG_LEVEL", "--log-level"}, argc, argv, env)) {
        cfg.logLevel = v->second;
    }
    if (auto v = lookup({"MICROMCP_LOG_FILE", "--log-file"}, argc, argv, env)) {
        cfg.logFile = v->second;
    }

    if (cfg.deviceId.empty()) {
        cfg.deviceId = DefaultDeviceId();
    }
    return cfg;
}

void ApplyLoggingConfig(const ServerConfig& config) {
    Logger::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty()) {
        Logger::setLogFile(config.logFile);
    }
}

} // namespace micromcp
