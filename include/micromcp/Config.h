//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server configuration from defaults, MICROMCP_* environment variables and --key=value arguments
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "micromcp/errors/Errors.h"

namespace micromcp {

//==========================================================================================================
// ServerConfig
// Purpose: Everything needed to construct and run a Server.
//==========================================================================================================
struct ServerConfig {
    std::string address{"0.0.0.0"};
    uint16_t port{8080};
    std::string name{"micromcp-server"};
    std::string version;
    std::string protocolVersion;
    std::string deviceId;
    std::size_t maxContentLength{1024 * 1024};
    std::string logLevel{"INFO"};
    std::string logFile;
};

// Environment lookup; returns empty optional when unset or empty
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--port")
// Returns:
//   Optional value string when present; empty optional otherwise. The last occurrence wins.
//==========================================================================================================
std::optional<std::string> GetArgValue(int argc, const char* const* argv, const std::string& key);

// Lowercase hex encoding of the bytes of text ("ab" -> "6162")
std::string HexEncode(const std::string& text);

// Hex of the host name, or "6d6963726f6d6370" ("micromcp") when the host name is unavailable
std::string DefaultDeviceId();

//==========================================================================================================
// LoadConfig
// Purpose: Builds a ServerConfig; each source overrides the previous (defaults, environment, arguments).
// Args:
//   argc/argv: Command line.
//   env: Environment lookup (defaults to the process environment).
// Returns:
//   The config, or an McpError (-32602) naming the offending option when a numeric value is invalid.
//==========================================================================================================
Result<ServerConfig> LoadConfig(int argc, const char* const* argv, const EnvLookup& env = EnvLookup{});

// Applies logLevel and logFile to the process-wide Logger.
void ApplyLoggingConfig(const ServerConfig& config);

} // namespace micromcp
