//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.h
// Purpose: Single-slot MCP session token (create / validate / clear)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace micromcp {

//==========================================================================================================
// SessionManager
// Purpose: Holds at most one active session token.
// Notes:
//   - Tokens are "<deviceId>-<monotonic milliseconds>"; the timestamp part is forced strictly
//     increasing so consecutive CreateSession() calls never repeat a token. Not cryptographically unique.
//   - No expiry. The slot is only cleared by ClearSession().
//==========================================================================================================
class SessionManager {
public:
    using MonotonicMillis = std::function<uint64_t()>;

    //==========================================================================================================
    // Constructs a manager for the given device identifier.
    // Args:
    //   deviceId: Stable device identifier used as the token prefix.
    //   clock: Monotonic millisecond source (defaults to std::chrono::steady_clock).
    //==========================================================================================================
    explicit SessionManager(std::string deviceId, MonotonicMillis clock = {});

    // Mints a new token, replacing any current one, and returns it.
    std::string CreateSession();

    std::optional<std::string> CurrentToken() const { return token; }

    void ClearSession() { token.reset(); }

    // Equality against the current token; always false when no session exists.
    bool Validate(const std::string& candidate) const;

    const std::string& DeviceId() const { return deviceId; }

private:
    std::string deviceId;
    MonotonicMillis clock;
    std::optional<std::string> token;
    std::optional<uint64_t> lastStamp;
};

} // namespace micromcp
