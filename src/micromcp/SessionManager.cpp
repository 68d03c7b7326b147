//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/micromcp/SessionManager.cpp
// Purpose: Single-slot session token management
//==========================================================================================================

#include <chrono>
#include <utility>

#include "logging/Logger.h"
#include "micromcp/SessionManager.h"

namespace micromcp {

SessionManager::SessionManager(std::string deviceId, MonotonicMillis clock)
    : deviceId(std::move(deviceId)), clock(std::move(clock)) {
    if (!this->clock) {
        this->clock = []() -> uint64_t {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now().time_since_epoch());
            return static_cast<uint64_t>(ms.count());
        };
    }
}

std::string SessionManager::CreateSession() {
    uint64_t stamp = clock();
    if (lastStamp.has_value() && stamp <= lastStamp.value()) {
        stamp = lastStamp.value() + 1;
    }
    lastStamp = stamp;
    token = deviceId + "-" + std::to_string(stamp);
    LOG_DEBUG("Generated session id: {}", token.value());
    return token.value();
}

bool SessionManager::Validate(const std::string& candidate) const {
    return token.has_value() && token.value() == candidate;
}

} // namespace micromcp
