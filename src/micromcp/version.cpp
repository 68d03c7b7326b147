//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Library version helpers formatted with {fmt}.
//==========================================================================================================
#include "micromcp/version.h"

#include <fmt/format.h>

namespace micromcp {

namespace {
constexpr VersionInfo kVersion{1, 0, 0};
}

VersionInfo getVersion() {
    return kVersion;
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace micromcp
