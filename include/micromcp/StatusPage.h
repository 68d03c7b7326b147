//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StatusPage.h
// Purpose: HTML diagnostics page served at GET /
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "micromcp/Protocol.h"
#include "micromcp/Registry.h"

namespace micromcp {

// Escapes &, <, >, " and ' for HTML text and attribute content.
std::string HtmlEscape(const std::string& text);

struct StatusSnapshot {
    Implementation serverInfo;
    std::string protocolVersion;
    std::optional<std::string> sessionId;
    const ToolRegistry* tools{nullptr};
    const ResourceRegistry* resources{nullptr};
};

//==========================================================================================================
// RenderStatusPage
// Purpose: Self-contained HTML page listing server identity, the current session and the registries.
// Notes:
//   Null registry pointers render as empty lists.
//==========================================================================================================
std::string RenderStatusPage(const StatusSnapshot& snapshot);

} // namespace micromcp
