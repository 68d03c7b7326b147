//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/micromcp/StatusPage.cpp
// Purpose: HTML diagnostics page rendering
//==========================================================================================================

#include <fmt/format.h>

#include "micromcp/StatusPage.h"

namespace micromcp {

std::string HtmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string RenderStatusPage(const StatusSnapshot& s) {
    const std::size_t toolCount = s.tools ? s.tools->Size() : 0;
    const std::size_t resourceCount = s.resources ? s.resources->Size() : 0;

    std::string html;
    html += "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\">";
    html += fmt::format("<title>{}</title>", HtmlEscape(s.serverInfo.name));
    html += "<style>body{font-family:sans-serif;margin:2em}code{background:#eee;padding:0 .3em}</style>";
    html += "</head><body>\n";
    html += fmt::format("<h1>{}</h1>\n", HtmlEscape(s.serverInfo.name));
    html += "<ul>\n";
    html += fmt::format("<li>Version: {}</li>\n", HtmlEscape(s.serverInfo.version));
    html += fmt::format("<li>Protocol: {}</li>\n", HtmlEscape(s.protocolVersion));
    html += fmt::format("<li>Endpoint: <code>POST {}</code></li>\n", MCP_ENDPOINT);
    html += fmt::format("<li>Session: {}</li>\n",
                        s.sessionId ? "<code>" + HtmlEscape(*s.sessionId) + "</code>" : std::string("none"));
    html += "</ul>\n";

    html += fmt::format("<h2>Tools ({})</h2>\n", toolCount);
    if (toolCount == 0) {
        html += "<p>No tools registered</p>\n";
    } else {
        html += "<ul>\n";
        for (const auto& t : s.tools->List()) {
            html += fmt::format("<li><code>{}</code>: {}</li>\n", HtmlEscape(t.name), HtmlEscape(t.description));
        }
        html += "</ul>\n";
    }

    html += fmt::format("<h2>Resources ({})</h2>\n", resourceCount);
    if (resourceCount == 0) {
        html += "<p>No resources registered</p>\n";
    } else {
        html += "<ul>\n";
        for (const auto& r : s.resources->List()) {
            html += fmt::format("<li><code>{}</code> ({}): {}</li>\n",
                                HtmlEscape(r.uri), HtmlEscape(r.mimeType), HtmlEscape(r.description));
        }
        html += "</ul>\n";
    }
    html += "</body></html>\n";
    return html;
}

} // namespace micromcp
