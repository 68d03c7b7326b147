//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/micromcp/HTTPFramer.cpp
// Purpose: Content-Length based HTTP/1.1 request framing over IConnection
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "logging/Logger.h"
#include "micromcp/HTTPFramer.h"

namespace micromcp {

namespace {
const std::string kTerminator = "\r\n\r\n";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char ch){ return !std::isspace(ch); };
    auto b = std::find_if(s.begin(), s.end(), notSpace);
    auto e = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (b < e) ? std::string(b, e) : std::string();
}

std::vector<std::string> splitLines(const std::string& block) {
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos <= block.size()) {
        std::size_t eol = block.find('\n', pos);
        std::string line = block.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        if (eol == std::string::npos) {
            break;
        }
        pos = eol + 1;
    }
    return lines;
}

enum class LengthStatus { Ok, TooLarge };

// Scans the header block for Content-Length. Missing or malformed values yield 0.
LengthStatus declaredLength(const std::vector<std::string>& lines, std::size_t maxLen, std::size_t& out) {
    out = 0;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        auto colon = line.find(':');
        if (colon == std::string::npos || toLower(trim(line.substr(0, colon))) != "content-length") {
            continue;
        }
        const std::string value = trim(line.substr(colon + 1));
        unsigned long long v64 = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), v64);
        if (ec == std::errc::result_out_of_range) {
            LOG_WARN("Content-Length {} exceeds limits (max={})", value, maxLen);
            return LengthStatus::TooLarge;
        }
        if (ec != std::errc() || ptr != value.data() + value.size()) {
            LOG_WARN("Invalid Content-Length header: '{}', assuming 0", value);
            return LengthStatus::Ok;
        }
        if (v64 > maxLen) {
            LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxLen);
            return LengthStatus::TooLarge;
        }
        out = static_cast<std::size_t>(v64);
        return LengthStatus::Ok;
    }
    return LengthStatus::Ok;
}
} // namespace

std::optional<std::string> HTTPRequestFrame::Header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<HTTPRequestFrame> ReadHTTPRequest(IConnection& conn, const FramerOptions& opts) {
    std::string buffer;
    std::size_t headerEnd = std::string::npos;
    bool closed = false;

    // Phase 1: headers
    while (headerEnd == std::string::npos) {
        std::string chunk = conn.ReadSome(opts.chunkSize);
        if (chunk.empty()) {
            closed = true;
            break;
        }
        buffer.append(chunk);
        headerEnd = buffer.find(kTerminator);
    }

    if (buffer.empty()) {
        LOG_DEBUG("Connection from {} closed before sending any data", conn.Peer());
        return std::nullopt;
    }

    HTTPRequestFrame frame;
    frame.headersComplete = (headerEnd != std::string::npos);
    const std::string headerBlock = frame.headersComplete ? buffer.substr(0, headerEnd) : buffer;
    const std::vector<std::string> lines = splitLines(headerBlock);

    // Phase 2: body
    if (frame.headersComplete) {
        std::size_t contentLength = 0;
        if (declaredLength(lines, opts.maxContentLength, contentLength) == LengthStatus::TooLarge) {
            return std::nullopt;
        }
        frame.body = buffer.substr(headerEnd + kTerminator.size());
        while (!closed && frame.body.size() < contentLength) {
            std::string chunk = conn.ReadSome(opts.chunkSize);
            if (chunk.empty()) {
                closed = true;
                break;
            }
            frame.body.append(chunk);
        }
        if (frame.body.size() < contentLength) {
            LOG_WARN("Body truncated: expected {} bytes, received {}", contentLength, frame.body.size());
        }
    } else {
        LOG_WARN("Stream from {} ended before the header terminator", conn.Peer());
    }

    // Request line
    std::istringstream requestLine(lines.empty() ? std::string() : lines.front());
    if (!(requestLine >> frame.method >> frame.path)) {
        LOG_WARN("Malformed request line from {}", conn.Peer());
        return std::nullopt;
    }

    // Header lines; first occurrence wins
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = toLower(trim(line.substr(0, colon)));
        if (key.empty()) {
            continue;
        }
        frame.headers.emplace(std::move(key), trim(line.substr(colon + 1)));
    }
    return frame;
}

} // namespace micromcp
