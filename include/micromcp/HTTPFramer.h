//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPFramer.h
// Purpose: Reconstructs one HTTP/1.1 request from a raw connection byte stream
//==========================================================================================================

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "micromcp/Connection.h"

namespace micromcp {

//==========================================================================================================
// HTTPRequestFrame
// Purpose: One framed request.
// Fields:
//   method/path: First two tokens of the request line.
//   headers: Lowercased names; on duplicates the first value seen is kept.
//   body: Bytes after the header terminator (may be shorter than declared when the peer closed early).
//   headersComplete: False when the stream ended before the blank line was seen.
//==========================================================================================================
struct HTTPRequestFrame {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    bool headersComplete{false};

    // Case-insensitive lookup; empty optional when absent
    std::optional<std::string> Header(const std::string& name) const;
};

struct FramerOptions {
    std::size_t maxContentLength{1024 * 1024};
    std::size_t chunkSize{1024};
};

//==========================================================================================================
// ReadHTTPRequest
// Purpose: Reads until the header terminator, then until Content-Length body bytes have arrived.
// Returns:
//   The frame, or std::nullopt when nothing was received, the request line is malformed, or the
//   declared Content-Length exceeds opts.maxContentLength.
// Notes:
//   A missing or malformed Content-Length is treated as 0.
//==========================================================================================================
std::optional<HTTPRequestFrame> ReadHTTPRequest(IConnection& conn, const FramerOptions& opts = FramerOptions{});

} // namespace micromcp
