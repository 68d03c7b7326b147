//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TestHelpers.h
// Purpose: In-memory IConnection fake and Beast-based response parsing shared by the tests
//==========================================================================================================

#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/beast/http.hpp>

#include "micromcp/Connection.h"
#include "micromcp/JSONRPCTypes.h"

namespace micromcp::test {

//==========================================================================================================
// FakeConnection
// Purpose: Serves a scripted input in fixed-size pieces and records everything written.
//==========================================================================================================
class FakeConnection : public IConnection {
public:
    explicit FakeConnection(std::string input, std::size_t pieceSize = 7)
        : input(std::move(input)), pieceSize(pieceSize) {}

    std::string ReadSome(std::size_t maxBytes) override {
        ++reads;
        if (failReads) {
            throw std::runtime_error("read failed");
        }
        if (offset >= input.size()) {
            return std::string();
        }
        std::size_t n = std::min({maxBytes, pieceSize, input.size() - offset});
        std::string out = input.substr(offset, n);
        offset += n;
        return out;
    }

    void WriteAll(const std::string& data) override {
        if (failWrites) {
            throw std::runtime_error("write failed");
        }
        written += data;
    }

    void Close() override { ++closeCount; }
    std::string Peer() const override { return "fake:0"; }

    std::string input;
    std::size_t pieceSize;
    std::size_t offset{0};
    std::size_t reads{0};
    std::string written;
    int closeCount{0};
    bool failReads{false};
    bool failWrites{false};
};

using Response = boost::beast::http::response<boost::beast::http::string_body>;

// Parses raw HTTP response bytes; fails the current test when they are not one complete response.
inline Response ParseResponse(const std::string& raw) {
    namespace http = boost::beast::http;
    http::response_parser<http::string_body> parser;
    parser.eager(true);
    boost::asio::const_buffer buf(raw.data(), raw.size());
    boost::beast::error_code ec;
    while (!parser.is_done() && buf.size() > 0) {
        std::size_t n = parser.put(buf, ec);
        if (ec == http::error::need_more) {
            ec = {};
            if (n == 0) {
                break;
            }
        } else if (ec) {
            break;
        }
        buf += n;
    }
    if (!parser.is_done() && !ec) {
        parser.put_eof(ec);
    }
    EXPECT_FALSE(ec) << ec.message() << "\n" << raw;
    EXPECT_TRUE(parser.is_done()) << raw;
    return parser.release();
}

inline JSONValue ParseBody(const std::string& body) {
    JSONValue v;
    std::string err;
    EXPECT_TRUE(ParseJSON(body, v, err)) << err << " in: " << body;
    return v;
}

// Builds "METHOD PATH HTTP/1.1" with the given extra header lines and a Content-Length body.
inline std::string MakeRequest(const std::string& method, const std::string& path, const std::string& body = "",
                               const std::string& extraHeaders = "") {
    std::string req = method + " " + path + " HTTP/1.1\r\nHost: device.local\r\n" + extraHeaders;
    if (!body.empty()) {
        req += "Content-Type: application/json\r\nContent-Length: " + std::to_string(body.size()) + "\r\n";
    }
    req += "\r\n" + body;
    return req;
}

// Nested member lookup on a parsed value; nullptr when any step is missing.
inline const JSONValue* Path(const JSONValue& v, std::initializer_list<const char*> keys) {
    const JSONValue* cur = &v;
    for (const char* k : keys) {
        cur = FindMember(*cur, k);
        if (cur == nullptr) {
            return nullptr;
        }
    }
    return cur;
}

inline const JSONValue::Array& AsArray(const JSONValue& v) {
    return std::get<JSONValue::Array>(v.value);
}

inline std::string AsString(const JSONValue* v) {
    if (v == nullptr || !v->IsString()) {
        return "<not a string>";
    }
    return std::get<std::string>(v->value);
}

inline int64_t AsInt(const JSONValue* v) {
    if (v == nullptr || !std::holds_alternative<int64_t>(v->value)) {
        return -1;
    }
    return std::get<int64_t>(v->value);
}

} // namespace micromcp::test
