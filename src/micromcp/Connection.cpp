//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/micromcp/Connection.cpp
// Purpose: Blocking Boost.Asio TCP connection
//==========================================================================================================

#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include "logging/Logger.h"
#include "micromcp/Connection.h"

namespace micromcp {
namespace net = boost::asio;
using tcp = net::ip::tcp;

AsioConnection::AsioConnection(tcp::socket s) : socket(std::move(s)) {
    boost::system::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec) {
        peer = "<unknown>";
    } else {
        peer = ep.address().to_string() + ":" + std::to_string(ep.port());
    }
}

AsioConnection::~AsioConnection() {
    Close();
}

std::string AsioConnection::ReadSome(std::size_t maxBytes) {
    std::string chunk(maxBytes, '\0');
    boost::system::error_code ec;
    std::size_t n = socket.read_some(net::buffer(chunk.data(), chunk.size()), ec);
    if (ec == net::error::eof || ec == net::error::connection_reset) {
        return std::string();
    }
    if (ec) {
        throw boost::system::system_error(ec, "read");
    }
    chunk.resize(n);
    return chunk;
}

void AsioConnection::WriteAll(const std::string& data) {
    net::write(socket, net::buffer(data));
}

void AsioConnection::Close() {
    if (!socket.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != net::error::not_connected) {
        LOG_DEBUG("Socket shutdown for {}: {}", peer, ec.message());
    }
    socket.close(ec);
    if (ec) {
        LOG_WARN("Socket close for {} failed: {}", peer, ec.message());
    }
}

std::string AsioConnection::Peer() const {
    return peer;
}

} // namespace micromcp
