//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/micromcp/HTTPServer.cpp
// Purpose: Sequential blocking HTTP listener using Boost.Asio
//==========================================================================================================

#include <algorithm>
#include <thread>
#include <utility>

#include <boost/asio.hpp>

#include "logging/Logger.h"
#include "micromcp/Connection.h"
#include "micromcp/HTTPServer.hpp"

namespace micromcp {
namespace net = boost::asio;
using tcp = net::ip::tcp;

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    ConnectionHandler& handler;

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;

    Impl(const HTTPServer::Options& o, ConnectionHandler& h) : opts(o), handler(h) {}

    void bind() {
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, std::to_string(opts.port));
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen(1);
        LOG_INFO("Listening on {}:{}", acceptor->local_endpoint().address().to_string(),
                 acceptor->local_endpoint().port());
    }

    bool acceptOne() {
        tcp::socket socket(ioc);
        boost::system::error_code ec;
        acceptor->accept(socket, ec);
        if (ec) {
            LOG_ERROR("HTTPServer accept error: {}", ec.message());
            return false;
        }
        try {
            AsioConnection conn(std::move(socket));
            LOG_DEBUG("Accepted connection from {}", conn.Peer());
            handler.Handle(conn);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer connection error: {}", e.what());
        }
        return true;
    }
};

HTTPServer::HTTPServer(const Options& opts, ConnectionHandler& handler)
    : pImpl(std::make_unique<Impl>(opts, handler)) {}

HTTPServer::~HTTPServer() = default;

void HTTPServer::Bind() {
    pImpl->bind();
}

bool HTTPServer::AcceptOne() {
    if (!pImpl->acceptor) {
        Bind();
    }
    return pImpl->acceptOne();
}

void HTTPServer::Run() {
    if (!pImpl->acceptor) {
        Bind();
    }
    unsigned failures = 0;
    for (;;) {
        if (pImpl->acceptOne()) {
            failures = 0;
            continue;
        }
        ++failures;
        std::this_thread::sleep_for(AcceptBackoff(failures));
    }
}

std::chrono::milliseconds HTTPServer::AcceptBackoff(unsigned consecutiveFailures) {
    constexpr std::chrono::milliseconds kInitial{100};
    constexpr std::chrono::milliseconds kMax{1000};
    if (consecutiveFailures == 0) {
        return std::chrono::milliseconds{0};
    }
    // 100 ms * 2^(n-1), shift clamped well before overflow
    const unsigned shift = std::min(consecutiveFailures - 1, 4u);
    return std::min(std::chrono::milliseconds{kInitial.count() << shift}, kMax);
}

uint16_t HTTPServer::LocalPort() const {
    if (!pImpl->acceptor) {
        return 0;
    }
    boost::system::error_code ec;
    auto ep = pImpl->acceptor->local_endpoint(ec);
    return ec ? 0 : ep.port();
}

} // namespace micromcp
