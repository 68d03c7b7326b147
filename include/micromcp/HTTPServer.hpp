//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Sequential blocking TCP listener (Boost.Asio) delegating each connection to ConnectionHandler
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "micromcp/ConnectionHandler.h"

namespace micromcp {

  class HTTPServer {
  public:
    //==========================================================================================================
    // Options
    // Purpose: Bind configuration.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8080; 0 picks an ephemeral port)
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        uint16_t port{8080};
    };

    HTTPServer(const Options& opts, ConnectionHandler& handler);
    ~HTTPServer();

    //==========================================================================================================
    // Opens, binds and listens (backlog 1, SO_REUSEADDR).
    // Throws:
    //   boost::system::system_error when the address cannot be resolved or bound.
    //==========================================================================================================
    void Bind();

    //==========================================================================================================
    // Accepts one connection and hands it to the ConnectionHandler.
    // Returns:
    //   false when accept itself failed (logged); true once a connection was accepted and handled.
    // Notes:
    //   Handler failures are logged and swallowed so the caller's loop keeps running.
    //==========================================================================================================
    bool AcceptOne();

    //==========================================================================================================
    // Binds when needed, then accepts connections one at a time forever.
    // Consecutive accept failures are spaced out by AcceptBackoff().
    //==========================================================================================================
    [[noreturn]] void Run();

    // Pause before retrying after consecutiveFailures accept errors in a row:
    // zero when none, then 100 ms doubling per failure up to 1 s.
    static std::chrono::milliseconds AcceptBackoff(unsigned consecutiveFailures);

    // Actual bound port (useful with port 0); 0 before Bind()
    uint16_t LocalPort() const;

  private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

} // namespace micromcp
