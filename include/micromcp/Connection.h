//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.h
// Purpose: Byte-stream connection capability and its Boost.Asio TCP implementation
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>

#include <boost/asio/ip/tcp.hpp>

namespace micromcp {

//==========================================================================================================
// IConnection
// Purpose: One accepted, bidirectional byte stream.
// Methods:
//   ReadSome(maxBytes): Blocks until at least one byte arrives; returns "" when the peer closed.
//   WriteAll(data): Writes every byte or throws.
//   Close(): Shuts the stream down; safe to call more than once.
//   Peer(): Human-readable remote endpoint for logging.
//==========================================================================================================
class IConnection {
public:
    virtual ~IConnection() = default;
    virtual std::string ReadSome(std::size_t maxBytes) = 0;
    virtual void WriteAll(const std::string& data) = 0;
    virtual void Close() = 0;
    virtual std::string Peer() const = 0;
};

//==========================================================================================================
// AsioConnection
// Purpose: IConnection over a connected boost::asio TCP socket (synchronous calls only).
// Notes:
//   - End of stream maps to an empty read; any other socket error throws boost::system::system_error.
//==========================================================================================================
class AsioConnection : public IConnection {
public:
    explicit AsioConnection(boost::asio::ip::tcp::socket socket);
    ~AsioConnection() override;

    std::string ReadSome(std::size_t maxBytes) override;
    void WriteAll(const std::string& data) override;
    void Close() override;
    std::string Peer() const override;

private:
    boost::asio::ip::tcp::socket socket;
    std::string peer;
};

} // namespace micromcp
