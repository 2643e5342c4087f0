//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SocketStream.hpp
// Purpose: Byte stream over a TCP connection to a language server listening on a socket
//==========================================================================================================
#pragma once

#include "lspc/Transport.h"
#include <memory>
#include <string>

namespace lspc {

//==========================================================================================================
// SocketStream
// Purpose: Blocking TCP byte stream built on Boost.Asio. Close() shuts the socket down in both
//          directions, which wakes a thread blocked in Read().
//==========================================================================================================
class SocketStream : public IByteStream {
public:
    virtual ~SocketStream();

    //==========================================================================================================
    // Connect
    // Purpose: Resolves host/port and connects to the first reachable endpoint.
    // Args:
    //   host: Host name or address (e.g. "127.0.0.1").
    //   port: Service name or port number as a string.
    // Returns:
    //   Connected stream. Throws errors::LspException(TransportClosed) when resolution or connect fails.
    //==========================================================================================================
    static std::unique_ptr<SocketStream> Connect(const std::string& host, const std::string& port);

    ////////////////////////////////////////// IByteStream //////////////////////////////////////////
    std::size_t Read(char* buf, std::size_t maxBytes) override;
    void Write(const std::string& data) override;
    void Close() override;
    std::string Describe() const override;

private:
    class Impl;
    explicit SocketStream(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> pImpl;
};

} // namespace lspc
