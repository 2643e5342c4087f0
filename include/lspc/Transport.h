//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Byte stream abstraction underneath the framed LSP transport
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace lspc {

//==========================================================================================================
// IByteStream
// Purpose: Duplex byte stream connecting the client to a language server. Implementations must allow
//          Write() from one thread while another thread is blocked in Read(), and Close() must unblock
//          a pending Read().
//==========================================================================================================
class IByteStream {
public:
    virtual ~IByteStream() = default;

    //==========================================================================================================
    // Reads up to maxBytes into buf, blocking until at least one byte is available.
    // Args:
    //   buf: Destination buffer.
    //   maxBytes: Capacity of buf.
    // Returns:
    //   Number of bytes read; 0 means end of stream (peer closed or Close() called).
    //   Throws errors::LspException(TransportClosed) on I/O failure.
    //==========================================================================================================
    virtual std::size_t Read(char* buf, std::size_t maxBytes) = 0;

    //==========================================================================================================
    // Writes all of data, blocking until it has been handed to the OS or peer.
    // Args:
    //   data: Bytes to write.
    // Returns:
    //   (none). Throws errors::LspException(TransportClosed) when the stream is closed or broken.
    //==========================================================================================================
    virtual void Write(const std::string& data) = 0;

    //==========================================================================================================
    // Closes both directions. Idempotent.
    //==========================================================================================================
    virtual void Close() = 0;

    //==========================================================================================================
    // Returns a short description for diagnostics (e.g. "pipe(r=5,w=8)", "tcp://127.0.0.1:2087").
    //==========================================================================================================
    virtual std::string Describe() const = 0;
};

// Concrete streams are declared in their respective headers:
//  - lspc/PipeStream.hpp
//  - lspc/SocketStream.hpp
//  - lspc/InMemoryStream.hpp

} // namespace lspc
