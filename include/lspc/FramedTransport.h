//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FramedTransport.h
// Purpose: Content-Length framed message transport over an IByteStream
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "lspc/ContentFramer.h"
#include "lspc/Transport.h"

namespace lspc {

//==========================================================================================================
// FramedTransport
// Purpose: Writes and reads whole LSP base-protocol frames. One reader thread may call ReadFrame()
//          while any number of threads call WriteFrame(); writes are serialized so frames never
//          interleave. The payload is never interpreted.
//==========================================================================================================
class FramedTransport {
public:
    //==========================================================================================================
    // Args:
    //   stream: Underlying byte stream; shared so the owner can Close() it to unblock the reader.
    //   maxContentLength: Largest accepted frame body; a larger declared length is fatal.
    //==========================================================================================================
    explicit FramedTransport(std::shared_ptr<IByteStream> stream,
                             std::size_t maxContentLength = DefaultMaxContentLength);
    ~FramedTransport();

    FramedTransport(const FramedTransport&) = delete;
    FramedTransport& operator=(const FramedTransport&) = delete;

    //==========================================================================================================
    // WriteFrame
    // Purpose: Writes "Content-Length: <n>\r\n\r\n" followed by the payload as a single write.
    // Args:
    //   payload: Message body.
    // Returns:
    //   (none). Throws errors::LspException(TransportClosed) when the stream is closed or broken.
    //==========================================================================================================
    void WriteFrame(const std::string& payload);

    //==========================================================================================================
    // ReadFrame
    // Purpose: Blocks until a whole frame is buffered and returns its payload.
    // Notes:
    //   - Frames may arrive in arbitrarily small chunks; partial data is kept across calls.
    //   - A frame with a malformed header is skipped with a warning and reading resynchronizes on
    //     the next Content-Length header. Stray output with no blank line within
    //     MaxHeaderSectionSize bytes is discarded the same way.
    // Returns:
    //   Frame payload. Throws errors::LspException(TransportClosed) on end of stream (before a header
    //   or mid-frame) and when a declared length exceeds the configured maximum.
    //==========================================================================================================
    std::string ReadFrame();

    //==========================================================================================================
    // Close
    // Purpose: Closes the underlying stream; a blocked ReadFrame() then fails with TransportClosed.
    //==========================================================================================================
    void Close();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace lspc
