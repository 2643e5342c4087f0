//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: LSP base protocol framing ("Content-Length: <n>\r\n\r\n<body>") without any I/O
//========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace lspc {

// Largest frame body accepted unless SessionOptions says otherwise (64 MiB)
constexpr std::size_t DefaultMaxContentLength = 64 * 1024 * 1024;

// Longest header section buffered while waiting for the blank line that ends it
constexpr std::size_t MaxHeaderSectionSize = 8 * 1024;

//========================================================================================================
// IContentFramer
// Purpose: Pure encode/decode of base protocol frames over a caller-owned byte buffer.
// Notes:
//   - Header names are matched case-insensitively; Content-Type and unknown headers are ignored.
//   - Content-Length counts bytes of the UTF-8 body, never characters.
//========================================================================================================
class IContentFramer {
public:
    virtual ~IContentFramer() = default;

    enum class DecodeStatus {
        Ok,             // a whole frame is at the front of the buffer
        Incomplete,     // header or body still partial; read more
        InvalidHeader,  // header block without a usable Content-Length, or no blank line within
                        // MaxHeaderSectionSize bytes; skip bytesConsumed
        BodyTooLarge    // declared length over the configured maximum
    };

    //========================================================================================================
    // DecodeResult
    // Fields:
    //   payload: Frame body when status == Ok.
    //   bytesConsumed: Ok: whole frame size. InvalidHeader/BodyTooLarge: header block size including the
    //                  blank line, or the whole buffer when the header section overran its limit.
    //                  Incomplete: 0.
    //========================================================================================================
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload;
        std::size_t bytesConsumed{0};
    };

    // Prepends the Content-Length header to payload
    virtual std::string encode(const std::string& payload) = 0;

    // Examines the front of buffer without modifying it
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

// Creates the Content-Length framer; larger declared bodies decode as BodyTooLarge
std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = DefaultMaxContentLength);

} // namespace lspc
