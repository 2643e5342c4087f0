//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryStream.hpp
// Purpose: In-memory byte stream pair for tests and embedding
//==========================================================================================================
#pragma once

#include "lspc/Transport.h"
#include <memory>
#include <utility>

namespace lspc {

//==========================================================================================================
// InMemoryStream
// Purpose: In-process byte stream. Bytes written on one end of a pair become readable on the other.
//          Closing either end ends both directions once buffered bytes are drained.
//==========================================================================================================
class InMemoryStream : public IByteStream {
public:
    virtual ~InMemoryStream();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired streams wired to each other in-memory.
    // Returns:
    //   pair(left,right) where writing on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryStream>, std::unique_ptr<InMemoryStream>> CreatePair();

    ////////////////////////////////////////// IByteStream //////////////////////////////////////////
    std::size_t Read(char* buf, std::size_t maxBytes) override;
    void Write(const std::string& data) override;
    void Close() override;
    std::string Describe() const override;

    //==========================================================================================================
    // BytesWritten
    // Purpose: Total bytes accepted by Write() on this end; lets tests assert that nothing hit the wire.
    //==========================================================================================================
    std::size_t BytesWritten() const;

private:
    class Impl;
    explicit InMemoryStream(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> pImpl;
};

} // namespace lspc
