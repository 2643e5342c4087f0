//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PipeStream.hpp
// Purpose: Byte stream over a pair of POSIX file descriptors (a child process's stdio pipes)
//==========================================================================================================
#pragma once

#include "lspc/Transport.h"
#include <memory>

namespace lspc {

//==========================================================================================================
// PipeStream
// Purpose: Reads from one descriptor and writes to another. Takes ownership of both descriptors and
//          closes them on Close() or destruction. A blocked Read() is woken through an eventfd.
//==========================================================================================================
class PipeStream : public IByteStream {
public:
    //==========================================================================================================
    // Args:
    //   readFd: Descriptor to read from (child's stdout).
    //   writeFd: Descriptor to write to (child's stdin).
    //==========================================================================================================
    PipeStream(int readFd, int writeFd);
    virtual ~PipeStream();

    ////////////////////////////////////////// IByteStream //////////////////////////////////////////
    std::size_t Read(char* buf, std::size_t maxBytes) override;
    void Write(const std::string& data) override;
    void Close() override;
    std::string Describe() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace lspc
