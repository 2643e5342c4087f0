//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FramedTransport.cpp
// Purpose: Content-Length framed transport implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <mutex>
#include <string>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "lspc/FramedTransport.h"
#include "lspc/errors/Errors.h"

namespace lspc {

namespace {
constexpr std::size_t ReadChunkSize = 8192;
const std::string HeaderName = "content-length";

// Case-insensitive search for the Content-Length header name
std::size_t findHeaderName(const std::string& buf) {
    auto it = std::search(buf.begin(), buf.end(), HeaderName.begin(), HeaderName.end(),
        [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) == b; });
    return (it == buf.end()) ? std::string::npos : static_cast<std::size_t>(it - buf.begin());
}
} // namespace

class FramedTransport::Impl {
public:
    std::shared_ptr<IByteStream> stream;
    std::unique_ptr<IContentFramer> framer;
    std::size_t maxContentLength;
    std::mutex writeMutex;
    std::string readBuffer;
    bool resyncing{false};
    bool traceWire{false};

    Impl(std::shared_ptr<IByteStream> s, std::size_t maxLen)
        : stream(std::move(s)), framer(MakeContentLengthFramer(maxLen)), maxContentLength(maxLen) {
        const std::string trace = GetEnvOrDefault("LSPC_TRACE_WIRE", "0");
        traceWire = (trace == "1" || trace == "true" || trace == "TRUE");
    }

    // Pulls more bytes into readBuffer; false on end of stream
    bool fill() {
        std::vector<char> tmp(ReadChunkSize);
        std::size_t got = stream->Read(tmp.data(), tmp.size());
        if (got == 0) {
            return false;
        }
        readBuffer.append(tmp.data(), got);
        return true;
    }

    // Drops bytes until the next Content-Length header; keeps a tail that may hold a split header name
    void resync() {
        std::size_t pos = findHeaderName(readBuffer);
        if (pos != std::string::npos) {
            readBuffer.erase(0, pos);
            resyncing = false;
            return;
        }
        if (readBuffer.size() > HeaderName.size()) {
            readBuffer.erase(0, readBuffer.size() - HeaderName.size());
        }
    }
};

FramedTransport::FramedTransport(std::shared_ptr<IByteStream> stream, std::size_t maxContentLength)
    : pImpl(std::make_unique<Impl>(std::move(stream), maxContentLength)) {
    FUNC_SCOPE();
}

FramedTransport::~FramedTransport() { FUNC_SCOPE(); }

void FramedTransport::WriteFrame(const std::string& payload) {
    FUNC_SCOPE();
    std::string frame = pImpl->framer->encode(payload);
    if (pImpl->traceWire) {
        LOG_DEBUG("--> {}", payload);
    }
    std::lock_guard<std::mutex> lock(pImpl->writeMutex);
    pImpl->stream->Write(frame);
}

std::string FramedTransport::ReadFrame() {
    FUNC_SCOPE();
    for (;;) {
        if (pImpl->resyncing) {
            pImpl->resync();
        }
        if (!pImpl->resyncing && !pImpl->readBuffer.empty()) {
            auto r = pImpl->framer->tryDecodeEx(pImpl->readBuffer);
            switch (r.status) {
                case IContentFramer::DecodeStatus::Ok:
                    pImpl->readBuffer.erase(0, r.bytesConsumed);
                    if (pImpl->traceWire) {
                        LOG_DEBUG("<-- {}", r.payload.value());
                    }
                    return std::move(r.payload.value());
                case IContentFramer::DecodeStatus::InvalidHeader:
                    LOG_WARN("FramedTransport: skipping frame with malformed header on {}", pImpl->stream->Describe());
                    pImpl->readBuffer.erase(0, r.bytesConsumed);
                    pImpl->resyncing = true;
                    continue;
                case IContentFramer::DecodeStatus::BodyTooLarge:
                    throw errors::LspException(errors::ErrorKind::TransportClosed,
                        "frame exceeds maximum content length " + std::to_string(pImpl->maxContentLength));
                case IContentFramer::DecodeStatus::Incomplete:
                    break;
            }
        }
        if (!pImpl->fill()) {
            const bool midFrame = !pImpl->readBuffer.empty() && !pImpl->resyncing;
            throw errors::LspException(errors::ErrorKind::TransportClosed,
                midFrame ? "end of stream in the middle of a frame" : "end of stream");
        }
    }
}

void FramedTransport::Close() {
    FUNC_SCOPE();
    pImpl->stream->Close();
}

} // namespace lspc
