//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryStream.cpp
// Purpose: In-memory byte stream implementation
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <random>
#include <string>

#include "logging/Logger.h"
#include "lspc/InMemoryStream.hpp"
#include "lspc/errors/Errors.h"

namespace lspc {

namespace {
// One direction of the pair; shared by the writing end and the reading end.
struct Channel {
    std::mutex mutex;
    std::condition_variable cv;
    std::string data;
    bool closed{false};
};
} // namespace

class InMemoryStream::Impl {
public:
    std::shared_ptr<Channel> inbound;
    std::shared_ptr<Channel> outbound;
    std::string name;
    std::atomic<std::size_t> bytesWritten{0};

    void closeChannel(Channel& ch) {
        {
            std::lock_guard<std::mutex> lock(ch.mutex);
            ch.closed = true;
        }
        ch.cv.notify_all();
    }
};

InMemoryStream::InMemoryStream(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) { FUNC_SCOPE(); }

InMemoryStream::~InMemoryStream() {
    FUNC_SCOPE();
    Close();
}

std::pair<std::unique_ptr<InMemoryStream>, std::unique_ptr<InMemoryStream>> InMemoryStream::CreatePair() {
    FUNC_SCOPE();
    auto leftToRight = std::make_shared<Channel>();
    auto rightToLeft = std::make_shared<Channel>();

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(1000, 9999);
    const std::string tag = std::to_string(dis(gen));

    auto left = std::make_unique<Impl>();
    left->outbound = leftToRight;
    left->inbound = rightToLeft;
    left->name = "memory-" + tag + "-L";

    auto right = std::make_unique<Impl>();
    right->outbound = rightToLeft;
    right->inbound = leftToRight;
    right->name = "memory-" + tag + "-R";

    return {
        std::unique_ptr<InMemoryStream>(new InMemoryStream(std::move(left))),
        std::unique_ptr<InMemoryStream>(new InMemoryStream(std::move(right)))
    };
}

std::size_t InMemoryStream::Read(char* buf, std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) {
        return 0;
    }
    Channel& ch = *pImpl->inbound;
    std::unique_lock<std::mutex> lock(ch.mutex);
    ch.cv.wait(lock, [&ch]() { return !ch.data.empty() || ch.closed; });
    if (ch.data.empty()) {
        return 0; // closed and drained
    }
    const std::size_t n = std::min(maxBytes, ch.data.size());
    std::memcpy(buf, ch.data.data(), n);
    ch.data.erase(0, n);
    return n;
}

void InMemoryStream::Write(const std::string& data) {
    FUNC_SCOPE();
    Channel& ch = *pImpl->outbound;
    {
        std::lock_guard<std::mutex> lock(ch.mutex);
        if (ch.closed) {
            throw errors::LspException(errors::ErrorKind::TransportClosed, pImpl->name + ": stream closed");
        }
        ch.data.append(data);
    }
    pImpl->bytesWritten += data.size();
    ch.cv.notify_all();
}

void InMemoryStream::Close() {
    FUNC_SCOPE();
    pImpl->closeChannel(*pImpl->outbound);
    pImpl->closeChannel(*pImpl->inbound);
}

std::string InMemoryStream::Describe() const {
    return pImpl->name;
}

std::size_t InMemoryStream::BytesWritten() const {
    return pImpl->bytesWritten.load();
}

} // namespace lspc
