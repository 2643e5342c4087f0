//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PipeStream.cpp
// Purpose: POSIX pipe byte stream with eventfd wake-up for Close()
//==========================================================================================================

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "lspc/PipeStream.hpp"
#include "lspc/errors/Errors.h"

namespace lspc {

namespace {
// Writing to a pipe whose reader exited raises SIGPIPE; surface it as EPIPE instead
void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() {
        ::signal(SIGPIPE, SIG_IGN);
        LOG_DEBUG("PipeStream: SIGPIPE ignored for this process");
    });
}
} // namespace

class PipeStream::Impl {
public:
    int readFd{-1};
    int writeFd{-1};
    int wakeEventFd{-1};
    std::atomic<bool> closed{false};
    std::mutex writeMutex; // serializes writes and the close of writeFd
    std::string description;

    Impl(int r, int w) : readFd(r), writeFd(w) {
        description = std::format("pipe(r={},w={})", r, w);
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("PipeStream: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
        // Non-blocking writes so a full pipe can still be interrupted by Close()
        int flags = ::fcntl(writeFd, F_GETFL, 0);
        if (flags >= 0) { (void)::fcntl(writeFd, F_SETFL, flags | O_NONBLOCK); }
    }

    ~Impl() {
        closeWriteEnd();
        if (readFd >= 0) { ::close(readFd); readFd = -1; }
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void closeWriteEnd() {
        std::lock_guard<std::mutex> lock(writeMutex);
        if (writeFd >= 0) {
            ::close(writeFd);
            writeFd = -1;
        }
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            LOG_WARN("PipeStream: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
    }
};

PipeStream::PipeStream(int readFd, int writeFd) : pImpl(std::make_unique<Impl>(readFd, writeFd)) {
    FUNC_SCOPE();
    ignoreSigpipeOnce();
}

PipeStream::~PipeStream() {
    FUNC_SCOPE();
    Close();
}

std::size_t PipeStream::Read(char* buf, std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) {
        return 0;
    }
    for (;;) {
        if (pImpl->closed.load()) {
            return 0;
        }
        struct pollfd pfds[2];
        nfds_t nfds = 0;
        pfds[nfds++] = { pImpl->readFd, POLLIN, 0 };
        if (pImpl->wakeEventFd >= 0) {
            pfds[nfds++] = { pImpl->wakeEventFd, POLLIN, 0 };
        }
        int rc = ::poll(pfds, nfds, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw errors::LspException(errors::ErrorKind::TransportClosed,
                std::format("{}: poll failed (errno={} msg={})", pImpl->description, errno, ::strerror(errno)));
        }
        if (nfds > 1 && (pfds[1].revents & POLLIN)) {
            return 0; // Close() requested
        }
        if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t got = ::read(pImpl->readFd, buf, maxBytes);
            if (got > 0) {
                return static_cast<std::size_t>(got);
            }
            if (got == 0) {
                return 0;
            }
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            throw errors::LspException(errors::ErrorKind::TransportClosed,
                std::format("{}: read failed (errno={} msg={})", pImpl->description, errno, ::strerror(errno)));
        }
        if (pfds[0].revents & POLLNVAL) {
            return 0;
        }
    }
}

void PipeStream::Write(const std::string& data) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->writeMutex);
    if (pImpl->closed.load() || pImpl->writeFd < 0) {
        throw errors::LspException(errors::ErrorKind::TransportClosed, pImpl->description + ": stream closed");
    }
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(pImpl->writeFd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                struct pollfd pfds[2];
                nfds_t nfds = 0;
                pfds[nfds++] = { pImpl->writeFd, POLLOUT, 0 };
                if (pImpl->wakeEventFd >= 0) {
                    pfds[nfds++] = { pImpl->wakeEventFd, POLLIN, 0 };
                }
                int rc = ::poll(pfds, nfds, -1);
                if (rc < 0 && errno != EINTR) {
                    throw errors::LspException(errors::ErrorKind::TransportClosed,
                        std::format("{}: poll failed (errno={} msg={})", pImpl->description, errno, ::strerror(errno)));
                }
                if (pImpl->closed.load()) {
                    throw errors::LspException(errors::ErrorKind::TransportClosed, pImpl->description + ": stream closed");
                }
                continue;
            }
            throw errors::LspException(errors::ErrorKind::TransportClosed,
                std::format("{}: write failed (errno={} msg={})", pImpl->description, errno, ::strerror(errno)));
        }
        off += static_cast<std::size_t>(n);
    }
}

void PipeStream::Close() {
    FUNC_SCOPE();
    if (pImpl->closed.exchange(true)) {
        return;
    }
    LOG_DEBUG("PipeStream: closing {}", pImpl->description);
    pImpl->wake();
    pImpl->closeWriteEnd();
}

std::string PipeStream::Describe() const {
    return pImpl->description;
}

} // namespace lspc
