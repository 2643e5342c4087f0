//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SocketStream.cpp
// Purpose: TCP byte stream implementation using Boost.Asio
//==========================================================================================================

#include <atomic>
#include <mutex>
#include <string>

#include <boost/asio.hpp>

#include "logging/Logger.h"
#include "lspc/SocketStream.hpp"
#include "lspc/errors/Errors.h"

namespace lspc {

namespace net = boost::asio;
using tcp = net::ip::tcp;

class SocketStream::Impl {
public:
    net::io_context ioc;
    tcp::socket socket{ioc};
    std::mutex writeMutex;
    std::atomic<bool> closed{false};
    std::string description;
};

SocketStream::SocketStream(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) { FUNC_SCOPE(); }

SocketStream::~SocketStream() {
    FUNC_SCOPE();
    Close();
    boost::system::error_code ec;
    pImpl->socket.close(ec);
}

std::unique_ptr<SocketStream> SocketStream::Connect(const std::string& host, const std::string& port) {
    FUNC_SCOPE();
    auto impl = std::make_unique<Impl>();
    boost::system::error_code ec;
    tcp::resolver resolver(impl->ioc);
    auto results = resolver.resolve(host, port, ec);
    if (ec) {
        throw errors::LspException(errors::ErrorKind::TransportClosed,
            "resolve " + host + ":" + port + " failed: " + ec.message());
    }
    net::connect(impl->socket, results, ec);
    if (ec) {
        throw errors::LspException(errors::ErrorKind::TransportClosed,
            "connect " + host + ":" + port + " failed: " + ec.message());
    }
    impl->socket.set_option(tcp::no_delay(true), ec);
    if (ec) {
        LOG_WARN("SocketStream: TCP_NODELAY not applied: {}", ec.message());
    }
    impl->description = "tcp://" + host + ":" + port;
    LOG_INFO("SocketStream: connected to {}", impl->description);
    return std::unique_ptr<SocketStream>(new SocketStream(std::move(impl)));
}

std::size_t SocketStream::Read(char* buf, std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0 || pImpl->closed.load()) {
        return 0;
    }
    boost::system::error_code ec;
    std::size_t n = pImpl->socket.read_some(net::buffer(buf, maxBytes), ec);
    if (ec == net::error::eof) {
        return 0;
    }
    if (ec) {
        if (pImpl->closed.load()) {
            return 0; // woken by Close()
        }
        throw errors::LspException(errors::ErrorKind::TransportClosed,
            pImpl->description + ": read failed: " + ec.message());
    }
    return n;
}

void SocketStream::Write(const std::string& data) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->writeMutex);
    if (pImpl->closed.load()) {
        throw errors::LspException(errors::ErrorKind::TransportClosed, pImpl->description + ": stream closed");
    }
    boost::system::error_code ec;
    net::write(pImpl->socket, net::buffer(data), ec);
    if (ec) {
        throw errors::LspException(errors::ErrorKind::TransportClosed,
            pImpl->description + ": write failed: " + ec.message());
    }
}

void SocketStream::Close() {
    FUNC_SCOPE();
    if (pImpl->closed.exchange(true)) {
        return;
    }
    LOG_DEBUG("SocketStream: closing {}", pImpl->description);
    boost::system::error_code ec;
    pImpl->socket.shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != net::error::not_connected) {
        LOG_DEBUG("SocketStream: shutdown reported {}", ec.message());
    }
}

std::string SocketStream::Describe() const {
    return pImpl->description;
}

} // namespace lspc
