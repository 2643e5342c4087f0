//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_socket_stream.cpp
// Purpose: TCP byte stream against a local Boost.Asio echo peer
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <thread>

#include <boost/asio.hpp>

#include "lspc/FramedTransport.h"
#include "lspc/SocketStream.hpp"
#include "lspc/errors/Errors.h"

using namespace lspc;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
// Accepts one connection on 127.0.0.1 and echoes bytes back until the peer closes
class EchoPeer {
public:
    EchoPeer() : acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
        port = acceptor.local_endpoint().port();
        worker = std::thread([this]() {
            boost::system::error_code ec;
            tcp::socket socket(ioc);
            acceptor.accept(socket, ec);
            if (ec) {
                return;
            }
            char buf[1024];
            for (;;) {
                std::size_t n = socket.read_some(net::buffer(buf), ec);
                if (ec) {
                    break;
                }
                net::write(socket, net::buffer(buf, n), ec);
                if (ec) {
                    break;
                }
            }
        });
    }

    ~EchoPeer() {
        boost::system::error_code ec;
        acceptor.close(ec);
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::string Port() const { return std::to_string(port); }

private:
    net::io_context ioc;
    tcp::acceptor acceptor;
    unsigned short port{0};
    std::thread worker;
};
} // namespace

TEST(SocketStream, FramesRoundTripThroughEchoPeer) {
    EchoPeer peer;
    std::shared_ptr<IByteStream> stream = SocketStream::Connect("127.0.0.1", peer.Port());
    EXPECT_EQ(stream->Describe(), "tcp://127.0.0.1:" + peer.Port());

    FramedTransport transport(stream);
    transport.WriteFrame(R"({"jsonrpc":"2.0","method":"initialized","params":{}})");
    transport.WriteFrame(R"({"jsonrpc":"2.0","id":1,"method":"shutdown"})");
    EXPECT_EQ(transport.ReadFrame(), R"({"jsonrpc":"2.0","method":"initialized","params":{}})");
    EXPECT_EQ(transport.ReadFrame(), R"({"jsonrpc":"2.0","id":1,"method":"shutdown"})");
    transport.Close();
}

TEST(SocketStream, CloseUnblocksReaderAndRejectsWrites) {
    EchoPeer peer;
    auto stream = SocketStream::Connect("127.0.0.1", peer.Port());
    std::thread reader([&]() {
        char buf[16];
        EXPECT_EQ(stream->Read(buf, sizeof(buf)), 0u);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stream->Close();
    reader.join();
    EXPECT_THROW(stream->Write("x"), errors::LspException);
}

TEST(SocketStream, ConnectionRefusedIsTransportClosed) {
    std::string port;
    {
        net::io_context ioc;
        tcp::acceptor portFinder(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = std::to_string(portFinder.local_endpoint().port());
    }
    try {
        (void)SocketStream::Connect("127.0.0.1", port);
        FAIL() << "expected connect to fail";
    } catch (const errors::LspException& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::TransportClosed);
    }
}
