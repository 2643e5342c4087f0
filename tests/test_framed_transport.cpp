//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_framed_transport.cpp
// Purpose: FramedTransport tests (chunked reads, resync after malformed headers, EOF handling)
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "lspc/FramedTransport.h"
#include "lspc/InMemoryStream.hpp"
#include "lspc/errors/Errors.h"

using namespace lspc;

namespace {
// Serves a fixed byte string at most `chunk` bytes per Read()
class ChunkedStream : public IByteStream {
public:
    ChunkedStream(std::string data, std::size_t chunk) : data(std::move(data)), chunk(chunk) {}

    std::size_t Read(char* buf, std::size_t maxBytes) override {
        const std::size_t n = std::min({chunk, maxBytes, data.size() - pos});
        std::copy_n(data.data() + pos, n, buf);
        pos += n;
        return n;
    }
    void Write(const std::string& d) override { written += d; }
    void Close() override {}
    std::string Describe() const override { return "chunked"; }

    std::string written;

private:
    std::string data;
    std::size_t chunk;
    std::size_t pos{0};
};

std::string frame(const std::string& payload) {
    return "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + payload;
}

void expectTransportClosed(FramedTransport& t) {
    try {
        (void)t.ReadFrame();
        FAIL() << "expected TransportClosed";
    } catch (const errors::LspException& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::TransportClosed);
    }
}
} // namespace

TEST(FramedTransport, ChunkSizesDecodeIdentically) {
    const std::vector<std::string> payloads = {
        R"({"jsonrpc":"2.0","id":1,"result":null})",
        R"({"jsonrpc":"2.0","method":"window/logMessage","params":{"type":3,"message":"hi"}})",
        "{}"
    };
    std::string wire;
    for (const auto& p : payloads) {
        wire += frame(p);
    }
    for (std::size_t chunk : {1u, 2u, 3u, 7u, 16u, 4096u}) {
        FramedTransport t(std::make_shared<ChunkedStream>(wire, chunk));
        for (const auto& p : payloads) {
            EXPECT_EQ(t.ReadFrame(), p) << "chunk=" << chunk;
        }
        expectTransportClosed(t);
    }
}

TEST(FramedTransport, EndOfStreamMidFrameIsTransportClosed) {
    FramedTransport t(std::make_shared<ChunkedStream>("Content-Length: 10\r\n\r\nabc", 4));
    try {
        (void)t.ReadFrame();
        FAIL() << "expected TransportClosed";
    } catch (const errors::LspException& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::TransportClosed);
        EXPECT_NE(std::string(e.what()).find("middle of a frame"), std::string::npos);
    }
}

TEST(FramedTransport, EndOfStreamBeforeHeaderIsTransportClosed) {
    FramedTransport t(std::make_shared<ChunkedStream>("", 4));
    expectTransportClosed(t);
}

TEST(FramedTransport, MalformedHeaderFrameIsSkipped) {
    const std::string wire = "Content-Length: abc\r\n\r\n{\"bad\":1}" + frame("{\"good\":1}");
    FramedTransport t(std::make_shared<ChunkedStream>(wire, 5));
    EXPECT_EQ(t.ReadFrame(), "{\"good\":1}");
}

TEST(FramedTransport, StrayOutputWithoutBlankLineIsDiscarded) {
    std::string noise;
    while (noise.size() < 64 * 1024) {
        noise += "server banner without any header terminator\n";
    }
    FramedTransport t(std::make_shared<ChunkedStream>(noise + frame("{\"good\":2}"), 1000));
    EXPECT_EQ(t.ReadFrame(), "{\"good\":2}");
    expectTransportClosed(t);
}

TEST(FramedTransport, OversizedFrameIsFatal) {
    FramedTransport t(std::make_shared<ChunkedStream>(frame("0123456789"), 64), 8);
    expectTransportClosed(t);
}

TEST(FramedTransport, WriteFrameAddsHeader) {
    auto stream = std::make_shared<ChunkedStream>("", 1);
    FramedTransport t(stream);
    t.WriteFrame("{}");
    t.WriteFrame("[1]");
    EXPECT_EQ(stream->written, frame("{}") + frame("[1]"));
}

TEST(FramedTransport, ConcurrentWritersNeverInterleave) {
    auto pair = InMemoryStream::CreatePair();
    std::shared_ptr<IByteStream> left = std::move(pair.first);
    std::shared_ptr<IByteStream> right = std::move(pair.second);
    FramedTransport writer(left);
    FramedTransport reader(right);

    constexpr int Threads = 4;
    constexpr int PerThread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < Threads; ++t) {
        threads.emplace_back([&writer, t]() {
            for (int i = 0; i < PerThread; ++i) {
                writer.WriteFrame(std::string(100 + t, static_cast<char>('a' + t)));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    for (int i = 0; i < Threads * PerThread; ++i) {
        std::string payload = reader.ReadFrame();
        ASSERT_FALSE(payload.empty());
        const char c = payload.front();
        EXPECT_EQ(payload, std::string(100 + (c - 'a'), c));
    }
}

TEST(FramedTransport, CloseUnblocksReader) {
    auto pair = InMemoryStream::CreatePair();
    std::shared_ptr<IByteStream> right = std::move(pair.second);
    FramedTransport reader(right);
    auto fut = std::async(std::launch::async, [&reader]() {
        try {
            (void)reader.ReadFrame();
        } catch (const errors::LspException& e) {
            return e.kind();
        }
        return errors::ErrorKind::ProtocolViolation;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    reader.Close();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(fut.get(), errors::ErrorKind::TransportClosed);
}
