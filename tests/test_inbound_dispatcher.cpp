//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inbound_dispatcher.cpp
// Purpose: Routing of server requests, notifications and responses
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "lspc/InboundDispatcher.h"

using namespace lspc;
using namespace std::chrono_literals;

namespace {
// Collects serialized responses written by the dispatcher
class ResponseSink {
public:
    InboundDispatcher::ResponseWriter writer() {
        return [this](const std::string& payload) {
            std::lock_guard<std::mutex> lock(mutex);
            written.push_back(payload);
            cv.notify_all();
        };
    }

    // Waits for at least n responses and returns them
    std::vector<std::string> waitFor(std::size_t n) {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, 5s, [&]() { return written.size() >= n; });
        return written;
    }

private:
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> written;
};

JSONRPCResponse parseResponse(const std::string& payload) {
    JSONRPCResponse response;
    EXPECT_TRUE(response.Deserialize(payload)) << payload;
    return response;
}

struct DispatcherFixture : public ::testing::Test {
    std::vector<std::string> outbound;
    RequestMultiplexer mux{[this](const std::string& p) { outbound.push_back(p); }, 0ms};
    ResponseSink sink;
    InboundDispatcher dispatcher{mux, sink.writer(), 4};
};
} // namespace

TEST_F(DispatcherFixture, UnhandledRequestGetsNullResult) {
    dispatcher.Dispatch(R"({"jsonrpc":"2.0","id":7,"method":"window/showDocument","params":{}})");
    auto written = sink.waitFor(1);
    ASSERT_EQ(written.size(), 1u);
    auto response = parseResponse(written[0]);
    EXPECT_EQ(std::get<int64_t>(response.id), 7);
    EXPECT_FALSE(response.IsError());
    ASSERT_TRUE(response.result.has_value());
    EXPECT_TRUE(response.result->isNull());
}

TEST_F(DispatcherFixture, HandlerResultIsSentWithRequestId) {
    dispatcher.SetRequestHandler("workspace/configuration", InboundDispatcher::WrapSync([](const JSONRPCRequest& req) {
        EXPECT_EQ(req.method, "workspace/configuration");
        return JSONValue(std::string("configured"));
    }));
    dispatcher.Dispatch(R"({"jsonrpc":"2.0","id":"cfg-1","method":"workspace/configuration","params":{"items":[]}})");
    auto response = parseResponse(sink.waitFor(1).at(0));
    EXPECT_EQ(std::get<std::string>(response.id), "cfg-1");
    EXPECT_EQ(std::get<std::string>(response.result->value), "configured");
}

TEST_F(DispatcherFixture, AsynchronousHandlerIsAwaited) {
    auto gate = std::make_shared<std::promise<JSONValue>>();
    dispatcher.SetRequestHandler("slow", [gate](const JSONRPCRequest&) { return gate->get_future(); });
    dispatcher.Dispatch(R"({"jsonrpc":"2.0","id":1,"method":"slow"})");
    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(sink.waitFor(0).empty());
    gate->set_value(JSONValue(int64_t(42)));
    auto response = parseResponse(sink.waitFor(1).at(0));
    EXPECT_EQ(std::get<int64_t>(response.result->value), 42);
}

TEST_F(DispatcherFixture, RpcErrorFromHandlerKeepsItsCode) {
    dispatcher.SetRequestHandler("client/registerCapability", InboundDispatcher::WrapSync([](const JSONRPCRequest&) -> JSONValue {
        errors::RpcErrorInfo info;
        info.code = JSONRPCErrorCodes::InvalidParams;
        info.message = "missing registrations";
        throw errors::LspException(info);
    }));
    dispatcher.Dispatch(R"({"jsonrpc":"2.0","id":3,"method":"client/registerCapability"})");
    auto response = parseResponse(sink.waitFor(1).at(0));
    ASSERT_TRUE(response.IsError());
    EXPECT_EQ(GetIntMember(response.error.value(), "code").value(), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(GetStringMember(response.error.value(), "message").value(), "missing registrations");
}

TEST_F(DispatcherFixture, OtherHandlerFailuresBecomeInternalError) {
    dispatcher.SetRequestHandler("boom", [](const JSONRPCRequest&) -> std::future<JSONValue> {
        throw std::runtime_error("handler exploded");
    });
    dispatcher.Dispatch(R"({"jsonrpc":"2.0","id":4,"method":"boom"})");
    auto response = parseResponse(sink.waitFor(1).at(0));
    ASSERT_TRUE(response.IsError());
    EXPECT_EQ(GetIntMember(response.error.value(), "code").value(), JSONRPCErrorCodes::InternalError);
}

TEST_F(DispatcherFixture, NullHandlerRestoresDefaultReply) {
    dispatcher.SetRequestHandler("x", InboundDispatcher::WrapSync([](const JSONRPCRequest&) { return JSONValue(true); }));
    dispatcher.SetRequestHandler("x", nullptr);
    dispatcher.Dispatch(R"({"jsonrpc":"2.0","id":5,"method":"x"})");
    auto response = parseResponse(sink.waitFor(1).at(0));
    EXPECT_TRUE(response.result->isNull());
}

TEST_F(DispatcherFixture, NotificationsForOneDocumentArriveInOrder) {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<int64_t> seenA;
    std::vector<int64_t> seenB;
    dispatcher.AddNotificationListener("textDocument/publishDiagnostics", [&](const JSONRPCNotification& n) {
        auto uri = GetStringMember(n.params.value(), "uri").value();
        auto version = GetIntMember(n.params.value(), "version").value();
        // Uneven work per message so reordering would show up
        std::this_thread::sleep_for(std::chrono::microseconds((version % 3) * 200));
        std::lock_guard<std::mutex> lock(mutex);
        (uri == "file:///a" ? seenA : seenB).push_back(version);
        cv.notify_all();
    });

    constexpr int N = 40;
    for (int i = 0; i < N; ++i) {
        for (const char* uri : {"file:///a", "file:///b"}) {
            dispatcher.Dispatch(std::string(R"({"jsonrpc":"2.0","method":"textDocument/publishDiagnostics","params":{"uri":")") +
                                uri + R"(","version":)" + std::to_string(i) + R"(,"diagnostics":[]}})");
        }
    }
    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, 5s, [&]() { return seenA.size() == N && seenB.size() == N; }));
    for (int i = 0; i < N; ++i) {
        EXPECT_EQ(seenA[static_cast<std::size_t>(i)], i);
        EXPECT_EQ(seenB[static_cast<std::size_t>(i)], i);
    }
}

TEST_F(DispatcherFixture, ThrowingListenerDoesNotStopOthers) {
    std::atomic<int> delivered{0};
    dispatcher.AddNotificationListener("window/logMessage", [](const JSONRPCNotification&) {
        throw std::runtime_error("listener bug");
    });
    dispatcher.AddNotificationListener("window/logMessage", [&](const JSONRPCNotification&) { ++delivered; });
    dispatcher.Dispatch(R"({"jsonrpc":"2.0","method":"window/logMessage","params":{"type":3,"message":"hi"}})");
    dispatcher.Dispatch(R"({"jsonrpc":"2.0","method":"window/logMessage","params":{"type":3,"message":"again"}})");
    dispatcher.Stop();
    EXPECT_EQ(delivered.load(), 2);
}

TEST_F(DispatcherFixture, RemovedListenerIsNotCalled) {
    std::atomic<int> calls{0};
    auto id = dispatcher.AddNotificationListener("$/progress", [&](const JSONRPCNotification&) { ++calls; });
    dispatcher.RemoveNotificationListener(id);
    dispatcher.Dispatch(R"({"jsonrpc":"2.0","method":"$/progress","params":{"token":1,"value":{}}})");
    dispatcher.Stop();
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(DispatcherFixture, ResponsesResolvePendingCalls) {
    auto handle = mux.Call("textDocument/hover");
    dispatcher.Dispatch(R"({"jsonrpc":"2.0","id":1,"result":{"contents":"doc"}})");
    ASSERT_EQ(handle.result.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(GetStringMember(handle.result.get(), "contents").value(), "doc");
}

TEST_F(DispatcherFixture, UnknownResponseAndGarbageAreDropped) {
    EXPECT_NO_THROW(dispatcher.Dispatch(R"({"jsonrpc":"2.0","id":99,"result":null})"));
    EXPECT_NO_THROW(dispatcher.Dispatch("{not json"));
    EXPECT_NO_THROW(dispatcher.Dispatch(R"({"jsonrpc":"2.0"})"));
    dispatcher.Stop();
    EXPECT_TRUE(sink.waitFor(0).empty());
}

TEST(InboundDispatcherKey, UsesDocumentUriWhenPresent) {
    EXPECT_EQ(InboundDispatcher::OrderingKey("m", std::nullopt), "m");
    EXPECT_EQ(InboundDispatcher::OrderingKey("m", ParseJSON(R"({"uri":"file:///x"})")), "m|file:///x");
    EXPECT_EQ(InboundDispatcher::OrderingKey("m", ParseJSON(R"({"textDocument":{"uri":"file:///y"}})")), "m|file:///y");
    EXPECT_EQ(InboundDispatcher::OrderingKey("m", ParseJSON(R"({"token":"t"})")), "m");
    EXPECT_EQ(InboundDispatcher::OrderingKey("m", ParseJSON("[1,2]")), "m");
}
