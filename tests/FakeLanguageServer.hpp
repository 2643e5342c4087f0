//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeLanguageServer.hpp
// Purpose: Scriptable in-process language server speaking framed JSON-RPC over an InMemoryStream
//==========================================================================================================
#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <gtest/gtest.h>

#include "lspc/FramedTransport.h"
#include "lspc/InMemoryStream.hpp"
#include "lspc/MessageCodec.h"
#include "lspc/errors/Errors.h"

namespace lspc {
namespace fake {

//==========================================================================================================
// FakeLanguageServer
// Purpose: Owns the server end of an in-memory stream pair. Every inbound message is recorded; requests
//          whose method has a canned reply are answered, the others are left pending until Respond().
//          "initialize" and "shutdown" are answered by default and "exit" closes the stream.
//==========================================================================================================
class FakeLanguageServer {
public:
    explicit FakeLanguageServer(const std::string& capabilitiesJson = R"({"definitionProvider":true})") {
        auto [client, server] = InMemoryStream::CreatePair();
        clientRaw = client.get();
        clientEnd = std::shared_ptr<InMemoryStream>(std::move(client));
        transport = std::make_unique<FramedTransport>(std::shared_ptr<IByteStream>(std::move(server)));
        codec = MakeMessageCodec();
        SetReply("initialize", ParseJSON(std::string(R"({"capabilities":)") + capabilitiesJson +
                                         R"(,"serverInfo":{"name":"fake","version":"1.0"}})"));
        SetReply("shutdown", JSONValue(nullptr));
        reader = std::thread([this]() { readLoop(); });
    }

    ~FakeLanguageServer() {
        Close();
        if (reader.joinable()) {
            reader.join();
        }
    }

    FakeLanguageServer(const FakeLanguageServer&) = delete;
    FakeLanguageServer& operator=(const FakeLanguageServer&) = delete;

    // Client end to hand to Session::Attach; its BytesWritten() counts client traffic
    std::shared_ptr<IByteStream> ClientStream() const { return clientEnd; }
    std::size_t ClientBytesWritten() const { return clientRaw->BytesWritten(); }

    void SetReply(const std::string& method, JSONValue result) {
        std::lock_guard<std::mutex> lock(mutex);
        replies[method] = CannedReply{std::move(result), false};
    }

    void SetErrorReply(const std::string& method, int code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        replies[method] = CannedReply{CreateErrorObject(code, message), true};
    }

    // Leaves requests for method unanswered
    void ClearReply(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex);
        replies.erase(method);
    }

    void Respond(const JSONRPCId& id, JSONValue result) {
        Send(JSONRPCResponse(id, std::move(result)).Serialize());
    }

    void Send(const std::string& payload) { transport->WriteFrame(payload); }

    void Close() { transport->Close(); }

    std::vector<JSONRPCRequest> Requests(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<JSONRPCRequest> out;
        for (const auto& m : received) {
            if (const auto* r = std::get_if<JSONRPCRequest>(&m); r && r->method == method) {
                out.push_back(*r);
            }
        }
        return out;
    }

    std::vector<JSONRPCNotification> Notifications(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<JSONRPCNotification> out;
        for (const auto& m : received) {
            if (const auto* n = std::get_if<JSONRPCNotification>(&m); n && n->method == method) {
                out.push_back(*n);
            }
        }
        return out;
    }

    std::optional<JSONRPCResponse> ResponseTo(const std::string& idStr) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& m : received) {
            if (const auto* r = std::get_if<JSONRPCResponse>(&m); r && JSONRPCIdToString(r->id) == idStr) {
                return *r;
            }
        }
        return std::nullopt;
    }

    // Method names of every inbound request and notification, in arrival order
    std::vector<std::string> MethodLog() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::string> out;
        for (const auto& m : received) {
            if (const auto* r = std::get_if<JSONRPCRequest>(&m)) {
                out.push_back(r->method);
            } else if (const auto* n = std::get_if<JSONRPCNotification>(&m)) {
                out.push_back(n->method);
            }
        }
        return out;
    }

    // Polls pred until it holds or the timeout elapses
    bool WaitUntil(const std::function<bool()>& pred,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, std::chrono::milliseconds(10));
        }
        return true;
    }

private:
    struct CannedReply {
        JSONValue value;
        bool isError{false};
    };

    void readLoop() {
        for (;;) {
            std::string payload;
            try {
                payload = transport->ReadFrame();
            } catch (const errors::LspException&) {
                break;
            }
            Message message;
            try {
                message = codec->decode(payload);
            } catch (const errors::LspException& e) {
                ADD_FAILURE() << "client sent an undecodable frame: " << e.what();
                continue;
            }
            std::optional<CannedReply> reply;
            std::optional<JSONRPCId> replyId;
            bool exitRequested = false;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (const auto* r = std::get_if<JSONRPCRequest>(&message)) {
                    auto it = replies.find(r->method);
                    if (it != replies.end()) {
                        reply = it->second;
                        replyId = r->id;
                    }
                } else if (const auto* n = std::get_if<JSONRPCNotification>(&message)) {
                    exitRequested = n->method == "exit";
                }
                received.push_back(std::move(message));
            }
            cv.notify_all();
            if (reply.has_value()) {
                JSONRPCResponse response = reply->isError
                    ? JSONRPCResponse(replyId.value(), reply->value, true)
                    : JSONRPCResponse(replyId.value(), reply->value);
                try {
                    Send(response.Serialize());
                } catch (const errors::LspException&) {
                    break;
                }
            }
            if (exitRequested) {
                Close();
            }
        }
        cv.notify_all();
    }

    InMemoryStream* clientRaw{nullptr};
    std::shared_ptr<IByteStream> clientEnd;
    std::unique_ptr<FramedTransport> transport;
    std::unique_ptr<IMessageCodec> codec;

    std::mutex mutex;
    std::condition_variable cv;
    std::unordered_map<std::string, CannedReply> replies;
    std::vector<Message> received;
    std::thread reader;
};

} // namespace fake
} // namespace lspc
