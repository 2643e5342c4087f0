//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: Default implementation of the JSON-RPC message codec
//========================================================================================================

#include <string>

#include "lspc/MessageCodec.h"
#include "lspc/errors/Errors.h"

namespace lspc {

namespace {
class MessageCodec : public IMessageCodec {
public:
    std::string encode(const Message& message) override {
        return std::visit([](const auto& m) { return m.Serialize(); }, message);
    }

    MessageKind classify(const JSONValue& root) override {
        if (!root.isObject()) {
            return MessageKind::Unknown;
        }
        const bool hasMethod = FindMember(root, "method") != nullptr;
        const bool hasId = FindMember(root, "id") != nullptr;
        if (hasMethod && hasId) {
            return MessageKind::Request;
        }
        if (hasMethod) {
            return MessageKind::Notification;
        }
        if (hasId) {
            return MessageKind::Response;
        }
        return MessageKind::Unknown;
    }

    Message decode(const std::string& payload) override {
        JSONValue root;
        try {
            root = ParseJSON(payload);
        } catch (const std::runtime_error& e) {
            throw errors::LspException(errors::ErrorKind::ProtocolViolation, e.what());
        }
        if (!root.isObject()) {
            throw errors::LspException(errors::ErrorKind::ProtocolViolation, "top-level JSON value is not an object");
        }

        switch (classify(root)) {
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (request.FromJSON(root)) {
                    return request;
                }
                break;
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (notification.FromJSON(root)) {
                    return notification;
                }
                break;
            }
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.FromJSON(root)) {
                    return response;
                }
                break;
            }
            case MessageKind::Unknown:
                break;
        }
        throw errors::LspException(errors::ErrorKind::ProtocolViolation, "message matches no JSON-RPC envelope shape");
    }
};
} // namespace

std::unique_ptr<IMessageCodec> MakeMessageCodec() {
    return std::make_unique<MessageCodec>();
}

} // namespace lspc
