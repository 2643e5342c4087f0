//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Encode, decode and classify JSON-RPC 2.0 envelopes carried in LSP frames
//========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <variant>

#include "lspc/JSONRPCTypes.h"

namespace lspc {

// Tagged union of the three JSON-RPC envelope shapes.
using Message = std::variant<JSONRPCRequest, JSONRPCNotification, JSONRPCResponse>;

class IMessageCodec {
public:
    virtual ~IMessageCodec() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Serialize a message to its JSON-RPC 2.0 wire shape.
    virtual std::string encode(const Message& message) = 0;

    // Classify a parsed document by its top-level keys without building a message:
    // method+id => Request, method without id => Notification, id without method => Response.
    virtual MessageKind classify(const JSONValue& root) = 0;

    // Parse and classify an inbound payload.
    // Throws errors::LspException(ProtocolViolation) for malformed JSON, a non-object top level,
    // or a document matching none of the envelope shapes.
    virtual Message decode(const std::string& payload) = 0;
};

// Factory: returns the default codec implementation
std::unique_ptr<IMessageCodec> MakeMessageCodec();

} // namespace lspc
