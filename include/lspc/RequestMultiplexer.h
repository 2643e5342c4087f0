//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestMultiplexer.h
// Purpose: Correlates outgoing JSON-RPC requests with their responses over one ordered channel
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "lspc/JSONRPCTypes.h"
#include "lspc/errors/Errors.h"

namespace lspc {

//==========================================================================================================
// RequestMultiplexer
// Purpose: Mints correlation ids, keeps the Pending Call table, and resolves each call exactly once
//          (response, error response, timeout, cancellation or terminal failure).
// Notes:
//   - Thread-safe; callers may Call/Notify from any thread while the reader thread calls Resolve().
//   - A sweeper thread expires calls at their deadlines and sends "$/cancelRequest" for them.
//   - Recently abandoned ids are remembered so a late response can be told apart from a bogus one.
//==========================================================================================================
class RequestMultiplexer {
public:
    // Writes one serialized JSON-RPC payload; throws errors::LspException(TransportClosed) on failure.
    using SendFunction = std::function<void(const std::string& payload)>;

    // Result of a Call(): the minted id (for Cancel) and the future of the result value.
    struct PendingCallHandle {
        int64_t id{0};
        std::future<JSONValue> result;
    };

    enum class ResolveOutcome {
        Delivered,       // matched a Pending Call
        LateAbandoned,   // id was recently timed out or cancelled
        UnknownId        // id was never issued or was resolved long ago
    };

    //==========================================================================================================
    // Args:
    //   send: Sink for serialized requests/notifications.
    //   defaultTimeout: Per-call timeout when Call() gets none; zero disables timeouts.
    //==========================================================================================================
    RequestMultiplexer(SendFunction send, std::chrono::milliseconds defaultTimeout);
    ~RequestMultiplexer();

    RequestMultiplexer(const RequestMultiplexer&) = delete;
    RequestMultiplexer& operator=(const RequestMultiplexer&) = delete;

    //==========================================================================================================
    // Call
    // Purpose: Sends a request and returns a handle whose future completes with the result.
    // Args:
    //   method: JSON-RPC method name.
    //   params: Optional params value.
    //   timeout: Overrides the default timeout; zero means no timeout.
    // Returns:
    //   PendingCallHandle. The future fails with LspException of kind RpcError, RequestTimeout,
    //   RequestCancelled, TransportClosed, or the terminal kind given to Close().
    //==========================================================================================================
    PendingCallHandle Call(const std::string& method,
                           std::optional<JSONValue> params = std::nullopt,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    //==========================================================================================================
    // Notify
    // Purpose: Sends a notification; never waits on a response.
    // Returns:
    //   (none). Throws errors::LspException when closed or when the send fails.
    //==========================================================================================================
    void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    //==========================================================================================================
    // Cancel
    // Purpose: Fails one Pending Call with RequestCancelled and sends "$/cancelRequest" for it.
    // Returns:
    //   true when the id was pending; false when it had already resolved.
    //==========================================================================================================
    bool Cancel(int64_t id);

    //==========================================================================================================
    // Resolve
    // Purpose: Completes the Pending Call matching response.id.
    //==========================================================================================================
    ResolveOutcome Resolve(JSONRPCResponse&& response);

    //==========================================================================================================
    // FailAll
    // Purpose: Fails every Pending Call with the given kind. New calls are still accepted.
    //==========================================================================================================
    void FailAll(errors::ErrorKind kind, const std::string& message);

    //==========================================================================================================
    // Close
    // Purpose: Fails every Pending Call and rejects all later Call/Notify with the given kind.
    //          The first Close() wins; later calls only flush.
    //==========================================================================================================
    void Close(errors::ErrorKind kind, const std::string& message);

    // Number of unresolved calls
    std::size_t PendingCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace lspc
