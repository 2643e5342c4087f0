//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InboundDispatcher.h
// Purpose: Routes inbound responses, server requests and notifications
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "lspc/JSONRPCTypes.h"
#include "lspc/MessageCodec.h"
#include "lspc/RequestMultiplexer.h"

namespace lspc {

//==========================================================================================================
// InboundDispatcher
// Purpose: Consumes decoded frames from the reader thread.
//   - Responses resolve Pending Calls on the calling thread.
//   - Server requests go to the handler registered for the method; its result (or error) is written
//     back as a response. Without a handler the reply is a null result.
//   - Notifications go to every listener registered for the method; unrouted ones are dropped.
// Notes:
//   Handlers and listeners run on a worker pool. Messages sharing an ordering key (method plus
//   params.textDocument.uri or params.uri) run strictly in arrival order.
//==========================================================================================================
class InboundDispatcher {
public:
    using RequestHandler = std::function<std::future<JSONValue>(const JSONRPCRequest&)>;
    using SyncRequestHandler = std::function<JSONValue(const JSONRPCRequest&)>;
    using NotificationListener = std::function<void(const JSONRPCNotification&)>;
    // Writes one serialized response; throws errors::LspException(TransportClosed) on failure.
    using ResponseWriter = std::function<void(const std::string& payload)>;
    using ListenerId = uint64_t;

    //==========================================================================================================
    // Args:
    //   multiplexer: Receives inbound responses; must outlive the dispatcher.
    //   writer: Sink for responses to server requests.
    //   threads: Worker pool size (at least 1).
    //==========================================================================================================
    InboundDispatcher(RequestMultiplexer& multiplexer, ResponseWriter writer, std::size_t threads);
    ~InboundDispatcher();

    InboundDispatcher(const InboundDispatcher&) = delete;
    InboundDispatcher& operator=(const InboundDispatcher&) = delete;

    //==========================================================================================================
    // SetRequestHandler
    // Purpose: Installs (or replaces) the handler for a server-to-client request method.
    //          A handler failure becomes an error response: an LspException of kind RpcError keeps its
    //          code, anything else maps to InternalError.
    //==========================================================================================================
    void SetRequestHandler(const std::string& method, RequestHandler handler);

    // Wraps a synchronous handler into one returning an already completed future.
    static RequestHandler WrapSync(SyncRequestHandler handler);

    //==========================================================================================================
    // AddNotificationListener / RemoveNotificationListener
    // Purpose: Registers a listener for a notification method; several listeners may share a method.
    //==========================================================================================================
    ListenerId AddNotificationListener(const std::string& method, NotificationListener listener);
    void RemoveNotificationListener(ListenerId id);

    //==========================================================================================================
    // Dispatch
    // Purpose: Decodes and routes one frame payload. Protocol violations are logged and the frame dropped.
    //==========================================================================================================
    void Dispatch(const std::string& payload);
    void Dispatch(Message&& message);

    // Ordering key for a message: method, plus "|" and the document uri when the params carry one.
    static std::string OrderingKey(const std::string& method, const std::optional<JSONValue>& params);

    //==========================================================================================================
    // Stop
    // Purpose: Stops accepting messages and waits for queued handlers and listeners to finish.
    //==========================================================================================================
    void Stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace lspc
