//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InboundDispatcher.cpp
// Purpose: Inbound routing on a Boost.Asio thread pool with per-key strands
//==========================================================================================================

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "lspc/InboundDispatcher.h"
#include "lspc/errors/Errors.h"

namespace lspc {

namespace net = boost::asio;

class InboundDispatcher::Impl {
public:
    using Strand = net::strand<net::thread_pool::executor_type>;

    // One strand per ordering key; dropped once no work for the key is queued
    struct KeyQueue {
        Strand strand;
        std::size_t inflight{0};
    };

    RequestMultiplexer& multiplexer;
    ResponseWriter writer;
    std::unique_ptr<IMessageCodec> codec;
    net::thread_pool pool;
    std::atomic<bool> stopped{false};

    std::mutex handlersMutex;
    std::unordered_map<std::string, RequestHandler> requestHandlers;
    std::unordered_map<std::string, std::vector<std::pair<ListenerId, NotificationListener>>> listeners;
    ListenerId nextListenerId{1};

    std::mutex strandsMutex;
    std::unordered_map<std::string, KeyQueue> strands;

    Impl(RequestMultiplexer& mux, ResponseWriter w, std::size_t threads)
        : multiplexer(mux), writer(std::move(w)), codec(MakeMessageCodec()), pool(threads == 0 ? 1 : threads) {}

    // Runs fn on the strand for key; work for one key never overlaps and keeps posting order
    template <typename Fn>
    void postOrdered(const std::string& key, Fn&& fn) {
        Strand* strand = nullptr;
        {
            std::lock_guard<std::mutex> lock(strandsMutex);
            auto it = strands.find(key);
            if (it == strands.end()) {
                it = strands.emplace(key, KeyQueue{net::make_strand(pool.get_executor()), 0}).first;
            }
            ++it->second.inflight;
            strand = &it->second.strand;
        }
        net::post(*strand, [this, key, fn = std::forward<Fn>(fn)]() mutable {
            fn();
            std::lock_guard<std::mutex> lock(strandsMutex);
            auto it = strands.find(key);
            if (it != strands.end() && --it->second.inflight == 0) {
                strands.erase(it);
            }
        });
    }

    void sendResponse(const JSONRPCResponse& response) {
        try {
            writer(response.Serialize());
        } catch (const errors::LspException& e) {
            LOG_WARN("Dispatcher: response to request {} not sent: {}", JSONRPCIdToString(response.id), e.what());
        }
    }

    static JSONRPCResponse errorResponseFor(const JSONRPCId& id, const std::exception& e) {
        if (const auto* lsp = dynamic_cast<const errors::LspException*>(&e)) {
            if (lsp->kind() == errors::ErrorKind::RpcError && lsp->rpcError().has_value()) {
                return std::move(*errors::makeErrorResponse(id, lsp->rpcError().value()));
            }
        }
        return std::move(*CreateErrorResponse(id, JSONRPCErrorCodes::InternalError, e.what()));
    }

    // Waits for a handler's future and answers the request
    void completeRequest(const JSONRPCRequest& request, std::future<JSONValue>& fut) {
        try {
            JSONValue result = fut.get();
            sendResponse(JSONRPCResponse(request.id, std::move(result)));
        } catch (const std::exception& e) {
            LOG_ERROR("Request handler for {} failed: {}", request.method, e.what());
            sendResponse(errorResponseFor(request.id, e));
        }
    }

    void handleRequest(JSONRPCRequest request) {
        RequestHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            auto it = requestHandlers.find(request.method);
            if (it != requestHandlers.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            LOG_DEBUG("Dispatcher: no handler for server request {}; replying null", request.method);
            sendResponse(JSONRPCResponse(request.id, JSONValue(nullptr)));
            return;
        }

        std::future<JSONValue> fut;
        try {
            fut = handler(request);
        } catch (const std::exception& e) {
            LOG_ERROR("Request handler for {} threw: {}", request.method, e.what());
            sendResponse(errorResponseFor(request.id, e));
            return;
        }
        if (!fut.valid()) {
            sendResponse(JSONRPCResponse(request.id, JSONValue(nullptr)));
            return;
        }
        if (fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            completeRequest(request, fut);
            return;
        }
        // Pending result: wait off the strand so later messages for this key are not held back
        auto shared = std::make_shared<std::future<JSONValue>>(std::move(fut));
        net::post(pool, [this, request = std::move(request), shared]() {
            completeRequest(request, *shared);
        });
    }

    void handleNotification(const JSONRPCNotification& notification) {
        std::vector<NotificationListener> targets;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            auto it = listeners.find(notification.method);
            if (it != listeners.end()) {
                for (const auto& entry : it->second) {
                    targets.push_back(entry.second);
                }
            }
        }
        for (auto& listener : targets) {
            try {
                listener(notification);
            } catch (const std::exception& e) {
                LOG_ERROR("Notification listener for {} threw: {}", notification.method, e.what());
            }
        }
    }

    void handleResponse(JSONRPCResponse&& response) {
        const std::string idStr = JSONRPCIdToString(response.id);
        switch (multiplexer.Resolve(std::move(response))) {
            case RequestMultiplexer::ResolveOutcome::Delivered:
                break;
            case RequestMultiplexer::ResolveOutcome::LateAbandoned:
                LOG_INFO("Dropping late response for abandoned request {}", idStr);
                break;
            case RequestMultiplexer::ResolveOutcome::UnknownId:
                LOG_WARN("ProtocolViolation: response for unknown request id {} dropped", idStr);
                break;
        }
    }
};

InboundDispatcher::InboundDispatcher(RequestMultiplexer& multiplexer, ResponseWriter writer, std::size_t threads)
    : pImpl(std::make_unique<Impl>(multiplexer, std::move(writer), threads)) {
    FUNC_SCOPE();
}

InboundDispatcher::~InboundDispatcher() {
    FUNC_SCOPE();
    Stop();
}

void InboundDispatcher::SetRequestHandler(const std::string& method, RequestHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    if (handler) {
        pImpl->requestHandlers[method] = std::move(handler);
    } else {
        pImpl->requestHandlers.erase(method);
    }
}

InboundDispatcher::RequestHandler InboundDispatcher::WrapSync(SyncRequestHandler handler) {
    return [handler = std::move(handler)](const JSONRPCRequest& request) {
        std::promise<JSONValue> p;
        try {
            p.set_value(handler(request));
        } catch (const std::exception&) {
            p.set_exception(std::current_exception());
        }
        return p.get_future();
    };
}

InboundDispatcher::ListenerId InboundDispatcher::AddNotificationListener(const std::string& method,
                                                                        NotificationListener listener) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    const ListenerId id = pImpl->nextListenerId++;
    pImpl->listeners[method].emplace_back(id, std::move(listener));
    return id;
}

void InboundDispatcher::RemoveNotificationListener(ListenerId id) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    for (auto& [method, entries] : pImpl->listeners) {
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            if (it->first == id) {
                entries.erase(it);
                return;
            }
        }
    }
}

std::string InboundDispatcher::OrderingKey(const std::string& method, const std::optional<JSONValue>& params) {
    if (!params.has_value()) {
        return method;
    }
    if (auto uri = GetStringMember(params.value(), "uri")) {
        return method + "|" + uri.value();
    }
    if (const JSONValue* doc = FindMember(params.value(), "textDocument")) {
        if (auto uri = GetStringMember(*doc, "uri")) {
            return method + "|" + uri.value();
        }
    }
    return method;
}

void InboundDispatcher::Dispatch(const std::string& payload) {
    FUNC_SCOPE();
    Message message;
    try {
        message = pImpl->codec->decode(payload);
    } catch (const errors::LspException& e) {
        LOG_WARN("Dropping inbound frame: {}", e.what());
        return;
    }
    Dispatch(std::move(message));
}

void InboundDispatcher::Dispatch(Message&& message) {
    FUNC_SCOPE();
    if (pImpl->stopped.load()) {
        return;
    }
    if (auto* response = std::get_if<JSONRPCResponse>(&message)) {
        pImpl->handleResponse(std::move(*response));
        return;
    }
    if (auto* request = std::get_if<JSONRPCRequest>(&message)) {
        const std::string key = OrderingKey(request->method, request->params);
        pImpl->postOrdered(key, [this, req = std::move(*request)]() mutable {
            pImpl->handleRequest(std::move(req));
        });
        return;
    }
    auto& notification = std::get<JSONRPCNotification>(message);
    const std::string key = OrderingKey(notification.method, notification.params);
    pImpl->postOrdered(key, [this, note = std::move(notification)]() {
        pImpl->handleNotification(note);
    });
}

void InboundDispatcher::Stop() {
    FUNC_SCOPE();
    if (pImpl->stopped.exchange(true)) {
        return;
    }
    pImpl->pool.join();
}

} // namespace lspc
