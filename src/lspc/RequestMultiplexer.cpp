//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestMultiplexer.cpp
// Purpose: Pending Call table, correlation ids, timeout sweeper and cancellation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "logging/Logger.h"
#include "lspc/Protocol.h"
#include "lspc/RequestMultiplexer.h"

namespace lspc {

namespace {
constexpr std::size_t AbandonedIdMemory = 1024;
constexpr std::chrono::milliseconds SweepInterval{20};

struct PendingCall {
    std::string method;
    std::chrono::steady_clock::time_point created;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::promise<JSONValue> promise;
};
} // namespace

class RequestMultiplexer::Impl {
public:
    SendFunction send;
    std::chrono::milliseconds defaultTimeout;

    mutable std::mutex requestMutex;
    std::condition_variable cvSweep;
    // Keyed by the integer ids minted by Call(); a response carrying a string id never matches
    std::unordered_map<int64_t, PendingCall> pendingRequests;
    std::deque<int64_t> abandonedOrder;
    std::unordered_set<int64_t> abandonedIds;
    std::atomic<int64_t> requestCounter{0};
    std::optional<errors::ErrorKind> closedKind;
    std::string closedMessage;
    bool stopping{false};
    std::thread timeoutThread;

    Impl(SendFunction s, std::chrono::milliseconds timeout) : send(std::move(s)), defaultTimeout(timeout) {}

    // Caller holds requestMutex
    void rememberAbandoned(int64_t id) {
        if (abandonedIds.insert(id).second) {
            abandonedOrder.push_back(id);
            if (abandonedOrder.size() > AbandonedIdMemory) {
                abandonedIds.erase(abandonedOrder.front());
                abandonedOrder.pop_front();
            }
        }
    }

    void sendCancelRequest(int64_t id) {
        JSONValue::Object params;
        params["id"] = std::make_shared<JSONValue>(id);
        JSONRPCNotification cancel(Methods::CancelRequest, JSONValue(params));
        try {
            send(cancel.Serialize());
        } catch (const errors::LspException& e) {
            LOG_DEBUG("RequestMultiplexer: $/cancelRequest for {} not sent: {}", id, e.what());
        }
    }

    void startTimeouts() {
        timeoutThread = std::thread([this]() {
            using clock = std::chrono::steady_clock;
            std::unique_lock<std::mutex> lock(requestMutex);
            while (!stopping) {
                cvSweep.wait_for(lock, SweepInterval, [this]() { return stopping; });
                if (stopping) {
                    break;
                }
                std::vector<int64_t> expired;
                auto now = clock::now();
                for (auto it = pendingRequests.begin(); it != pendingRequests.end();) {
                    if (it->second.deadline.has_value() && it->second.deadline.value() <= now) {
                        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second.created);
                        LOG_WARN("Request {} ({}) timed out after {} ms", it->first, it->second.method, elapsed.count());
                        it->second.promise.set_exception(errors::makeExceptionPtr(errors::ErrorKind::RequestTimeout,
                            it->second.method + " (id " + std::to_string(it->first) + ") timed out"));
                        rememberAbandoned(it->first);
                        expired.push_back(it->first);
                        it = pendingRequests.erase(it);
                    } else {
                        ++it;
                    }
                }
                if (!expired.empty()) {
                    lock.unlock();
                    for (int64_t id : expired) {
                        sendCancelRequest(id);
                    }
                    lock.lock();
                }
            }
        });
    }

    // Caller holds requestMutex
    void failAllLocked(errors::ErrorKind kind, const std::string& message) {
        for (auto& [id, call] : pendingRequests) {
            call.promise.set_exception(errors::makeExceptionPtr(kind, call.method + ": " + message));
        }
        pendingRequests.clear();
    }
};

RequestMultiplexer::RequestMultiplexer(SendFunction send, std::chrono::milliseconds defaultTimeout)
    : pImpl(std::make_unique<Impl>(std::move(send), defaultTimeout)) {
    FUNC_SCOPE();
    pImpl->startTimeouts();
}

RequestMultiplexer::~RequestMultiplexer() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->stopping = true;
        pImpl->failAllLocked(errors::ErrorKind::SessionClosed, "multiplexer destroyed");
    }
    pImpl->cvSweep.notify_all();
    if (pImpl->timeoutThread.joinable()) {
        pImpl->timeoutThread.join();
    }
}

RequestMultiplexer::PendingCallHandle RequestMultiplexer::Call(const std::string& method,
                                                               std::optional<JSONValue> params,
                                                               std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    PendingCallHandle handle;
    std::promise<JSONValue> promise;
    handle.result = promise.get_future();

    const auto effective = timeout.value_or(pImpl->defaultTimeout);
    const int64_t id = ++pImpl->requestCounter;
    handle.id = id;

    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        if (pImpl->closedKind.has_value()) {
            promise.set_exception(errors::makeExceptionPtr(pImpl->closedKind.value(), pImpl->closedMessage));
            return handle;
        }
        PendingCall call;
        call.method = method;
        call.created = std::chrono::steady_clock::now();
        if (effective.count() > 0) {
            call.deadline = call.created + effective;
        }
        call.promise = std::move(promise);
        pImpl->pendingRequests.emplace(id, std::move(call));
    }

    JSONRPCRequest request(id, method, std::move(params));
    try {
        pImpl->send(request.Serialize());
    } catch (const errors::LspException& e) {
        LOG_WARN("Request {} ({}) could not be sent: {}", id, method, e.what());
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        auto it = pImpl->pendingRequests.find(id);
        if (it != pImpl->pendingRequests.end()) {
            it->second.promise.set_exception(errors::makeExceptionPtr(errors::ErrorKind::TransportClosed, e.what()));
            pImpl->pendingRequests.erase(it);
        }
    }
    return handle;
}

void RequestMultiplexer::Notify(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        if (pImpl->closedKind.has_value()) {
            throw errors::LspException(pImpl->closedKind.value(), pImpl->closedMessage);
        }
    }
    JSONRPCNotification notification(method, std::move(params));
    pImpl->send(notification.Serialize());
}

bool RequestMultiplexer::Cancel(int64_t id) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        auto it = pImpl->pendingRequests.find(id);
        if (it == pImpl->pendingRequests.end()) {
            return false;
        }
        LOG_DEBUG("Cancelling request {} ({})", id, it->second.method);
        it->second.promise.set_exception(errors::makeExceptionPtr(errors::ErrorKind::RequestCancelled,
            it->second.method + " (id " + std::to_string(id) + ") cancelled"));
        pImpl->rememberAbandoned(id);
        pImpl->pendingRequests.erase(it);
    }
    pImpl->sendCancelRequest(id);
    return true;
}

RequestMultiplexer::ResolveOutcome RequestMultiplexer::Resolve(JSONRPCResponse&& response) {
    FUNC_SCOPE();
    const auto* id = std::get_if<int64_t>(&response.id);
    if (id == nullptr) {
        return ResolveOutcome::UnknownId;
    }

    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    auto it = pImpl->pendingRequests.find(*id);
    if (it == pImpl->pendingRequests.end()) {
        return pImpl->abandonedIds.count(*id) ? ResolveOutcome::LateAbandoned : ResolveOutcome::UnknownId;
    }
    if (response.IsError()) {
        auto info = errors::rpcErrorFromResponse(response);
        if (!info.has_value()) {
            errors::RpcErrorInfo malformed;
            malformed.code = JSONRPCErrorCodes::UnknownErrorCode;
            malformed.message = "malformed error object: " + SerializeJSON(response.error.value());
            malformed.category = errors::errorCategoryFromCode(malformed.code);
            info = std::move(malformed);
        }
        LOG_DEBUG("Request {} ({}) failed: {} {}", *id, it->second.method, info->code, info->message);
        it->second.promise.set_exception(std::make_exception_ptr(errors::LspException(std::move(info.value()))));
    } else {
        it->second.promise.set_value(response.result.has_value() ? std::move(response.result.value()) : JSONValue(nullptr));
    }
    pImpl->pendingRequests.erase(it);
    return ResolveOutcome::Delivered;
}

void RequestMultiplexer::FailAll(errors::ErrorKind kind, const std::string& message) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    if (!pImpl->pendingRequests.empty()) {
        LOG_INFO("Failing {} pending request(s): {}", pImpl->pendingRequests.size(), errors::toString(kind));
    }
    pImpl->failAllLocked(kind, message);
}

void RequestMultiplexer::Close(errors::ErrorKind kind, const std::string& message) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    if (!pImpl->closedKind.has_value()) {
        pImpl->closedKind = kind;
        pImpl->closedMessage = message;
    }
    pImpl->failAllLocked(pImpl->closedKind.value(), pImpl->closedMessage);
}

std::size_t RequestMultiplexer::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pendingRequests.size();
}

} // namespace lspc
