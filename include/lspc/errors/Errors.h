//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy, LspException and JSON-RPC error mapping helpers for the LSP client
//==========================================================================================================

#pragma once

#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "lspc/JSONRPCTypes.h"

namespace lspc {
namespace errors {

// Failure kinds surfaced by the client core.
enum class ErrorKind {
    TransportClosed,
    ProtocolViolation,
    RpcError,
    RequestTimeout,
    RequestCancelled,
    SessionNotReady,
    DocumentNotOpen,
    UnsupportedByServer,
    SpawnFailed,
    SessionClosed,
    SessionFailed
};

// Human readable name of an ErrorKind ("RequestTimeout", ...).
inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransportClosed: return "TransportClosed";
        case ErrorKind::ProtocolViolation: return "ProtocolViolation";
        case ErrorKind::RpcError: return "RpcError";
        case ErrorKind::RequestTimeout: return "RequestTimeout";
        case ErrorKind::RequestCancelled: return "RequestCancelled";
        case ErrorKind::SessionNotReady: return "SessionNotReady";
        case ErrorKind::DocumentNotOpen: return "DocumentNotOpen";
        case ErrorKind::UnsupportedByServer: return "UnsupportedByServer";
        case ErrorKind::SpawnFailed: return "SpawnFailed";
        case ErrorKind::SessionClosed: return "SessionClosed";
        case ErrorKind::SessionFailed: return "SessionFailed";
    }
    return "Unknown";
}

// Categorization of JSON-RPC and LSP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    LspServerNotInitialized,
    LspUnknownErrorCode,
    LspRequestFailed,
    LspServerCancelled,
    LspContentModified,
    LspRequestCancelled,
    Unknown
};

// Typed error object received in (or sent as) a JSON-RPC error response.
struct RpcErrorInfo {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/LSP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or LSP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ServerNotInitialized: return ErrorCategory::LspServerNotInitialized;
        case JSONRPCErrorCodes::UnknownErrorCode: return ErrorCategory::LspUnknownErrorCode;
        case JSONRPCErrorCodes::RequestFailed: return ErrorCategory::LspRequestFailed;
        case JSONRPCErrorCodes::ServerCancelled: return ErrorCategory::LspServerCancelled;
        case JSONRPCErrorCodes::ContentModified: return ErrorCategory::LspContentModified;
        case JSONRPCErrorCodes::RequestCancelled: return ErrorCategory::LspRequestCancelled;
        default: return ErrorCategory::Unknown;
    }
}

//==========================================================================================================
// LspException
// Purpose: Exception type carried by failed futures and thrown by synchronous precondition checks.
// Fields:
//   kind(): The ErrorKind of the failure.
//   rpcError(): Present when kind() == RpcError.
//==========================================================================================================
class LspException : public std::runtime_error {
public:
    LspException(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(toString(kind)) + ": " + message), errKind(kind) {}

    explicit LspException(RpcErrorInfo info)
        : std::runtime_error(std::string("RpcError ") + std::to_string(info.code) + ": " + info.message),
          errKind(ErrorKind::RpcError), rpc(std::move(info)) {}

    ErrorKind kind() const noexcept { return errKind; }
    const std::optional<RpcErrorInfo>& rpcError() const noexcept { return rpc; }

private:
    ErrorKind errKind;
    std::optional<RpcErrorInfo> rpc;
};

// Convenience for building an exception_ptr to place on a promise.
inline std::exception_ptr makeExceptionPtr(ErrorKind kind, const std::string& message) {
    return std::make_exception_ptr(LspException(kind, message));
}

// Returns a future already failed with the given kind; used for precondition failures on async APIs.
template <typename T>
std::future<T> makeFailedFuture(ErrorKind kind, const std::string& message) {
    std::promise<T> p;
    p.set_exception(makeExceptionPtr(kind, message));
    return p.get_future();
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RpcErrorInfo.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<RpcErrorInfo> rpcErrorFromErrorValue(const JSONValue& errVal) {
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    auto code = GetIntMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }

    RpcErrorInfo e;
    e.code = static_cast<int>(code.value());
    e.message = std::move(message.value());
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract RpcErrorInfo from a JSONRPCResponse if it carries an error.
inline std::optional<RpcErrorInfo> rpcErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return rpcErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed RpcErrorInfo.
inline JSONValue makeErrorValue(const RpcErrorInfo& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from RpcErrorInfo and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const RpcErrorInfo& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace lspc
