//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the error taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <future>
#include <string>

#include "lspc/JSONRPCTypes.h"
#include "lspc/errors/Errors.h"

using namespace lspc;

TEST(Errors, CategoryMapping) {
    using errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ServerNotInitialized), ErrorCategory::LspServerNotInitialized);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::UnknownErrorCode), ErrorCategory::LspUnknownErrorCode);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::RequestFailed), ErrorCategory::LspRequestFailed);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ServerCancelled), ErrorCategory::LspServerCancelled);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ContentModified), ErrorCategory::LspContentModified);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::RequestCancelled), ErrorCategory::LspRequestCancelled);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ExceptionCarriesKindAndMessage) {
    errors::LspException e(errors::ErrorKind::DocumentNotOpen, "file:///a.py");
    EXPECT_EQ(e.kind(), errors::ErrorKind::DocumentNotOpen);
    EXPECT_EQ(std::string(e.what()), "DocumentNotOpen: file:///a.py");
    EXPECT_FALSE(e.rpcError().has_value());
}

TEST(Errors, RpcErrorRoundTripThroughResponse) {
    errors::RpcErrorInfo info;
    info.code = JSONRPCErrorCodes::ContentModified;
    info.message = "document changed";
    info.data = JSONValue(std::string("v3"));
    auto resp = errors::makeErrorResponse(JSONRPCId{static_cast<int64_t>(9)}, info);
    ASSERT_TRUE(resp != nullptr);
    ASSERT_TRUE(resp->IsError());

    auto back = errors::rpcErrorFromResponse(*resp);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->code, JSONRPCErrorCodes::ContentModified);
    EXPECT_EQ(back->message, "document changed");
    EXPECT_EQ(back->category, errors::ErrorCategory::LspContentModified);
    ASSERT_TRUE(back->data.has_value());
    EXPECT_EQ(std::get<std::string>(back->data->value), "v3");

    errors::LspException ex(back.value());
    EXPECT_EQ(ex.kind(), errors::ErrorKind::RpcError);
    ASSERT_TRUE(ex.rpcError().has_value());
    EXPECT_EQ(ex.rpcError()->code, JSONRPCErrorCodes::ContentModified);
}

TEST(Errors, MalformedErrorObjectIsRejected) {
    EXPECT_FALSE(errors::rpcErrorFromErrorValue(ParseJSON(R"({"message":"no code"})")).has_value());
    EXPECT_FALSE(errors::rpcErrorFromErrorValue(ParseJSON(R"("oops")")).has_value());
    JSONRPCResponse ok(static_cast<int64_t>(1), JSONValue(nullptr));
    EXPECT_FALSE(errors::rpcErrorFromResponse(ok).has_value());
}

TEST(Errors, FailedFutureRethrowsKind) {
    auto fut = errors::makeFailedFuture<JSONValue>(errors::ErrorKind::SessionNotReady, "not yet");
    try {
        (void)fut.get();
        FAIL() << "expected exception";
    } catch (const errors::LspException& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::SessionNotReady);
    }
}

TEST(Errors, KindNames) {
    EXPECT_STREQ(errors::toString(errors::ErrorKind::TransportClosed), "TransportClosed");
    EXPECT_STREQ(errors::toString(errors::ErrorKind::UnsupportedByServer), "UnsupportedByServer");
    EXPECT_STREQ(errors::toString(errors::ErrorKind::SessionFailed), "SessionFailed");
}
