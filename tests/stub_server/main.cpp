//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/stub_server/main.cpp
// Purpose: Minimal language server over stdio used by the end-to-end session tests
//==========================================================================================================

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <unistd.h>

#include "logging/Logger.h"
#include "lspc/FramedTransport.h"
#include "lspc/MessageCodec.h"
#include "lspc/PipeStream.hpp"
#include "lspc/errors/Errors.h"
#include "lspc/version.h"

using namespace lspc;

namespace {

// Answers for the requests the stub understands; "stub/hang" is deliberately never answered
std::optional<JSONValue> cannedResult(const JSONRPCRequest& request) {
    if (request.method == "initialize") {
        return ParseJSON(R"({"capabilities":{"definitionProvider":true,"documentSymbolProvider":true,"textDocumentSync":1},)"
                         R"("serverInfo":{"name":"lspc-stub-server","version":")" + getVersionString() + R"("}})");
    }
    if (request.method == "textDocument/definition") {
        return ParseJSON(R"([{"uri":"file:///stub/target.py","range":{"start":{"line":4,"character":0},"end":{"line":4,"character":8}}},)"
                         R"({"uri":"file:///stub/other.py","range":{"start":{"line":0,"character":2},"end":{"line":0,"character":6}}}])");
    }
    if (request.method == "textDocument/documentSymbol") {
        return ParseJSON(R"([{"name":"main","kind":12,)"
                         R"("range":{"start":{"line":0,"character":0},"end":{"line":2,"character":0}},)"
                         R"("selectionRange":{"start":{"line":0,"character":4},"end":{"line":0,"character":8}}}])");
    }
    if (request.method == "shutdown") {
        return JSONValue(nullptr);
    }
    return std::nullopt;
}

std::string publishDiagnosticsFor(const std::string& uri) {
    JSONValue::Object params;
    params["uri"] = std::make_shared<JSONValue>(uri);
    params["diagnostics"] = std::make_shared<JSONValue>(ParseJSON(
        R"([{"range":{"start":{"line":0,"character":0},"end":{"line":0,"character":1}},"severity":2,"message":"stub diagnostic"}])"));
    return JSONRPCNotification("textDocument/publishDiagnostics", JSONValue(std::move(params))).Serialize();
}

} // namespace

int main() {
    Logger::initFromEnvironment();
    FramedTransport transport(std::make_shared<PipeStream>(STDIN_FILENO, STDOUT_FILENO));
    auto codec = MakeMessageCodec();
    bool shutdownRequested = false;

    for (;;) {
        std::string payload;
        try {
            payload = transport.ReadFrame();
        } catch (const errors::LspException& e) {
            LOG_INFO("stub server: input closed: {}", e.what());
            return 1;
        }

        Message message;
        try {
            message = codec->decode(payload);
        } catch (const errors::LspException& e) {
            LOG_WARN("stub server: dropping frame: {}", e.what());
            continue;
        }

        try {
            if (auto* request = std::get_if<JSONRPCRequest>(&message)) {
                LOG_DEBUG("stub server: request {}", request->method);
                if (request->method == "shutdown") {
                    shutdownRequested = true;
                }
                if (auto result = cannedResult(*request)) {
                    transport.WriteFrame(JSONRPCResponse(request->id, std::move(result.value())).Serialize());
                } else if (request->method != "stub/hang") {
                    transport.WriteFrame(CreateErrorResponse(request->id, JSONRPCErrorCodes::MethodNotFound,
                                                             "unhandled method " + request->method)->Serialize());
                }
            } else if (auto* note = std::get_if<JSONRPCNotification>(&message)) {
                LOG_DEBUG("stub server: notification {}", note->method);
                if (note->method == "exit") {
                    return shutdownRequested ? 0 : 1;
                }
                if (note->method == "textDocument/didOpen" && note->params.has_value()) {
                    if (const JSONValue* doc = FindMember(note->params.value(), "textDocument")) {
                        transport.WriteFrame(publishDiagnosticsFor(GetStringMember(*doc, "uri").value_or("")));
                    }
                }
            }
        } catch (const errors::LspException& e) {
            LOG_INFO("stub server: output closed: {}", e.what());
            return 1;
        }
    }
}
