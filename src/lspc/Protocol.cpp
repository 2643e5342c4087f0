//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Helpers for LSP protocol values (positions, file URIs, default client capabilities)
//==========================================================================================================

#include <cctype>
#include <string>

#include "lspc/Protocol.h"

namespace lspc {

namespace {
// Declared client capabilities; a server-independent subset of LSP 3.17 ClientCapabilities
constexpr const char* DefaultCapabilitiesJson = R"({
  "workspace": {
    "applyEdit": false,
    "workspaceFolders": true,
    "configuration": true,
    "didChangeConfiguration": { "dynamicRegistration": true },
    "symbol": { "dynamicRegistration": true }
  },
  "textDocument": {
    "synchronization": { "dynamicRegistration": true, "didSave": false, "willSave": false },
    "definition": { "dynamicRegistration": true, "linkSupport": true },
    "typeDefinition": { "dynamicRegistration": true, "linkSupport": true },
    "implementation": { "dynamicRegistration": true, "linkSupport": true },
    "references": { "dynamicRegistration": true },
    "hover": { "dynamicRegistration": true, "contentFormat": ["markdown", "plaintext"] },
    "documentSymbol": { "dynamicRegistration": true, "hierarchicalDocumentSymbolSupport": true },
    "completion": {
      "dynamicRegistration": true,
      "contextSupport": true,
      "completionItem": { "snippetSupport": false, "documentationFormat": ["markdown", "plaintext"] }
    },
    "publishDiagnostics": { "relatedInformation": true, "versionSupport": true }
  },
  "window": { "workDoneProgress": true, "showMessage": {} },
  "general": { "positionEncodings": ["utf-16"] }
})";

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '/';
}
} // namespace

JSONValue Position::toJSON() const {
    JSONValue::Object obj;
    obj["line"] = std::make_shared<JSONValue>(line);
    obj["character"] = std::make_shared<JSONValue>(character);
    return JSONValue(obj);
}

std::string FileUriFromPath(const std::string& path) {
    static const char* hex = "0123456789ABCDEF";
    std::string uri = "file://";
    if (path.empty() || path.front() != '/') {
        uri.push_back('/');
    }
    for (char ch : path) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (isUnreserved(c)) {
            uri.push_back(ch);
        } else {
            uri.push_back('%');
            uri.push_back(hex[c >> 4]);
            uri.push_back(hex[c & 0x0F]);
        }
    }
    return uri;
}

JSONValue DefaultClientCapabilities() {
    return ParseJSON(DefaultCapabilitiesJson);
}

} // namespace lspc
