//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: LSP protocol constants, launch configuration and handshake inputs
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lspc {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// LSP protocol version implemented by the client core
constexpr const char* LSP_PROTOCOL_VERSION = "3.17";

///////////////////////////////////////// Positions ///////////////////////////////////////////
// Zero-based line and UTF-16 character offset (LSP Position)
struct Position {
    int64_t line{0};
    int64_t character{0};

    Position() = default;
    Position(int64_t line, int64_t character) : line(line), character(character) {}

    JSONValue toJSON() const;
};

///////////////////////////////////////// Launch configuration ///////////////////////////////////////////
//==========================================================================================================
// ServerLaunchConfig
// Purpose: How to start a language server subprocess.
// Fields:
//   executable: Program name (resolved through PATH) or path.
//   arguments: argv[1..].
//   environment: Variables set on top of the parent's environment.
//   workingDirectory: Child's cwd; empty keeps the parent's.
//==========================================================================================================
struct ServerLaunchConfig {
    std::string executable;
    std::vector<std::string> arguments;
    std::unordered_map<std::string, std::string> environment;
    std::string workingDirectory;
};

///////////////////////////////////////// Handshake ///////////////////////////////////////////
// Client identification sent in initialize.clientInfo
struct ClientInfo {
    std::string name{"lspc-cpp"};
    std::string version;
};

//==========================================================================================================
// InitializeOptions
// Purpose: Inputs to the initialize request. Opaque JSON members are merged verbatim.
// Fields:
//   processId: Defaults to the current process id.
//   rootPath: Workspace root directory.
//   rootUri: Derived from rootPath when absent.
//   workspaceFolders: Derived from rootUri when absent (array of {uri,name}).
//   capabilities: Declared client capabilities; a default set is used when absent.
//   initializationOptions: Server-specific blob, never interpreted.
//   trace: "off" | "messages" | "verbose" when set.
//==========================================================================================================
struct InitializeOptions {
    std::optional<int64_t> processId;
    ClientInfo clientInfo;
    std::optional<std::string> rootPath;
    std::optional<std::string> rootUri;
    std::optional<JSONValue> workspaceFolders;
    std::optional<JSONValue> capabilities;
    std::optional<JSONValue> initializationOptions;
    std::optional<std::string> trace;
};

//==========================================================================================================
// FileUriFromPath
// Purpose: Builds a file:// URI from an absolute path, percent-encoding bytes outside the unreserved set.
// Args:
//   path: Absolute filesystem path (e.g. "/home/u/a b.cpp").
// Returns:
//   URI string (e.g. "file:///home/u/a%20b.cpp").
//==========================================================================================================
std::string FileUriFromPath(const std::string& path);

// Default client capabilities declared during the handshake
JSONValue DefaultClientCapabilities();

///////////////////////////////////////// Method names ///////////////////////////////////////////
// LSP method names
namespace Methods {
    // Lifecycle
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "initialized";
    constexpr const char* Shutdown = "shutdown";
    constexpr const char* Exit = "exit";
    constexpr const char* CancelRequest = "$/cancelRequest";
    constexpr const char* Progress = "$/progress";

    // Document synchronization
    constexpr const char* DidOpen = "textDocument/didOpen";
    constexpr const char* DidChange = "textDocument/didChange";
    constexpr const char* DidClose = "textDocument/didClose";

    // Language features
    constexpr const char* Definition = "textDocument/definition";
    constexpr const char* TypeDefinition = "textDocument/typeDefinition";
    constexpr const char* Implementation = "textDocument/implementation";
    constexpr const char* References = "textDocument/references";
    constexpr const char* Hover = "textDocument/hover";
    constexpr const char* DocumentSymbol = "textDocument/documentSymbol";
    constexpr const char* Completion = "textDocument/completion";
    constexpr const char* WorkspaceSymbol = "workspace/symbol";

    // Server to client
    constexpr const char* PublishDiagnostics = "textDocument/publishDiagnostics";
    constexpr const char* WorkDoneProgressCreate = "window/workDoneProgress/create";
    constexpr const char* LogMessage = "window/logMessage";
    constexpr const char* ShowMessage = "window/showMessage";
    constexpr const char* Configuration = "workspace/configuration";
    constexpr const char* RegisterCapability = "client/registerCapability";
    constexpr const char* UnregisterCapability = "client/unregisterCapability";
}

// Server capability keys gating feature calls
namespace CapabilityKeys {
    constexpr const char* Definition = "definitionProvider";
    constexpr const char* TypeDefinition = "typeDefinitionProvider";
    constexpr const char* Implementation = "implementationProvider";
    constexpr const char* References = "referencesProvider";
    constexpr const char* Hover = "hoverProvider";
    constexpr const char* DocumentSymbol = "documentSymbolProvider";
    constexpr const char* Completion = "completionProvider";
    constexpr const char* WorkspaceSymbol = "workspaceSymbolProvider";
}

} // namespace lspc
