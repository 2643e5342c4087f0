//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: LSP session interface - lifecycle, document synchronization and language feature calls
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lspc/InboundDispatcher.h"
#include "lspc/JSONRPCTypes.h"
#include "lspc/Protocol.h"
#include "lspc/RequestMultiplexer.h"
#include "lspc/SessionOptions.h"
#include "lspc/Transport.h"

namespace lspc {

// Session lifecycle. Closed and Failed are terminal.
enum class SessionState {
    Unstarted,
    Initializing,
    Ready,
    ShuttingDown,
    Closed,
    Failed
};

const char* toString(SessionState state);

//==========================================================================================================
// ServerCapabilities
// Purpose: Snapshot of the initialize result, taken once at the end of the handshake.
// Fields:
//   capabilities: Raw "capabilities" object from the server.
//   serverInfo: Raw "serverInfo" object when the server sent one.
//==========================================================================================================
struct ServerCapabilities {
    JSONValue capabilities{JSONValue::Object{}};
    std::optional<JSONValue> serverInfo;

    // True when key exists and is neither false nor null
    bool Has(const std::string& key) const;
};

//==========================================================================================================
// ProgressState
// Purpose: Last known state of one work-done progress token.
// Fields:
//   token: Token in string form.
//   kind: "created", "begin" or "report".
//   title/message/percentage: Latest values reported by the server.
//==========================================================================================================
struct ProgressState {
    std::string token;
    std::string kind{"created"};
    std::optional<std::string> title;
    std::optional<std::string> message;
    std::optional<int64_t> percentage;
};

//==========================================================================================================
// ISession
// Purpose: One LSP conversation with one language server.
// Notes:
//   - Document and feature operations require state Ready. Before that they fail with SessionNotReady,
//     after Shutdown() with SessionClosed and after a transport or process failure with SessionFailed.
//   - Operations returning a future report failures on the future; the others throw
//     errors::LspException.
//==========================================================================================================
class ISession {
public:
    using StateListener = std::function<void(SessionState from, SessionState to)>;
    using ErrorHandler = std::function<void(const std::string& error)>;
    using DiagnosticsListener = std::function<void(const std::string& uri, const JSONValue& diagnostics)>;
    using ProgressListener = std::function<void(const std::string& token, const JSONValue& value)>;
    using NotificationListener = InboundDispatcher::NotificationListener;
    using RequestHandler = InboundDispatcher::RequestHandler;
    using ListenerId = InboundDispatcher::ListenerId;

    virtual ~ISession() = default;

    ////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Start
    // Purpose: Launches the language server, starts reading its stdout and performs the handshake.
    // Args:
    //   launch: Executable, arguments, environment and working directory of the server.
    //   init: Inputs to the initialize request.
    // Returns:
    //   (none) once the session is Ready. Throws errors::LspException: SpawnFailed when the process
    //   cannot be launched, or the failure of the initialize call (RpcError, RequestTimeout,
    //   TransportClosed, SessionFailed). Every failure leaves the session Failed.
    //==========================================================================================================
    virtual void Start(const ServerLaunchConfig& launch, const InitializeOptions& init) = 0;

    //==========================================================================================================
    // Attach
    // Purpose: Same as Start() over an existing byte stream (TCP, in-memory); no subprocess is owned.
    //==========================================================================================================
    virtual void Attach(std::shared_ptr<IByteStream> stream, const InitializeOptions& init) = 0;

    //==========================================================================================================
    // Shutdown
    // Purpose: Sends shutdown, then exit, waits up to the shutdown grace for the server to exit and
    //          terminates it otherwise. Ends in Closed. A no-op once Closed or Failed.
    //==========================================================================================================
    virtual void Shutdown() = 0;

    virtual SessionState GetState() const = 0;

    // Capabilities snapshot; empty until the handshake completed
    virtual std::optional<ServerCapabilities> GetServerCapabilities() const = 0;

    // Pid of the owned server process; empty for attached streams or before Start()
    virtual std::optional<int> ServerPid() const = 0;

    ////////////////////////////////////////// Document synchronization ///////////////////////////////////////////
    //==========================================================================================================
    // OpenDocument
    // Purpose: Sends textDocument/didOpen at version 0. Opening an open uri only adds a reference.
    //==========================================================================================================
    virtual void OpenDocument(const std::string& uri, const std::string& text, const std::string& languageId) = 0;

    //==========================================================================================================
    // ChangeDocument
    // Purpose: Bumps the version by one and sends textDocument/didChange with the full new text.
    //          Throws DocumentNotOpen when uri is not open.
    //==========================================================================================================
    virtual void ChangeDocument(const std::string& uri, const std::string& text) = 0;

    //==========================================================================================================
    // CloseDocument
    // Purpose: Drops one reference; the last one sends textDocument/didClose.
    //          Throws DocumentNotOpen when uri is not open.
    //==========================================================================================================
    virtual void CloseDocument(const std::string& uri) = 0;

    virtual std::optional<int64_t> GetDocumentVersion(const std::string& uri) const = 0;

    ////////////////////////////////////////// Language features ///////////////////////////////////////////
    // Each call is gated on the matching server capability and fails with UnsupportedByServer without
    // any wire traffic when the server did not announce it. Results are the raw LSP result values.
    virtual std::future<JSONValue> Definition(const std::string& uri, const Position& pos) = 0;
    virtual std::future<JSONValue> TypeDefinition(const std::string& uri, const Position& pos) = 0;
    virtual std::future<JSONValue> Implementation(const std::string& uri, const Position& pos) = 0;
    virtual std::future<JSONValue> References(const std::string& uri, const Position& pos,
                                              bool includeDeclaration) = 0;
    virtual std::future<JSONValue> Hover(const std::string& uri, const Position& pos) = 0;
    virtual std::future<JSONValue> DocumentSymbols(const std::string& uri) = 0;
    virtual std::future<JSONValue> Completion(const std::string& uri, const Position& pos) = 0;
    virtual std::future<JSONValue> WorkspaceSymbols(const std::string& query) = 0;

    ////////////////////////////////////////// Generic calls ///////////////////////////////////////////
    //==========================================================================================================
    // Call
    // Purpose: Sends an arbitrary request (Ready only).
    // Args:
    //   timeout: Overrides SessionOptions::requestTimeout; zero means no timeout.
    //==========================================================================================================
    virtual std::future<JSONValue> Call(const std::string& method, std::optional<JSONValue> params,
                                        std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

    // Like Call() but also returns the correlation id for Cancel()
    virtual RequestMultiplexer::PendingCallHandle CallCancellable(const std::string& method,
                                                                  std::optional<JSONValue> params) = 0;

    // Fails the pending call with RequestCancelled and sends $/cancelRequest; false when already resolved
    virtual bool Cancel(int64_t id) = 0;

    // Sends an arbitrary notification (Ready only)
    virtual void Notify(const std::string& method, std::optional<JSONValue> params) = 0;

    ////////////////////////////////////////// Server push ///////////////////////////////////////////
    virtual ListenerId OnNotification(const std::string& method, NotificationListener listener) = 0;
    virtual void RemoveNotificationListener(ListenerId id) = 0;

    //==========================================================================================================
    // OnRequest
    // Purpose: Installs the handler for a server-to-client request method, replacing a built-in one
    //          (e.g. workspace/configuration). A null handler restores the default null reply.
    //==========================================================================================================
    virtual void OnRequest(const std::string& method, RequestHandler handler) = 0;

    // Diagnostics pushed by the server, delivered in arrival order per uri
    virtual void OnDiagnostics(DiagnosticsListener listener) = 0;
    virtual std::optional<JSONValue> GetDiagnostics(const std::string& uri) const = 0;

    // $/progress values (begin/report/end), in arrival order
    virtual void OnProgress(ProgressListener listener) = 0;
    virtual std::vector<ProgressState> GetActiveProgress() const = 0;

    virtual void OnStateChanged(StateListener listener) = 0;

    // Transport and process failures
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// Session
// Purpose: Standard ISession over a FramedTransport, RequestMultiplexer and InboundDispatcher.
//          Destroying a Ready session shuts it down first.
//==========================================================================================================
class Session : public ISession {
public:
    explicit Session(const SessionOptions& options = SessionOptions::FromEnvironment());
    virtual ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    ////////////////////////////////////////// ISession implementation //////////////////////////////////////////
    void Start(const ServerLaunchConfig& launch, const InitializeOptions& init) override;
    void Attach(std::shared_ptr<IByteStream> stream, const InitializeOptions& init) override;
    void Shutdown() override;
    SessionState GetState() const override;
    std::optional<ServerCapabilities> GetServerCapabilities() const override;
    std::optional<int> ServerPid() const override;

    void OpenDocument(const std::string& uri, const std::string& text, const std::string& languageId) override;
    void ChangeDocument(const std::string& uri, const std::string& text) override;
    void CloseDocument(const std::string& uri) override;
    std::optional<int64_t> GetDocumentVersion(const std::string& uri) const override;

    std::future<JSONValue> Definition(const std::string& uri, const Position& pos) override;
    std::future<JSONValue> TypeDefinition(const std::string& uri, const Position& pos) override;
    std::future<JSONValue> Implementation(const std::string& uri, const Position& pos) override;
    std::future<JSONValue> References(const std::string& uri, const Position& pos,
                                      bool includeDeclaration) override;
    std::future<JSONValue> Hover(const std::string& uri, const Position& pos) override;
    std::future<JSONValue> DocumentSymbols(const std::string& uri) override;
    std::future<JSONValue> Completion(const std::string& uri, const Position& pos) override;
    std::future<JSONValue> WorkspaceSymbols(const std::string& query) override;

    std::future<JSONValue> Call(const std::string& method, std::optional<JSONValue> params,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;
    RequestMultiplexer::PendingCallHandle CallCancellable(const std::string& method,
                                                          std::optional<JSONValue> params) override;
    bool Cancel(int64_t id) override;
    void Notify(const std::string& method, std::optional<JSONValue> params) override;

    ListenerId OnNotification(const std::string& method, NotificationListener listener) override;
    void RemoveNotificationListener(ListenerId id) override;
    void OnRequest(const std::string& method, RequestHandler handler) override;
    void OnDiagnostics(DiagnosticsListener listener) override;
    std::optional<JSONValue> GetDiagnostics(const std::string& uri) const override;
    void OnProgress(ProgressListener listener) override;
    std::vector<ProgressState> GetActiveProgress() const override;
    void OnStateChanged(StateListener listener) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ScopedDocument
// Purpose: Keeps a document open for the lifetime of the guard (OpenDocument in the constructor,
//          CloseDocument in the destructor).
//==========================================================================================================
class ScopedDocument {
public:
    ScopedDocument(ISession& session, std::string uri, const std::string& text, const std::string& languageId);
    ~ScopedDocument();

    ScopedDocument(const ScopedDocument&) = delete;
    ScopedDocument& operator=(const ScopedDocument&) = delete;

    const std::string& Uri() const { return uri; }

private:
    ISession& session;
    std::string uri;
};

// Session factory interface
class ISessionFactory {
public:
    virtual ~ISessionFactory() = default;
    virtual std::unique_ptr<ISession> CreateSession(const SessionOptions& options) = 0;
};

// Standard session factory
class SessionFactory : public ISessionFactory {
public:
    std::unique_ptr<ISession> CreateSession(const SessionOptions& options) override;
};

} // namespace lspc
