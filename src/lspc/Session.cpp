//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: LSP session implementation
//==========================================================================================================
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <format>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <unistd.h>

#include "logging/Logger.h"
#include "lspc/FramedTransport.h"
#include "lspc/ProcessSupervisor.h"
#include "lspc/Session.h"
#include "lspc/errors/Errors.h"
#include "lspc/version.h"

namespace lspc {

namespace {

void setMember(JSONValue::Object& obj, const std::string& key, JSONValue value) {
    obj[key] = std::make_shared<JSONValue>(std::move(value));
}

JSONValue textDocumentIdentifier(const std::string& uri) {
    JSONValue::Object doc;
    setMember(doc, "uri", JSONValue(uri));
    return JSONValue(std::move(doc));
}

JSONValue textDocumentPositionParams(const std::string& uri, const Position& pos) {
    JSONValue::Object params;
    setMember(params, "textDocument", textDocumentIdentifier(uri));
    setMember(params, "position", pos.toJSON());
    return JSONValue(std::move(params));
}

// Progress tokens are integer or string
std::optional<std::string> tokenToString(const JSONValue* token) {
    if (token == nullptr) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&token->value)) {
        return *s;
    }
    if (const auto* i = std::get_if<int64_t>(&token->value)) {
        return std::to_string(*i);
    }
    return std::nullopt;
}

std::string workspaceFolderName(const std::optional<std::string>& rootPath, const std::string& rootUri) {
    if (rootPath.has_value()) {
        std::filesystem::path p(rootPath.value());
        if (!p.has_filename()) {
            p = p.parent_path();
        }
        return p.filename().string();
    }
    std::string trimmed = rootUri;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    auto slash = trimmed.find_last_of('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

std::future<JSONValue> failedCall(const errors::LspException& e) {
    std::promise<JSONValue> p;
    p.set_exception(std::make_exception_ptr(e));
    return p.get_future();
}

// Legal lifecycle edges. Ready is only entered from Initializing and nothing leaves Closed or Failed.
bool isLegalTransition(SessionState from, SessionState to) {
    switch (from) {
        case SessionState::Unstarted:
            return to == SessionState::Initializing || to == SessionState::Closed || to == SessionState::Failed;
        case SessionState::Initializing:
            return to != SessionState::Unstarted && to != SessionState::Initializing;
        case SessionState::Ready:
            return to == SessionState::ShuttingDown || to == SessionState::Closed || to == SessionState::Failed;
        case SessionState::ShuttingDown:
            return to == SessionState::Closed || to == SessionState::Failed;
        case SessionState::Closed:
        case SessionState::Failed:
            return false;
    }
    return false;
}

// Open document bookkeeping
struct DocumentHandle {
    std::string languageId;
    int64_t version{0};
    std::size_t refCount{1};
};

} // namespace

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Unstarted: return "Unstarted";
        case SessionState::Initializing: return "Initializing";
        case SessionState::Ready: return "Ready";
        case SessionState::ShuttingDown: return "ShuttingDown";
        case SessionState::Closed: return "Closed";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

bool ServerCapabilities::Has(const std::string& key) const {
    const JSONValue* v = FindMember(capabilities, key);
    if (v == nullptr || v->isNull()) {
        return false;
    }
    if (const auto* b = std::get_if<bool>(&v->value)) {
        return *b;
    }
    return true;
}

// Session implementation
class Session::Impl {
public:
    SessionOptions options;

    mutable std::mutex stateMutex;
    SessionState state{SessionState::Unstarted};
    // Serializes the end of the handshake (initialized + Ready) against entering ShuttingDown
    std::mutex handshakeMutex;
    bool started{false};
    std::optional<int> serverPid;
    std::optional<ServerCapabilities> serverCapabilities;
    ISession::StateListener stateListener;
    ISession::ErrorHandler errorHandler;

    mutable std::mutex documentsMutex;
    std::unordered_map<std::string, DocumentHandle> documents;

    mutable std::mutex pushMutex;
    std::unordered_map<std::string, JSONValue> diagnostics;
    std::vector<ISession::DiagnosticsListener> diagnosticsListeners;
    std::unordered_map<std::string, ProgressState> progress;
    std::vector<ISession::ProgressListener> progressListeners;

    std::unique_ptr<ProcessSupervisor> supervisor;

    std::mutex transportMutex;
    std::shared_ptr<FramedTransport> transport;

    std::mutex readerMutex;
    std::condition_variable cvReader;
    bool readerFinished{false};
    std::thread readerThread;

    std::unique_ptr<RequestMultiplexer> multiplexer;
    std::unique_ptr<InboundDispatcher> dispatcher;

    explicit Impl(const SessionOptions& opts) : options(opts) {
        multiplexer = std::make_unique<RequestMultiplexer>(
            [this](const std::string& payload) { send(payload); }, options.requestTimeout);
        dispatcher = std::make_unique<InboundDispatcher>(
            *multiplexer, [this](const std::string& payload) { send(payload); }, options.dispatcherThreads);
        installBuiltinHandlers();
    }

    ////////////////////////////////////////// Wire ///////////////////////////////////////////
    void send(const std::string& payload) {
        std::shared_ptr<FramedTransport> t;
        {
            std::lock_guard<std::mutex> lock(transportMutex);
            t = transport;
        }
        if (!t) {
            throw errors::LspException(errors::ErrorKind::TransportClosed, "no transport attached");
        }
        t->WriteFrame(payload);
    }

    void closeTransport() {
        std::shared_ptr<FramedTransport> t;
        {
            std::lock_guard<std::mutex> lock(transportMutex);
            t = transport;
        }
        if (t) {
            t->Close();
        }
    }

    void joinReader() {
        if (readerThread.joinable() && readerThread.get_id() != std::this_thread::get_id()) {
            readerThread.join();
        }
    }

    bool waitReaderFinished(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(readerMutex);
        return cvReader.wait_for(lock, timeout, [this]() { return readerFinished; });
    }

    void connect(std::shared_ptr<IByteStream> stream) {
        LOG_INFO("Session connecting over {}", stream->Describe());
        auto t = std::make_shared<FramedTransport>(std::move(stream), options.maxContentLength);
        {
            std::lock_guard<std::mutex> lock(transportMutex);
            transport = t;
        }
        readerThread = std::thread([this, t]() { readLoop(t); });
    }

    void readLoop(std::shared_ptr<FramedTransport> t) {
        for (;;) {
            std::string payload;
            try {
                payload = t->ReadFrame();
            } catch (const errors::LspException& e) {
                const SessionState st = getState();
                if (st == SessionState::ShuttingDown || st == SessionState::Closed || st == SessionState::Failed) {
                    LOG_DEBUG("Session reader stopped: {}", e.what());
                } else {
                    fail(std::format("transport closed: {}", e.what()));
                }
                break;
            }
            dispatcher->Dispatch(payload);
        }
        {
            std::lock_guard<std::mutex> lock(readerMutex);
            readerFinished = true;
        }
        cvReader.notify_all();
    }

    ////////////////////////////////////////// State ///////////////////////////////////////////
    SessionState getState() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        return state;
    }

    //==========================================================================================================
    // transition
    // Purpose: Moves to `to` when isLegalTransition() allows it. Entering Closed or Failed flushes
    //          every Pending Call with SessionClosed/SessionFailed and rejects later calls.
    // Returns:
    //   true when the state changed.
    //==========================================================================================================
    bool transition(SessionState to, const std::string& reason) {
        SessionState from;
        ISession::StateListener listener;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            from = state;
            if (!isLegalTransition(from, to)) {
                if (from != to) {
                    LOG_DEBUG("Session state {} -> {} refused", toString(from), toString(to));
                }
                return false;
            }
            state = to;
            listener = stateListener;
        }
        LOG_INFO("Session state {} -> {}", toString(from), toString(to));
        if (to == SessionState::Closed) {
            multiplexer->Close(errors::ErrorKind::SessionClosed, reason);
        } else if (to == SessionState::Failed) {
            multiplexer->Close(errors::ErrorKind::SessionFailed, reason);
        }
        if (listener) {
            try {
                listener(from, to);
            } catch (const std::exception& e) {
                LOG_ERROR("Session state listener threw: {}", e.what());
            }
        }
        return true;
    }

    void fail(const std::string& reason) {
        if (!transition(SessionState::Failed, reason)) {
            return;
        }
        LOG_ERROR("Session failed: {}", reason);
        closeTransport();
        ISession::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(reason);
        }
    }

    void onProcessExit(const ProcessExitInfo& info) {
        const std::string what = info.Signaled()
            ? std::format("language server killed by signal {}", info.termSignal)
            : std::format("language server exited with code {}", info.exitCode);
        const SessionState st = getState();
        if (st == SessionState::ShuttingDown || st == SessionState::Closed || st == SessionState::Failed) {
            LOG_DEBUG("Session: {}", what);
            return;
        }
        fail(what);
    }

    errors::ErrorKind terminalKind() const {
        return getState() == SessionState::Closed ? errors::ErrorKind::SessionClosed : errors::ErrorKind::SessionFailed;
    }

    // Failure for a document or feature call in the current state; empty when Ready
    std::optional<errors::LspException> notReadyError(const std::string& what) const {
        switch (getState()) {
            case SessionState::Ready:
                return std::nullopt;
            case SessionState::Unstarted:
            case SessionState::Initializing:
                return errors::LspException(errors::ErrorKind::SessionNotReady,
                                            what + " before the handshake completed");
            case SessionState::ShuttingDown:
            case SessionState::Closed:
                return errors::LspException(errors::ErrorKind::SessionClosed, what + " after shutdown");
            case SessionState::Failed:
                return errors::LspException(errors::ErrorKind::SessionFailed, what + " on a failed session");
        }
        return std::nullopt;
    }

    void requireReady(const std::string& what) const {
        if (auto e = notReadyError(what)) {
            throw e.value();
        }
    }

    void beginStart() {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (started || state != SessionState::Unstarted) {
            throw errors::LspException(errors::ErrorKind::SessionNotReady,
                                       std::format("session already started (state {})", toString(state)));
        }
        started = true;
    }

    ////////////////////////////////////////// Handshake ///////////////////////////////////////////
    JSONValue buildInitializeParams(const InitializeOptions& init) const {
        JSONValue::Object params;
        setMember(params, "processId", JSONValue(static_cast<int64_t>(init.processId.value_or(::getpid()))));

        JSONValue::Object client;
        setMember(client, "name", JSONValue(init.clientInfo.name));
        setMember(client, "version",
                  JSONValue(init.clientInfo.version.empty() ? getVersionString() : init.clientInfo.version));
        setMember(params, "clientInfo", JSONValue(std::move(client)));

        std::optional<std::string> rootUri = init.rootUri;
        if (!rootUri.has_value() && init.rootPath.has_value()) {
            rootUri = FileUriFromPath(init.rootPath.value());
        }
        if (init.rootPath.has_value()) {
            setMember(params, "rootPath", JSONValue(init.rootPath.value()));
        }
        setMember(params, "rootUri", rootUri.has_value() ? JSONValue(rootUri.value()) : JSONValue(nullptr));

        if (init.workspaceFolders.has_value()) {
            setMember(params, "workspaceFolders", init.workspaceFolders.value());
        } else if (rootUri.has_value()) {
            JSONValue::Object folder;
            setMember(folder, "uri", JSONValue(rootUri.value()));
            setMember(folder, "name", JSONValue(workspaceFolderName(init.rootPath, rootUri.value())));
            JSONValue::Array folders;
            folders.push_back(std::make_shared<JSONValue>(std::move(folder)));
            setMember(params, "workspaceFolders", JSONValue(std::move(folders)));
        } else {
            setMember(params, "workspaceFolders", JSONValue(nullptr));
        }

        setMember(params, "capabilities",
                  init.capabilities.has_value() ? init.capabilities.value() : DefaultClientCapabilities());
        if (init.initializationOptions.has_value()) {
            setMember(params, "initializationOptions", init.initializationOptions.value());
        }
        if (init.trace.has_value()) {
            setMember(params, "trace", JSONValue(init.trace.value()));
        }
        return JSONValue(std::move(params));
    }

    void runHandshake(const InitializeOptions& init) {
        if (!transition(SessionState::Initializing, "")) {
            throw errors::LspException(terminalKind(), "session ended before initialize");
        }

        auto handle = multiplexer->Call(Methods::Initialize, buildInitializeParams(init), options.initializeTimeout);
        JSONValue result;
        try {
            result = handle.result.get();
        } catch (const errors::LspException& e) {
            fail(std::format("initialize failed: {}", e.what()));
            throw;
        }

        if (!result.isObject()) {
            const std::string msg = "initialize result is not an object: " + SerializeJSON(result);
            fail(msg);
            throw errors::LspException(errors::ErrorKind::ProtocolViolation, msg);
        }
        ServerCapabilities caps;
        if (const JSONValue* c = FindMember(result, "capabilities"); c != nullptr && c->isObject()) {
            caps.capabilities = *c;
        } else {
            LOG_WARN("initialize result carries no capabilities object; assuming none");
        }
        if (const JSONValue* info = FindMember(result, "serverInfo"); info != nullptr && info->isObject()) {
            caps.serverInfo = *info;
            LOG_INFO("Server: {} {}", GetStringMember(*info, "name").value_or("?"),
                     GetStringMember(*info, "version").value_or(""));
        }
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            serverCapabilities = std::move(caps);
        }

        {
            std::lock_guard<std::mutex> handshakeLock(handshakeMutex);
            if (getState() != SessionState::Initializing) {
                throw handshakeOvertaken();
            }
            try {
                multiplexer->Notify(Methods::Initialized, JSONValue(JSONValue::Object{}));
            } catch (const errors::LspException& e) {
                fail(std::format("initialized not sent: {}", e.what()));
                throw;
            }
        }
        if (!transition(SessionState::Ready, "")) {
            throw handshakeOvertaken();
        }
    }

    // Shutdown() or a failure moved the session on before it became Ready
    errors::LspException handshakeOvertaken() const {
        const SessionState st = getState();
        return errors::LspException(st == SessionState::Failed ? errors::ErrorKind::SessionFailed
                                                               : errors::ErrorKind::SessionClosed,
                                    std::format("session left Initializing ({}) before the handshake completed",
                                                toString(st)));
    }

    ////////////////////////////////////////// Calls ///////////////////////////////////////////
    std::future<JSONValue> featureCall(const char* method, const char* capability, JSONValue params) {
        if (auto e = notReadyError(method)) {
            return failedCall(e.value());
        }
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            if (!serverCapabilities.has_value() || !serverCapabilities->Has(capability)) {
                return errors::makeFailedFuture<JSONValue>(errors::ErrorKind::UnsupportedByServer,
                    std::format("{} requires {}", method, capability));
            }
        }
        return multiplexer->Call(method, std::move(params)).result;
    }

    ////////////////////////////////////////// Server push ///////////////////////////////////////////
    void onDiagnostics(const JSONRPCNotification& note) {
        if (!note.params.has_value()) {
            return;
        }
        auto uri = GetStringMember(note.params.value(), "uri");
        if (!uri.has_value()) {
            LOG_WARN("publishDiagnostics without uri dropped");
            return;
        }
        const JSONValue* list = FindMember(note.params.value(), "diagnostics");
        JSONValue value = list != nullptr ? *list : JSONValue(JSONValue::Array{});

        std::vector<ISession::DiagnosticsListener> targets;
        {
            std::lock_guard<std::mutex> lock(pushMutex);
            diagnostics[uri.value()] = value;
            targets = diagnosticsListeners;
        }
        for (auto& listener : targets) {
            try {
                listener(uri.value(), value);
            } catch (const std::exception& e) {
                LOG_ERROR("Diagnostics listener threw: {}", e.what());
            }
        }
    }

    void onProgress(const JSONRPCNotification& note) {
        if (!note.params.has_value()) {
            return;
        }
        auto token = tokenToString(FindMember(note.params.value(), "token"));
        const JSONValue* value = FindMember(note.params.value(), "value");
        if (!token.has_value() || value == nullptr) {
            LOG_WARN("$/progress without token or value dropped");
            return;
        }

        std::vector<ISession::ProgressListener> targets;
        {
            std::lock_guard<std::mutex> lock(pushMutex);
            const std::string kind = GetStringMember(*value, "kind").value_or("");
            if (kind == "end") {
                progress.erase(token.value());
            } else {
                auto& entry = progress[token.value()];
                entry.token = token.value();
                if (!kind.empty()) {
                    entry.kind = kind;
                }
                if (auto title = GetStringMember(*value, "title")) { entry.title = title; }
                if (auto message = GetStringMember(*value, "message")) { entry.message = message; }
                if (auto pct = GetIntMember(*value, "percentage")) { entry.percentage = pct; }
            }
            targets = progressListeners;
        }
        for (auto& listener : targets) {
            try {
                listener(token.value(), *value);
            } catch (const std::exception& e) {
                LOG_ERROR("Progress listener threw: {}", e.what());
            }
        }
    }

    // window/logMessage and window/showMessage: MessageType 1=Error 2=Warning 3=Info 4=Log
    static void onServerMessage(const JSONRPCNotification& note) {
        if (!note.params.has_value()) {
            return;
        }
        const int64_t type = GetIntMember(note.params.value(), "type").value_or(4);
        const std::string message = GetStringMember(note.params.value(), "message").value_or("");
        switch (type) {
            case 1: LOG_ERROR("[server] {}", message); break;
            case 2: LOG_WARN("[server] {}", message); break;
            case 3: LOG_INFO("[server] {}", message); break;
            default: LOG_DEBUG("[server] {}", message); break;
        }
    }

    void installBuiltinHandlers() {
        dispatcher->AddNotificationListener(Methods::PublishDiagnostics,
            [this](const JSONRPCNotification& note) { onDiagnostics(note); });
        dispatcher->AddNotificationListener(Methods::Progress,
            [this](const JSONRPCNotification& note) { onProgress(note); });
        dispatcher->AddNotificationListener(Methods::LogMessage, &Impl::onServerMessage);
        dispatcher->AddNotificationListener(Methods::ShowMessage, &Impl::onServerMessage);

        dispatcher->SetRequestHandler(Methods::WorkDoneProgressCreate, InboundDispatcher::WrapSync(
            [this](const JSONRPCRequest& request) {
                std::optional<std::string> token;
                if (request.params.has_value()) {
                    token = tokenToString(FindMember(request.params.value(), "token"));
                }
                if (!token.has_value()) {
                    errors::RpcErrorInfo err;
                    err.code = JSONRPCErrorCodes::InvalidParams;
                    err.message = "missing progress token";
                    err.category = errors::errorCategoryFromCode(err.code);
                    throw errors::LspException(std::move(err));
                }
                std::lock_guard<std::mutex> lock(pushMutex);
                auto& entry = progress[token.value()];
                entry.token = token.value();
                return JSONValue(nullptr);
            }));

        // One null per requested item: "no client-side setting"
        dispatcher->SetRequestHandler(Methods::Configuration, InboundDispatcher::WrapSync(
            [](const JSONRPCRequest& request) {
                JSONValue::Array answers;
                if (request.params.has_value()) {
                    if (const JSONValue* items = FindMember(request.params.value(), "items"); items && items->isArray()) {
                        for (std::size_t i = 0; i < std::get<JSONValue::Array>(items->value).size(); ++i) {
                            answers.push_back(std::make_shared<JSONValue>(nullptr));
                        }
                    }
                }
                return JSONValue(std::move(answers));
            }));

        auto acknowledge = InboundDispatcher::WrapSync([](const JSONRPCRequest&) { return JSONValue(nullptr); });
        dispatcher->SetRequestHandler(Methods::RegisterCapability, acknowledge);
        dispatcher->SetRequestHandler(Methods::UnregisterCapability, acknowledge);
    }

    ////////////////////////////////////////// Teardown ///////////////////////////////////////////
    void teardown() {
        transition(SessionState::Closed, "session destroyed");
        closeTransport();
        joinReader();
        dispatcher->Stop();
        if (supervisor) {
            if (supervisor->IsAlive()) {
                supervisor->Terminate(options.shutdownGrace);
            }
            supervisor.reset();
        }
    }
};

Session::Session(const SessionOptions& options) : pImpl(std::make_unique<Impl>(options)) {
    FUNC_SCOPE();
    // LSPC_LOG_FILE and friends apply process-wide; the first session picks them up
    static std::once_flag loggingConfigured;
    std::call_once(loggingConfigured, []() { Logger::initFromEnvironment(); });
}

Session::~Session() {
    FUNC_SCOPE();
    const SessionState st = pImpl->getState();
    if (st == SessionState::Ready || st == SessionState::Initializing) {
        Shutdown();
    }
    pImpl->teardown();
}

void Session::Start(const ServerLaunchConfig& launch, const InitializeOptions& init) {
    FUNC_SCOPE();
    pImpl->beginStart();

    auto supervisor = std::make_unique<ProcessSupervisor>();
    supervisor->SetExitHandler([impl = pImpl.get()](const ProcessExitInfo& info) { impl->onProcessExit(info); });
    std::shared_ptr<IByteStream> stream;
    try {
        stream = supervisor->Start(launch);
    } catch (const errors::LspException& e) {
        pImpl->fail(e.what());
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        pImpl->serverPid = supervisor->Pid();
    }
    pImpl->supervisor = std::move(supervisor);

    pImpl->connect(std::move(stream));
    pImpl->runHandshake(init);
}

void Session::Attach(std::shared_ptr<IByteStream> stream, const InitializeOptions& init) {
    FUNC_SCOPE();
    if (!stream) {
        throw errors::LspException(errors::ErrorKind::TransportClosed, "null stream");
    }
    pImpl->beginStart();
    pImpl->connect(std::move(stream));
    pImpl->runHandshake(init);
}

void Session::Shutdown() {
    FUNC_SCOPE();
    const SessionState st = pImpl->getState();
    if (st == SessionState::Closed || st == SessionState::Failed) {
        return;
    }
    if (st == SessionState::Unstarted) {
        pImpl->transition(SessionState::Closed, "session closed before start");
        return;
    }
    {
        std::lock_guard<std::mutex> handshakeLock(pImpl->handshakeMutex);
        if (!pImpl->transition(SessionState::ShuttingDown, "")) {
            return;
        }
    }

    const auto grace = std::max(pImpl->options.shutdownGrace, std::chrono::milliseconds(1));
    auto handle = pImpl->multiplexer->Call(Methods::Shutdown, std::nullopt, grace);
    try {
        handle.result.get();
    } catch (const errors::LspException& e) {
        LOG_WARN("shutdown request failed: {}", e.what());
    }
    try {
        pImpl->multiplexer->Notify(Methods::Exit);
    } catch (const errors::LspException& e) {
        LOG_DEBUG("exit notification not sent: {}", e.what());
    }

    if (pImpl->supervisor) {
        if (!pImpl->supervisor->WaitForExit(grace)) {
            LOG_WARN("Language server did not exit within {} ms; terminating", grace.count());
            pImpl->supervisor->Terminate(grace);
        }
    } else if (!pImpl->waitReaderFinished(grace)) {
        LOG_DEBUG("Attached stream still open after exit; closing it");
    }
    pImpl->closeTransport();
    pImpl->joinReader();
    pImpl->transition(SessionState::Closed, "session shut down");
}

SessionState Session::GetState() const {
    return pImpl->getState();
}

std::optional<ServerCapabilities> Session::GetServerCapabilities() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->serverCapabilities;
}

std::optional<int> Session::ServerPid() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->serverPid;
}

void Session::OpenDocument(const std::string& uri, const std::string& text, const std::string& languageId) {
    FUNC_SCOPE();
    pImpl->requireReady(Methods::DidOpen);
    std::lock_guard<std::mutex> lock(pImpl->documentsMutex);
    auto it = pImpl->documents.find(uri);
    if (it != pImpl->documents.end()) {
        ++it->second.refCount;
        LOG_DEBUG("{} already open ({} references)", uri, it->second.refCount);
        return;
    }
    JSONValue::Object item;
    setMember(item, "uri", JSONValue(uri));
    setMember(item, "languageId", JSONValue(languageId));
    setMember(item, "version", JSONValue(static_cast<int64_t>(0)));
    setMember(item, "text", JSONValue(text));
    JSONValue::Object params;
    setMember(params, "textDocument", JSONValue(std::move(item)));
    pImpl->multiplexer->Notify(Methods::DidOpen, JSONValue(std::move(params)));
    pImpl->documents.emplace(uri, DocumentHandle{languageId, 0, 1});
}

void Session::ChangeDocument(const std::string& uri, const std::string& text) {
    FUNC_SCOPE();
    pImpl->requireReady(Methods::DidChange);
    std::lock_guard<std::mutex> lock(pImpl->documentsMutex);
    auto it = pImpl->documents.find(uri);
    if (it == pImpl->documents.end()) {
        throw errors::LspException(errors::ErrorKind::DocumentNotOpen, uri);
    }
    const int64_t next = it->second.version + 1;

    JSONValue::Object doc;
    setMember(doc, "uri", JSONValue(uri));
    setMember(doc, "version", JSONValue(next));
    JSONValue::Object change;
    setMember(change, "text", JSONValue(text));
    JSONValue::Array changes;
    changes.push_back(std::make_shared<JSONValue>(std::move(change)));
    JSONValue::Object params;
    setMember(params, "textDocument", JSONValue(std::move(doc)));
    setMember(params, "contentChanges", JSONValue(std::move(changes)));
    pImpl->multiplexer->Notify(Methods::DidChange, JSONValue(std::move(params)));
    it->second.version = next;
}

void Session::CloseDocument(const std::string& uri) {
    FUNC_SCOPE();
    pImpl->requireReady(Methods::DidClose);
    std::lock_guard<std::mutex> lock(pImpl->documentsMutex);
    auto it = pImpl->documents.find(uri);
    if (it == pImpl->documents.end()) {
        throw errors::LspException(errors::ErrorKind::DocumentNotOpen, uri);
    }
    if (--it->second.refCount > 0) {
        return;
    }
    pImpl->documents.erase(it);
    JSONValue::Object params;
    setMember(params, "textDocument", textDocumentIdentifier(uri));
    pImpl->multiplexer->Notify(Methods::DidClose, JSONValue(std::move(params)));
}

std::optional<int64_t> Session::GetDocumentVersion(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(pImpl->documentsMutex);
    auto it = pImpl->documents.find(uri);
    if (it == pImpl->documents.end()) {
        return std::nullopt;
    }
    return it->second.version;
}

std::future<JSONValue> Session::Definition(const std::string& uri, const Position& pos) {
    FUNC_SCOPE();
    return pImpl->featureCall(Methods::Definition, CapabilityKeys::Definition, textDocumentPositionParams(uri, pos));
}

std::future<JSONValue> Session::TypeDefinition(const std::string& uri, const Position& pos) {
    FUNC_SCOPE();
    return pImpl->featureCall(Methods::TypeDefinition, CapabilityKeys::TypeDefinition,
                              textDocumentPositionParams(uri, pos));
}

std::future<JSONValue> Session::Implementation(const std::string& uri, const Position& pos) {
    FUNC_SCOPE();
    return pImpl->featureCall(Methods::Implementation, CapabilityKeys::Implementation,
                              textDocumentPositionParams(uri, pos));
}

std::future<JSONValue> Session::References(const std::string& uri, const Position& pos, bool includeDeclaration) {
    FUNC_SCOPE();
    JSONValue params = textDocumentPositionParams(uri, pos);
    JSONValue::Object context;
    setMember(context, "includeDeclaration", JSONValue(includeDeclaration));
    setMember(std::get<JSONValue::Object>(params.value), "context", JSONValue(std::move(context)));
    return pImpl->featureCall(Methods::References, CapabilityKeys::References, std::move(params));
}

std::future<JSONValue> Session::Hover(const std::string& uri, const Position& pos) {
    FUNC_SCOPE();
    return pImpl->featureCall(Methods::Hover, CapabilityKeys::Hover, textDocumentPositionParams(uri, pos));
}

std::future<JSONValue> Session::DocumentSymbols(const std::string& uri) {
    FUNC_SCOPE();
    JSONValue::Object params;
    setMember(params, "textDocument", textDocumentIdentifier(uri));
    return pImpl->featureCall(Methods::DocumentSymbol, CapabilityKeys::DocumentSymbol, JSONValue(std::move(params)));
}

std::future<JSONValue> Session::Completion(const std::string& uri, const Position& pos) {
    FUNC_SCOPE();
    JSONValue params = textDocumentPositionParams(uri, pos);
    JSONValue::Object context;
    setMember(context, "triggerKind", JSONValue(static_cast<int64_t>(1))); // Invoked
    setMember(std::get<JSONValue::Object>(params.value), "context", JSONValue(std::move(context)));
    return pImpl->featureCall(Methods::Completion, CapabilityKeys::Completion, std::move(params));
}

std::future<JSONValue> Session::WorkspaceSymbols(const std::string& query) {
    FUNC_SCOPE();
    JSONValue::Object params;
    setMember(params, "query", JSONValue(query));
    return pImpl->featureCall(Methods::WorkspaceSymbol, CapabilityKeys::WorkspaceSymbol, JSONValue(std::move(params)));
}

std::future<JSONValue> Session::Call(const std::string& method, std::optional<JSONValue> params,
                                     std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    if (auto e = pImpl->notReadyError(method)) {
        return failedCall(e.value());
    }
    return pImpl->multiplexer->Call(method, std::move(params), timeout).result;
}

RequestMultiplexer::PendingCallHandle Session::CallCancellable(const std::string& method,
                                                               std::optional<JSONValue> params) {
    FUNC_SCOPE();
    if (auto e = pImpl->notReadyError(method)) {
        RequestMultiplexer::PendingCallHandle handle;
        handle.result = failedCall(e.value());
        return handle;
    }
    return pImpl->multiplexer->Call(method, std::move(params));
}

bool Session::Cancel(int64_t id) {
    FUNC_SCOPE();
    return pImpl->multiplexer->Cancel(id);
}

void Session::Notify(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    pImpl->requireReady(method);
    pImpl->multiplexer->Notify(method, std::move(params));
}

ISession::ListenerId Session::OnNotification(const std::string& method, NotificationListener listener) {
    return pImpl->dispatcher->AddNotificationListener(method, std::move(listener));
}

void Session::RemoveNotificationListener(ListenerId id) {
    pImpl->dispatcher->RemoveNotificationListener(id);
}

void Session::OnRequest(const std::string& method, RequestHandler handler) {
    pImpl->dispatcher->SetRequestHandler(method, std::move(handler));
}

void Session::OnDiagnostics(DiagnosticsListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->pushMutex);
    pImpl->diagnosticsListeners.push_back(std::move(listener));
}

std::optional<JSONValue> Session::GetDiagnostics(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(pImpl->pushMutex);
    auto it = pImpl->diagnostics.find(uri);
    if (it == pImpl->diagnostics.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Session::OnProgress(ProgressListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->pushMutex);
    pImpl->progressListeners.push_back(std::move(listener));
}

std::vector<ProgressState> Session::GetActiveProgress() const {
    std::lock_guard<std::mutex> lock(pImpl->pushMutex);
    std::vector<ProgressState> out;
    out.reserve(pImpl->progress.size());
    for (const auto& [token, entry] : pImpl->progress) {
        out.push_back(entry);
    }
    return out;
}

void Session::OnStateChanged(StateListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->stateListener = std::move(listener);
}

void Session::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->errorHandler = std::move(handler);
}

ScopedDocument::ScopedDocument(ISession& session, std::string uri, const std::string& text,
                               const std::string& languageId)
    : session(session), uri(std::move(uri)) {
    session.OpenDocument(this->uri, text, languageId);
}

ScopedDocument::~ScopedDocument() {
    try {
        session.CloseDocument(uri);
    } catch (const errors::LspException& e) {
        LOG_WARN("Closing {} failed: {}", uri, e.what());
    }
}

std::unique_ptr<ISession> SessionFactory::CreateSession(const SessionOptions& options) {
    return std::make_unique<Session>(options);
}

} // namespace lspc
