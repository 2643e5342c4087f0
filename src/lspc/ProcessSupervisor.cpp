//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessSupervisor.cpp
// Purpose: fork/exec based subprocess supervision with stderr draining and a reaper thread
//==========================================================================================================

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <format>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "lspc/PipeStream.hpp"
#include "lspc/ProcessSupervisor.h"
#include "lspc/errors/Errors.h"

extern char** environ;

namespace lspc {

namespace {
// Closes both ends of a pipe pair that are still open
void closePair(int fds[2]) {
    for (int k = 0; k < 2; ++k) {
        if (fds[k] >= 0) {
            ::close(fds[k]);
            fds[k] = -1;
        }
    }
}

std::vector<std::string> buildEnvironment(const std::unordered_map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            merged[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    for (const auto& [k, v] : overrides) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}

// Logs the child's stderr line by line; owns fd and touches nothing else so it may outlive the supervisor
void drainStderr(int fd, std::string name, std::shared_ptr<std::atomic<bool>> exited) {
    std::string pending;
    char buf[4096];
    for (;;) {
        ssize_t got = ::read(fd, buf, sizeof(buf));
        if (got < 0 && errno == EINTR) {
            continue;
        }
        if (got <= 0) {
            break;
        }
        pending.append(buf, static_cast<std::size_t>(got));
        std::size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            LOG_DEBUG("[{} stderr] {}", name, line);
            pending.erase(0, nl + 1);
        }
    }
    if (!pending.empty()) {
        LOG_DEBUG("[{} stderr] {}", name, pending);
    }
    ::close(fd);
    exited->store(true);
}
} // namespace

class ProcessSupervisor::Impl {
public:
    mutable std::mutex stateMutex;
    std::condition_variable cvExit;
    pid_t pid{-1};
    bool started{false};
    std::optional<ProcessExitInfo> exitInfo;
    ExitHandler exitHandler;
    std::string name;
    std::thread reaperThread;
    std::thread stderrThread;
    std::shared_ptr<std::atomic<bool>> stderrExited{std::make_shared<std::atomic<bool>>(false)};

    void startReaper() {
        reaperThread = std::thread([this]() {
            int status = 0;
            pid_t r;
            do {
                r = ::waitpid(pid, &status, 0);
            } while (r < 0 && errno == EINTR);

            ProcessExitInfo info;
            if (r < 0) {
                LOG_ERROR("ProcessSupervisor: waitpid({}) failed (errno={} msg={})", pid, errno, ::strerror(errno));
            } else if (WIFEXITED(status)) {
                info.exitCode = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                info.termSignal = WTERMSIG(status);
            }
            if (info.Signaled()) {
                LOG_INFO("Language server {} (pid {}) terminated by signal {}", name, pid, info.termSignal);
            } else {
                LOG_INFO("Language server {} (pid {}) exited with code {}", name, pid, info.exitCode);
            }

            ExitHandler handler;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                exitInfo = info;
                handler = exitHandler;
            }
            cvExit.notify_all();
            if (handler) {
                handler(info);
            }
        });
    }

    void sendSignal(int sig) {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (pid > 0 && !exitInfo.has_value()) {
            if (::kill(pid, sig) != 0 && errno != ESRCH) {
                LOG_WARN("ProcessSupervisor: kill({}, {}) failed (errno={} msg={})", pid, sig, errno, ::strerror(errno));
            }
        }
    }
};

ProcessSupervisor::ProcessSupervisor() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }

ProcessSupervisor::~ProcessSupervisor() {
    FUNC_SCOPE();
    if (IsAlive()) {
        Terminate(std::chrono::milliseconds(2000));
    }
    if (pImpl->reaperThread.joinable()) {
        pImpl->reaperThread.join();
    }
    if (pImpl->stderrThread.joinable()) {
        // A grandchild may keep stderr open; give the drain a moment, then let it finish on its own
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
        while (!pImpl->stderrExited->load()) {
            if (std::chrono::steady_clock::now() >= deadline) { break; }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (pImpl->stderrExited->load()) { pImpl->stderrThread.join(); }
        else { LOG_WARN("ProcessSupervisor: stderr drain appears blocked; detaching to avoid hang"); pImpl->stderrThread.detach(); }
    }
}

void ProcessSupervisor::SetExitHandler(ExitHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->exitHandler = std::move(handler);
}

std::shared_ptr<IByteStream> ProcessSupervisor::Start(const ServerLaunchConfig& config) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        if (pImpl->started) {
            throw errors::LspException(errors::ErrorKind::SpawnFailed, "process already started");
        }
        pImpl->started = true;
    }
    if (config.executable.empty()) {
        throw errors::LspException(errors::ErrorKind::SpawnFailed, "empty executable");
    }
    pImpl->name = config.executable;

    // Everything the child needs is built before fork
    std::vector<std::string> argStorage;
    argStorage.push_back(config.executable);
    argStorage.insert(argStorage.end(), config.arguments.begin(), config.arguments.end());
    std::vector<char*> argv;
    for (auto& a : argStorage) { argv.push_back(a.data()); }
    argv.push_back(nullptr);

    std::vector<std::string> envStorage = buildEnvironment(config.environment);
    std::vector<char*> envp;
    for (auto& e : envStorage) { envp.push_back(e.data()); }
    envp.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    auto closeAll = [&]() { closePair(inPipe); closePair(outPipe); closePair(errPipe); closePair(execPipe); };

    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(execPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeAll();
        throw errors::LspException(errors::ErrorKind::SpawnFailed,
            std::format("pipe creation failed (errno={} msg={})", err, ::strerror(err)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeAll();
        throw errors::LspException(errors::ErrorKind::SpawnFailed,
            std::format("fork failed (errno={} msg={})", err, ::strerror(err)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        if (!config.workingDirectory.empty() && ::chdir(config.workingDirectory.c_str()) != 0) {
            int err = errno;
            (void)!::write(execPipe[1], &err, sizeof(err));
            ::_exit(127);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        (void)!::write(execPipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    // Parent
    ::close(inPipe[0]); inPipe[0] = -1;
    ::close(outPipe[1]); outPipe[1] = -1;
    ::close(errPipe[1]); errPipe[1] = -1;
    ::close(execPipe[1]); execPipe[1] = -1;

    int childErr = 0;
    ssize_t got;
    do {
        got = ::read(execPipe[0], &childErr, sizeof(childErr));
    } while (got < 0 && errno == EINTR);
    closePair(execPipe);

    if (got > 0) {
        // exec failed; reap the child before reporting
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        closeAll();
        throw errors::LspException(errors::ErrorKind::SpawnFailed,
            std::format("cannot launch '{}' (errno={} msg={})", config.executable, childErr, ::strerror(childErr)));
    }

    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        pImpl->pid = pid;
    }
    LOG_INFO("Started language server {} (pid {})", config.executable, pid);

    pImpl->stderrThread = std::thread(drainStderr, errPipe[0], config.executable, pImpl->stderrExited);
    errPipe[0] = -1;
    pImpl->startReaper();

    auto stream = std::make_shared<PipeStream>(outPipe[0], inPipe[1]);
    outPipe[0] = -1;
    inPipe[1] = -1;
    return stream;
}

bool ProcessSupervisor::IsAlive() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->pid > 0 && !pImpl->exitInfo.has_value();
}

int ProcessSupervisor::Pid() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return static_cast<int>(pImpl->pid);
}

bool ProcessSupervisor::WaitForExit(std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    std::unique_lock<std::mutex> lock(pImpl->stateMutex);
    if (pImpl->pid <= 0) {
        return true;
    }
    return pImpl->cvExit.wait_for(lock, timeout, [this]() { return pImpl->exitInfo.has_value(); });
}

bool ProcessSupervisor::Terminate(std::chrono::milliseconds grace) {
    FUNC_SCOPE();
    if (!IsAlive()) {
        return true;
    }
    LOG_DEBUG("ProcessSupervisor: sending SIGTERM to pid {}", Pid());
    pImpl->sendSignal(SIGTERM);
    if (WaitForExit(grace)) {
        return true;
    }
    LOG_WARN("Language server pid {} did not exit within {} ms; sending SIGKILL", Pid(), grace.count());
    pImpl->sendSignal(SIGKILL);
    WaitForExit(std::chrono::milliseconds(5000));
    return false;
}

std::optional<ProcessExitInfo> ProcessSupervisor::ExitInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->exitInfo;
}

} // namespace lspc
