//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessSupervisor.h
// Purpose: Spawns, watches and terminates a language server subprocess
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "lspc/Protocol.h"
#include "lspc/Transport.h"

namespace lspc {

//==========================================================================================================
// ProcessExitInfo
// Fields:
//   exitCode: Exit status when the child exited normally, otherwise -1.
//   termSignal: Terminating signal number when the child was killed, otherwise 0.
//==========================================================================================================
struct ProcessExitInfo {
    int exitCode{-1};
    int termSignal{0};

    bool Signaled() const { return termSignal != 0; }
};

//==========================================================================================================
// ProcessSupervisor
// Purpose: Owns one child process. The child's stdin/stdout become a PipeStream; its stderr is drained
//          and logged line by line at DEBUG. A reaper thread waits for the child and reports the exit
//          exactly once to the exit handler.
//==========================================================================================================
class ProcessSupervisor {
public:
    using ExitHandler = std::function<void(const ProcessExitInfo&)>;

    ProcessSupervisor();
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    //==========================================================================================================
    // SetExitHandler
    // Purpose: Registers the callback run on the reaper thread when the child exits. Set before Start().
    //==========================================================================================================
    void SetExitHandler(ExitHandler handler);

    //==========================================================================================================
    // Start
    // Purpose: Spawns the child described by config.
    // Args:
    //   config: Executable, arguments, extra environment and working directory.
    // Returns:
    //   Byte stream connected to the child's stdin/stdout. Throws errors::LspException(SpawnFailed) when
    //   pipes cannot be created, fork fails, or exec fails in the child (reported through a
    //   close-on-exec pipe). Starting twice is an error.
    //==========================================================================================================
    std::shared_ptr<IByteStream> Start(const ServerLaunchConfig& config);

    // True while the child has not been reaped
    bool IsAlive() const;

    // Child pid, or -1 before Start()
    int Pid() const;

    //==========================================================================================================
    // WaitForExit
    // Purpose: Blocks until the child has been reaped or the timeout elapses.
    // Returns:
    //   true when the child has exited.
    //==========================================================================================================
    bool WaitForExit(std::chrono::milliseconds timeout);

    //==========================================================================================================
    // Terminate
    // Purpose: Sends SIGTERM, waits up to grace, then SIGKILL and waits for the reap.
    // Returns:
    //   true when the child exited within the grace period; false when it had to be killed.
    //==========================================================================================================
    bool Terminate(std::chrono::milliseconds grace);

    // Exit status once reaped
    std::optional<ProcessExitInfo> ExitInfo() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace lspc
