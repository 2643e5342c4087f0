//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_supervisor.cpp
// Purpose: Spawning, exit reporting and termination of child processes
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <signal.h>
#include <string>

#include "lspc/ProcessSupervisor.h"
#include "lspc/errors/Errors.h"

using namespace lspc;
using namespace std::chrono_literals;

namespace {
ServerLaunchConfig shell(const std::string& script) {
    ServerLaunchConfig config;
    config.executable = "/bin/sh";
    config.arguments = {"-c", script};
    return config;
}

// Reads until end of stream
std::string readAll(IByteStream& stream) {
    std::string out;
    char buf[256];
    for (;;) {
        std::size_t n = stream.Read(buf, sizeof(buf));
        if (n == 0) {
            break;
        }
        out.append(buf, n);
    }
    return out;
}

errors::ErrorKind startFailure(ProcessSupervisor& supervisor, const ServerLaunchConfig& config) {
    try {
        (void)supervisor.Start(config);
    } catch (const errors::LspException& e) {
        return e.kind();
    }
    ADD_FAILURE() << "Start() did not throw";
    return errors::ErrorKind::ProtocolViolation;
}
} // namespace

TEST(ProcessSupervisor, ChildStdioIsConnected) {
    ProcessSupervisor supervisor;
    EXPECT_EQ(supervisor.Pid(), -1);
    ServerLaunchConfig config;
    config.executable = "cat"; // resolved through PATH
    auto stream = supervisor.Start(config);
    ASSERT_NE(stream, nullptr);
    EXPECT_GT(supervisor.Pid(), 0);
    EXPECT_TRUE(supervisor.IsAlive());

    stream->Write("Content-Length: 2\r\n\r\n{}");
    std::string echoed;
    char buf[64];
    while (echoed.size() < 23) {
        std::size_t n = stream->Read(buf, sizeof(buf));
        ASSERT_GT(n, 0u);
        echoed.append(buf, n);
    }
    EXPECT_EQ(echoed, "Content-Length: 2\r\n\r\n{}");

    stream->Close(); // cat sees EOF on stdin and exits
    ASSERT_TRUE(supervisor.WaitForExit(5s));
    EXPECT_FALSE(supervisor.IsAlive());
    ASSERT_TRUE(supervisor.ExitInfo().has_value());
    EXPECT_EQ(supervisor.ExitInfo()->exitCode, 0);
    EXPECT_FALSE(supervisor.ExitInfo()->Signaled());
}

TEST(ProcessSupervisor, ExitCodeIsReportedOnce) {
    std::atomic<int> calls{0};
    std::atomic<int> code{-100};
    {
        ProcessSupervisor supervisor;
        supervisor.SetExitHandler([&](const ProcessExitInfo& info) {
            ++calls;
            code = info.exitCode;
        });
        auto stream = supervisor.Start(shell("echo 'server log line' >&2; exit 3"));
        ASSERT_TRUE(supervisor.WaitForExit(5s));
        EXPECT_EQ(supervisor.ExitInfo()->exitCode, 3);
        EXPECT_EQ(readAll(*stream), "");
    }
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(code.load(), 3);
}

TEST(ProcessSupervisor, EnvironmentAndWorkingDirectoryReachChild) {
    const std::string dir = std::filesystem::canonical(std::filesystem::temp_directory_path()).string();
    ProcessSupervisor supervisor;
    auto config = shell("printf '%s|%s|%s' \"$LSPC_SUPERVISOR_TEST\" \"$(pwd -P)\" \"${PATH:+inherited}\"");
    config.environment["LSPC_SUPERVISOR_TEST"] = "hello world";
    config.workingDirectory = dir;
    auto stream = supervisor.Start(config);
    EXPECT_EQ(readAll(*stream), "hello world|" + dir + "|inherited");
    ASSERT_TRUE(supervisor.WaitForExit(5s));
    EXPECT_EQ(supervisor.ExitInfo()->exitCode, 0);
}

TEST(ProcessSupervisor, MissingExecutableIsSpawnFailed) {
    ProcessSupervisor supervisor;
    ServerLaunchConfig config;
    config.executable = "/nonexistent/lspc-no-such-server";
    EXPECT_EQ(startFailure(supervisor, config), errors::ErrorKind::SpawnFailed);
    EXPECT_FALSE(supervisor.IsAlive());
}

TEST(ProcessSupervisor, BadWorkingDirectoryIsSpawnFailed) {
    ProcessSupervisor supervisor;
    auto config = shell("exit 0");
    config.workingDirectory = "/nonexistent/lspc-no-such-dir";
    EXPECT_EQ(startFailure(supervisor, config), errors::ErrorKind::SpawnFailed);
}

TEST(ProcessSupervisor, EmptyExecutableAndSecondStartAreRejected) {
    ProcessSupervisor empty;
    EXPECT_EQ(startFailure(empty, ServerLaunchConfig{}), errors::ErrorKind::SpawnFailed);

    ProcessSupervisor twice;
    auto stream = twice.Start(shell("exit 0"));
    EXPECT_EQ(startFailure(twice, shell("exit 0")), errors::ErrorKind::SpawnFailed);
    ASSERT_TRUE(twice.WaitForExit(5s));
}

TEST(ProcessSupervisor, TerminateStopsChildWithSigterm) {
    ProcessSupervisor supervisor;
    auto stream = supervisor.Start(shell("exec sleep 30"));
    EXPECT_TRUE(supervisor.IsAlive());
    EXPECT_FALSE(supervisor.WaitForExit(50ms));
    EXPECT_TRUE(supervisor.Terminate(2000ms));
    ASSERT_TRUE(supervisor.ExitInfo().has_value());
    EXPECT_TRUE(supervisor.ExitInfo()->Signaled());
    EXPECT_EQ(supervisor.ExitInfo()->termSignal, SIGTERM);
}

TEST(ProcessSupervisor, TerminateEscalatesToSigkill) {
    ProcessSupervisor supervisor;
    auto stream = supervisor.Start(shell("trap '' TERM; echo ready; while :; do sleep 1; done"));
    char buf[16];
    ASSERT_GT(stream->Read(buf, sizeof(buf)), 0u); // trap installed
    EXPECT_FALSE(supervisor.Terminate(200ms));
    ASSERT_TRUE(supervisor.ExitInfo().has_value());
    EXPECT_EQ(supervisor.ExitInfo()->termSignal, SIGKILL);
}

TEST(ProcessSupervisor, DestructorTerminatesLiveChild) {
    int pid = -1;
    {
        ProcessSupervisor supervisor;
        auto stream = supervisor.Start(shell("exec sleep 30"));
        pid = supervisor.Pid();
    }
    ASSERT_GT(pid, 0);
    EXPECT_NE(::kill(pid, 0), 0); // reaped
}
