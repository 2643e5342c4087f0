//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_options.cpp
// Purpose: SessionOptions defaults, environment overrides and config string parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>

#include "lspc/SessionOptions.h"

using namespace lspc;

namespace {
// Clears the option variables for the duration of a test
class SessionOptionsEnv : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : {"LSPC_REQUEST_TIMEOUT_MS", "LSPC_INITIALIZE_TIMEOUT_MS", "LSPC_SHUTDOWN_GRACE_MS",
                                 "LSPC_MAX_CONTENT_LENGTH", "LSPC_DISPATCHER_THREADS"}) {
            ::unsetenv(name);
        }
    }
};
} // namespace

TEST_F(SessionOptionsEnv, Defaults) {
    SessionOptions opts = SessionOptions::FromEnvironment();
    EXPECT_EQ(opts.requestTimeout.count(), 30000);
    EXPECT_EQ(opts.initializeTimeout.count(), 60000);
    EXPECT_EQ(opts.shutdownGrace.count(), 5000);
    EXPECT_EQ(opts.maxContentLength, DefaultMaxContentLength);
    EXPECT_EQ(opts.dispatcherThreads, 2u);
}

TEST_F(SessionOptionsEnv, EnvironmentOverridesDefaults) {
    ::setenv("LSPC_REQUEST_TIMEOUT_MS", "1500", 1);
    ::setenv("LSPC_DISPATCHER_THREADS", "4", 1);
    ::setenv("LSPC_SHUTDOWN_GRACE_MS", "soon", 1); // malformed: ignored
    SessionOptions opts = SessionOptions::FromEnvironment();
    EXPECT_EQ(opts.requestTimeout.count(), 1500);
    EXPECT_EQ(opts.dispatcherThreads, 4u);
    EXPECT_EQ(opts.shutdownGrace.count(), 5000);
}

TEST_F(SessionOptionsEnv, ConfigStringWinsOverEnvironment) {
    ::setenv("LSPC_REQUEST_TIMEOUT_MS", "1500", 1);
    SessionOptions opts = ParseSessionOptions("request_timeout_ms=250; initialize_timeout_ms=0 max_content_length=1024");
    EXPECT_EQ(opts.requestTimeout.count(), 250);
    EXPECT_EQ(opts.initializeTimeout.count(), 0);
    EXPECT_EQ(opts.maxContentLength, 1024u);
}

TEST_F(SessionOptionsEnv, MalformedAndUnknownEntriesIgnored) {
    SessionOptions opts = ParseSessionOptions("bogus=1;request_timeout_ms=-5;shutdown_grace_ms=12x;noequals;dispatcher_threads=3");
    EXPECT_EQ(opts.requestTimeout.count(), 30000);
    EXPECT_EQ(opts.shutdownGrace.count(), 5000);
    EXPECT_EQ(opts.dispatcherThreads, 3u);
}

TEST_F(SessionOptionsEnv, ZeroThreadsAndLengthClampToOne) {
    SessionOptions opts = ParseSessionOptions("dispatcher_threads=0;max_content_length=0");
    EXPECT_EQ(opts.dispatcherThreads, 1u);
    EXPECT_EQ(opts.maxContentLength, 1u);
}
