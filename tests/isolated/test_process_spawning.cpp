/*
 * test_process_spawning.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_process_spawning.cpp
 * @brief Tests for worker process spawning, waiting and killing
 */

#include <gtest/gtest.h>
#include "isolated/process_spawning.hpp"
#include "ipc/channel.hpp"

#include <csignal>
#include <thread>

using namespace warden::isolated;
using namespace std::chrono_literals;

class ProcessSpawnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(channel_.create().has_value());
    }

    void TearDown() override {
        channel_.close();
    }

    Result<int> spawnShell(const std::string& script,
                           std::filesystem::path cwd = {}) {
        SpawnOptions options;
        options.workerPath = "/bin/sh";
        options.workingDirectory = std::move(cwd);
        options.arguments = {"-c", script};
        return ProcessSpawner::spawn(options, channel_.getSubprocessFds());
    }

    warden::ipc::BidirectionalChannel channel_;
};

TEST_F(ProcessSpawnerTest, ExitCodeIsReported) {
    auto pid = spawnShell("exit 7");
    ASSERT_TRUE(pid.has_value()) << pid.error().detail;

    auto status = ProcessSpawner::waitForProcess(*pid, 5000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->exited);
    EXPECT_EQ(status->exitCode, 7);
    EXPECT_FALSE(status->isCleanExit());
}

TEST_F(ProcessSpawnerTest, CleanExit) {
    auto pid = spawnShell("exit 0");
    ASSERT_TRUE(pid.has_value());
    auto status = ProcessSpawner::waitForProcess(*pid, 5000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->isCleanExit());
}

TEST_F(ProcessSpawnerTest, ChannelIsOnFixedDescriptors) {
    auto pid = spawnShell("test -e /proc/self/fd/3 && test -e /proc/self/fd/4");
    ASSERT_TRUE(pid.has_value());
    auto status = ProcessSpawner::waitForProcess(*pid, 5000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->isCleanExit());
}

TEST_F(ProcessSpawnerTest, OtherDescriptorsAreClosed) {
    auto pid = spawnShell("test ! -e /proc/self/fd/9");
    ASSERT_TRUE(pid.has_value());
    auto status = ProcessSpawner::waitForProcess(*pid, 5000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->isCleanExit());
}

TEST_F(ProcessSpawnerTest, DefaultEnvironmentIsApplied) {
    auto pid = spawnShell("test \"$OPENBLAS_NUM_THREADS\" = 1 && "
                          "test \"$PYTHONDONTWRITEBYTECODE\" = 1");
    ASSERT_TRUE(pid.has_value());
    auto status = ProcessSpawner::waitForProcess(*pid, 5000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->isCleanExit());
}

TEST_F(ProcessSpawnerTest, WorkingDirectory) {
    auto pid = spawnShell("test \"$(pwd -P)\" = \"$(cd / && pwd -P)\"", "/");
    ASSERT_TRUE(pid.has_value());
    auto status = ProcessSpawner::waitForProcess(*pid, 5000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->isCleanExit());
}

TEST_F(ProcessSpawnerTest, WaitTimesOut) {
    auto pid = spawnShell("sleep 30");
    ASSERT_TRUE(pid.has_value());

    EXPECT_FALSE(ProcessSpawner::waitForProcess(*pid, 50ms).has_value());
    EXPECT_TRUE(ProcessSpawner::isProcessRunning(*pid));

    auto status = ProcessSpawner::killProcess(*pid);
    EXPECT_TRUE(status.signaled);
    EXPECT_EQ(status.signal, SIGKILL);
}

TEST_F(ProcessSpawnerTest, KillReachesTheProcessGroup) {
    auto pid = spawnShell("sleep 30 & wait");
    ASSERT_TRUE(pid.has_value());
    std::this_thread::sleep_for(100ms);

    auto status = ProcessSpawner::killProcess(*pid);
    EXPECT_TRUE(status.signaled);
    EXPECT_FALSE(ProcessSpawner::isProcessRunning(*pid));
}

TEST_F(ProcessSpawnerTest, MissingExecutable) {
    SpawnOptions options;
    options.workerPath = "/nonexistent/warden-worker";
    auto pid = ProcessSpawner::spawn(options, channel_.getSubprocessFds());
    ASSERT_FALSE(pid.has_value());
    EXPECT_EQ(pid.error().error, BoundaryError::WorkerNotFound);
}

TEST_F(ProcessSpawnerTest, ClosedChannel) {
    SpawnOptions options;
    options.workerPath = "/bin/sh";
    auto pid = ProcessSpawner::spawn(options, {-1, -1});
    ASSERT_FALSE(pid.has_value());
    EXPECT_EQ(pid.error().error, BoundaryError::ChannelSetupFailed);
}

TEST_F(ProcessSpawnerTest, KillInvalidPid) {
    auto status = ProcessSpawner::killProcess(-1);
    EXPECT_FALSE(status.exited);
    EXPECT_FALSE(status.signaled);
    EXPECT_FALSE(ProcessSpawner::isProcessRunning(-1));
}
