/*
 * test_lifecycle.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_lifecycle.cpp
 * @brief Tests for worker process lifecycle management
 */

#include <gtest/gtest.h>
#include "isolated/lifecycle.hpp"

#include <csignal>

using namespace warden::isolated;
using namespace std::chrono_literals;

class ProcessLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel_ = std::make_shared<warden::ipc::BidirectionalChannel>();
        ASSERT_TRUE(channel_->create().has_value());
    }

    int spawnShell(const std::string& script) {
        SpawnOptions options;
        options.workerPath = "/bin/sh";
        options.arguments = {"-c", script};
        auto pid = ProcessSpawner::spawn(options, channel_->getSubprocessFds());
        return pid.value_or(-1);
    }

    std::shared_ptr<warden::ipc::BidirectionalChannel> channel_;
};

TEST_F(ProcessLifecycleTest, DefaultState) {
    ProcessLifecycle lifecycle;
    EXPECT_FALSE(lifecycle.isRunning());
    EXPECT_EQ(lifecycle.getProcessId(), -1);
    EXPECT_FALSE(lifecycle.exitStatus().has_value());
}

TEST_F(ProcessLifecycleTest, WaitForNormalExit) {
    ProcessLifecycle lifecycle;
    int pid = spawnShell("exit 3");
    ASSERT_GT(pid, 0);
    lifecycle.setProcessId(pid);
    EXPECT_TRUE(lifecycle.isRunning());

    auto status = lifecycle.waitForExit(5000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exitCode, 3);
    EXPECT_FALSE(lifecycle.isRunning());
    ASSERT_TRUE(lifecycle.exitStatus().has_value());
    EXPECT_EQ(lifecycle.exitStatus()->exitCode, 3);
}

TEST_F(ProcessLifecycleTest, KillRunningProcess) {
    ProcessLifecycle lifecycle;
    int pid = spawnShell("sleep 30");
    ASSERT_GT(pid, 0);
    lifecycle.setProcessId(pid);

    EXPECT_FALSE(lifecycle.waitForExit(50ms).has_value());
    EXPECT_TRUE(lifecycle.isRunning());

    auto status = lifecycle.kill();
    EXPECT_TRUE(status.signaled);
    EXPECT_EQ(status.signal, SIGKILL);
    EXPECT_FALSE(lifecycle.isRunning());
}

TEST_F(ProcessLifecycleTest, KillAfterExitReturnsRecordedStatus) {
    ProcessLifecycle lifecycle;
    int pid = spawnShell("exit 0");
    ASSERT_GT(pid, 0);
    lifecycle.setProcessId(pid);
    ASSERT_TRUE(lifecycle.waitForExit(5000ms).has_value());

    auto status = lifecycle.kill();
    EXPECT_TRUE(status.isCleanExit());
}

TEST_F(ProcessLifecycleTest, DestructorKillsProcess) {
    int pid = spawnShell("sleep 30");
    ASSERT_GT(pid, 0);
    {
        ProcessLifecycle lifecycle;
        lifecycle.setProcessId(pid);
    }
    EXPECT_FALSE(ProcessSpawner::isProcessRunning(pid));
}

TEST_F(ProcessLifecycleTest, CleanupClosesChannel) {
    ProcessLifecycle lifecycle;
    lifecycle.setChannel(channel_);
    EXPECT_TRUE(channel_->isOpen());

    lifecycle.cleanup();
    EXPECT_FALSE(channel_->isOpen());
}

TEST_F(ProcessLifecycleTest, MoveTransfersOwnership) {
    int pid = spawnShell("sleep 30");
    ASSERT_GT(pid, 0);

    ProcessLifecycle first;
    first.setProcessId(pid);
    ProcessLifecycle second(std::move(first));

    EXPECT_FALSE(first.isRunning());
    EXPECT_TRUE(second.isRunning());
    EXPECT_EQ(second.getProcessId(), pid);
    second.kill();
}
