/*
 * lifecycle.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "lifecycle.hpp"

#include <spdlog/spdlog.h>

#include <signal.h>

namespace warden::isolated {

ProcessLifecycle::ProcessLifecycle() = default;

ProcessLifecycle::~ProcessLifecycle() {
    kill();
    cleanup();
}

ProcessLifecycle::ProcessLifecycle(ProcessLifecycle&& other) noexcept
    : channel_(std::move(other.channel_)),
      running_(other.running_.load()),
      processId_(other.processId_),
      exitStatus_(other.exitStatus_) {
    other.processId_ = -1;
    other.running_ = false;
}

ProcessLifecycle& ProcessLifecycle::operator=(ProcessLifecycle&& other) noexcept {
    if (this != &other) {
        kill();
        cleanup();
        channel_ = std::move(other.channel_);
        running_ = other.running_.load();
        processId_ = other.processId_;
        exitStatus_ = other.exitStatus_;
        other.processId_ = -1;
        other.running_ = false;
    }
    return *this;
}

void ProcessLifecycle::setChannel(std::shared_ptr<ipc::BidirectionalChannel> channel) {
    channel_ = std::move(channel);
}

void ProcessLifecycle::setProcessId(int processId) {
    processId_ = processId;
    exitStatus_.reset();
    running_ = processId > 0;
}

bool ProcessLifecycle::isRunning() const {
    return running_;
}

int ProcessLifecycle::getProcessId() const {
    return processId_;
}

ExitStatus ProcessLifecycle::kill() {
    if (!running_) {
        return exitStatus_.value_or(ExitStatus{});
    }

    running_ = false;
    auto status = ProcessSpawner::killProcess(processId_);
    exitStatus_ = status;

    spdlog::debug("Killed worker process {}", processId_);
    return status;
}

std::optional<ExitStatus> ProcessLifecycle::waitForExit(
    std::chrono::milliseconds timeout) {
    if (!running_) {
        return exitStatus_;
    }

    auto status = ProcessSpawner::waitForProcess(processId_, timeout);
    if (status) {
        running_ = false;
        exitStatus_ = status;
        // Stray members of the worker's group do not outlive it
        ::kill(-processId_, SIGKILL);
    }
    return status;
}

std::optional<ExitStatus> ProcessLifecycle::exitStatus() const {
    return exitStatus_;
}

void ProcessLifecycle::cleanup() {
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
}

}  // namespace warden::isolated
