/*
 * lifecycle.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_ISOLATED_LIFECYCLE_HPP
#define WARDEN_ISOLATED_LIFECYCLE_HPP

#include "../ipc/channel.hpp"
#include "process_spawning.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace warden::isolated {

/**
 * @brief Process lifecycle management
 *
 * Owns one worker process and its channel. Destruction kills the process
 * group, reaps the child and closes every pipe, so no exit path can leak
 * either.
 */
class ProcessLifecycle {
public:
    ProcessLifecycle();
    ~ProcessLifecycle();

    // Non-copyable
    ProcessLifecycle(const ProcessLifecycle&) = delete;
    ProcessLifecycle& operator=(const ProcessLifecycle&) = delete;

    // Movable
    ProcessLifecycle(ProcessLifecycle&&) noexcept;
    ProcessLifecycle& operator=(ProcessLifecycle&&) noexcept;

    /**
     * @brief Set the IPC channel for communication
     */
    void setChannel(std::shared_ptr<ipc::BidirectionalChannel> channel);

    /**
     * @brief Take ownership of a spawned process
     */
    void setProcessId(int processId);

    /**
     * @brief Check if an unreaped process is owned
     */
    [[nodiscard]] bool isRunning() const;

    /**
     * @brief Get current process ID (-1 if none)
     */
    [[nodiscard]] int getProcessId() const;

    /**
     * @brief Kill the process group and reap the child
     * @return How the process ended (empty status if nothing was running)
     */
    ExitStatus kill();

    /**
     * @brief Wait for the process to exit on its own
     * @return Exit status, or nullopt if still running after the timeout
     */
    std::optional<ExitStatus> waitForExit(std::chrono::milliseconds timeout);

    /**
     * @brief Exit status of the reaped process, if any
     */
    [[nodiscard]] std::optional<ExitStatus> exitStatus() const;

    /**
     * @brief Close the channel
     */
    void cleanup();

private:
    std::shared_ptr<ipc::BidirectionalChannel> channel_;
    std::atomic<bool> running_{false};
    int processId_{-1};
    std::optional<ExitStatus> exitStatus_;
};

}  // namespace warden::isolated

#endif  // WARDEN_ISOLATED_LIFECYCLE_HPP
