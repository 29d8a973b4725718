/*
 * process_spawning.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_ISOLATED_PROCESS_SPAWNING_HPP
#define WARDEN_ISOLATED_PROCESS_SPAWNING_HPP

#include "types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warden::isolated {

/**
 * @brief Descriptor numbers the worker finds its channel on
 */
inline constexpr int kWorkerReadFd = 3;
inline constexpr int kWorkerWriteFd = 4;

/**
 * @brief How a child process ended
 */
struct ExitStatus {
    bool exited{false};    ///< Normal exit
    int exitCode{-1};      ///< Valid when exited
    bool signaled{false};  ///< Killed by a signal
    int signal{0};         ///< Valid when signaled

    [[nodiscard]] bool isCleanExit() const noexcept {
        return exited && exitCode == 0;
    }
};

/**
 * @brief Worker launch parameters
 */
struct SpawnOptions {
    std::filesystem::path workerPath;
    std::filesystem::path workingDirectory;  ///< Empty = inherit
    std::vector<std::string> arguments;      ///< Extra argv after the path
    std::vector<std::pair<std::string, std::string>> environment;  ///< Overrides
};

/**
 * @brief fork/exec helpers for the worker process
 */
class ProcessSpawner {
public:
    /**
     * @brief Spawn the worker in its own process group
     *
     * The channel ends in subprocessFds are installed as descriptors 3
     * (read) and 4 (write); every other descriptor above 2 is closed, and
     * stdin/stdout point at /dev/null. stderr is inherited.
     *
     * @return Process ID on success, or error
     */
    [[nodiscard]] static Result<int> spawn(const SpawnOptions& options,
                                           std::pair<int, int> subprocessFds);

    /**
     * @brief Wait for the process to exit
     * @param processId Process ID to wait for
     * @param timeout Maximum time to wait
     * @return Exit status, or nullopt if still running after the timeout
     */
    [[nodiscard]] static std::optional<ExitStatus> waitForProcess(
        int processId, std::chrono::milliseconds timeout);

    /**
     * @brief SIGKILL the process group and reap the process
     */
    static ExitStatus killProcess(int processId);

    /**
     * @brief Check if process is still running
     */
    [[nodiscard]] static bool isProcessRunning(int processId);

    /**
     * @brief Environment entries forced on every worker
     */
    [[nodiscard]] static std::vector<std::pair<std::string, std::string>>
    defaultEnvironment();
};

}  // namespace warden::isolated

#endif  // WARDEN_ISOLATED_PROCESS_SPAWNING_HPP
