/*
 * worker_discovery.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_ISOLATED_WORKER_DISCOVERY_HPP
#define WARDEN_ISOLATED_WORKER_DISCOVERY_HPP

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace warden::isolated {

/**
 * @brief Locates the warden-worker executable
 */
class WorkerDiscovery {
public:
    static constexpr std::string_view kWorkerName = "warden-worker";
    static constexpr std::string_view kWorkerEnv = "WARDEN_WORKER";

    /**
     * @brief Find the worker executable
     *
     * A configured path is the only candidate when given. Otherwise the
     * search order is $WARDEN_WORKER, the directory of the running
     * executable, then the system libexec and bin directories.
     *
     * @param configured Configured path (may be empty)
     * @return Path to an executable file or nullopt
     */
    [[nodiscard]] static std::optional<std::filesystem::path> findWorker(
        const std::filesystem::path& configured = {});

    /**
     * @brief Candidate paths in search order
     */
    [[nodiscard]] static std::vector<std::filesystem::path> searchPaths(
        const std::filesystem::path& configured = {});

    /**
     * @brief Check that a path names an executable regular file
     */
    [[nodiscard]] static bool isExecutable(const std::filesystem::path& path);
};

}  // namespace warden::isolated

#endif  // WARDEN_ISOLATED_WORKER_DISCOVERY_HPP
