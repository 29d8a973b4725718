/*
 * worker_discovery.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "worker_discovery.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

#include <unistd.h>

namespace warden::isolated {

std::vector<std::filesystem::path> WorkerDiscovery::searchPaths(
    const std::filesystem::path& configured) {
    if (!configured.empty()) {
        return {configured};
    }

    std::vector<std::filesystem::path> paths;

    if (const char* env = std::getenv(std::string(kWorkerEnv).c_str());
        env != nullptr && *env != '\0') {
        paths.emplace_back(env);
    }

    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        paths.push_back(self.parent_path() / kWorkerName);
    }

    paths.push_back(std::filesystem::path("/usr/local/libexec/warden") / kWorkerName);
    paths.push_back(std::filesystem::path("/usr/libexec/warden") / kWorkerName);
    paths.push_back(std::filesystem::path("/usr/local/bin") / kWorkerName);
    paths.push_back(std::filesystem::path("/usr/bin") / kWorkerName);

    return paths;
}

std::optional<std::filesystem::path> WorkerDiscovery::findWorker(
    const std::filesystem::path& configured) {
    for (const auto& path : searchPaths(configured)) {
        if (isExecutable(path)) {
            spdlog::debug("Using worker executable {}", path.string());
            return path;
        }
    }

    if (!configured.empty()) {
        spdlog::error("Configured worker {} is not an executable file",
                      configured.string());
    } else {
        spdlog::warn("{} not found in any search location", kWorkerName);
    }
    return std::nullopt;
}

bool WorkerDiscovery::isExecutable(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) &&
           ::access(path.c_str(), X_OK) == 0;
}

}  // namespace warden::isolated
