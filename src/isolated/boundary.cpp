/*
 * boundary.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "boundary.hpp"
#include "process_boundary.hpp"
#include "thread_boundary.hpp"
#include "worker_discovery.hpp"

#include <spdlog/spdlog.h>

namespace warden::isolated {

std::unique_ptr<IsolationBoundary> createBoundary(
    const config::IsolationConfig& config,
    std::shared_ptr<const sandbox::Registry> registry) {
    auto mode = isolationModeFromString(config.mode).value_or(IsolationMode::Process);
    auto grace = std::chrono::milliseconds{config.terminationGraceMs};
    auto poll = std::chrono::milliseconds{config.pollIntervalMs};

    if (mode == IsolationMode::Thread) {
        spdlog::warn("Thread isolation selected: no memory ceiling or crash isolation");
        return std::make_unique<ThreadBoundary>(std::move(registry), grace, poll);
    }

    auto worker = WorkerDiscovery::findWorker(config.workerPath);
    if (!worker) {
        spdlog::warn("{} not found, falling back to thread isolation",
                     WorkerDiscovery::kWorkerName);
        return std::make_unique<ThreadBoundary>(std::move(registry), grace, poll);
    }

    spdlog::info("Process isolation using worker {}", worker->string());
    return std::make_unique<ProcessBoundary>(config, std::move(registry));
}

}  // namespace warden::isolated
