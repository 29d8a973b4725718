/*
 * process_boundary.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file process_boundary.hpp
 * @brief One warden-worker process per execution
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_ISOLATED_PROCESS_BOUNDARY_HPP
#define WARDEN_ISOLATED_PROCESS_BOUNDARY_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>

#include "boundary.hpp"
#include "message_handlers.hpp"
#include "process_spawning.hpp"

namespace warden::isolated {

/**
 * @brief Classify how a worker ended when it reported no result
 *
 * @param status Exit status after reaping
 * @param peakBytes Largest observed RSS of the child (0 if unknown)
 * @param limitMB Memory ceiling of the run
 */
void classifyExit(const ExitStatus& status, size_t peakBytes, size_t limitMB,
                  RawExecutionOutcome& outcome);

/**
 * @brief Fresh-process isolation
 *
 * Each run gets its own pipes and its own worker in a new process group.
 * The parent enforces the wall-clock deadline, cancellation and a second
 * memory check on sampled RSS; the worker enforces rlimits on itself.
 */
class ProcessBoundary : public IsolationBoundary {
public:
    ProcessBoundary(config::IsolationConfig config,
                    std::shared_ptr<const sandbox::Registry> registry);
    ~ProcessBoundary() override;

    [[nodiscard]] Result<RawExecutionOutcome> runIsolated(
        const IsolatedRun& run, const CancellationToken& token) override;

    [[nodiscard]] IsolationMode mode() const noexcept override {
        return IsolationMode::Process;
    }

    [[nodiscard]] bool isAvailable() const override;

    [[nodiscard]] std::optional<std::filesystem::path> workerPath() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace warden::isolated

#endif  // WARDEN_ISOLATED_PROCESS_BOUNDARY_HPP
