/*
 * thread_boundary.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file thread_boundary.hpp
 * @brief In-process fallback boundary
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_ISOLATED_THREAD_BOUNDARY_HPP
#define WARDEN_ISOLATED_THREAD_BOUNDARY_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

#include "boundary.hpp"

namespace warden::isolated {

/**
 * @brief Runs code on a dedicated thread of the host's embedded interpreter
 *
 * Degraded mode: no memory or CPU ceiling and no crash isolation. Runs are
 * serialised. Timeout and cancellation raise TimeoutError asynchronously in
 * the running thread, repeatedly, until it returns or the stop grace period
 * ends. A thread that still does not stop is detached and the boundary
 * refuses further work.
 */
class ThreadBoundary : public IsolationBoundary {
public:
    explicit ThreadBoundary(std::shared_ptr<const sandbox::Registry> registry,
                            std::chrono::milliseconds stopGrace = std::chrono::milliseconds{2000},
                            std::chrono::milliseconds pollInterval = std::chrono::milliseconds{100});

    [[nodiscard]] Result<RawExecutionOutcome> runIsolated(
        const IsolatedRun& run, const CancellationToken& token) override;

    [[nodiscard]] IsolationMode mode() const noexcept override {
        return IsolationMode::Thread;
    }

    [[nodiscard]] bool isAvailable() const override;

    [[nodiscard]] bool isPoisoned() const noexcept { return poisoned_; }

private:
    std::shared_ptr<const sandbox::Registry> registry_;
    std::chrono::milliseconds stopGrace_;
    std::chrono::milliseconds pollInterval_;
    std::mutex runMutex_;
    std::atomic<bool> poisoned_{false};
};

}  // namespace warden::isolated

#endif  // WARDEN_ISOLATED_THREAD_BOUNDARY_HPP
