/*
 * boundary.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file boundary.hpp
 * @brief Isolation boundary interface and factory
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_ISOLATED_BOUNDARY_HPP
#define WARDEN_ISOLATED_BOUNDARY_HPP

#include <memory>

#include "../config/sandbox_config.hpp"
#include "../sandbox/registry.hpp"
#include "types.hpp"

namespace warden::isolated {

/**
 * @brief Runs one validated execution outside the caller's control flow
 *
 * User-code outcomes (exceptions, timeouts, memory overruns, crashes) are
 * reported in RawExecutionOutcome. Failures of the boundary itself are
 * returned as BoundaryFailure.
 */
class IsolationBoundary {
public:
    virtual ~IsolationBoundary() = default;

    [[nodiscard]] virtual Result<RawExecutionOutcome> runIsolated(
        const IsolatedRun& run, const CancellationToken& token) = 0;

    [[nodiscard]] virtual IsolationMode mode() const noexcept = 0;

    /**
     * @brief The boundary can accept work
     */
    [[nodiscard]] virtual bool isAvailable() const = 0;

    void setLogCallback(LogCallback callback) { logCallback_ = std::move(callback); }

protected:
    LogCallback logCallback_;
};

/**
 * @brief Create the boundary selected by configuration
 *
 * Process mode falls back to thread mode, with a warning, when the worker
 * executable cannot be found.
 */
[[nodiscard]] std::unique_ptr<IsolationBoundary> createBoundary(
    const config::IsolationConfig& config,
    std::shared_ptr<const sandbox::Registry> registry);

}  // namespace warden::isolated

#endif  // WARDEN_ISOLATED_BOUNDARY_HPP
