/*
 * service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file service.hpp
 * @brief Public entry point of the sandbox
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_SANDBOX_SERVICE_HPP
#define WARDEN_SANDBOX_SERVICE_HPP

#include <future>
#include <memory>
#include <string_view>

#include "../config/sandbox_config.hpp"
#include "../isolated/boundary.hpp"
#include "registry.hpp"
#include "types.hpp"

namespace warden::sandbox {

/**
 * @brief Validates, isolates and runs user code
 *
 * Every request moves through RECEIVED, VALIDATING and then either
 * REJECTED or VALIDATED, RUNNING and one terminal state. Outcomes caused by
 * the code are reported in ExecutionResult; a failure of the sandbox
 * itself is thrown as SandboxFault.
 *
 * All public methods are safe to call from multiple threads.
 */
class SandboxService {
public:
    /**
     * @throw atom::error::InvalidArgument if the configuration is inconsistent
     */
    explicit SandboxService(config::SandboxConfig config = {});

    /**
     * @brief Use a caller-supplied boundary instead of the configured one
     */
    SandboxService(config::SandboxConfig config,
                   std::unique_ptr<isolated::IsolationBoundary> boundary);

    ~SandboxService();

    SandboxService(const SandboxService&) = delete;
    SandboxService& operator=(const SandboxService&) = delete;

    /**
     * @brief Run one request to completion
     * @throw SandboxFault on spawn, handshake, IPC or limit-setup failure
     */
    [[nodiscard]] ExecutionResult execute(const ExecutionRequest& request,
                                          isolated::CancellationToken token = {});

    /**
     * @brief execute() on a separate thread
     *
     * A SandboxFault is delivered through the future.
     */
    [[nodiscard]] std::future<ExecutionResult> executeAsync(
        ExecutionRequest request, isolated::CancellationToken token = {});

    /**
     * @brief Static analysis only; never runs the code
     */
    [[nodiscard]] ValidationResult validate(std::string_view code) const;

    [[nodiscard]] ExecutionLimits getLimits() const;

    [[nodiscard]] HealthStatus health() const;

    [[nodiscard]] std::shared_ptr<const Registry> registry() const;

    [[nodiscard]] isolated::IsolationMode isolationMode() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_SERVICE_HPP
