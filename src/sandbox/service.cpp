/*
 * service.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "service.hpp"
#include "analyzer.hpp"
#include "exception.hpp"
#include "request_validator.hpp"

#include "../logging/log_config.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <format>

#include "atom/error/exception.hpp"

namespace warden::sandbox {

namespace {

constexpr double kBytesPerMB = 1024.0 * 1024.0;

void advance(ExecutionResult& result, ExecutionState next) {
    spdlog::trace("Execution state {} -> {}", executionStateToString(result.state),
                  executionStateToString(next));
    result.state = next;
}

void fail(ExecutionResult& result, ExecutionState state, std::string_view errorType,
          std::string message) {
    result.success = false;
    result.errorType = std::string(errorType);
    result.errorMessage = std::move(message);
    advance(result, state);
}

std::string describeIssue(const SecurityIssue& issue) {
    return std::format("{} (line {}, column {})", issue.message, issue.line, issue.column);
}

}  // namespace

// ============================================================================
// SandboxService::Impl
// ============================================================================

class SandboxService::Impl {
public:
    Impl(config::SandboxConfig config, std::unique_ptr<isolated::IsolationBoundary> boundary)
        : config_(std::move(config)),
          registry_(Registry::create(config_.registry)),
          analyzer_(registry_, config_.analyzer, config_.limits.maxCodeLength),
          requestValidator_(config_.limits),
          boundary_(boundary ? std::move(boundary)
                             : isolated::createBoundary(config_.isolation, registry_)) {}

    ExecutionResult execute(const ExecutionRequest& request,
                            const isolated::CancellationToken& token) {
        auto start = std::chrono::steady_clock::now();
        auto audit = logging::LogConfig::audit();
        auto correlationId = request.correlationId.value_or("-");
        auto userId = request.userId.value_or("-");

        ExecutionResult result;
        advance(result, ExecutionState::Validating);

        runValidated(request, token, result, correlationId, userId);

        result.executionTimeSeconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        audit->info("execution correlation_id={} user_id={} state={} error_type={} "
                    "time={:.3f}s",
                    correlationId, userId, executionStateToString(result.state),
                    result.errorType.value_or("none"), result.executionTimeSeconds);
        return result;
    }

    void runValidated(const ExecutionRequest& request,
                      const isolated::CancellationToken& token, ExecutionResult& result,
                      const std::string& correlationId, const std::string& userId) {
        if (auto valid = requestValidator_.validate(request); !valid) {
            fail(result, ExecutionState::Rejected, error_type::kInvalidRequest,
                 std::string(requestErrorToString(valid.error())));
            return;
        }

        auto validation = analyzer_.analyze(request.code);
        if (validation.syntaxError) {
            const auto* issue = validation.firstBlockingIssue();
            fail(result, ExecutionState::Rejected, error_type::kSyntaxInvalid,
                 issue ? issue->message : "syntax error");
            return;
        }
        if (!validation.isSafe) {
            const auto* issue = validation.firstBlockingIssue();
            std::string summary = issue ? describeIssue(*issue) : "security violation";
            logging::LogConfig::audit()->warn(
                "security rejection correlation_id={} user_id={} calls=[{}] imports=[{}]: {}",
                correlationId, userId, joinSet(validation.dangerousCalls),
                joinSet(validation.forbiddenImports), summary);
            fail(result, ExecutionState::Rejected, error_type::kSecurityError,
                 std::move(summary));
            return;
        }
        if (validation.status == ValidationStatus::Warning) {
            spdlog::info("Running code with {} complexity warning(s)",
                         validation.issues.size());
        }
        advance(result, ExecutionState::Validated);

        isolated::IsolatedRun run;
        run.code = request.code;
        run.globals = request.globals;
        run.locals = request.locals;
        run.captureLocals = request.captureLocals;
        run.timeout = std::chrono::seconds{requestValidator_.effectiveTimeout(request)};
        run.memoryLimitMB =
            static_cast<size_t>(requestValidator_.effectiveMemoryMB(request));
        run.outputLimitBytes = config_.limits.outputLimitBytes;
        run.maxProcesses = config_.limits.maxProcesses;
        run.maxFileSizeBytes = config_.limits.maxFileSizeBytes;

        advance(result, ExecutionState::Running);
        auto outcome = boundary_->runIsolated(run, token);
        if (!outcome) {
            spdlog::error("Isolation boundary failed: {}: {}",
                          isolated::boundaryErrorToString(outcome.error().error),
                          outcome.error().detail);
            THROW_SANDBOX_FAULT(std::format(
                "{}: {}", isolated::boundaryErrorToString(outcome.error().error),
                outcome.error().detail));
        }

        applyOutcome(*outcome, run, result);
    }

    void applyOutcome(isolated::RawExecutionOutcome& outcome,
                      const isolated::IsolatedRun& run, ExecutionResult& result) {
        result.stdoutText = std::move(outcome.stdoutText);
        result.stderrText = std::move(outcome.stderrText);
        if (outcome.peakMemoryBytes > 0) {
            result.memoryUsedMB = static_cast<double>(outcome.peakMemoryBytes) / kBytesPerMB;
        }

        if (outcome.cancelled) {
            fail(result, ExecutionState::Cancelled, error_type::kCancelled,
                 "Execution was cancelled");
        } else if (outcome.timedOut) {
            fail(result, ExecutionState::TimedOut, error_type::kTimeoutError,
                 std::format("Execution exceeded the {}s timeout", run.timeout.count()));
        } else if (outcome.memoryExceeded) {
            fail(result, ExecutionState::MemoryExceeded, error_type::kMemoryLimitError,
                 std::format("Execution exceeded the {} MB memory limit",
                             run.memoryLimitMB));
        } else if (outcome.crashed) {
            fail(result, ExecutionState::Failed, error_type::kProcessCrashed,
                 outcome.signal != 0
                     ? std::format("Worker process crashed (signal {})", outcome.signal)
                     : std::string("Worker process exited unexpectedly"));
        } else if (outcome.exception) {
            fail(result, ExecutionState::Failed, outcome.exception->type,
                 outcome.exception->message);
        } else {
            result.success = true;
            if (run.captureLocals) {
                result.localsDict =
                    outcome.localsSnapshot.value_or(nlohmann::json::object());
            }
            advance(result, ExecutionState::Completed);
        }
    }

    static std::string joinSet(const std::set<std::string>& names) {
        std::string out;
        for (const auto& name : names) {
            if (!out.empty()) {
                out += ", ";
            }
            out += name;
        }
        return out;
    }

    config::SandboxConfig config_;
    std::shared_ptr<const Registry> registry_;
    StaticAnalyzer analyzer_;
    RequestValidator requestValidator_;
    std::unique_ptr<isolated::IsolationBoundary> boundary_;
};

// ============================================================================
// SandboxService
// ============================================================================

namespace {

config::SandboxConfig checked(config::SandboxConfig config) {
    if (auto valid = config.validate(); !valid) {
        THROW_INVALID_ARGUMENT(std::string("Invalid sandbox configuration: ") +
                               std::string(config::configErrorToString(valid.error())));
    }
    return config;
}

}  // namespace

SandboxService::SandboxService(config::SandboxConfig config)
    : pImpl_(std::make_unique<Impl>(checked(std::move(config)), nullptr)) {}

SandboxService::SandboxService(config::SandboxConfig config,
                               std::unique_ptr<isolated::IsolationBoundary> boundary)
    : pImpl_(std::make_unique<Impl>(checked(std::move(config)), std::move(boundary))) {}

SandboxService::~SandboxService() = default;

ExecutionResult SandboxService::execute(const ExecutionRequest& request,
                                        isolated::CancellationToken token) {
    return pImpl_->execute(request, token);
}

std::future<ExecutionResult> SandboxService::executeAsync(
    ExecutionRequest request, isolated::CancellationToken token) {
    return std::async(std::launch::async,
                      [this, request = std::move(request), token]() {
                          return pImpl_->execute(request, token);
                      });
}

ValidationResult SandboxService::validate(std::string_view code) const {
    return pImpl_->analyzer_.analyze(code);
}

ExecutionLimits SandboxService::getLimits() const {
    const auto& limits = pImpl_->config_.limits;
    ExecutionLimits out;
    out.timeoutMin = limits.timeoutMinSeconds;
    out.timeoutMax = limits.timeoutMaxSeconds;
    out.timeoutDefault = limits.timeoutDefaultSeconds;
    out.memoryMinMB = limits.memoryMinMB;
    out.memoryMaxMB = limits.memoryMaxMB;
    out.memoryDefaultMB = limits.memoryDefaultMB;
    out.outputLimitBytes = limits.outputLimitBytes;
    return out;
}

HealthStatus SandboxService::health() const {
    HealthStatus status;
    auto mode = pImpl_->boundary_->mode();
    status.executorAvailable = pImpl_->boundary_->isAvailable();
    status.isolation = std::string(isolated::isolationModeToString(mode));
    status.status = (mode == isolated::IsolationMode::Process && status.executorAvailable)
                        ? "healthy"
                        : "degraded";
    status.defaultTimeout = pImpl_->config_.limits.timeoutDefaultSeconds;
    status.defaultMemoryLimitMB = pImpl_->config_.limits.memoryDefaultMB;
    return status;
}

std::shared_ptr<const Registry> SandboxService::registry() const {
    return pImpl_->registry_;
}

isolated::IsolationMode SandboxService::isolationMode() const noexcept {
    return pImpl_->boundary_->mode();
}

}  // namespace warden::sandbox
