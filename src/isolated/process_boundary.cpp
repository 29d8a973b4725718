/*
 * process_boundary.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "process_boundary.hpp"
#include "lifecycle.hpp"
#include "resource_limiter.hpp"
#include "resource_monitor.hpp"
#include "worker_discovery.hpp"

#include "../ipc/message.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <format>

#include <signal.h>

namespace warden::isolated {

namespace {

constexpr double kNearLimitRatio = 0.9;

BoundaryError errorForWorkerKind(std::string_view kind) {
    if (kind == "LimitSetupFailed") return BoundaryError::LimitSetupFailed;
    if (kind == "InterpreterFailed") return BoundaryError::InterpreterUnavailable;
    if (kind == "ProtocolError") return BoundaryError::CommunicationError;
    return BoundaryError::WorkerFailed;
}

std::string describeExit(const ExitStatus& status) {
    if (status.signaled) {
        return std::format("killed by signal {} ({})", status.signal,
                           ::strsignal(status.signal));
    }
    if (status.exited) {
        return std::format("exited with code {}", status.exitCode);
    }
    return "exit status unknown";
}

}  // namespace

void classifyExit(const ExitStatus& status, size_t peakBytes, size_t limitMB,
                  RawExecutionOutcome& outcome) {
    if (!status.signaled) {
        outcome.crashed = true;
        return;
    }

    outcome.signal = status.signal;
    auto limitBytes = limitMB * 1024 * 1024;
    bool nearLimit = limitBytes > 0 &&
                     static_cast<double>(peakBytes) >= kNearLimitRatio * limitBytes;

    switch (status.signal) {
        case SIGXCPU:
            outcome.timedOut = true;
            break;
        case SIGKILL:
            // Nobody in the sandbox sent it: the kernel OOM killer did
            outcome.memoryExceeded = true;
            break;
        case SIGSEGV:
        case SIGBUS:
        case SIGABRT:
            if (nearLimit) {
                outcome.memoryExceeded = true;
            } else {
                outcome.crashed = true;
            }
            break;
        default:
            outcome.crashed = true;
            break;
    }
}

// ============================================================================
// ProcessBoundary::Impl
// ============================================================================

class ProcessBoundary::Impl {
public:
    Impl(config::IsolationConfig config,
         std::shared_ptr<const sandbox::Registry> registry)
        : config_(std::move(config)), registry_(std::move(registry)) {}

    Result<RawExecutionOutcome> run(const IsolatedRun& run,
                                    const CancellationToken& token,
                                    const LogCallback& logCallback) {
        auto worker = WorkerDiscovery::findWorker(config_.workerPath);
        if (!worker) {
            return std::unexpected(BoundaryFailure{
                BoundaryError::WorkerNotFound,
                std::format("{} not found", WorkerDiscovery::kWorkerName)});
        }

        auto channel = std::make_shared<ipc::BidirectionalChannel>();
        if (auto created = channel->create(); !created) {
            return std::unexpected(BoundaryFailure{
                BoundaryError::ChannelSetupFailed,
                std::string(ipc::ipcErrorToString(created.error()))});
        }

        SpawnOptions options;
        options.workerPath = *worker;
        options.workingDirectory = config_.workingDirectory.empty()
                                       ? std::filesystem::temp_directory_path()
                                       : std::filesystem::path(config_.workingDirectory);
        auto level = spdlog::level::to_string_view(spdlog::get_level());
        options.arguments = {"--log-level", std::string(level.data(), level.size())};
        options.environment = ProcessSpawner::defaultEnvironment();

        auto pid = ProcessSpawner::spawn(options, channel->getSubprocessFds());
        if (!pid) {
            return std::unexpected(pid.error());
        }

        ProcessLifecycle lifecycle;
        lifecycle.setChannel(channel);
        lifecycle.setProcessId(*pid);
        channel->setupParent();

        auto handshake =
            channel->performHandshake(std::chrono::milliseconds{config_.handshakeTimeoutMs});
        if (!handshake) {
            auto status = lifecycle.kill();
            return std::unexpected(BoundaryFailure{
                BoundaryError::HandshakeFailed,
                std::format("{}; worker {}", ipc::ipcErrorToString(handshake.error()),
                            describeExit(status))});
        }
        spdlog::debug("Worker {} ready (Python {})", *pid, handshake->pythonVersion);

        ipc::ExecuteRequest request;
        request.code = run.code;
        request.globals = run.globals;
        request.locals = run.locals;
        request.captureLocals = run.captureLocals;
        request.memoryLimitMB = run.memoryLimitMB;
        request.cpuLimitSeconds = ResourceLimiter::cpuSecondsForTimeout(run.timeout.count());
        request.outputLimitBytes = run.outputLimitBytes;
        request.maxProcesses = run.maxProcesses;
        request.maxFileSizeBytes = run.maxFileSizeBytes;
        request.policy = registry_->toJson();

        if (auto sent = channel->send(ipc::MessageType::Execute, request.toJson()); !sent) {
            auto status = lifecycle.kill();
            return std::unexpected(BoundaryFailure{
                BoundaryError::CommunicationError,
                std::format("Failed to send execute request: {}; worker {}",
                            ipc::ipcErrorToString(sent.error()), describeExit(status))});
        }

        MessageHandler handler(run.outputLimitBytes);
        int workerPid = *pid;
        handler.setLogCallback([&logCallback, workerPid](std::string_view level,
                                                         std::string_view message) {
            if (logCallback) {
                logCallback(level, message);
                return;
            }
            spdlog::log(spdlog::level::from_str(std::string(level)), "[worker {}] {}",
                        workerPid, message);
        });

        RawExecutionOutcome outcome;
        size_t peakBytes = 0;
        bool monitorExceeded = false;
        bool complete = false;
        std::optional<ipc::IPCError> channelError;

        auto deadline = std::chrono::steady_clock::now() + run.timeout;
        auto pollInterval = std::chrono::milliseconds{config_.pollIntervalMs};

        while (true) {
            if (token.isCancelled()) {
                outcome.cancelled = true;
                break;
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                outcome.timedOut = true;
                break;
            }

            if (config_.monitorMemory) {
                if (auto rss = ResourceMonitor::getMemoryUsage(workerPid)) {
                    peakBytes = std::max(peakBytes, *rss);
                    if (*rss > run.memoryLimitMB * 1024 * 1024) {
                        monitorExceeded = true;
                        break;
                    }
                }
            }

            auto slice = std::min(
                pollInterval,
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
                    std::chrono::milliseconds{1});
            auto message = channel->receive(slice);
            if (!message) {
                if (message.error() == ipc::IPCError::Timeout) {
                    continue;
                }
                channelError = message.error();
                break;
            }

            if (handler.processMessage(*message).executionComplete) {
                complete = true;
                break;
            }
        }

        ExitStatus status;
        if (outcome.timedOut || outcome.cancelled || monitorExceeded) {
            status = lifecycle.kill();
            spdlog::info("Worker {} terminated: {}", workerPid,
                         outcome.cancelled ? "cancelled"
                         : outcome.timedOut ? "wall-clock timeout"
                                            : "memory ceiling");
            outcome.memoryExceeded = monitorExceeded;
        } else {
            auto exited = lifecycle.waitForExit(
                std::chrono::milliseconds{config_.terminationGraceMs});
            if (exited) {
                status = *exited;
            } else {
                spdlog::warn("Worker {} did not exit after reporting, killing it",
                             workerPid);
                status = lifecycle.kill();
            }
        }

        auto& report = handler.report();

        if (report.error) {
            return std::unexpected(BoundaryFailure{errorForWorkerKind(report.error->kind),
                                                   report.error->message});
        }

        if (channelError && *channelError != ipc::IPCError::ChannelClosed) {
            return std::unexpected(BoundaryFailure{
                BoundaryError::CommunicationError,
                std::format("{}; worker {}", ipc::ipcErrorToString(*channelError),
                            describeExit(status))});
        }

        if (complete && report.result) {
            const auto& result = *report.result;
            if (!result.success) {
                outcome.exception = ExceptionInfo{result.exceptionType,
                                                  result.exceptionMessage,
                                                  result.traceback};
                outcome.memoryExceeded = result.memoryError;
            }
            if (result.success && run.captureLocals) {
                outcome.localsSnapshot = result.locals;
            }
            peakBytes = std::max(peakBytes, result.peakMemoryBytes);
        } else if (!outcome.timedOut && !outcome.cancelled && !monitorExceeded) {
            if (status.exited) {
                switch (status.exitCode) {
                    case WorkerExitCode::LimitSetupFailed:
                        return std::unexpected(BoundaryFailure{
                            BoundaryError::LimitSetupFailed, describeExit(status)});
                    case WorkerExitCode::InterpreterFailed:
                        return std::unexpected(BoundaryFailure{
                            BoundaryError::InterpreterUnavailable, describeExit(status)});
                    case WorkerExitCode::ProtocolError:
                    case WorkerExitCode::Usage:
                        return std::unexpected(BoundaryFailure{
                            BoundaryError::CommunicationError, describeExit(status)});
                    case WorkerExitCode::ExecFailed:
                        return std::unexpected(BoundaryFailure{
                            BoundaryError::SpawnFailed, describeExit(status)});
                    default:
                        break;
                }
            }
            classifyExit(status, peakBytes, run.memoryLimitMB, outcome);
            spdlog::warn("Worker {} ended without a result: {}", workerPid,
                         describeExit(status));
        }

        outcome.stdoutTruncated = report.stdoutBuffer.truncated();
        outcome.stderrTruncated = report.stderrBuffer.truncated();
        outcome.stdoutText = report.stdoutBuffer.take();
        outcome.stderrText = report.stderrBuffer.take();
        outcome.peakMemoryBytes = peakBytes;
        if (status.signaled && outcome.signal == 0 && !outcome.timedOut &&
            !outcome.cancelled) {
            outcome.signal = status.signal;
        }
        return outcome;
    }

    config::IsolationConfig config_;
    std::shared_ptr<const sandbox::Registry> registry_;
};

// ============================================================================
// ProcessBoundary
// ============================================================================

ProcessBoundary::ProcessBoundary(config::IsolationConfig config,
                                 std::shared_ptr<const sandbox::Registry> registry)
    : pImpl_(std::make_unique<Impl>(std::move(config), std::move(registry))) {}

ProcessBoundary::~ProcessBoundary() = default;

Result<RawExecutionOutcome> ProcessBoundary::runIsolated(
    const IsolatedRun& run, const CancellationToken& token) {
    return pImpl_->run(run, token, logCallback_);
}

bool ProcessBoundary::isAvailable() const { return workerPath().has_value(); }

std::optional<std::filesystem::path> ProcessBoundary::workerPath() const {
    return WorkerDiscovery::findWorker(pImpl_->config_.workerPath);
}

}  // namespace warden::isolated
