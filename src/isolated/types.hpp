/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Isolation boundary type definitions
 * @date 2024
 * @version 1.1.0
 */

#ifndef WARDEN_ISOLATED_TYPES_HPP
#define WARDEN_ISOLATED_TYPES_HPP

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace warden::isolated {

/**
 * @brief Where user code runs
 */
enum class IsolationMode {
    Process,  ///< Fresh warden-worker process per execution
    Thread    ///< Dedicated thread in the host interpreter (degraded)
};

[[nodiscard]] constexpr std::string_view isolationModeToString(
    IsolationMode mode) noexcept {
    switch (mode) {
        case IsolationMode::Process: return "process";
        case IsolationMode::Thread: return "thread";
    }
    return "process";
}

[[nodiscard]] inline std::optional<IsolationMode> isolationModeFromString(
    std::string_view str) noexcept {
    if (str == "process") return IsolationMode::Process;
    if (str == "thread") return IsolationMode::Thread;
    return std::nullopt;
}

/**
 * @brief Infrastructure failures of an isolation boundary
 *
 * Anything the user code did is reported through RawExecutionOutcome; these
 * are failures of the sandbox itself.
 */
enum class BoundaryError {
    Success = 0,
    WorkerNotFound,
    ChannelSetupFailed,
    SpawnFailed,
    HandshakeFailed,
    CommunicationError,
    LimitSetupFailed,
    WorkerFailed,
    InterpreterUnavailable,
    BoundaryPoisoned,
    UnknownError
};

[[nodiscard]] constexpr std::string_view boundaryErrorToString(
    BoundaryError error) noexcept {
    switch (error) {
        case BoundaryError::Success: return "Success";
        case BoundaryError::WorkerNotFound: return "Worker executable not found";
        case BoundaryError::ChannelSetupFailed: return "IPC channel setup failed";
        case BoundaryError::SpawnFailed: return "Process spawn failed";
        case BoundaryError::HandshakeFailed: return "Handshake failed";
        case BoundaryError::CommunicationError: return "Communication error";
        case BoundaryError::LimitSetupFailed: return "Resource limit setup failed";
        case BoundaryError::WorkerFailed: return "Worker failed before reporting a result";
        case BoundaryError::InterpreterUnavailable: return "Python interpreter unavailable";
        case BoundaryError::BoundaryPoisoned: return "Previous execution could not be stopped";
        case BoundaryError::UnknownError: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief warden-worker exit codes
 */
struct WorkerExitCode {
    static constexpr int Ok = 0;
    static constexpr int Usage = 2;
    static constexpr int LimitSetupFailed = 3;
    static constexpr int ProtocolError = 4;
    static constexpr int InterpreterFailed = 5;
    static constexpr int ExecFailed = 127;
};

/**
 * @brief Error plus detail text for boundary operations
 */
struct BoundaryFailure {
    BoundaryError error{BoundaryError::UnknownError};
    std::string detail;
};

template <typename T>
using Result = std::expected<T, BoundaryFailure>;

/**
 * @brief Shared cancellation flag
 *
 * Copies observe the same flag. A default-constructed token can never be
 * cancelled by anyone but its holders.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief A Python exception raised by user code
 */
struct ExceptionInfo {
    std::string type;       ///< Exception class name
    std::string message;    ///< str(exception)
    std::string traceback;  ///< Formatted traceback
};

/**
 * @brief One validated execution handed to a boundary
 */
struct IsolatedRun {
    std::string code;
    nlohmann::json globals = nlohmann::json::object();
    nlohmann::json locals = nlohmann::json::object();
    bool captureLocals{false};
    std::chrono::seconds timeout{30};
    size_t memoryLimitMB{512};
    size_t outputLimitBytes{1048576};
    uint64_t maxProcesses{0};
    uint64_t maxFileSizeBytes{0};
};

/**
 * @brief What happened inside the boundary
 *
 * At most one of timedOut, memoryExceeded, cancelled and crashed is set.
 * exception is set when user code raised.
 */
struct RawExecutionOutcome {
    std::string stdoutText;
    std::string stderrText;
    bool stdoutTruncated{false};
    bool stderrTruncated{false};
    std::optional<nlohmann::json> localsSnapshot;
    std::optional<ExceptionInfo> exception;
    bool timedOut{false};
    bool memoryExceeded{false};
    bool cancelled{false};
    bool crashed{false};
    int signal{0};               ///< Terminating signal, if any
    size_t peakMemoryBytes{0};   ///< 0 when unknown
};

/**
 * @brief Log callback type
 */
using LogCallback = std::function<void(std::string_view level,
                                       std::string_view message)>;

}  // namespace warden::isolated

#endif  // WARDEN_ISOLATED_TYPES_HPP
