/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Public request, result and report types of the sandbox service
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_SANDBOX_TYPES_HPP
#define WARDEN_SANDBOX_TYPES_HPP

#include <nlohmann/json.hpp>

#include <expected>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace warden::sandbox {

using json = nlohmann::json;

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Overall verdict of static analysis
 */
enum class ValidationStatus { Safe, Warning, Dangerous };

[[nodiscard]] constexpr std::string_view validationStatusToString(
    ValidationStatus status) noexcept {
    switch (status) {
        case ValidationStatus::Safe: return "SAFE";
        case ValidationStatus::Warning: return "WARNING";
        case ValidationStatus::Dangerous: return "DANGEROUS";
    }
    return "DANGEROUS";
}

enum class Severity { Low, Medium, High, Critical };

[[nodiscard]] constexpr std::string_view severityToString(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low: return "LOW";
        case Severity::Medium: return "MEDIUM";
        case Severity::High: return "HIGH";
        case Severity::Critical: return "CRITICAL";
    }
    return "CRITICAL";
}

/**
 * @brief Machine-readable issue kinds
 */
namespace issue_code {
inline constexpr std::string_view kSyntaxError = "syntax-error";
inline constexpr std::string_view kForbiddenImport = "forbidden-import";
inline constexpr std::string_view kRelativeImport = "relative-import";
inline constexpr std::string_view kForbiddenCall = "forbidden-call";
inline constexpr std::string_view kForbiddenAttribute = "forbidden-attribute";
inline constexpr std::string_view kNestingDepth = "nesting-depth";
inline constexpr std::string_view kCyclomaticComplexity = "cyclomatic-complexity";
inline constexpr std::string_view kCodeLength = "code-length";
}  // namespace issue_code

struct SecurityIssue {
    Severity severity{Severity::Low};
    int line{0};
    int column{0};
    std::string code;
    std::string message;
    std::string suggestion;

    [[nodiscard]] json toJson() const;
};

struct ComplexityMetrics {
    int linesOfCode{0};
    int cyclomaticComplexity{1};
    int nestingDepth{0};

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Static analysis report
 *
 * isSafe == (status != Dangerous). Non-empty dangerousCalls or
 * forbiddenImports always means Dangerous.
 */
struct ValidationResult {
    ValidationStatus status{ValidationStatus::Safe};
    bool isSafe{true};
    std::vector<SecurityIssue> issues;  ///< Ordered by (line, column)
    std::set<std::string> imports;
    std::set<std::string> dangerousCalls;
    std::set<std::string> forbiddenImports;
    bool syntaxError{false};
    ComplexityMetrics complexity;

    /**
     * @brief First issue that made the result Dangerous
     */
    [[nodiscard]] const SecurityIssue* firstBlockingIssue() const noexcept;

    [[nodiscard]] json toJson() const;
};

// ============================================================================
// Execution
// ============================================================================

/**
 * @brief Request schema violations
 */
enum class RequestError {
    MalformedRequest,
    EmptyCode,
    WhitespaceOnlyCode,
    CodeTooLong,
    TimeoutOutOfRange,
    MemoryOutOfRange,
    InvalidGlobals,
    InvalidLocals
};

[[nodiscard]] constexpr std::string_view requestErrorToString(
    RequestError error) noexcept {
    switch (error) {
        case RequestError::MalformedRequest: return "Malformed request";
        case RequestError::EmptyCode: return "Code must not be empty";
        case RequestError::WhitespaceOnlyCode: return "Code cannot be empty or whitespace only";
        case RequestError::CodeTooLong: return "Code exceeds the maximum length";
        case RequestError::TimeoutOutOfRange: return "timeout_seconds out of range";
        case RequestError::MemoryOutOfRange: return "max_memory_mb out of range";
        case RequestError::InvalidGlobals: return "globals must be an object";
        case RequestError::InvalidLocals: return "locals must be an object";
    }
    return "Invalid request";
}

/**
 * @brief One execution request
 *
 * Unset timeout and memory fields take the configured defaults.
 */
struct ExecutionRequest {
    std::string code;
    std::optional<int> timeoutSeconds;
    std::optional<int> maxMemoryMB;
    json globals = json::object();
    json locals = json::object();
    bool captureLocals{false};
    std::optional<std::string> correlationId;  ///< Audit only
    std::optional<std::string> userId;         ///< Audit only

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static std::expected<ExecutionRequest, RequestError> fromJson(
        const json& j);
};

/**
 * @brief Orchestrator states
 */
enum class ExecutionState {
    Received,
    Validating,
    Rejected,
    Validated,
    Running,
    Completed,
    Failed,
    TimedOut,
    MemoryExceeded,
    Cancelled
};

[[nodiscard]] constexpr std::string_view executionStateToString(
    ExecutionState state) noexcept {
    switch (state) {
        case ExecutionState::Received: return "RECEIVED";
        case ExecutionState::Validating: return "VALIDATING";
        case ExecutionState::Rejected: return "REJECTED";
        case ExecutionState::Validated: return "VALIDATED";
        case ExecutionState::Running: return "RUNNING";
        case ExecutionState::Completed: return "COMPLETED";
        case ExecutionState::Failed: return "FAILED";
        case ExecutionState::TimedOut: return "TIMED_OUT";
        case ExecutionState::MemoryExceeded: return "MEMORY_EXCEEDED";
        case ExecutionState::Cancelled: return "CANCELLED";
    }
    return "FAILED";
}

[[nodiscard]] constexpr bool isTerminalState(ExecutionState state) noexcept {
    switch (state) {
        case ExecutionState::Rejected:
        case ExecutionState::Completed:
        case ExecutionState::Failed:
        case ExecutionState::TimedOut:
        case ExecutionState::MemoryExceeded:
        case ExecutionState::Cancelled:
            return true;
        default:
            return false;
    }
}

/**
 * @brief error_type values produced by the sandbox itself
 */
namespace error_type {
inline constexpr std::string_view kInvalidRequest = "InvalidRequest";
inline constexpr std::string_view kSyntaxInvalid = "SyntaxInvalid";
inline constexpr std::string_view kSecurityError = "SecurityError";
inline constexpr std::string_view kTimeoutError = "TimeoutError";
inline constexpr std::string_view kMemoryLimitError = "MemoryLimitError";
inline constexpr std::string_view kCancelled = "Cancelled";
inline constexpr std::string_view kProcessCrashed = "ProcessCrashed";
}  // namespace error_type

/**
 * @brief Outcome of execute()
 *
 * Exactly one of success or errorType is set.
 */
struct ExecutionResult {
    bool success{false};
    std::string stdoutText;
    std::string stderrText;
    std::optional<std::string> errorType;
    std::optional<std::string> errorMessage;
    double executionTimeSeconds{0.0};
    std::optional<double> memoryUsedMB;
    std::optional<json> localsDict;
    ExecutionState state{ExecutionState::Received};

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Accepted request bounds
 */
struct ExecutionLimits {
    int timeoutMin{1};
    int timeoutMax{300};
    int timeoutDefault{30};
    int memoryMinMB{64};
    int memoryMaxMB{2048};
    int memoryDefaultMB{512};
    size_t outputLimitBytes{1048576};

    [[nodiscard]] json toJson() const;
};

struct HealthStatus {
    std::string status{"healthy"};  ///< "healthy" or "degraded"
    bool executorAvailable{true};
    std::string isolation{"process"};
    int defaultTimeout{30};
    int defaultMemoryLimitMB{512};

    [[nodiscard]] json toJson() const;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_TYPES_HPP
