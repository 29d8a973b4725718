/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <limits>

namespace warden::sandbox {

namespace {

std::expected<std::optional<int>, RequestError> optionalInt(const json& j,
                                                            const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::optional<int>{};
    }
    if (!j[key].is_number_integer()) {
        return std::unexpected(RequestError::MalformedRequest);
    }
    auto wide = j[key].get<int64_t>();
    wide = std::clamp<int64_t>(wide, std::numeric_limits<int>::min(),
                               std::numeric_limits<int>::max());
    return std::optional<int>{static_cast<int>(wide)};
}

std::optional<std::string> optionalString(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

}  // namespace

// ============================================================================
// Validation types
// ============================================================================

json SecurityIssue::toJson() const {
    return {
        {"severity", severityToString(severity)},
        {"line", line},
        {"column", column},
        {"code", code},
        {"message", message},
        {"suggestion", suggestion}
    };
}

json ComplexityMetrics::toJson() const {
    return {
        {"lines_of_code", linesOfCode},
        {"cyclomatic_complexity", cyclomaticComplexity},
        {"nesting_depth", nestingDepth}
    };
}

const SecurityIssue* ValidationResult::firstBlockingIssue() const noexcept {
    for (const auto& issue : issues) {
        if (issue.severity == Severity::High || issue.severity == Severity::Critical) {
            return &issue;
        }
    }
    return issues.empty() ? nullptr : &issues.front();
}

json ValidationResult::toJson() const {
    json issueList = json::array();
    for (const auto& issue : issues) {
        issueList.push_back(issue.toJson());
    }
    return {
        {"status", validationStatusToString(status)},
        {"is_safe", isSafe},
        {"issues", issueList},
        {"imports", imports},
        {"dangerous_calls", dangerousCalls},
        {"forbidden_imports", forbiddenImports},
        {"syntax_error", syntaxError},
        {"complexity", complexity.toJson()}
    };
}

// ============================================================================
// Execution types
// ============================================================================

json ExecutionRequest::toJson() const {
    json j = {
        {"code", code},
        {"globals", globals},
        {"locals", locals},
        {"capture_locals", captureLocals}
    };
    if (timeoutSeconds) j["timeout_seconds"] = *timeoutSeconds;
    if (maxMemoryMB) j["max_memory_mb"] = *maxMemoryMB;
    if (correlationId) j["correlation_id"] = *correlationId;
    if (userId) j["user_id"] = *userId;
    return j;
}

std::expected<ExecutionRequest, RequestError> ExecutionRequest::fromJson(
    const json& j) {
    if (!j.is_object()) {
        return std::unexpected(RequestError::MalformedRequest);
    }

    ExecutionRequest req;

    if (!j.contains("code") || !j["code"].is_string()) {
        return std::unexpected(RequestError::MalformedRequest);
    }
    req.code = j["code"].get<std::string>();

    // "timeout" is accepted as an alias of timeout_seconds
    auto timeout = optionalInt(j, j.contains("timeout_seconds") ? "timeout_seconds"
                                                                : "timeout");
    if (!timeout) return std::unexpected(timeout.error());
    req.timeoutSeconds = *timeout;

    auto memory = optionalInt(j, "max_memory_mb");
    if (!memory) return std::unexpected(memory.error());
    req.maxMemoryMB = *memory;

    if (j.contains("globals") && !j["globals"].is_null()) {
        if (!j["globals"].is_object()) {
            return std::unexpected(RequestError::InvalidGlobals);
        }
        req.globals = j["globals"];
    }
    if (j.contains("locals") && !j["locals"].is_null()) {
        if (!j["locals"].is_object()) {
            return std::unexpected(RequestError::InvalidLocals);
        }
        req.locals = j["locals"];
    }

    if (j.contains("capture_locals")) {
        if (!j["capture_locals"].is_boolean()) {
            return std::unexpected(RequestError::MalformedRequest);
        }
        req.captureLocals = j["capture_locals"].get<bool>();
    }

    req.correlationId = optionalString(j, "correlation_id");
    req.userId = optionalString(j, "user_id");
    return req;
}

json ExecutionResult::toJson() const {
    json j = {
        {"success", success},
        {"stdout", stdoutText},
        {"stderr", stderrText},
        {"error_type", nullptr},
        {"error_message", nullptr},
        {"execution_time_seconds", executionTimeSeconds},
        {"memory_used_mb", nullptr},
        {"locals_dict", nullptr},
        {"state", executionStateToString(state)}
    };
    if (errorType) j["error_type"] = *errorType;
    if (errorMessage) j["error_message"] = *errorMessage;
    if (memoryUsedMB) j["memory_used_mb"] = *memoryUsedMB;
    if (localsDict) j["locals_dict"] = *localsDict;
    return j;
}

json ExecutionLimits::toJson() const {
    return {
        {"timeout", {{"min", timeoutMin}, {"max", timeoutMax}, {"default", timeoutDefault}}},
        {"memory_mb", {{"min", memoryMinMB}, {"max", memoryMaxMB}, {"default", memoryDefaultMB}}},
        {"output_limit_bytes", outputLimitBytes}
    };
}

json HealthStatus::toJson() const {
    return {
        {"status", status},
        {"executor_available", executorAvailable},
        {"isolation", isolation},
        {"default_timeout", defaultTimeout},
        {"default_memory_limit_mb", defaultMemoryLimitMB}
    };
}

}  // namespace warden::sandbox
