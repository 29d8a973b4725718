/*
 * resource_limiter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_ISOLATED_RESOURCE_LIMITER_HPP
#define WARDEN_ISOLATED_RESOURCE_LIMITER_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>

namespace warden::isolated {

/**
 * @brief Which limit could not be installed
 */
enum class LimitError {
    AddressSpace,
    CpuTime,
    CoreDump,
    ProcessCount,
    FileSize,
    InvalidValue
};

[[nodiscard]] constexpr std::string_view limitErrorToString(
    LimitError error) noexcept {
    switch (error) {
        case LimitError::AddressSpace: return "RLIMIT_AS";
        case LimitError::CpuTime: return "RLIMIT_CPU";
        case LimitError::CoreDump: return "RLIMIT_CORE";
        case LimitError::ProcessCount: return "RLIMIT_NPROC";
        case LimitError::FileSize: return "RLIMIT_FSIZE";
        case LimitError::InvalidValue: return "invalid limit value";
    }
    return "unknown limit";
}

/**
 * @brief Ceilings applied to the current process
 */
struct ResourceLimits {
    size_t memoryMB{512};        ///< Address space
    int64_t cpuSeconds{31};      ///< Soft CPU limit; hard is one second later
    uint64_t maxProcesses{0};    ///< 0 = leave unchanged
    uint64_t maxFileSizeBytes{0};  ///< 0 = leave unchanged
};

/**
 * @brief Installs OS resource ceilings on the calling process
 *
 * Fail-closed: the first limit that cannot be set aborts apply() and the
 * caller must not run user code.
 */
class ResourceLimiter {
public:
    [[nodiscard]] static std::expected<void, LimitError> apply(
        const ResourceLimits& limits);

    /**
     * @brief CPU ceiling for a wall-clock timeout
     *
     * One second of slack so the wall-clock deadline normally fires first.
     */
    [[nodiscard]] static constexpr int64_t cpuSecondsForTimeout(
        int64_t timeoutSeconds) noexcept {
        return timeoutSeconds + 1;
    }
};

}  // namespace warden::isolated

#endif  // WARDEN_ISOLATED_RESOURCE_LIMITER_HPP
