/*
 * resource_limiter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "resource_limiter.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <sys/resource.h>

namespace warden::isolated {

namespace {

bool setLimit(int resource, rlim_t soft, rlim_t hard, std::string_view name) {
    struct rlimit limit;
    limit.rlim_cur = soft;
    limit.rlim_max = hard;
    if (setrlimit(resource, &limit) != 0) {
        spdlog::error("setrlimit({}) failed: {}", name, std::strerror(errno));
        return false;
    }
    return true;
}

}  // namespace

std::expected<void, LimitError> ResourceLimiter::apply(
    const ResourceLimits& limits) {
    if (limits.memoryMB == 0 || limits.cpuSeconds <= 0) {
        return std::unexpected(LimitError::InvalidValue);
    }

    auto memoryBytes = static_cast<rlim_t>(limits.memoryMB) * 1024 * 1024;
    if (!setLimit(RLIMIT_AS, memoryBytes, memoryBytes, "RLIMIT_AS")) {
        return std::unexpected(LimitError::AddressSpace);
    }

    auto cpuSoft = static_cast<rlim_t>(limits.cpuSeconds);
    if (!setLimit(RLIMIT_CPU, cpuSoft, cpuSoft + 1, "RLIMIT_CPU")) {
        return std::unexpected(LimitError::CpuTime);
    }

    if (!setLimit(RLIMIT_CORE, 0, 0, "RLIMIT_CORE")) {
        return std::unexpected(LimitError::CoreDump);
    }

    // RLIMIT_NPROC counts threads of the whole user, so it is opt-in
    if (limits.maxProcesses > 0) {
        auto count = static_cast<rlim_t>(limits.maxProcesses);
        if (!setLimit(RLIMIT_NPROC, count, count, "RLIMIT_NPROC")) {
            return std::unexpected(LimitError::ProcessCount);
        }
    }

    if (limits.maxFileSizeBytes > 0) {
        auto size = static_cast<rlim_t>(limits.maxFileSizeBytes);
        if (!setLimit(RLIMIT_FSIZE, size, size, "RLIMIT_FSIZE")) {
            return std::unexpected(LimitError::FileSize);
        }
    }

    spdlog::debug("Resource limits applied: {} MB address space, {} s CPU",
                  limits.memoryMB, limits.cpuSeconds);
    return {};
}

}  // namespace warden::isolated
