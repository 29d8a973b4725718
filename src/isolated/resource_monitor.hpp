/*
 * resource_monitor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_ISOLATED_RESOURCE_MONITOR_HPP
#define WARDEN_ISOLATED_RESOURCE_MONITOR_HPP

#include <cstddef>
#include <optional>

namespace warden::isolated {

/**
 * @brief Resource monitoring utilities for the worker process
 */
class ResourceMonitor {
public:
    /**
     * @brief Get current resident memory of a process
     * @param processId Process ID to query
     * @return Resident set size in bytes or nullopt if unavailable
     */
    [[nodiscard]] static std::optional<size_t> getMemoryUsage(int processId);

    /**
     * @brief Check if process exceeds memory limit
     * @param processId Process ID to check
     * @param limitMB Memory limit in megabytes
     * @return True if limit exceeded
     */
    [[nodiscard]] static bool isMemoryLimitExceeded(int processId, size_t limitMB);

    /**
     * @brief Get peak resident memory of a process
     * @param processId Process ID to query
     * @return High-water mark in bytes or nullopt if unavailable
     */
    [[nodiscard]] static std::optional<size_t> getPeakMemoryUsage(int processId);
};

}  // namespace warden::isolated

#endif  // WARDEN_ISOLATED_RESOURCE_MONITOR_HPP
