/*
 * resource_monitor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "resource_monitor.hpp"

#include <cstdio>
#include <fstream>
#include <string>

#include <unistd.h>

namespace warden::isolated {

std::optional<size_t> ResourceMonitor::getMemoryUsage(int processId) {
    if (processId <= 0) return std::nullopt;

    // statm: size resident shared text lib data dt (pages)
    std::ifstream statm("/proc/" + std::to_string(processId) + "/statm");
    if (statm) {
        size_t size = 0;
        size_t resident = 0;
        if (statm >> size >> resident) {
            return resident * static_cast<size_t>(sysconf(_SC_PAGESIZE));
        }
    }
    return std::nullopt;
}

bool ResourceMonitor::isMemoryLimitExceeded(int processId, size_t limitMB) {
    if (limitMB == 0) return false;  // No limit

    auto memUsage = getMemoryUsage(processId);
    if (memUsage) {
        return *memUsage > limitMB * 1024 * 1024;
    }
    return false;
}

std::optional<size_t> ResourceMonitor::getPeakMemoryUsage(int processId) {
    if (processId <= 0) return std::nullopt;

    std::ifstream status("/proc/" + std::to_string(processId) + "/status");
    if (status) {
        std::string line;
        while (std::getline(status, line)) {
            if (line.compare(0, 6, "VmHWM:") == 0) {
                size_t value;
                if (std::sscanf(line.c_str(), "VmHWM: %zu kB", &value) == 1) {
                    return value * 1024;  // Convert kB to bytes
                }
            }
        }
    }
    return std::nullopt;
}

}  // namespace warden::isolated
