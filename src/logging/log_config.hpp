/*
 * log_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: spdlog setup and named loggers for the sandbox

**************************************************/

#ifndef WARDEN_LOGGING_LOG_CONFIG_HPP
#define WARDEN_LOGGING_LOG_CONFIG_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "../config/sandbox_config.hpp"

namespace warden::logging {

inline constexpr std::string_view kDefaultLogger = "warden";
inline constexpr std::string_view kAuditLogger = "warden.audit";
inline constexpr std::string_view kWorkerLogger = "warden.worker";

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;

struct LoggerConfig {
    LogLevel level = LogLevel::INFO;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    bool console_output = true;
    bool console_stderr = false;  ///< Worker: stdout is not ours
    bool file_output = false;
    std::string log_file_path = "logs/warden.log";
    std::size_t max_file_size = 1048576 * 10;  // 10MB
    std::size_t max_files = 5;
    bool flush_on_error = true;

    [[nodiscard]] static LoggerConfig fromConfig(const config::LoggingConfig& cfg);
};

/**
 * @brief Process-wide spdlog configuration
 */
class LogConfig {
public:
    /**
     * @brief Create the default and audit loggers; later calls are no-ops
     * @throw std::runtime_error if a sink cannot be created
     */
    static void initialize(const LoggerConfig& config = LoggerConfig{});

    /**
     * @brief Get or create a logger sharing the configured sinks
     */
    static auto getLogger(std::string_view name) -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Logger for security rejections and execution audit records
     */
    static auto audit() -> std::shared_ptr<spdlog::logger>;

    static void setGlobalLevel(LogLevel level) noexcept;

    static void flushAll();

    [[nodiscard]] static bool isInitialized() noexcept {
        return initialized_.load(std::memory_order_acquire);
    }

private:
    static inline std::atomic<bool> initialized_{false};

    static auto convertLevel(LogLevel level) noexcept -> spdlog::level::level_enum;
};

}  // namespace warden::logging

#endif  // WARDEN_LOGGING_LOG_CONFIG_HPP
