/*
 * log_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: spdlog setup implementation

**************************************************/

#include "log_config.hpp"

#include <cstdio>
#include <filesystem>
#include <format>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace warden::logging {

namespace {
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> logger_registry_;
std::vector<spdlog::sink_ptr> shared_sinks_;
LoggerConfig active_config_;
std::shared_mutex registry_mutex_;
}  // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error" || name == "err") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    if (name == "off") return LogLevel::OFF;
    return std::nullopt;
}

LoggerConfig LoggerConfig::fromConfig(const config::LoggingConfig& cfg) {
    LoggerConfig out;
    out.level = parseLogLevel(cfg.level).value_or(LogLevel::INFO);
    out.pattern = cfg.pattern;
    out.console_output = cfg.consoleOutput;
    out.file_output = cfg.fileOutput;
    out.log_file_path = cfg.logFilePath;
    out.max_file_size = cfg.maxFileSize;
    out.max_files = cfg.maxFiles;
    return out;
}

void LogConfig::initialize(const LoggerConfig& config) {
    if (initialized_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    try {
        std::unique_lock lock(registry_mutex_);
        active_config_ = config;
        shared_sinks_.clear();

        if (config.console_output) {
            spdlog::sink_ptr console_sink;
            if (config.console_stderr) {
                console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            } else {
                console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            }
            console_sink->set_pattern(config.pattern);
            shared_sinks_.push_back(console_sink);
        }

        if (config.file_output) {
            auto parent = std::filesystem::path(config.log_file_path).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file_path, config.max_file_size, config.max_files);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] [%n] %v");
            shared_sinks_.push_back(file_sink);
        }
        lock.unlock();

        setGlobalLevel(config.level);

        auto default_logger = getLogger(kDefaultLogger);
        spdlog::set_default_logger(default_logger);
        getLogger(kAuditLogger);

        spdlog::set_error_handler([](const std::string& msg) {
            std::fprintf(stderr, "spdlog error: %s\n", msg.c_str());
        });

        default_logger->debug("Logging initialized");
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        initialized_.store(false, std::memory_order_release);
        throw;
    }
}

auto LogConfig::getLogger(std::string_view name) -> std::shared_ptr<spdlog::logger> {
    std::string nameStr{name};

    {
        std::shared_lock lock(registry_mutex_);
        if (auto it = logger_registry_.find(nameStr); it != logger_registry_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(registry_mutex_);
    if (auto it = logger_registry_.find(nameStr); it != logger_registry_.end()) {
        return it->second;
    }

    // A logger registered elsewhere (e.g. by a test) is adopted as is
    if (auto existing = spdlog::get(nameStr)) {
        logger_registry_.emplace(nameStr, existing);
        return existing;
    }

    try {
        auto logger = std::make_shared<spdlog::logger>(nameStr, shared_sinks_.begin(),
                                                       shared_sinks_.end());
        logger->set_level(convertLevel(active_config_.level));
        if (active_config_.flush_on_error) {
            logger->flush_on(spdlog::level::err);
        }
        spdlog::register_logger(logger);
        logger_registry_.emplace(nameStr, logger);
        return logger;
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::format("Failed to create logger '{}': {}", name, e.what()));
    }
}

auto LogConfig::audit() -> std::shared_ptr<spdlog::logger> {
    return getLogger(kAuditLogger);
}

void LogConfig::setGlobalLevel(LogLevel level) noexcept {
    auto spdLevel = convertLevel(level);
    spdlog::set_level(spdLevel);
    std::unique_lock lock(registry_mutex_);
    active_config_.level = level;
    for (const auto& [name, logger] : logger_registry_) {
        logger->set_level(spdLevel);
    }
}

void LogConfig::flushAll() {
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> l) { l->flush(); });
}

auto LogConfig::convertLevel(LogLevel level) noexcept -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace warden::logging
