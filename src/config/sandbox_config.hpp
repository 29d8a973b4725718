/*
 * sandbox_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Sandbox configuration sections (registry tables, limits,
analyzer thresholds, isolation, logging)

**************************************************/

#ifndef WARDEN_CONFIG_SANDBOX_CONFIG_HPP
#define WARDEN_CONFIG_SANDBOX_CONFIG_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace warden::config {

using json = nlohmann::json;

/**
 * @brief Configuration loading errors
 */
enum class ConfigError {
    FileNotFound,
    ReadFailed,
    ParseError,
    InvalidValue
};

[[nodiscard]] constexpr std::string_view configErrorToString(
    ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "Configuration file not found";
        case ConfigError::ReadFailed: return "Failed to read configuration file";
        case ConfigError::ParseError: return "Configuration is not valid JSON";
        case ConfigError::InvalidValue: return "Invalid configuration value";
    }
    return "Unknown configuration error";
}

template <typename T>
using ConfigResult = std::expected<T, ConfigError>;

/**
 * @brief A module pre-imported into every execution namespace
 */
struct LibraryHandleConfig {
    std::string alias;   ///< Name visible to user code (e.g. "np")
    std::string module;  ///< Module to import (e.g. "numpy")

    [[nodiscard]] json toJson() const {
        return {{"alias", alias}, {"module", module}};
    }

    [[nodiscard]] static LibraryHandleConfig fromJson(const json& j) {
        LibraryHandleConfig cfg;
        cfg.alias = j.value("alias", "");
        cfg.module = j.value("module", cfg.alias);
        return cfg;
    }
};

[[nodiscard]] std::vector<std::string> defaultAllowedImports();
[[nodiscard]] std::vector<std::string> defaultForbiddenImports();
[[nodiscard]] std::vector<std::string> defaultBlacklistCalls();
[[nodiscard]] std::vector<std::string> defaultForbiddenAttributes();
[[nodiscard]] std::vector<std::string> defaultBuiltins();
[[nodiscard]] std::vector<LibraryHandleConfig> defaultLibraryHandles();

/**
 * @brief Whitelist / blacklist tables
 *
 * The same structure is shipped to the worker as the policy snapshot, so
 * both sides of the process boundary enforce identical tables.
 */
struct RegistryConfig {
    std::vector<std::string> allowedImports = defaultAllowedImports();
    std::vector<std::string> forbiddenImports = defaultForbiddenImports();
    std::vector<std::string> blacklistCalls = defaultBlacklistCalls();
    std::vector<std::string> forbiddenAttributes = defaultForbiddenAttributes();
    std::vector<std::string> builtins = defaultBuiltins();
    std::vector<LibraryHandleConfig> libraryHandles = defaultLibraryHandles();

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static RegistryConfig fromJson(const json& j);
};

/**
 * @brief Request bounds and output capture limits
 */
struct LimitsConfig {
    int timeoutMinSeconds{1};
    int timeoutMaxSeconds{300};
    int timeoutDefaultSeconds{30};
    int memoryMinMB{64};
    int memoryMaxMB{2048};
    int memoryDefaultMB{512};
    size_t maxCodeLength{50000};         ///< Characters
    size_t outputLimitBytes{1048576};    ///< Per stream
    uint64_t maxProcesses{0};            ///< RLIMIT_NPROC, 0 = leave unset
    uint64_t maxFileSizeBytes{0};        ///< RLIMIT_FSIZE, 0 = leave unset

    [[nodiscard]] json toJson() const {
        return {
            {"timeoutMinSeconds", timeoutMinSeconds},
            {"timeoutMaxSeconds", timeoutMaxSeconds},
            {"timeoutDefaultSeconds", timeoutDefaultSeconds},
            {"memoryMinMB", memoryMinMB},
            {"memoryMaxMB", memoryMaxMB},
            {"memoryDefaultMB", memoryDefaultMB},
            {"maxCodeLength", maxCodeLength},
            {"outputLimitBytes", outputLimitBytes},
            {"maxProcesses", maxProcesses},
            {"maxFileSizeBytes", maxFileSizeBytes}
        };
    }

    [[nodiscard]] static LimitsConfig fromJson(const json& j) {
        LimitsConfig cfg;
        cfg.timeoutMinSeconds = j.value("timeoutMinSeconds", cfg.timeoutMinSeconds);
        cfg.timeoutMaxSeconds = j.value("timeoutMaxSeconds", cfg.timeoutMaxSeconds);
        cfg.timeoutDefaultSeconds = j.value("timeoutDefaultSeconds", cfg.timeoutDefaultSeconds);
        cfg.memoryMinMB = j.value("memoryMinMB", cfg.memoryMinMB);
        cfg.memoryMaxMB = j.value("memoryMaxMB", cfg.memoryMaxMB);
        cfg.memoryDefaultMB = j.value("memoryDefaultMB", cfg.memoryDefaultMB);
        cfg.maxCodeLength = j.value("maxCodeLength", cfg.maxCodeLength);
        cfg.outputLimitBytes = j.value("outputLimitBytes", cfg.outputLimitBytes);
        cfg.maxProcesses = j.value("maxProcesses", cfg.maxProcesses);
        cfg.maxFileSizeBytes = j.value("maxFileSizeBytes", cfg.maxFileSizeBytes);
        return cfg;
    }
};

/**
 * @brief Static analyzer thresholds
 */
struct AnalyzerConfig {
    int maxNestingDepth{6};
    int maxCyclomaticComplexity{50};

    [[nodiscard]] json toJson() const {
        return {
            {"maxNestingDepth", maxNestingDepth},
            {"maxCyclomaticComplexity", maxCyclomaticComplexity}
        };
    }

    [[nodiscard]] static AnalyzerConfig fromJson(const json& j) {
        AnalyzerConfig cfg;
        cfg.maxNestingDepth = j.value("maxNestingDepth", cfg.maxNestingDepth);
        cfg.maxCyclomaticComplexity =
            j.value("maxCyclomaticComplexity", cfg.maxCyclomaticComplexity);
        return cfg;
    }
};

/**
 * @brief Isolation boundary configuration
 */
struct IsolationConfig {
    std::string mode{"process"};       ///< "process" or "thread"
    std::string workerPath;            ///< warden-worker path (empty = discover)
    std::string workingDirectory;      ///< Worker cwd (empty = temp directory)
    size_t handshakeTimeoutMs{10000};
    size_t terminationGraceMs{2000};   ///< Wait for a clean exit before SIGKILL
    size_t pollIntervalMs{100};
    bool monitorMemory{true};          ///< Sample child RSS while waiting

    [[nodiscard]] json toJson() const {
        return {
            {"mode", mode},
            {"workerPath", workerPath},
            {"workingDirectory", workingDirectory},
            {"handshakeTimeoutMs", handshakeTimeoutMs},
            {"terminationGraceMs", terminationGraceMs},
            {"pollIntervalMs", pollIntervalMs},
            {"monitorMemory", monitorMemory}
        };
    }

    [[nodiscard]] static IsolationConfig fromJson(const json& j) {
        IsolationConfig cfg;
        cfg.mode = j.value("mode", cfg.mode);
        cfg.workerPath = j.value("workerPath", cfg.workerPath);
        cfg.workingDirectory = j.value("workingDirectory", cfg.workingDirectory);
        cfg.handshakeTimeoutMs = j.value("handshakeTimeoutMs", cfg.handshakeTimeoutMs);
        cfg.terminationGraceMs = j.value("terminationGraceMs", cfg.terminationGraceMs);
        cfg.pollIntervalMs = j.value("pollIntervalMs", cfg.pollIntervalMs);
        cfg.monitorMemory = j.value("monitorMemory", cfg.monitorMemory);
        return cfg;
    }
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level{"info"};
    std::string pattern{"[%H:%M:%S.%e] [%^%l%$] [%n] %v"};
    bool consoleOutput{true};
    bool fileOutput{false};
    std::string logFilePath{"logs/warden.log"};
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{5};

    [[nodiscard]] json toJson() const {
        return {
            {"level", level},
            {"pattern", pattern},
            {"consoleOutput", consoleOutput},
            {"fileOutput", fileOutput},
            {"logFilePath", logFilePath},
            {"maxFileSize", maxFileSize},
            {"maxFiles", maxFiles}
        };
    }

    [[nodiscard]] static LoggingConfig fromJson(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.consoleOutput = j.value("consoleOutput", cfg.consoleOutput);
        cfg.fileOutput = j.value("fileOutput", cfg.fileOutput);
        cfg.logFilePath = j.value("logFilePath", cfg.logFilePath);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        return cfg;
    }
};

/**
 * @brief Top-level sandbox configuration, read once at startup
 */
struct SandboxConfig {
    RegistryConfig registry;
    LimitsConfig limits;
    AnalyzerConfig analyzer;
    IsolationConfig isolation;
    LoggingConfig logging;

    [[nodiscard]] json toJson() const {
        return {
            {"registry", registry.toJson()},
            {"limits", limits.toJson()},
            {"analyzer", analyzer.toJson()},
            {"isolation", isolation.toJson()},
            {"logging", logging.toJson()}
        };
    }

    [[nodiscard]] static SandboxConfig fromJson(const json& j);

    /**
     * @brief Check bounds and enumerations for consistency
     * @return Empty on success, InvalidValue otherwise (details are logged)
     */
    [[nodiscard]] ConfigResult<void> validate() const;
};

/**
 * @brief Load and validate a JSON configuration file
 *
 * Missing sections and keys keep their defaults. Environment overrides are
 * applied after parsing.
 */
[[nodiscard]] ConfigResult<SandboxConfig> loadConfigFile(
    const std::filesystem::path& path);

/**
 * @brief Apply environment overrides (WARDEN_WORKER)
 */
void applyEnvironmentOverrides(SandboxConfig& config);

}  // namespace warden::config

#endif  // WARDEN_CONFIG_SANDBOX_CONFIG_HPP
