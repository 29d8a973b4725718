/*
 * sandbox_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sandbox_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace warden::config {

namespace {

std::vector<std::string> stringList(const json& j, const char* key,
                                    std::vector<std::string> fallback) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<std::string>>();
    }
    return fallback;
}

}  // namespace

std::vector<std::string> defaultAllowedImports() {
    return {"qlib",       "numpy", "pandas", "scipy",    "talib",
            "math",       "statistics",      "random",   "datetime",
            "time",       "collections",     "itertools", "typing"};
}

std::vector<std::string> defaultForbiddenImports() {
    return {"os",      "sys",    "subprocess", "shutil",    "socket",
            "urllib",  "requests", "http",     "ftplib",    "importlib",
            "pickle",  "shelve", "marshal",    "ctypes",    "cffi"};
}

std::vector<std::string> defaultBlacklistCalls() {
    return {"eval",      "exec",   "compile",    "__import__", "open",
            "file",      "input",  "raw_input",  "execfile",   "reload",
            "breakpoint", "os.system", "os.popen", "subprocess.*",
            "importlib.*"};
}

std::vector<std::string> defaultForbiddenAttributes() {
    return {"__subclasses__", "__globals__",  "__builtins__", "__code__",
            "__class__",      "__bases__",    "__mro__",      "__dict__",
            "__getattribute__", "__closure__", "f_globals",   "f_back",
            "gi_frame",       "tb_frame"};
}

std::vector<std::string> defaultBuiltins() {
    return {
        // Constants and constructors
        "None", "True", "False", "bool", "int", "float", "complex", "str",
        "bytes", "bytearray", "list", "tuple", "dict", "set", "frozenset",
        "object", "type", "slice", "range",
        // Functions
        "abs", "all", "any", "ascii", "bin", "callable", "chr", "divmod",
        "enumerate", "filter", "format", "hash", "hex", "id", "isinstance",
        "issubclass", "iter", "len", "map", "max", "min", "next", "oct",
        "ord", "pow", "print", "repr", "reversed", "round", "sorted", "sum",
        "zip", "hasattr", "classmethod", "staticmethod", "property", "super",
        "__build_class__",
        // Exceptions
        "BaseException", "Exception", "ArithmeticError", "AssertionError",
        "AttributeError", "ImportError", "IndexError", "KeyError",
        "LookupError", "MemoryError", "NameError", "NotImplementedError",
        "OverflowError", "RecursionError", "RuntimeError", "StopIteration",
        "TimeoutError", "TypeError", "ValueError", "ZeroDivisionError",
        "FloatingPointError", "UnicodeError",
        "Warning", "UserWarning", "DeprecationWarning", "RuntimeWarning",
        "NotImplemented", "Ellipsis"};
}

std::vector<LibraryHandleConfig> defaultLibraryHandles() {
    return {{"np", "numpy"},
            {"pd", "pandas"},
            {"math", "math"},
            {"statistics", "statistics"},
            {"datetime", "datetime"}};
}

// ============================================================================
// RegistryConfig
// ============================================================================

json RegistryConfig::toJson() const {
    json handles = json::array();
    for (const auto& handle : libraryHandles) {
        handles.push_back(handle.toJson());
    }
    return {
        {"allowedImports", allowedImports},
        {"forbiddenImports", forbiddenImports},
        {"blacklistCalls", blacklistCalls},
        {"forbiddenAttributes", forbiddenAttributes},
        {"builtins", builtins},
        {"libraryHandles", handles}
    };
}

RegistryConfig RegistryConfig::fromJson(const json& j) {
    RegistryConfig cfg;
    cfg.allowedImports = stringList(j, "allowedImports", cfg.allowedImports);
    cfg.forbiddenImports = stringList(j, "forbiddenImports", cfg.forbiddenImports);
    cfg.blacklistCalls = stringList(j, "blacklistCalls", cfg.blacklistCalls);
    cfg.forbiddenAttributes =
        stringList(j, "forbiddenAttributes", cfg.forbiddenAttributes);
    cfg.builtins = stringList(j, "builtins", cfg.builtins);
    if (j.contains("libraryHandles") && j["libraryHandles"].is_array()) {
        cfg.libraryHandles.clear();
        for (const auto& item : j["libraryHandles"]) {
            cfg.libraryHandles.push_back(LibraryHandleConfig::fromJson(item));
        }
    }
    return cfg;
}

// ============================================================================
// SandboxConfig
// ============================================================================

SandboxConfig SandboxConfig::fromJson(const json& j) {
    SandboxConfig cfg;
    if (j.contains("registry")) cfg.registry = RegistryConfig::fromJson(j["registry"]);
    if (j.contains("limits")) cfg.limits = LimitsConfig::fromJson(j["limits"]);
    if (j.contains("analyzer")) cfg.analyzer = AnalyzerConfig::fromJson(j["analyzer"]);
    if (j.contains("isolation")) cfg.isolation = IsolationConfig::fromJson(j["isolation"]);
    if (j.contains("logging")) cfg.logging = LoggingConfig::fromJson(j["logging"]);
    return cfg;
}

ConfigResult<void> SandboxConfig::validate() const {
    auto fail = [](std::string_view what) -> ConfigResult<void> {
        spdlog::error("Invalid configuration: {}", what);
        return std::unexpected(ConfigError::InvalidValue);
    };

    if (limits.timeoutMinSeconds < 1 ||
        limits.timeoutMinSeconds > limits.timeoutMaxSeconds) {
        return fail("timeout bounds");
    }
    if (limits.timeoutDefaultSeconds < limits.timeoutMinSeconds ||
        limits.timeoutDefaultSeconds > limits.timeoutMaxSeconds) {
        return fail("default timeout outside bounds");
    }
    if (limits.memoryMinMB < 1 || limits.memoryMinMB > limits.memoryMaxMB) {
        return fail("memory bounds");
    }
    if (limits.memoryDefaultMB < limits.memoryMinMB ||
        limits.memoryDefaultMB > limits.memoryMaxMB) {
        return fail("default memory limit outside bounds");
    }
    if (limits.maxCodeLength == 0) {
        return fail("maxCodeLength must be positive");
    }
    if (limits.outputLimitBytes == 0) {
        return fail("outputLimitBytes must be positive");
    }
    if (analyzer.maxNestingDepth < 1 || analyzer.maxCyclomaticComplexity < 1) {
        return fail("analyzer thresholds must be positive");
    }
    if (isolation.mode != "process" && isolation.mode != "thread") {
        return fail("isolation.mode must be \"process\" or \"thread\"");
    }
    if (isolation.pollIntervalMs == 0) {
        return fail("pollIntervalMs must be positive");
    }
    for (const auto& handle : registry.libraryHandles) {
        if (handle.alias.empty() || handle.module.empty()) {
            return fail("library handle needs alias and module");
        }
    }
    return {};
}

ConfigResult<SandboxConfig> loadConfigFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::error("Configuration file not found: {}", path.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::ifstream file(path);
    if (!file) {
        spdlog::error("Failed to open configuration file: {}", path.string());
        return std::unexpected(ConfigError::ReadFailed);
    }

    json j;
    try {
        j = json::parse(file, nullptr, true, true);
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to parse {}: {}", path.string(), e.what());
        return std::unexpected(ConfigError::ParseError);
    }

    SandboxConfig cfg;
    try {
        cfg = SandboxConfig::fromJson(j);
    } catch (const json::exception& e) {
        spdlog::error("Invalid value in {}: {}", path.string(), e.what());
        return std::unexpected(ConfigError::InvalidValue);
    }

    applyEnvironmentOverrides(cfg);

    if (auto valid = cfg.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    spdlog::info("Loaded configuration from {}", path.string());
    return cfg;
}

void applyEnvironmentOverrides(SandboxConfig& config) {
    if (const char* worker = std::getenv("WARDEN_WORKER");
        worker != nullptr && *worker != '\0') {
        config.isolation.workerPath = worker;
    }
}

}  // namespace warden::config
