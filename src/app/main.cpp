/*
 * main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-1-4

Description: warden command line front end

**************************************************/

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

#include "config/sandbox_config.hpp"
#include "logging/log_config.hpp"
#include "sandbox/exception.hpp"
#include "sandbox/service.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitFault = 2;

std::optional<std::string> readSource(const std::optional<std::string>& file) {
    if (file && !file->empty()) {
        std::ifstream in(*file, std::ios::binary);
        if (!in) {
            spdlog::error("Cannot open {}", *file);
            return std::nullopt;
        }
        return std::string(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
}

void printJson(const nlohmann::json& j) { std::cout << j.dump(2) << std::endl; }

}  // namespace

int main(int argc, char* argv[]) {
    using namespace warden;
    using atom::utils::ArgumentParser;

    ArgumentParser program("warden"s);
    program.addArgument("mode", ArgumentParser::ArgType::STRING, false, "execute"s,
                        "execute | validate | limits | health", {"m"});
    program.addArgument("file", ArgumentParser::ArgType::STRING, false, ""s,
                        "Python source file (default: stdin)", {"f"});
    program.addArgument("request", ArgumentParser::ArgType::STRING, false, ""s,
                        "JSON execution request file", {"r"});
    program.addArgument("timeout", ArgumentParser::ArgType::INTEGER, false, 0,
                        "Timeout in seconds (0 = configured default)", {"t"});
    program.addArgument("memory", ArgumentParser::ArgType::INTEGER, false, 0,
                        "Memory limit in MB (0 = configured default)", {"M"});
    program.addArgument("capture-locals", ArgumentParser::ArgType::BOOLEAN, false, false,
                        "Return the variables defined by the code", {"L"});
    program.addArgument("config", ArgumentParser::ArgType::STRING, false, ""s,
                        "Path to the JSON config file", {"c"});
    program.addArgument("log-level", ArgumentParser::ArgType::STRING, false, ""s,
                        "Log level (trace/debug/info/warn/error)", {"l"});

    program.addDescription("warden: run untrusted Python snippets in a sandbox");
    program.addEpilog("Exit status: 0 success, 1 failed or rejected run, 2 fault.");

    std::optional<std::string> mode;
    std::optional<std::string> configPath;
    std::optional<std::string> logLevel;
    try {
        std::vector<std::string> args(argv, argv + argc);
        program.parse(argc, args);
        mode = program.get<std::string>("mode");
        configPath = program.get<std::string>("config");
        logLevel = program.get<std::string>("log-level");
    } catch (const std::exception& e) {
        std::cerr << "warden: " << e.what() << std::endl;
        return kExitFault;
    }

    config::SandboxConfig sandboxConfig;
    if (configPath && !configPath->empty()) {
        auto loaded = config::loadConfigFile(*configPath);
        if (!loaded) {
            std::cerr << "warden: cannot load " << *configPath << ": "
                      << config::configErrorToString(loaded.error()) << std::endl;
            return kExitFault;
        }
        sandboxConfig = std::move(*loaded);
    } else {
        config::applyEnvironmentOverrides(sandboxConfig);
    }

    // stdout carries the JSON result
    auto logConfig = logging::LoggerConfig::fromConfig(sandboxConfig.logging);
    logConfig.console_stderr = true;
    if (logLevel && !logLevel->empty()) {
        auto level = logging::parseLogLevel(*logLevel);
        if (!level) {
            std::cerr << "warden: unknown log level '" << *logLevel << "'" << std::endl;
            return kExitFault;
        }
        logConfig.level = *level;
    }

    try {
        logging::LogConfig::initialize(logConfig);

        sandbox::SandboxService service(sandboxConfig);
        auto selected = mode.value_or("execute");

        if (selected == "limits") {
            printJson(service.getLimits().toJson());
            return kExitOk;
        }
        if (selected == "health") {
            printJson(service.health().toJson());
            return kExitOk;
        }

        if (selected == "validate") {
            auto source = readSource(program.get<std::string>("file"));
            if (!source) {
                return kExitFault;
            }
            auto validation = service.validate(*source);
            printJson(validation.toJson());
            return validation.isSafe ? kExitOk : kExitFailed;
        }

        if (selected != "execute") {
            std::cerr << "warden: unknown mode '" << selected << "'" << std::endl;
            return kExitFault;
        }

        sandbox::ExecutionRequest request;
        auto requestFile = program.get<std::string>("request");
        if (requestFile && !requestFile->empty()) {
            std::ifstream in(*requestFile);
            auto parsed = nlohmann::json::parse(in, nullptr, false);
            auto fromJson = sandbox::ExecutionRequest::fromJson(parsed);
            if (!fromJson) {
                sandbox::ExecutionResult rejected;
                rejected.errorType = std::string(sandbox::error_type::kInvalidRequest);
                rejected.errorMessage =
                    std::string(sandbox::requestErrorToString(fromJson.error()));
                rejected.state = sandbox::ExecutionState::Rejected;
                printJson(rejected.toJson());
                return kExitFailed;
            }
            request = std::move(*fromJson);
        } else {
            auto source = readSource(program.get<std::string>("file"));
            if (!source) {
                return kExitFault;
            }
            request.code = std::move(*source);
        }

        if (auto timeout = program.get<int>("timeout"); timeout && *timeout != 0) {
            request.timeoutSeconds = *timeout;
        }
        if (auto memory = program.get<int>("memory"); memory && *memory != 0) {
            request.maxMemoryMB = *memory;
        }
        if (auto capture = program.get<bool>("capture-locals"); capture && *capture) {
            request.captureLocals = true;
        }

        auto result = service.execute(request);
        printJson(result.toJson());
        return result.success ? kExitOk : kExitFailed;
    } catch (const SandboxFault& e) {
        spdlog::critical("Sandbox fault: {}", e.what());
        std::cerr << "warden: sandbox fault: " << e.what() << std::endl;
        return kExitFault;
    } catch (const std::exception& e) {
        std::cerr << "warden: " << e.what() << std::endl;
        return kExitFault;
    }
}
