/*
 * main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "worker.hpp"

#include "../isolated/process_spawning.hpp"
#include "../isolated/types.hpp"
#include "../logging/log_config.hpp"

#include <csignal>
#include <cstdio>
#include <cstring>
#include <string_view>

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    using namespace warden;

    std::signal(SIGPIPE, SIG_IGN);

    logging::LoggerConfig logConfig;
    logConfig.console_stderr = true;
    logConfig.pattern = "[%H:%M:%S.%e] [%^%l%$] [%n %P] %v";

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            auto level = logging::parseLogLevel(argv[++i]);
            if (!level) {
                std::fprintf(stderr, "warden-worker: unknown log level '%s'\n", argv[i]);
                return isolated::WorkerExitCode::Usage;
            }
            logConfig.level = *level;
        } else {
            std::fprintf(stderr, "warden-worker: unexpected argument '%s'\n", argv[i]);
            return isolated::WorkerExitCode::Usage;
        }
    }

    try {
        logging::LogConfig::initialize(logConfig);
        spdlog::set_default_logger(logging::LogConfig::getLogger(logging::kWorkerLogger));
    } catch (const std::exception& e) {
        std::fprintf(stderr, "warden-worker: %s\n", e.what());
        return isolated::WorkerExitCode::Usage;
    }

    worker::Worker worker(isolated::kWorkerReadFd, isolated::kWorkerWriteFd);
    int code = worker.run();
    logging::LogConfig::flushAll();
    return code;
}
