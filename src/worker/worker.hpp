/*
 * worker.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file worker.hpp
 * @brief Child side of process isolation
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_WORKER_WORKER_HPP
#define WARDEN_WORKER_WORKER_HPP

#include <chrono>

#include "../ipc/channel.hpp"
#include "../ipc/message.hpp"

namespace warden::worker {

/**
 * @brief Serves exactly one Execute request, then exits
 *
 * Order of work: handshake, receive Execute, apply rlimits, start the
 * interpreter, run, report. Output is streamed to the host as it is
 * written so that it survives a kill.
 */
class Worker {
public:
    Worker(int readFd, int writeFd);

    /**
     * @return Process exit code (see isolated::WorkerExitCode)
     */
    int run();

    static constexpr std::chrono::milliseconds kHandshakeTimeout{10000};
    static constexpr std::chrono::milliseconds kRequestTimeout{60000};

private:
    int execute(const ipc::ExecuteRequest& request);
    void reportError(std::string_view kind, std::string message);
    void forwardLog(std::string_view level, std::string message);

    ipc::BidirectionalChannel channel_;
};

}  // namespace warden::worker

#endif  // WARDEN_WORKER_WORKER_HPP
