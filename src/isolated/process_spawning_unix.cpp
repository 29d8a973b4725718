/*
 * process_spawning_unix.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace warden::isolated {

namespace {

ExitStatus decodeStatus(int status) {
    ExitStatus exitStatus;
    if (WIFEXITED(status)) {
        exitStatus.exited = true;
        exitStatus.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitStatus.signaled = true;
        exitStatus.signal = WTERMSIG(status);
    }
    return exitStatus;
}

std::vector<std::string> buildEnvironment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> entries;
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        std::string_view entry(*env);
        auto eq = entry.find('=');
        auto key = entry.substr(0, eq);
        bool overridden = false;
        for (const auto& [name, value] : overrides) {
            if (key == name) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            entries.emplace_back(entry);
        }
    }
    for (const auto& [name, value] : overrides) {
        entries.push_back(name + "=" + value);
    }
    return entries;
}

std::vector<char*> toPointerArray(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

// Runs between fork() and execve(); only async-signal-safe calls allowed.
[[noreturn]] void execWorker(const char* path, char* const* argv,
                             char* const* envp, const char* workingDirectory,
                             int readFd, int writeFd) {
    setpgid(0, 0);

    sigset_t emptySet;
    sigemptyset(&emptySet);
    sigprocmask(SIG_SETMASK, &emptySet, nullptr);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGXCPU, SIG_DFL);
    signal(SIGSEGV, SIG_DFL);

    // Move the channel out of the way before claiming 3 and 4
    int highRead = fcntl(readFd, F_DUPFD_CLOEXEC, 10);
    int highWrite = fcntl(writeFd, F_DUPFD_CLOEXEC, 10);
    if (highRead < 0 || highWrite < 0) {
        _exit(WorkerExitCode::ExecFailed);
    }
    if (dup2(highRead, kWorkerReadFd) < 0 || dup2(highWrite, kWorkerWriteFd) < 0) {
        _exit(WorkerExitCode::ExecFailed);
    }

    int devNull = open("/dev/null", O_RDWR);
    if (devNull < 0 || dup2(devNull, STDIN_FILENO) < 0 ||
        dup2(devNull, STDOUT_FILENO) < 0) {
        _exit(WorkerExitCode::ExecFailed);
    }

    close_range(kWorkerWriteFd + 1, ~0U, 0);

    if (workingDirectory != nullptr && chdir(workingDirectory) != 0) {
        _exit(WorkerExitCode::ExecFailed);
    }

    execve(path, argv, envp);
    _exit(WorkerExitCode::ExecFailed);
}

}  // namespace

std::vector<std::pair<std::string, std::string>>
ProcessSpawner::defaultEnvironment() {
    return {{"OPENBLAS_NUM_THREADS", "1"},
            {"OMP_NUM_THREADS", "1"},
            {"MKL_NUM_THREADS", "1"},
            {"PYTHONDONTWRITEBYTECODE", "1"}};
}

Result<int> ProcessSpawner::spawn(const SpawnOptions& options,
                                  std::pair<int, int> subprocessFds) {
    auto [readFd, writeFd] = subprocessFds;
    if (readFd < 0 || writeFd < 0) {
        return std::unexpected(BoundaryFailure{
            BoundaryError::ChannelSetupFailed, "channel descriptors are closed"});
    }

    if (::access(options.workerPath.c_str(), X_OK) != 0) {
        return std::unexpected(BoundaryFailure{
            BoundaryError::WorkerNotFound,
            options.workerPath.string() + ": " + std::strerror(errno)});
    }

    // Everything the child needs is allocated before fork
    std::string path = options.workerPath.string();
    std::vector<std::string> argStrings;
    argStrings.push_back(path);
    argStrings.insert(argStrings.end(), options.arguments.begin(),
                      options.arguments.end());
    auto argv = toPointerArray(argStrings);

    auto overrides = defaultEnvironment();
    overrides.insert(overrides.end(), options.environment.begin(),
                     options.environment.end());
    auto envStrings = buildEnvironment(overrides);
    auto envp = toPointerArray(envStrings);

    std::string workingDirectory = options.workingDirectory.string();
    const char* cwd = workingDirectory.empty() ? nullptr : workingDirectory.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("Fork failed: {}", std::strerror(errno));
        return std::unexpected(
            BoundaryFailure{BoundaryError::SpawnFailed, std::strerror(errno)});
    }

    if (pid == 0) {
        execWorker(path.c_str(), argv.data(), envp.data(), cwd, readFd, writeFd);
    }

    // Parent process; repeat setpgid so the group exists before any kill
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        spdlog::warn("setpgid({}) failed: {}", pid, std::strerror(errno));
    }

    spdlog::debug("Spawned worker process with PID {}", pid);
    return static_cast<int>(pid);
}

std::optional<ExitStatus> ProcessSpawner::waitForProcess(
    int processId, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        int status = 0;
        pid_t result = waitpid(processId, &status, WNOHANG);
        if (result == processId) {
            return decodeStatus(status);
        }
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("waitpid({}) failed: {}", processId, std::strerror(errno));
            return ExitStatus{};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
}

ExitStatus ProcessSpawner::killProcess(int processId) {
    if (processId <= 0) {
        return {};
    }

    ::kill(-processId, SIGKILL);
    ::kill(processId, SIGKILL);

    int status = 0;
    while (true) {
        pid_t result = waitpid(processId, &status, 0);
        if (result == processId) {
            return decodeStatus(status);
        }
        if (result < 0 && errno == EINTR) {
            continue;
        }
        spdlog::warn("Failed to reap process {}: {}", processId,
                     std::strerror(errno));
        return {};
    }
}

bool ProcessSpawner::isProcessRunning(int processId) {
    return processId > 0 && ::kill(processId, 0) == 0;
}

}  // namespace warden::isolated
