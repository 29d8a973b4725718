/*
 * thread_boundary.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "thread_boundary.hpp"

#include "../python/code_executor.hpp"
#include "../python/runtime.hpp"

#include <pybind11/pybind11.h>
#include <spdlog/spdlog.h>

#include <future>
#include <thread>

namespace warden::isolated {

namespace {

struct ThreadRunState {
    std::promise<python::CodeExecution> promise;
    std::atomic<unsigned long> threadId{0};
};

void injectTimeout(unsigned long threadId) {
    if (threadId == 0) {
        return;
    }
    pybind11::gil_scoped_acquire gil;
    PyThreadState_SetAsyncExc(threadId, PyExc_TimeoutError);
}

}  // namespace

ThreadBoundary::ThreadBoundary(std::shared_ptr<const sandbox::Registry> registry,
                               std::chrono::milliseconds stopGrace,
                               std::chrono::milliseconds pollInterval)
    : registry_(std::move(registry)), stopGrace_(stopGrace), pollInterval_(pollInterval) {}

bool ThreadBoundary::isAvailable() const {
    return !poisoned_ && python::PythonRuntime::instance().ensureInitialized();
}

Result<RawExecutionOutcome> ThreadBoundary::runIsolated(const IsolatedRun& run,
                                                        const CancellationToken& token) {
    std::lock_guard lock(runMutex_);

    if (poisoned_) {
        return std::unexpected(BoundaryFailure{
            BoundaryError::BoundaryPoisoned,
            "an earlier in-process execution is still running"});
    }
    if (!python::PythonRuntime::instance().ensureInitialized()) {
        return std::unexpected(BoundaryFailure{BoundaryError::InterpreterUnavailable,
                                               "embedded interpreter failed to start"});
    }

    auto state = std::make_shared<ThreadRunState>();
    auto future = state->promise.get_future();

    python::ExecutorOptions options;
    options.outputLimitBytes = run.outputLimitBytes;
    options.captureLocals = run.captureLocals;
    options.onStart = [state](unsigned long id) { state->threadId = id; };

    python::CodeExecutor executor(registry_);
    std::thread worker([state, executor, run, options]() {
        try {
            state->promise.set_value(
                executor.run(run.code, run.globals, run.locals, options));
        } catch (const std::exception& e) {
            spdlog::error("In-process execution failed: {}", e.what());
            state->promise.set_exception(std::current_exception());
        }
    });

    RawExecutionOutcome outcome;
    auto deadline = std::chrono::steady_clock::now() + run.timeout;

    while (future.wait_for(pollInterval_) != std::future_status::ready) {
        if (token.isCancelled()) {
            outcome.cancelled = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            outcome.timedOut = true;
            break;
        }
    }

    if (outcome.timedOut || outcome.cancelled) {
        // User code may catch the first TimeoutError, so keep raising it
        auto stopDeadline = std::chrono::steady_clock::now() + stopGrace_;
        do {
            injectTimeout(state->threadId);
        } while (future.wait_for(pollInterval_) != std::future_status::ready &&
                 std::chrono::steady_clock::now() < stopDeadline);

        if (future.wait_for(std::chrono::milliseconds{0}) != std::future_status::ready) {
            spdlog::error("In-process execution ignored termination for {} ms; "
                          "detaching its thread and disabling the thread boundary",
                          stopGrace_.count());
            worker.detach();
            poisoned_ = true;
            return std::unexpected(BoundaryFailure{
                BoundaryError::BoundaryPoisoned,
                "execution could not be stopped"});
        }
    }

    worker.join();

    python::CodeExecution execution;
    try {
        execution = future.get();
    } catch (const std::exception& e) {
        return std::unexpected(BoundaryFailure{BoundaryError::UnknownError, e.what()});
    }

    outcome.stdoutText = std::move(execution.stdoutText);
    outcome.stderrText = std::move(execution.stderrText);
    outcome.stdoutTruncated = execution.stdoutTruncated;
    outcome.stderrTruncated = execution.stderrTruncated;
    outcome.exception = std::move(execution.exception);
    outcome.memoryExceeded = execution.memoryError;
    if (execution.success) {
        outcome.localsSnapshot = std::move(execution.locals);
    }
    return outcome;
}

}  // namespace warden::isolated
