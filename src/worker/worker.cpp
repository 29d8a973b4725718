/*
 * worker.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "worker.hpp"

#include "../isolated/resource_limiter.hpp"
#include "../isolated/types.hpp"
#include "../python/bounded_buffer.hpp"
#include "../python/code_executor.hpp"
#include "../python/runtime.hpp"
#include "../sandbox/registry.hpp"

#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <format>
#include <optional>

#include <sys/resource.h>
#include <unistd.h>

namespace warden::worker {

using isolated::WorkerExitCode;

namespace {

constexpr size_t kMaxDiagnosticBytes = 64 * 1024;

void clip(std::string& text) {
    text.resize(python::utf8PrefixLength(text, kMaxDiagnosticBytes));
}

}  // namespace

Worker::Worker(int readFd, int writeFd) { channel_.attach(readFd, writeFd); }

void Worker::reportError(std::string_view kind, std::string message) {
    spdlog::error("{}: {}", kind, message);
    ipc::ErrorPayload error{std::string(kind), std::move(message)};
    if (auto sent = channel_.send(ipc::MessageType::Error, error.toJson()); !sent) {
        spdlog::error("Failed to report error to host: {}",
                      ipc::ipcErrorToString(sent.error()));
    }
}

void Worker::forwardLog(std::string_view level, std::string message) {
    ipc::LogRecord record{std::string(level), std::move(message)};
    if (auto sent = channel_.send(ipc::MessageType::Log, record.toJson()); !sent) {
        spdlog::warn("Failed to forward log record: {}",
                     ipc::ipcErrorToString(sent.error()));
    }
}

int Worker::run() {
    ipc::HandshakePayload self;
    self.version = "1.0";
    self.pythonVersion = python::PythonRuntime::pythonVersion();
    self.capabilities = {"execute", "output-stream"};
    self.pid = static_cast<uint32_t>(::getpid());

    auto host = channel_.respondToHandshake(self, kHandshakeTimeout);
    if (!host) {
        spdlog::error("Handshake failed: {}", ipc::ipcErrorToString(host.error()));
        return WorkerExitCode::ProtocolError;
    }
    spdlog::debug("Handshake with host {} complete", host->pid);

    auto message = channel_.receive(kRequestTimeout);
    if (!message) {
        spdlog::error("No execute request: {}", ipc::ipcErrorToString(message.error()));
        return WorkerExitCode::ProtocolError;
    }
    if (message->header.type != ipc::MessageType::Execute) {
        reportError("ProtocolError", std::format("unexpected message type {}",
                                                 ipc::messageTypeName(message->header.type)));
        return WorkerExitCode::ProtocolError;
    }

    auto payload = message->getPayloadAsJson();
    if (!payload) {
        reportError("ProtocolError", std::string(ipc::ipcErrorToString(payload.error())));
        return WorkerExitCode::ProtocolError;
    }
    auto request = ipc::ExecuteRequest::fromJson(*payload);
    if (!request) {
        reportError("ProtocolError", std::string(ipc::ipcErrorToString(request.error())));
        return WorkerExitCode::ProtocolError;
    }

    return execute(*request);
}

int Worker::execute(const ipc::ExecuteRequest& request) {
    isolated::ResourceLimits limits;
    limits.memoryMB = request.memoryLimitMB;
    limits.cpuSeconds = request.cpuLimitSeconds;
    limits.maxProcesses = request.maxProcesses;
    limits.maxFileSizeBytes = request.maxFileSizeBytes;

    if (auto applied = isolated::ResourceLimiter::apply(limits); !applied) {
        reportError("LimitSetupFailed",
                    std::format("setrlimit({}) failed",
                                isolated::limitErrorToString(applied.error())));
        return WorkerExitCode::LimitSetupFailed;
    }

    auto registry = sandbox::Registry::create(config::RegistryConfig::fromJson(request.policy));

    std::optional<pybind11::scoped_interpreter> interpreter;
    try {
        interpreter.emplace(false);
    } catch (const std::exception& e) {
        reportError("InterpreterFailed", e.what());
        return WorkerExitCode::InterpreterFailed;
    }

    auto started = std::chrono::steady_clock::now();

    auto makeSink = [this](ipc::OutputStream stream) {
        return [this, stream](std::string_view data, bool truncatedNow) {
            ipc::OutputChunk chunk{stream, std::string(data), truncatedNow};
            if (auto sent = channel_.send(ipc::MessageType::Output, chunk.toJson()); !sent) {
                spdlog::warn("Failed to stream {}: {}", ipc::outputStreamToString(stream),
                             ipc::ipcErrorToString(sent.error()));
            }
        };
    };

    python::ExecutorOptions options;
    options.outputLimitBytes = request.outputLimitBytes;
    options.captureLocals = request.captureLocals;
    options.stdoutSink = makeSink(ipc::OutputStream::Stdout);
    options.stderrSink = makeSink(ipc::OutputStream::Stderr);

    python::CodeExecutor executor(registry);
    auto execution = executor.run(request.code, request.globals, request.locals, options);

    for (const auto& name : execution.droppedNames) {
        forwardLog("warn", std::format("injected name '{}' shadows a restricted name "
                                       "and was dropped", name));
    }
    for (const auto& library : execution.missingLibraries) {
        forwardLog("warn", std::format("library '{}' is not installed", library));
    }

    ipc::ExecuteResult result;
    result.success = execution.success;
    if (execution.exception) {
        result.exceptionType = execution.exception->type;
        result.exceptionMessage = execution.exception->message;
        result.traceback = execution.exception->traceback;
    }
    result.locals = std::move(execution.locals);
    result.memoryError = execution.memoryError;

    struct rusage usage{};
    if (::getrusage(RUSAGE_SELF, &usage) == 0) {
        result.peakMemoryBytes = static_cast<size_t>(usage.ru_maxrss) * 1024;
    }
    result.executionTimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();

    auto sent = channel_.send(ipc::MessageType::Result, result.toJson());
    if (!sent && sent.error() == ipc::IPCError::MessageTooLarge) {
        forwardLog("warn", "result exceeds the IPC payload limit; locals dropped");
        result.locals.reset();
        clip(result.exceptionMessage);
        clip(result.traceback);
        sent = channel_.send(ipc::MessageType::Result, result.toJson());
    }
    if (!sent) {
        spdlog::error("Failed to send result: {}", ipc::ipcErrorToString(sent.error()));
        return WorkerExitCode::ProtocolError;
    }
    return WorkerExitCode::Ok;
}

}  // namespace warden::worker
