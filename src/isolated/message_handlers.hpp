/*
 * message_handlers.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_ISOLATED_MESSAGE_HANDLERS_HPP
#define WARDEN_ISOLATED_MESSAGE_HANDLERS_HPP

#include "types.hpp"
#include "../ipc/message.hpp"
#include "../python/bounded_buffer.hpp"

#include <optional>

namespace warden::isolated {

/**
 * @brief Handler result after processing a message
 */
struct MessageHandlerResult {
    bool shouldContinue{true};      ///< Continue waiting for messages
    bool executionComplete{false};  ///< Worker sent Result or Error
};

/**
 * @brief Everything the worker has reported so far
 *
 * Output is accumulated chunk by chunk, so it survives a worker that is
 * killed before sending its Result.
 */
struct WorkerReport {
    python::BoundedBuffer stdoutBuffer;
    python::BoundedBuffer stderrBuffer;
    std::optional<ipc::ExecuteResult> result;
    std::optional<ipc::ErrorPayload> error;

    explicit WorkerReport(size_t outputLimitBytes)
        : stdoutBuffer(outputLimitBytes), stderrBuffer(outputLimitBytes) {}
};

/**
 * @brief Host-side IPC message handler for one execution
 */
class MessageHandler {
public:
    explicit MessageHandler(size_t outputLimitBytes);

    /**
     * @brief Set log callback for worker Log messages
     */
    void setLogCallback(LogCallback callback);

    /**
     * @brief Process an incoming IPC message
     * @param message Message to process
     * @return Handler result indicating what to do next
     */
    [[nodiscard]] MessageHandlerResult processMessage(const ipc::Message& message);

    [[nodiscard]] WorkerReport& report() noexcept { return report_; }
    [[nodiscard]] const WorkerReport& report() const noexcept { return report_; }

private:
    [[nodiscard]] MessageHandlerResult handleResult(const nlohmann::json& payload);
    [[nodiscard]] MessageHandlerResult handleOutput(const nlohmann::json& payload);
    [[nodiscard]] MessageHandlerResult handleLog(const nlohmann::json& payload);
    [[nodiscard]] MessageHandlerResult handleError(const nlohmann::json& payload);

    WorkerReport report_;
    LogCallback logCallback_;
};

}  // namespace warden::isolated

#endif  // WARDEN_ISOLATED_MESSAGE_HANDLERS_HPP
