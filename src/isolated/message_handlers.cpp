/*
 * message_handlers.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "message_handlers.hpp"

#include <spdlog/spdlog.h>

namespace warden::isolated {

namespace {

MessageHandlerResult complete() {
    MessageHandlerResult result;
    result.shouldContinue = false;
    result.executionComplete = true;
    return result;
}

}  // namespace

MessageHandler::MessageHandler(size_t outputLimitBytes)
    : report_(outputLimitBytes) {}

void MessageHandler::setLogCallback(LogCallback callback) {
    logCallback_ = std::move(callback);
}

MessageHandlerResult MessageHandler::processMessage(const ipc::Message& message) {
    auto payloadResult = message.getPayloadAsJson();
    if (!payloadResult) {
        spdlog::warn("Dropping {} message with unreadable payload",
                     ipc::messageTypeName(message.header.type));
        return {};
    }

    const auto& payload = *payloadResult;

    switch (message.header.type) {
        case ipc::MessageType::Result:
            return handleResult(payload);

        case ipc::MessageType::Output:
            return handleOutput(payload);

        case ipc::MessageType::Log:
            return handleLog(payload);

        case ipc::MessageType::Error:
            return handleError(payload);

        default:
            spdlog::warn("Unexpected message type: {}",
                         ipc::messageTypeName(message.header.type));
            return {};
    }
}

MessageHandlerResult MessageHandler::handleResult(const nlohmann::json& payload) {
    auto execResult = ipc::ExecuteResult::fromJson(payload);
    if (!execResult) {
        report_.error = ipc::ErrorPayload{"ProtocolError", "malformed Result payload"};
        return complete();
    }
    report_.result = std::move(*execResult);
    return complete();
}

MessageHandlerResult MessageHandler::handleOutput(const nlohmann::json& payload) {
    auto chunk = ipc::OutputChunk::fromJson(payload);
    if (!chunk) {
        spdlog::warn("Dropping malformed Output chunk");
        return {};
    }

    auto& buffer = chunk->stream == ipc::OutputStream::Stdout
                       ? report_.stdoutBuffer
                       : report_.stderrBuffer;
    (void)buffer.append(chunk->data);
    if (chunk->truncated) {
        buffer.markTruncated();
    }
    return {};
}

MessageHandlerResult MessageHandler::handleLog(const nlohmann::json& payload) {
    auto record = ipc::LogRecord::fromJson(payload);
    if (record && logCallback_) {
        logCallback_(record->level, record->message);
    }
    return {};
}

MessageHandlerResult MessageHandler::handleError(const nlohmann::json& payload) {
    auto error = ipc::ErrorPayload::fromJson(payload);
    if (error) {
        report_.error = std::move(*error);
    } else {
        report_.error = ipc::ErrorPayload{"ProtocolError", "malformed Error payload"};
    }
    return complete();
}

}  // namespace warden::isolated
