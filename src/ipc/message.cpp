/*
 * message.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "message.hpp"
#include "serializer.hpp"

#include <spdlog/spdlog.h>

namespace warden::ipc {

namespace {

void putUint32(std::vector<uint8_t>& data, size_t& offset, uint32_t value) {
    data[offset++] = static_cast<uint8_t>((value >> 24) & 0xFF);
    data[offset++] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[offset++] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[offset++] = static_cast<uint8_t>(value & 0xFF);
}

uint32_t getUint32(std::span<const uint8_t> data, size_t& offset) {
    uint32_t value = (static_cast<uint32_t>(data[offset]) << 24) |
                     (static_cast<uint32_t>(data[offset + 1]) << 16) |
                     (static_cast<uint32_t>(data[offset + 2]) << 8) |
                     static_cast<uint32_t>(data[offset + 3]);
    offset += 4;
    return value;
}

}  // namespace

// ============================================================================
// MessageHeader Implementation
// ============================================================================

std::vector<uint8_t> MessageHeader::serialize() const {
    std::vector<uint8_t> data(SIZE);
    size_t offset = 0;

    putUint32(data, offset, magic);
    data[offset++] = version;
    data[offset++] = static_cast<uint8_t>(type);
    putUint32(data, offset, payloadSize);
    putUint32(data, offset, sequenceId);
    data[offset++] = flags;
    data[offset++] = reserved;

    return data;
}

IPCResult<MessageHeader> MessageHeader::deserialize(std::span<const uint8_t> data) {
    if (data.size() < SIZE) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    MessageHeader header;
    size_t offset = 0;

    header.magic = getUint32(data, offset);
    if (header.magic != MAGIC) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    header.version = data[offset++];
    header.type = static_cast<MessageType>(data[offset++]);
    header.payloadSize = getUint32(data, offset);
    header.sequenceId = getUint32(data, offset);
    header.flags = data[offset++];
    header.reserved = data[offset++];

    if (header.version != VERSION) {
        return std::unexpected(IPCError::InvalidMessage);
    }
    if (header.payloadSize > ProtocolConstants::MAX_PAYLOAD_SIZE) {
        return std::unexpected(IPCError::MessageTooLarge);
    }

    return header;
}

bool MessageHeader::isValid() const noexcept {
    return magic == MAGIC && version == VERSION &&
           payloadSize <= ProtocolConstants::MAX_PAYLOAD_SIZE;
}

// ============================================================================
// Message Implementation
// ============================================================================

IPCResult<Message> Message::create(MessageType type, const json& payload,
                                   uint32_t sequenceId) {
    auto bytes = IPCSerializer::serialize(payload);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return create(type, std::move(*bytes), sequenceId);
}

Message Message::create(MessageType type, std::vector<uint8_t> payload,
                        uint32_t sequenceId) {
    Message msg;
    msg.header.type = type;
    msg.header.sequenceId = sequenceId;
    msg.payload = std::move(payload);
    msg.header.payloadSize = static_cast<uint32_t>(msg.payload.size());
    return msg;
}

IPCResult<json> Message::getPayloadAsJson() const {
    if (payload.empty()) {
        return json::object();
    }
    return IPCSerializer::deserialize(payload);
}

std::vector<uint8_t> Message::serialize() const {
    auto headerData = header.serialize();
    std::vector<uint8_t> result;
    result.reserve(headerData.size() + payload.size());
    result.insert(result.end(), headerData.begin(), headerData.end());
    result.insert(result.end(), payload.begin(), payload.end());
    return result;
}

IPCResult<Message> Message::deserialize(std::span<const uint8_t> data) {
    auto headerResult = MessageHeader::deserialize(data);
    if (!headerResult) {
        return std::unexpected(headerResult.error());
    }

    Message msg;
    msg.header = *headerResult;

    size_t expectedSize = MessageHeader::SIZE + msg.header.payloadSize;
    if (data.size() < expectedSize) {
        return std::unexpected(IPCError::InvalidMessage);
    }

    msg.payload.assign(data.begin() + MessageHeader::SIZE,
                       data.begin() + expectedSize);

    return msg;
}

// ============================================================================
// Payload Structures Implementation
// ============================================================================

json ExecuteRequest::toJson() const {
    return {
        {"code", code},
        {"globals", globals},
        {"locals", locals},
        {"capture_locals", captureLocals},
        {"memory_limit_mb", memoryLimitMB},
        {"cpu_limit_seconds", cpuLimitSeconds},
        {"output_limit_bytes", outputLimitBytes},
        {"max_processes", maxProcesses},
        {"max_file_size_bytes", maxFileSizeBytes},
        {"policy", policy}
    };
}

IPCResult<ExecuteRequest> ExecuteRequest::fromJson(const json& j) {
    try {
        ExecuteRequest req;
        req.code = j.at("code").get<std::string>();
        if (j.contains("globals")) req.globals = j["globals"];
        if (j.contains("locals")) req.locals = j["locals"];
        req.captureLocals = j.value("capture_locals", req.captureLocals);
        req.memoryLimitMB = j.value("memory_limit_mb", req.memoryLimitMB);
        req.cpuLimitSeconds = j.value("cpu_limit_seconds", req.cpuLimitSeconds);
        req.outputLimitBytes = j.value("output_limit_bytes", req.outputLimitBytes);
        req.maxProcesses = j.value("max_processes", req.maxProcesses);
        req.maxFileSizeBytes = j.value("max_file_size_bytes", req.maxFileSizeBytes);
        if (j.contains("policy")) req.policy = j["policy"];
        return req;
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse ExecuteRequest: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

json ExecuteResult::toJson() const {
    json j = {
        {"success", success},
        {"exception_type", exceptionType},
        {"exception_message", exceptionMessage},
        {"traceback", traceback},
        {"memory_error", memoryError},
        {"peak_memory_bytes", peakMemoryBytes},
        {"execution_time_ms", executionTimeMs}
    };
    if (locals) {
        j["locals"] = *locals;
    }
    return j;
}

IPCResult<ExecuteResult> ExecuteResult::fromJson(const json& j) {
    try {
        ExecuteResult res;
        res.success = j.at("success").get<bool>();
        res.exceptionType = j.value("exception_type", "");
        res.exceptionMessage = j.value("exception_message", "");
        res.traceback = j.value("traceback", "");
        if (j.contains("locals") && j["locals"].is_object()) {
            res.locals = j["locals"];
        }
        res.memoryError = j.value("memory_error", false);
        res.peakMemoryBytes = j.value("peak_memory_bytes", size_t{0});
        res.executionTimeMs = j.value("execution_time_ms", int64_t{0});
        return res;
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse ExecuteResult: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

json OutputChunk::toJson() const {
    return {
        {"stream", outputStreamToString(stream)},
        {"data", data},
        {"truncated", truncated}
    };
}

IPCResult<OutputChunk> OutputChunk::fromJson(const json& j) {
    try {
        OutputChunk chunk;
        auto stream = j.at("stream").get<std::string>();
        if (stream == "stdout") {
            chunk.stream = OutputStream::Stdout;
        } else if (stream == "stderr") {
            chunk.stream = OutputStream::Stderr;
        } else {
            return std::unexpected(IPCError::InvalidMessage);
        }
        chunk.data = j.value("data", "");
        chunk.truncated = j.value("truncated", false);
        return chunk;
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse OutputChunk: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

json LogRecord::toJson() const {
    return {{"level", level}, {"message", message}};
}

IPCResult<LogRecord> LogRecord::fromJson(const json& j) {
    try {
        LogRecord record;
        record.level = j.value("level", record.level);
        record.message = j.value("message", "");
        return record;
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse LogRecord: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

json ErrorPayload::toJson() const {
    return {{"kind", kind}, {"message", message}};
}

IPCResult<ErrorPayload> ErrorPayload::fromJson(const json& j) {
    try {
        ErrorPayload payload;
        payload.kind = j.at("kind").get<std::string>();
        payload.message = j.value("message", "");
        return payload;
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse ErrorPayload: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

json HandshakePayload::toJson() const {
    return {
        {"version", version},
        {"python_version", pythonVersion},
        {"capabilities", capabilities},
        {"pid", pid}
    };
}

IPCResult<HandshakePayload> HandshakePayload::fromJson(const json& j) {
    try {
        HandshakePayload payload;
        if (j.contains("version")) payload.version = j["version"].get<std::string>();
        if (j.contains("python_version")) payload.pythonVersion = j["python_version"].get<std::string>();
        if (j.contains("capabilities")) {
            payload.capabilities = j["capabilities"].get<std::vector<std::string>>();
        }
        if (j.contains("pid")) payload.pid = j["pid"].get<uint32_t>();
        return payload;
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse HandshakePayload: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

}  // namespace warden::ipc
