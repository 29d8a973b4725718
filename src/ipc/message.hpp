/*
 * message.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file message.hpp
 * @brief IPC message structures and serialization
 * @date 2024
 * @version 1.1.0
 *
 * This module provides message structures for communication between the
 * sandbox host and an isolated worker process:
 * - Message header with magic number and version validation
 * - Generic message container with binary/JSON payload support
 * - Payload structures (ExecuteRequest, ExecuteResult, OutputChunk, ...)
 */

#ifndef WARDEN_IPC_MESSAGE_HPP
#define WARDEN_IPC_MESSAGE_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "message_types.hpp"

namespace warden::ipc {

using json = nlohmann::json;

/**
 * @brief Message header structure
 *
 * Provides binary protocol framing with magic number validation
 * and protocol version checking.
 */
struct MessageHeader {
    static constexpr uint32_t MAGIC = ProtocolConstants::MAGIC;
    static constexpr uint8_t VERSION = ProtocolConstants::VERSION;
    static constexpr size_t SIZE = ProtocolConstants::HEADER_SIZE;

    uint32_t magic{MAGIC};     ///< Magic number for validation
    uint8_t version{VERSION};  ///< Protocol version
    MessageType type{MessageType::Handshake};  ///< Message type
    uint32_t payloadSize{0};   ///< Size of payload in bytes
    uint32_t sequenceId{0};    ///< Message sequence number
    uint8_t flags{0};          ///< Message flags
    uint8_t reserved{0};       ///< Reserved for future use

    /**
     * @brief Serialize header to bytes
     * @return Serialized header as byte vector
     */
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /**
     * @brief Deserialize header from bytes
     * @param data Byte buffer to deserialize from
     * @return Deserialized header or error
     */
    [[nodiscard]] static IPCResult<MessageHeader> deserialize(
        std::span<const uint8_t> data);

    /**
     * @brief Validate the header
     * @return True if magic and version match and the payload fits the
     * protocol limit
     */
    [[nodiscard]] bool isValid() const noexcept;
};

/**
 * @brief IPC Message structure
 */
struct Message {
    MessageHeader header;
    std::vector<uint8_t> payload;

    /**
     * @brief Create a message with JSON payload
     * @param type Message type
     * @param payload JSON payload to serialize
     * @param sequenceId Optional sequence ID
     * @return Constructed message or serialization error
     */
    [[nodiscard]] static IPCResult<Message> create(MessageType type,
                                                   const json& payload,
                                                   uint32_t sequenceId = 0);

    /**
     * @brief Create a message with binary payload
     */
    [[nodiscard]] static Message create(MessageType type,
                                        std::vector<uint8_t> payload,
                                        uint32_t sequenceId = 0);

    /**
     * @brief Get payload as JSON
     */
    [[nodiscard]] IPCResult<json> getPayloadAsJson() const;

    /**
     * @brief Serialize the entire message (header + payload)
     */
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /**
     * @brief Deserialize a message from bytes
     */
    [[nodiscard]] static IPCResult<Message> deserialize(
        std::span<const uint8_t> data);
};

/**
 * @brief Execute request payload
 *
 * Everything the worker needs to set up limits, build the restricted
 * namespace and run the code. The policy is the host's registry snapshot so
 * the worker never reads configuration of its own.
 */
struct ExecuteRequest {
    std::string code;                  ///< Source to execute
    json globals = json::object();     ///< Caller-injected globals
    json locals = json::object();      ///< Caller-injected initial locals
    bool captureLocals{false};         ///< Snapshot locals after execution
    size_t memoryLimitMB{512};         ///< Address-space ceiling
    int64_t cpuLimitSeconds{31};       ///< CPU-time ceiling
    size_t outputLimitBytes{1048576};  ///< Per-stream capture cap
    uint64_t maxProcesses{0};          ///< RLIMIT_NPROC (0 = leave unset)
    uint64_t maxFileSizeBytes{0};      ///< RLIMIT_FSIZE (0 = leave unset)
    json policy = json::object();      ///< Registry snapshot

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<ExecuteRequest> fromJson(const json& j);
};

/**
 * @brief Execution result payload
 *
 * Output is not part of the result: it is streamed as OutputChunk messages
 * while the code runs, so the host keeps partial output if the worker dies.
 */
struct ExecuteResult {
    bool success{false};             ///< Whether user code completed
    std::string exceptionType;       ///< Exception class name
    std::string exceptionMessage;    ///< str(exception)
    std::string traceback;           ///< Formatted traceback
    std::optional<json> locals;      ///< Locals snapshot if requested
    bool memoryError{false};         ///< MemoryError raised under the ceiling
    size_t peakMemoryBytes{0};       ///< Self-reported peak RSS
    int64_t executionTimeMs{0};      ///< Self-reported, informational only

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<ExecuteResult> fromJson(const json& j);
};

/**
 * @brief Output stream identifier
 */
enum class OutputStream { Stdout, Stderr };

[[nodiscard]] constexpr std::string_view outputStreamToString(
    OutputStream stream) noexcept {
    return stream == OutputStream::Stdout ? "stdout" : "stderr";
}

/**
 * @brief A chunk of captured program output
 */
struct OutputChunk {
    OutputStream stream{OutputStream::Stdout};
    std::string data;
    bool truncated{false};  ///< Capture cap was reached with this chunk

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<OutputChunk> fromJson(const json& j);
};

/**
 * @brief Diagnostic log record forwarded from the worker
 */
struct LogRecord {
    std::string level{"info"};
    std::string message;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<LogRecord> fromJson(const json& j);
};

/**
 * @brief Setup failure reported by the worker before any user code ran
 */
struct ErrorPayload {
    std::string kind;     ///< e.g. "LimitSetupFailed"
    std::string message;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<ErrorPayload> fromJson(const json& j);
};

/**
 * @brief Handshake payload
 */
struct HandshakePayload {
    std::string version;                    ///< Protocol version
    std::string pythonVersion;              ///< Python version
    std::vector<std::string> capabilities;  ///< Supported capabilities
    uint32_t pid{0};                        ///< Process ID

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static IPCResult<HandshakePayload> fromJson(const json& j);
};

}  // namespace warden::ipc

#endif  // WARDEN_IPC_MESSAGE_HPP
