/*
 * message_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file message_types.hpp
 * @brief IPC message type definitions for the host/worker protocol
 * @date 2024
 * @version 1.1.0
 */

#ifndef WARDEN_IPC_MESSAGE_TYPES_HPP
#define WARDEN_IPC_MESSAGE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>

namespace warden::ipc {

/**
 * @brief IPC error codes
 */
enum class IPCError {
    Success = 0,
    ConnectionFailed,
    MessageTooLarge,
    SerializationFailed,
    DeserializationFailed,
    Timeout,
    PipeError,
    InvalidMessage,
    ChannelClosed,
    UnknownError
};

/**
 * @brief Get string representation of IPCError
 */
[[nodiscard]] constexpr std::string_view ipcErrorToString(IPCError error) noexcept {
    switch (error) {
        case IPCError::Success: return "Success";
        case IPCError::ConnectionFailed: return "Connection failed";
        case IPCError::MessageTooLarge: return "Message too large";
        case IPCError::SerializationFailed: return "Serialization failed";
        case IPCError::DeserializationFailed: return "Deserialization failed";
        case IPCError::Timeout: return "Timeout";
        case IPCError::PipeError: return "Pipe error";
        case IPCError::InvalidMessage: return "Invalid message";
        case IPCError::ChannelClosed: return "Channel closed";
        case IPCError::UnknownError: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for IPC operations
 */
template<typename T>
using IPCResult = std::expected<T, IPCError>;

/**
 * @brief Message types exchanged between the host and a worker
 */
enum class MessageType : uint8_t {
    // Control messages (0x01-0x0F)
    Handshake = 0x01,     ///< Host greets the worker
    HandshakeAck = 0x02,  ///< Worker acknowledges with its capabilities

    // Execution messages (0x10-0x1F)
    Execute = 0x10,       ///< Host -> worker: run this code
    Result = 0x11,        ///< Worker -> host: execution finished
    Error = 0x12,         ///< Worker -> host: setup failure, nothing was run

    // Stream messages (0x20-0x2F)
    Output = 0x20,        ///< Worker -> host: captured stdout/stderr chunk
    Log = 0x21            ///< Worker -> host: diagnostic log record
};

/**
 * @brief Get string name for message type
 */
[[nodiscard]] constexpr std::string_view messageTypeName(MessageType type) noexcept {
    switch (type) {
        case MessageType::Handshake: return "Handshake";
        case MessageType::HandshakeAck: return "HandshakeAck";
        case MessageType::Execute: return "Execute";
        case MessageType::Result: return "Result";
        case MessageType::Error: return "Error";
        case MessageType::Output: return "Output";
        case MessageType::Log: return "Log";
    }
    return "Unknown";
}

/**
 * @brief Check if message type is a control message
 */
[[nodiscard]] constexpr bool isControlMessage(MessageType type) noexcept {
    return static_cast<uint8_t>(type) >= 0x01 &&
           static_cast<uint8_t>(type) <= 0x0F;
}

/**
 * @brief Check if message type is an execution message
 */
[[nodiscard]] constexpr bool isExecutionMessage(MessageType type) noexcept {
    return static_cast<uint8_t>(type) >= 0x10 &&
           static_cast<uint8_t>(type) <= 0x1F;
}

/**
 * @brief Check if message type carries streamed data
 */
[[nodiscard]] constexpr bool isStreamMessage(MessageType type) noexcept {
    return static_cast<uint8_t>(type) >= 0x20 &&
           static_cast<uint8_t>(type) <= 0x2F;
}

/**
 * @brief Protocol constants
 */
struct ProtocolConstants {
    static constexpr uint32_t MAGIC = 0x57415244;  // "WARD"
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 16;
    static constexpr size_t MAX_PAYLOAD_SIZE = 64 * 1024 * 1024;  // 64MB
};

}  // namespace warden::ipc

#endif  // WARDEN_IPC_MESSAGE_TYPES_HPP
