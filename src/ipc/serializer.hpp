/*
 * serializer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_IPC_SERIALIZER_HPP
#define WARDEN_IPC_SERIALIZER_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <span>
#include <vector>

#include "message_types.hpp"

namespace warden::ipc {

using json = nlohmann::json;

/**
 * @brief Payload serializer for IPC messages
 *
 * Payloads travel as UTF-8 JSON text. Invalid UTF-8 in string values is
 * replaced rather than rejected, so captured program output can never make
 * a message unserializable.
 */
class IPCSerializer {
public:
    /**
     * @brief Serialize JSON to bytes
     */
    [[nodiscard]] static IPCResult<std::vector<uint8_t>> serialize(
        const json& data);

    /**
     * @brief Deserialize bytes to JSON
     */
    [[nodiscard]] static IPCResult<json> deserialize(
        std::span<const uint8_t> data);
};

}  // namespace warden::ipc

#endif  // WARDEN_IPC_SERIALIZER_HPP
