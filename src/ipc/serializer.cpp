/*
 * serializer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "serializer.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace warden::ipc {

IPCResult<std::vector<uint8_t>> IPCSerializer::serialize(const json& data) {
    try {
        std::string jsonStr =
            data.dump(-1, ' ', false, json::error_handler_t::replace);
        if (jsonStr.size() > ProtocolConstants::MAX_PAYLOAD_SIZE) {
            spdlog::error("IPC payload of {} bytes exceeds the protocol limit",
                          jsonStr.size());
            return std::unexpected(IPCError::MessageTooLarge);
        }
        return std::vector<uint8_t>(jsonStr.begin(), jsonStr.end());
    } catch (const json::exception& e) {
        spdlog::error("JSON serialize error: {}", e.what());
        return std::unexpected(IPCError::SerializationFailed);
    }
}

IPCResult<json> IPCSerializer::deserialize(std::span<const uint8_t> data) {
    try {
        return json::parse(data.begin(), data.end());
    } catch (const json::exception& e) {
        spdlog::error("JSON parse error: {}", e.what());
        return std::unexpected(IPCError::DeserializationFailed);
    }
}

}  // namespace warden::ipc
