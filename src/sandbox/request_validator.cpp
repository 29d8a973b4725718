/*
 * request_validator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "request_validator.hpp"

#include <spdlog/spdlog.h>

#include "../python/bounded_buffer.hpp"

namespace warden::sandbox {

bool isBlank(std::string_view text) noexcept {
    return text.find_first_not_of(" \t\n\r\f\v") == std::string_view::npos;
}

RequestValidator::RequestValidator(config::LimitsConfig limits)
    : limits_(std::move(limits)) {}

std::expected<void, RequestError> RequestValidator::validate(
    const ExecutionRequest& request) const {
    if (request.code.empty()) {
        return std::unexpected(RequestError::EmptyCode);
    }
    if (isBlank(request.code)) {
        return std::unexpected(RequestError::WhitespaceOnlyCode);
    }

    auto length = python::utf8Length(request.code);
    if (length > limits_.maxCodeLength) {
        spdlog::debug("Rejecting request: code length {} > {}", length,
                      limits_.maxCodeLength);
        return std::unexpected(RequestError::CodeTooLong);
    }

    int timeout = effectiveTimeout(request);
    if (timeout < limits_.timeoutMinSeconds || timeout > limits_.timeoutMaxSeconds) {
        return std::unexpected(RequestError::TimeoutOutOfRange);
    }

    int memory = effectiveMemoryMB(request);
    if (memory < limits_.memoryMinMB || memory > limits_.memoryMaxMB) {
        return std::unexpected(RequestError::MemoryOutOfRange);
    }

    if (!request.globals.is_object()) {
        return std::unexpected(RequestError::InvalidGlobals);
    }
    if (!request.locals.is_object()) {
        return std::unexpected(RequestError::InvalidLocals);
    }
    return {};
}

std::expected<ExecutionRequest, RequestError> RequestValidator::parse(
    const json& j) const {
    auto request = ExecutionRequest::fromJson(j);
    if (!request) {
        return request;
    }
    if (auto valid = validate(*request); !valid) {
        return std::unexpected(valid.error());
    }
    return request;
}

}  // namespace warden::sandbox
