/*
 * request_validator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_SANDBOX_REQUEST_VALIDATOR_HPP
#define WARDEN_SANDBOX_REQUEST_VALIDATOR_HPP

#include <expected>
#include <string_view>

#include "../config/sandbox_config.hpp"
#include "types.hpp"

namespace warden::sandbox {

/**
 * @brief Schema checks on an ExecutionRequest, run before static analysis
 */
class RequestValidator {
public:
    explicit RequestValidator(config::LimitsConfig limits);

    /**
     * @brief Check code and limit fields
     *
     * Code length is counted in characters (UTF-8 code points), not bytes.
     */
    [[nodiscard]] std::expected<void, RequestError> validate(
        const ExecutionRequest& request) const;

    /**
     * @brief Parse and validate a JSON request in one step
     */
    [[nodiscard]] std::expected<ExecutionRequest, RequestError> parse(
        const json& j) const;

    [[nodiscard]] int effectiveTimeout(const ExecutionRequest& request) const noexcept {
        return request.timeoutSeconds.value_or(limits_.timeoutDefaultSeconds);
    }

    [[nodiscard]] int effectiveMemoryMB(const ExecutionRequest& request) const noexcept {
        return request.maxMemoryMB.value_or(limits_.memoryDefaultMB);
    }

    [[nodiscard]] const config::LimitsConfig& limits() const noexcept { return limits_; }

private:
    config::LimitsConfig limits_;
};

/**
 * @brief Text consists only of whitespace (or is empty)
 */
[[nodiscard]] bool isBlank(std::string_view text) noexcept;

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_REQUEST_VALIDATOR_HPP
