/*
 * registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file registry.hpp
 * @brief Immutable whitelist / blacklist tables shared by every layer
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_SANDBOX_REGISTRY_HPP
#define WARDEN_SANDBOX_REGISTRY_HPP

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "../config/sandbox_config.hpp"

namespace warden::sandbox {

/**
 * @brief Read-only security tables
 *
 * Built once from configuration and shared as shared_ptr<const Registry>;
 * every query is const and safe from any thread.
 *
 * Blacklist entries come in three forms:
 * - undotted (`eval`): matches any call whose last component is the name
 * - dotted (`os.system`): matches the full name or any chain ending in it
 * - pattern (`subprocess.*`): matches the prefix followed by at least one
 *   more component, anywhere in the chain
 */
class Registry {
public:
    explicit Registry(config::RegistryConfig config);

    [[nodiscard]] static std::shared_ptr<const Registry> create(
        config::RegistryConfig config = {});

    /**
     * @brief Root module may be imported
     */
    [[nodiscard]] bool isImportAllowed(std::string_view root) const;

    /**
     * @brief Root module is on the explicit deny list
     */
    [[nodiscard]] bool isForbiddenImport(std::string_view root) const;

    /**
     * @brief Match a dotted call name against the blacklist
     * @return The matching entry, or nullopt
     */
    [[nodiscard]] std::optional<std::string> matchBlacklistedCall(
        std::string_view dottedName) const;

    [[nodiscard]] bool isForbiddenAttribute(std::string_view name) const;

    /**
     * @brief Whether an attribute name refers to a forbidden module
     *
     * Leading underscores are ignored, so `_os` and `_sys` (the private
     * aliases stdlib modules keep) match `os` and `sys`.
     */
    [[nodiscard]] bool isForbiddenModuleReference(std::string_view name) const;
    [[nodiscard]] bool isBuiltin(std::string_view name) const;
    [[nodiscard]] bool isHandleAlias(std::string_view name) const;

    /**
     * @brief Name is an undotted blacklist entry or a pattern prefix
     */
    [[nodiscard]] bool isBlacklistedName(std::string_view name) const;

    [[nodiscard]] const std::vector<std::string>& builtins() const noexcept {
        return config_.builtins;
    }

    [[nodiscard]] const std::vector<config::LibraryHandleConfig>& libraryHandles()
        const noexcept {
        return config_.libraryHandles;
    }

    [[nodiscard]] const config::RegistryConfig& config() const noexcept {
        return config_;
    }

    /**
     * @brief Snapshot for the worker process
     */
    [[nodiscard]] nlohmann::json toJson() const { return config_.toJson(); }

    /**
     * @brief First component of a dotted module name
     */
    [[nodiscard]] static std::string_view rootModule(std::string_view dotted) noexcept;

private:
    using NameSet = std::set<std::string, std::less<>>;

    config::RegistryConfig config_;
    NameSet allowedImports_;
    NameSet forbiddenImports_;
    NameSet forbiddenAttributes_;
    NameSet builtins_;
    NameSet handleAliases_;
    NameSet undottedCalls_;
    std::vector<std::string> dottedCalls_;
    std::vector<std::string> callPatterns_;  ///< Prefixes of `prefix.*`
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_REGISTRY_HPP
