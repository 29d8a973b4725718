/*
 * registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "registry.hpp"

#include <spdlog/spdlog.h>

namespace warden::sandbox {

namespace {

constexpr std::string_view kPatternSuffix = ".*";

bool endsWithComponent(std::string_view chain, std::string_view suffix) {
    if (chain == suffix) {
        return true;
    }
    return chain.size() > suffix.size() && chain.ends_with(suffix) &&
           chain[chain.size() - suffix.size() - 1] == '.';
}

bool containsPrefixComponent(std::string_view chain, std::string_view prefix) {
    std::string leading = std::string(prefix) + ".";
    if (chain.starts_with(leading)) {
        return true;
    }
    std::string inner = "." + leading;
    return chain.find(inner) != std::string_view::npos;
}

}  // namespace

Registry::Registry(config::RegistryConfig config) : config_(std::move(config)) {
    allowedImports_.insert(config_.allowedImports.begin(), config_.allowedImports.end());
    forbiddenImports_.insert(config_.forbiddenImports.begin(),
                             config_.forbiddenImports.end());
    forbiddenAttributes_.insert(config_.forbiddenAttributes.begin(),
                                config_.forbiddenAttributes.end());
    builtins_.insert(config_.builtins.begin(), config_.builtins.end());

    for (const auto& handle : config_.libraryHandles) {
        handleAliases_.insert(handle.alias);
    }

    for (const auto& entry : config_.blacklistCalls) {
        std::string_view view(entry);
        if (view.ends_with(kPatternSuffix)) {
            callPatterns_.emplace_back(view.substr(0, view.size() - kPatternSuffix.size()));
        } else if (view.find('.') != std::string_view::npos) {
            dottedCalls_.push_back(entry);
        } else {
            undottedCalls_.insert(entry);
        }
    }

    for (const auto& name : allowedImports_) {
        if (forbiddenImports_.contains(name)) {
            spdlog::warn("Module '{}' is both allowed and forbidden; deny wins", name);
        }
    }
}

std::shared_ptr<const Registry> Registry::create(config::RegistryConfig config) {
    return std::make_shared<Registry>(std::move(config));
}

std::string_view Registry::rootModule(std::string_view dotted) noexcept {
    auto dot = dotted.find('.');
    return dot == std::string_view::npos ? dotted : dotted.substr(0, dot);
}

bool Registry::isImportAllowed(std::string_view root) const {
    return allowedImports_.contains(root) && !forbiddenImports_.contains(root);
}

bool Registry::isForbiddenImport(std::string_view root) const {
    return forbiddenImports_.contains(root);
}

std::optional<std::string> Registry::matchBlacklistedCall(
    std::string_view dottedName) const {
    if (dottedName.empty()) {
        return std::nullopt;
    }

    auto lastDot = dottedName.rfind('.');
    auto last = lastDot == std::string_view::npos ? dottedName
                                                  : dottedName.substr(lastDot + 1);
    if (auto it = undottedCalls_.find(last); it != undottedCalls_.end()) {
        return *it;
    }

    for (const auto& entry : dottedCalls_) {
        if (endsWithComponent(dottedName, entry)) {
            return entry;
        }
    }

    for (const auto& prefix : callPatterns_) {
        if (containsPrefixComponent(dottedName, prefix)) {
            return prefix + std::string(kPatternSuffix);
        }
    }

    return std::nullopt;
}

bool Registry::isForbiddenAttribute(std::string_view name) const {
    return forbiddenAttributes_.contains(name);
}

bool Registry::isForbiddenModuleReference(std::string_view name) const {
    auto first = name.find_first_not_of('_');
    if (first == std::string_view::npos) {
        return false;
    }
    return forbiddenImports_.contains(name.substr(first));
}

bool Registry::isBuiltin(std::string_view name) const {
    return builtins_.contains(name);
}

bool Registry::isHandleAlias(std::string_view name) const {
    return handleAliases_.contains(name);
}

bool Registry::isBlacklistedName(std::string_view name) const {
    if (undottedCalls_.contains(name)) {
        return true;
    }
    for (const auto& prefix : callPatterns_) {
        if (prefix == name) {
            return true;
        }
    }
    return false;
}

}  // namespace warden::sandbox
