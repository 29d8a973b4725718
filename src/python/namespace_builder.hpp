/*
 * namespace_builder.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file namespace_builder.hpp
 * @brief Capability-restricted execution namespace
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_PYTHON_NAMESPACE_BUILDER_HPP
#define WARDEN_PYTHON_NAMESPACE_BUILDER_HPP

#include <nlohmann/json.hpp>
#include <pybind11/pybind11.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../sandbox/registry.hpp"

namespace warden::python {

namespace py = pybind11;

/**
 * @brief A freshly built namespace and what was left out of it
 */
struct NamespaceBuild {
    py::dict globals;     ///< The namespace user code runs in
    py::dict baseline;    ///< Copy taken before caller locals were merged
    std::vector<std::string> dropped;           ///< Rejected injected keys
    std::vector<std::string> missingLibraries;  ///< Handles that failed to import
};

/**
 * @brief Builds the execution namespace from the registry
 *
 * The namespace starts empty. `__builtins__` is a new dict holding only the
 * curated builtins plus a guarded `__import__` that resolves whitelisted
 * root modules and raises ImportError for anything else, relative imports
 * included. Library handles are imported next; caller globals and then
 * caller locals are merged last, and no injected key may shadow a
 * restricted name.
 */
class RestrictedNamespaceBuilder {
public:
    explicit RestrictedNamespaceBuilder(std::shared_ptr<const sandbox::Registry> registry);

    /**
     * @brief Build a namespace (GIL required)
     */
    [[nodiscard]] NamespaceBuild build(const nlohmann::json& globals,
                                       const nlohmann::json& locals) const;

    /**
     * @brief The curated builtins dict with the guarded importer
     */
    [[nodiscard]] py::dict buildBuiltins() const;

    /**
     * @brief An injected key with this name would be dropped
     */
    [[nodiscard]] bool isReservedName(std::string_view name) const;

private:
    void merge(py::dict& ns, const nlohmann::json& values, std::string_view source,
               std::vector<std::string>& dropped) const;

    std::shared_ptr<const sandbox::Registry> registry_;
};

/**
 * @brief `__name__`-style identifier check
 */
[[nodiscard]] bool isDunder(std::string_view name) noexcept;

}  // namespace warden::python

#endif  // WARDEN_PYTHON_NAMESPACE_BUILDER_HPP
