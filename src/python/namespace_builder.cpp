/*
 * namespace_builder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "namespace_builder.hpp"
#include "json_bridge.hpp"

#include <spdlog/spdlog.h>

namespace warden::python {

bool isDunder(std::string_view name) noexcept {
    return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
}

RestrictedNamespaceBuilder::RestrictedNamespaceBuilder(
    std::shared_ptr<const sandbox::Registry> registry)
    : registry_(std::move(registry)) {}

bool RestrictedNamespaceBuilder::isReservedName(std::string_view name) const {
    return name.starts_with("__") || registry_->isBuiltin(name) ||
           registry_->isHandleAlias(name) || registry_->isBlacklistedName(name);
}

py::dict RestrictedNamespaceBuilder::buildBuiltins() const {
    auto builtinsModule = py::module_::import("builtins");
    py::dict builtins;

    for (const auto& name : registry_->builtins()) {
        if (name == "__import__") {
            continue;
        }
        if (!py::hasattr(builtinsModule, name.c_str())) {
            spdlog::warn("Builtin '{}' does not exist in this interpreter", name);
            continue;
        }
        builtins[py::str(name)] = builtinsModule.attr(name.c_str());
    }

    py::object realImport = builtinsModule.attr("__import__");
    auto registry = registry_;
    builtins["__import__"] = py::cpp_function(
        [realImport, registry](const std::string& name, py::object globals,
                               py::object locals, py::object fromlist,
                               int level) -> py::object {
            if (level != 0) {
                throw py::import_error("relative imports are not allowed");
            }
            auto root = sandbox::Registry::rootModule(name);
            if (!registry->isImportAllowed(root)) {
                throw py::import_error("import of '" + name + "' is not allowed");
            }
            return realImport(name, globals, locals, fromlist, level);
        },
        py::arg("name"), py::arg("globals") = py::none(),
        py::arg("locals") = py::none(), py::arg("fromlist") = py::tuple(),
        py::arg("level") = 0);

    return builtins;
}

NamespaceBuild RestrictedNamespaceBuilder::build(const nlohmann::json& globals,
                                                 const nlohmann::json& locals) const {
    NamespaceBuild result;
    py::dict ns;

    ns["__builtins__"] = buildBuiltins();
    ns["__name__"] = py::str("__sandbox__");

    for (const auto& handle : registry_->libraryHandles()) {
        try {
            ns[py::str(handle.alias)] = py::module_::import(handle.module.c_str());
        } catch (const py::error_already_set& e) {
            spdlog::warn("Library '{}' unavailable, '{}' not provided: {}",
                         handle.module, handle.alias, e.what());
            result.missingLibraries.push_back(handle.module);
        }
    }

    merge(ns, globals, "globals", result.dropped);
    result.baseline = py::dict(ns);
    merge(ns, locals, "locals", result.dropped);

    result.globals = std::move(ns);
    return result;
}

void RestrictedNamespaceBuilder::merge(py::dict& ns, const nlohmann::json& values,
                                       std::string_view source,
                                       std::vector<std::string>& dropped) const {
    if (!values.is_object()) {
        return;
    }
    for (const auto& [key, value] : values.items()) {
        if (isReservedName(key)) {
            spdlog::warn("Dropping injected {} key '{}': restricted name", source, key);
            dropped.push_back(key);
            continue;
        }
        ns[py::str(key)] = toPython(value);
    }
}

}  // namespace warden::python
