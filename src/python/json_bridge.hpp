/*
 * json_bridge.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_PYTHON_JSON_BRIDGE_HPP
#define WARDEN_PYTHON_JSON_BRIDGE_HPP

#include <nlohmann/json.hpp>
#include <pybind11/pybind11.h>

#include <optional>
#include <string>

namespace warden::python {

namespace py = pybind11;

// All functions require the GIL.

/**
 * @brief Convert JSON to the equivalent Python object (dict, list, str, ...)
 */
[[nodiscard]] py::object toPython(const nlohmann::json& value);

/**
 * @brief Convert a Python object through json.dumps(allow_nan=False)
 * @return nullopt if the value is not JSON-serializable
 */
[[nodiscard]] std::optional<nlohmann::json> toJson(py::handle value);

/**
 * @brief type(value).__name__
 */
[[nodiscard]] std::string typeName(py::handle value);

}  // namespace warden::python

#endif  // WARDEN_PYTHON_JSON_BRIDGE_HPP
