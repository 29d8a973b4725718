/*
 * json_bridge.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "json_bridge.hpp"

#include <spdlog/spdlog.h>

namespace warden::python {

py::object toPython(const nlohmann::json& value) {
    auto json = py::module_::import("json");
    return json.attr("loads")(value.dump(-1, ' ', false,
                                         nlohmann::json::error_handler_t::replace));
}

std::optional<nlohmann::json> toJson(py::handle value) {
    std::string text;
    try {
        auto json = py::module_::import("json");
        text = json.attr("dumps")(value, py::arg("allow_nan") = false)
                   .cast<std::string>();
    } catch (const py::error_already_set& e) {
        spdlog::debug("Value of type {} is not JSON-serializable: {}",
                      typeName(value), e.what());
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("json.dumps output rejected: {}", e.what());
        return std::nullopt;
    }
}

std::string typeName(py::handle value) {
    try {
        return py::str(py::type::handle_of(value).attr("__name__")).cast<std::string>();
    } catch (const py::error_already_set&) {
        return "object";
    }
}

}  // namespace warden::python
