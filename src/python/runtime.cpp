/*
 * runtime.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "runtime.hpp"

#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

#include <format>

namespace py = pybind11;

namespace warden::python {

PythonRuntime& PythonRuntime::instance() {
    static PythonRuntime runtime;
    return runtime;
}

bool PythonRuntime::ensureInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || Py_IsInitialized()) {
        return true;
    }
    if (failed_) {
        return false;
    }

    try {
        py::initialize_interpreter(false);
    } catch (const std::exception& e) {
        spdlog::error("Failed to start embedded Python: {}", e.what());
        failed_ = true;
        return false;
    }

    // Hand the GIL back; every user acquires it explicitly
    PyEval_SaveThread();
    started_ = true;
    spdlog::info("Embedded Python {} initialized", pythonVersion());
    return true;
}

bool PythonRuntime::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ || Py_IsInitialized();
}

std::string PythonRuntime::pythonVersion() {
    return std::format("{}.{}.{}", PY_MAJOR_VERSION, PY_MINOR_VERSION,
                       PY_MICRO_VERSION);
}

}  // namespace warden::python
