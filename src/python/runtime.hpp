/*
 * runtime.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_PYTHON_RUNTIME_HPP
#define WARDEN_PYTHON_RUNTIME_HPP

#include <mutex>
#include <string>

namespace warden::python {

/**
 * @brief Process-wide embedded interpreter for the host
 *
 * Started on first use with Python's own signal handlers disabled, after
 * which the GIL is released so any thread can take it with
 * py::gil_scoped_acquire. The interpreter is never finalized: extension
 * modules such as numpy do not survive re-initialization.
 *
 * If an interpreter is already running (the worker's scoped_interpreter, a
 * test main) it is used as is.
 */
class PythonRuntime {
public:
    static PythonRuntime& instance();

    /**
     * @brief Start the interpreter if needed
     * @return False if the interpreter could not be started
     */
    [[nodiscard]] bool ensureInitialized();

    [[nodiscard]] bool isInitialized() const;

    /**
     * @brief "major.minor.micro" of the embedded interpreter
     */
    [[nodiscard]] static std::string pythonVersion();

    PythonRuntime(const PythonRuntime&) = delete;
    PythonRuntime& operator=(const PythonRuntime&) = delete;

private:
    PythonRuntime() = default;

    mutable std::mutex mutex_;
    bool started_{false};
    bool failed_{false};
};

}  // namespace warden::python

#endif  // WARDEN_PYTHON_RUNTIME_HPP
