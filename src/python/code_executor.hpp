/*
 * code_executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file code_executor.hpp
 * @brief Compile and run user code inside the restricted namespace
 * @date 2024
 * @version 1.0.0
 *
 * Shared by the worker process and the in-process thread boundary, so both
 * isolation modes build the namespace, capture output and report
 * exceptions identically.
 */

#ifndef WARDEN_PYTHON_CODE_EXECUTOR_HPP
#define WARDEN_PYTHON_CODE_EXECUTOR_HPP

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../isolated/types.hpp"
#include "../sandbox/registry.hpp"
#include "output_capture.hpp"

namespace warden::python {

/**
 * @brief Result of one compile + exec
 */
struct CodeExecution {
    bool success{false};
    std::optional<isolated::ExceptionInfo> exception;
    bool memoryError{false};  ///< The exception was a MemoryError
    std::string stdoutText;
    std::string stderrText;
    bool stdoutTruncated{false};
    bool stderrTruncated{false};
    std::optional<nlohmann::json> locals;  ///< Only on success when requested
    std::vector<std::string> droppedNames;
    std::vector<std::string> missingLibraries;
};

/**
 * @brief Per-run options
 */
struct ExecutorOptions {
    size_t outputLimitBytes{BoundedBuffer::kDefaultCapacity};
    bool captureLocals{false};
    OutputSink stdoutSink;  ///< Optional live forwarding
    OutputSink stderrSink;
    /// Called with the Python thread id just before user code starts
    std::function<void(unsigned long)> onStart;
};

/**
 * @brief Runs user code in a fresh restricted namespace
 */
class CodeExecutor {
public:
    explicit CodeExecutor(std::shared_ptr<const sandbox::Registry> registry);

    /**
     * @brief Execute code; acquires the GIL for the duration
     *
     * Python exceptions raised by the code are returned in the result,
     * never thrown. The traceback is also written to the captured stderr.
     */
    [[nodiscard]] CodeExecution run(std::string_view code,
                                    const nlohmann::json& globals,
                                    const nlohmann::json& locals,
                                    const ExecutorOptions& options) const;

    /**
     * @brief Filename used for compiled user code in tracebacks
     */
    static constexpr const char* kFilename = "<sandbox>";

private:
    std::shared_ptr<const sandbox::Registry> registry_;
};

}  // namespace warden::python

#endif  // WARDEN_PYTHON_CODE_EXECUTOR_HPP
