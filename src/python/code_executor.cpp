/*
 * code_executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "code_executor.hpp"
#include "json_bridge.hpp"
#include "namespace_builder.hpp"

#include <pybind11/pybind11.h>
#include <spdlog/spdlog.h>

namespace warden::python {

namespace {

isolated::ExceptionInfo describe(const py::error_already_set& e) {
    isolated::ExceptionInfo info;

    try {
        info.type = py::str(e.type().attr("__name__")).cast<std::string>();
    } catch (const py::error_already_set&) {
        info.type = "Exception";
    }

    try {
        info.message = py::str(e.value()).cast<std::string>();
    } catch (const py::error_already_set&) {
        info.message = "<exception str() failed>";
    }

    // Formatting can itself fail, e.g. while memory is exhausted
    try {
        auto traceback = py::module_::import("traceback");
        py::list lines = traceback.attr("format_exception")(e.type(), e.value(), e.trace());
        std::string text;
        for (auto line : lines) {
            text += line.cast<std::string>();
        }
        info.traceback = std::move(text);
    } catch (const py::error_already_set&) {
        info.traceback = info.type + ": " + info.message + "\n";
    }

    return info;
}

}  // namespace

CodeExecutor::CodeExecutor(std::shared_ptr<const sandbox::Registry> registry)
    : registry_(std::move(registry)) {}

CodeExecution CodeExecutor::run(std::string_view code, const nlohmann::json& globals,
                                const nlohmann::json& locals,
                                const ExecutorOptions& options) const {
    CodeExecution out;

    auto stdoutStream =
        std::make_shared<CaptureStream>(options.outputLimitBytes, options.stdoutSink);
    auto stderrStream =
        std::make_shared<CaptureStream>(options.outputLimitBytes, options.stderrSink);

    py::gil_scoped_acquire gil;

    try {
        RestrictedNamespaceBuilder builder(registry_);
        auto ns = builder.build(globals, locals);
        out.droppedNames = ns.dropped;
        out.missingLibraries = ns.missingLibraries;

        auto builtins = py::module_::import("builtins");
        py::object pyOut = makePythonStream(stdoutStream);
        py::object pyErr = makePythonStream(stderrStream);

        if (options.onStart) {
            options.onStart(PyThread_get_thread_ident());
        }

        try {
            StreamRedirect redirect(pyOut, pyErr);
            py::object compiled = builtins.attr("compile")(
                py::str(code.data(), code.size()), kFilename, "exec",
                py::arg("dont_inherit") = true);
            builtins.attr("exec")(compiled, ns.globals);
            out.success = true;
        } catch (const py::error_already_set& e) {
            out.memoryError = e.matches(PyExc_MemoryError);
            out.exception = describe(e);
            stderrStream->writeText(out.exception->traceback);
        }

        if (out.success && options.captureLocals) {
            out.locals = snapshotLocals(ns.globals, ns.baseline);
        }
    } catch (const py::error_already_set& e) {
        // Raised outside user code: namespace setup, or an asynchronous
        // exception delivered after exec returned
        spdlog::warn("Python error outside user code: {}", e.what());
        out.success = false;
        out.locals.reset();
        out.memoryError = e.matches(PyExc_MemoryError);
        out.exception = describe(e);
        stderrStream->writeText(out.exception->traceback);
    }

    out.stdoutTruncated = stdoutStream->buffer().truncated();
    out.stderrTruncated = stderrStream->buffer().truncated();
    out.stdoutText = stdoutStream->buffer().take();
    out.stderrText = stderrStream->buffer().take();
    return out;
}

}  // namespace warden::python
