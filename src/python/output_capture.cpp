/*
 * output_capture.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "output_capture.hpp"
#include "json_bridge.hpp"
#include "namespace_builder.hpp"

#include <format>

#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

PYBIND11_EMBEDDED_MODULE(_warden_io, m) {
    using warden::python::CaptureStream;
    namespace py = pybind11;

    m.doc() = "Capture streams for sandboxed execution";

    py::class_<CaptureStream, std::shared_ptr<CaptureStream>>(m, "CaptureStream")
        .def("write", &CaptureStream::write, py::arg("text"))
        .def("flush", &CaptureStream::flush)
        .def("isatty", &CaptureStream::isatty)
        .def("writable", &CaptureStream::writable)
        .def_property_readonly("encoding",
                               [](const CaptureStream&) { return "utf-8"; });
}

namespace warden::python {

// ============================================================================
// CaptureStream
// ============================================================================

CaptureStream::CaptureStream(size_t capacity, OutputSink sink)
    : buffer_(capacity), sink_(std::move(sink)) {}

py::int_ CaptureStream::write(const py::object& text) {
    if (!py::isinstance<py::str>(text)) {
        throw py::type_error("write() argument must be str, not " + typeName(text));
    }

    py::bytes encoded = text.attr("encode")("utf-8", "replace");
    writeText(static_cast<std::string_view>(encoded));
    return py::int_(py::len(text));
}

void CaptureStream::writeText(std::string_view text) {
    auto appended = buffer_.append(text);
    if (sink_ && (!appended.accepted.empty() || appended.truncatedNow)) {
        sink_(appended.accepted, appended.truncatedNow);
    }
}

// ============================================================================
// StreamRedirect
// ============================================================================

StreamRedirect::StreamRedirect(py::object out, py::object err)
    : sys_(py::module_::import("sys")),
      savedOut_(sys_.attr("stdout")),
      savedErr_(sys_.attr("stderr")) {
    sys_.attr("stdout") = std::move(out);
    sys_.attr("stderr") = std::move(err);
}

StreamRedirect::~StreamRedirect() {
    try {
        sys_.attr("stdout") = savedOut_;
        sys_.attr("stderr") = savedErr_;
    } catch (const py::error_already_set& e) {
        spdlog::error("Failed to restore sys.stdout/sys.stderr: {}", e.what());
    }
}

py::object makePythonStream(const std::shared_ptr<CaptureStream>& stream) {
    // Importing registers the class with pybind11
    py::module_::import("_warden_io");
    return py::cast(stream);
}

// ============================================================================
// Locals snapshot
// ============================================================================

nlohmann::json snapshotLocals(const py::dict& ns, const py::dict& baseline,
                              size_t budgetBytes) {
    auto snapshot = nlohmann::json::object();
    size_t used = 0;
    auto moduleType = py::module_::import("types").attr("ModuleType");

    for (auto item : ns) {
        if (!py::isinstance<py::str>(item.first)) {
            continue;
        }
        auto name = item.first.cast<std::string>();
        if (isDunder(name)) {
            continue;
        }
        if (py::isinstance(item.second, moduleType)) {
            continue;
        }
        if (baseline.contains(item.first)) {
            py::object before = baseline[item.first];
            if (before.ptr() == item.second.ptr()) {
                continue;
            }
        }

        auto value = toJson(item.second);
        if (!value) {
            snapshot[name] = "<unserializable: " + typeName(item.second) + ">";
            continue;
        }

        size_t size = value->dump().size() + name.size();
        if (used + size > budgetBytes) {
            spdlog::warn("Local '{}' ({} bytes) exceeds the snapshot budget", name, size);
            snapshot[name] = std::format("<too large: {}, {} bytes>",
                                         typeName(item.second), size);
            continue;
        }
        used += size;
        snapshot[name] = std::move(*value);
    }
    return snapshot;
}

}  // namespace warden::python
