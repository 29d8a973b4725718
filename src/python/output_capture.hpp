/*
 * output_capture.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file output_capture.hpp
 * @brief Bounded stdout/stderr capture and locals snapshot
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_PYTHON_OUTPUT_CAPTURE_HPP
#define WARDEN_PYTHON_OUTPUT_CAPTURE_HPP

#include <nlohmann/json.hpp>
#include <pybind11/pybind11.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>

#include "bounded_buffer.hpp"

namespace warden::python {

namespace py = pybind11;

/**
 * @brief Receives every accepted slice of captured text
 */
using OutputSink = std::function<void(std::string_view data, bool truncatedNow)>;

/**
 * @brief Python-visible text stream backed by a BoundedBuffer
 *
 * Exposed to Python as `_warden_io.CaptureStream` with `write`, `flush`,
 * `isatty`, `writable` and `encoding`.
 */
class CaptureStream {
public:
    explicit CaptureStream(size_t capacity = BoundedBuffer::kDefaultCapacity,
                           OutputSink sink = {});

    /**
     * @brief Write a str; returns the number of characters written
     *
     * Text is encoded as UTF-8 with unencodable characters replaced.
     */
    py::int_ write(const py::object& text);

    /**
     * @brief Append raw UTF-8 from C++
     */
    void writeText(std::string_view text);

    void flush() {}
    [[nodiscard]] bool isatty() const noexcept { return false; }
    [[nodiscard]] bool writable() const noexcept { return true; }

    [[nodiscard]] BoundedBuffer& buffer() noexcept { return buffer_; }
    [[nodiscard]] const BoundedBuffer& buffer() const noexcept { return buffer_; }

private:
    BoundedBuffer buffer_;
    OutputSink sink_;
};

/**
 * @brief RAII swap of sys.stdout and sys.stderr (GIL required for the
 * whole lifetime)
 */
class StreamRedirect {
public:
    StreamRedirect(py::object out, py::object err);
    ~StreamRedirect();

    StreamRedirect(const StreamRedirect&) = delete;
    StreamRedirect& operator=(const StreamRedirect&) = delete;

private:
    py::module_ sys_;
    py::object savedOut_;
    py::object savedErr_;
};

/**
 * @brief Wrap a CaptureStream as a Python object
 */
[[nodiscard]] py::object makePythonStream(const std::shared_ptr<CaptureStream>& stream);

/// Serialized size allowed for a whole locals snapshot
inline constexpr size_t kLocalsBudgetBytes = 16 * 1024 * 1024;

/**
 * @brief Serializable view of the names user code created or rebound
 *
 * Dunder names and modules are skipped. A value json.dumps rejects is
 * recorded as "<unserializable: TypeName>"; a value that would push the
 * snapshot past budgetBytes is recorded as "<too large: TypeName, N bytes>".
 * GIL required.
 *
 * @param ns Namespace after execution
 * @param baseline Namespace copy taken before execution
 * @param budgetBytes Upper bound on the serialized snapshot
 */
[[nodiscard]] nlohmann::json snapshotLocals(const py::dict& ns, const py::dict& baseline,
                                            size_t budgetBytes = kLocalsBudgetBytes);

}  // namespace warden::python

#endif  // WARDEN_PYTHON_OUTPUT_CAPTURE_HPP
