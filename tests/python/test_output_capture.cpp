/*
 * test_output_capture.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_output_capture.cpp
 * @brief Tests for stdout/stderr capture and locals snapshots
 */

#include <gtest/gtest.h>
#include "python/output_capture.hpp"
#include "python/runtime.hpp"

#include <pybind11/embed.h>

#include <string>
#include <vector>

using namespace warden::python;
namespace py = pybind11;
using namespace py::literals;

class OutputCaptureTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ASSERT_TRUE(PythonRuntime::instance().ensureInitialized());
    }
};

TEST_F(OutputCaptureTest, WriteTextIsForwardedToSink) {
    std::vector<std::pair<std::string, bool>> chunks;
    CaptureStream stream(8, [&](std::string_view data, bool truncatedNow) {
        chunks.emplace_back(std::string(data), truncatedNow);
    });

    stream.writeText("abc");
    stream.writeText("defghij");
    stream.writeText("ignored");

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].first, "abc");
    EXPECT_FALSE(chunks[0].second);
    EXPECT_EQ(chunks[1].first, "defgh");
    EXPECT_TRUE(chunks[1].second);
    EXPECT_TRUE(stream.buffer().truncated());
}

TEST_F(OutputCaptureTest, RedirectCapturesPrint) {
    py::gil_scoped_acquire gil;
    auto out = std::make_shared<CaptureStream>();
    auto err = std::make_shared<CaptureStream>();
    auto sys = py::module_::import("sys");
    py::object originalOut = sys.attr("stdout");
    {
        StreamRedirect redirect(makePythonStream(out), makePythonStream(err));
        py::exec("print('to stdout')\nimport sys\nprint('to stderr', file=sys.stderr)");
    }
    EXPECT_EQ(out->buffer().str(), "to stdout\n");
    EXPECT_EQ(err->buffer().str(), "to stderr\n");
    EXPECT_TRUE(sys.attr("stdout").is(originalOut));
}

TEST_F(OutputCaptureTest, WriteReturnsCharacterCount) {
    py::gil_scoped_acquire gil;
    auto out = std::make_shared<CaptureStream>();
    py::object stream = makePythonStream(out);
    auto written = stream.attr("write")("héllo").cast<int>();
    EXPECT_EQ(written, 5);
    EXPECT_EQ(out->buffer().str(), "h\xC3\xA9llo");
}

TEST_F(OutputCaptureTest, WriteRejectsNonString) {
    py::gil_scoped_acquire gil;
    auto out = std::make_shared<CaptureStream>();
    py::object stream = makePythonStream(out);
    try {
        stream.attr("write")(42);
        FAIL() << "write(42) was accepted";
    } catch (const py::error_already_set& e) {
        EXPECT_TRUE(e.matches(PyExc_TypeError));
    }
}

TEST_F(OutputCaptureTest, StreamLooksLikeATextFile) {
    py::gil_scoped_acquire gil;
    py::object stream = makePythonStream(std::make_shared<CaptureStream>());
    EXPECT_FALSE(stream.attr("isatty")().cast<bool>());
    EXPECT_TRUE(stream.attr("writable")().cast<bool>());
    EXPECT_EQ(stream.attr("encoding").cast<std::string>(), "utf-8");
    EXPECT_NO_THROW(stream.attr("flush")());
}

// =============================================================================
// Locals Snapshot
// =============================================================================

class SnapshotLocalsTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ASSERT_TRUE(PythonRuntime::instance().ensureInitialized());
    }
};

TEST_F(SnapshotLocalsTest, NewNamesOnly) {
    py::gil_scoped_acquire gil;
    py::dict ns;
    ns["injected"] = py::int_(1);
    ns["__name__"] = py::str("__sandbox__");
    py::dict baseline(ns);

    py::exec("x = 2\ny = [1, 'a']\nimport math", ns);
    auto snapshot = snapshotLocals(ns, baseline);

    EXPECT_EQ(snapshot["x"], 2);
    EXPECT_EQ(snapshot["y"], nlohmann::json::array({1, "a"}));
    EXPECT_FALSE(snapshot.contains("injected"));
    EXPECT_FALSE(snapshot.contains("__name__"));
    EXPECT_FALSE(snapshot.contains("__builtins__"));
    EXPECT_FALSE(snapshot.contains("math"));
}

TEST_F(SnapshotLocalsTest, RebindingAnInjectedNameIsReported) {
    py::gil_scoped_acquire gil;
    py::dict ns;
    ns["counter"] = py::int_(1);
    py::dict baseline(ns);

    py::exec("counter = counter + 41", ns);
    auto snapshot = snapshotLocals(ns, baseline);
    EXPECT_EQ(snapshot["counter"], 42);
}

TEST_F(SnapshotLocalsTest, UnserializableValues) {
    py::gil_scoped_acquire gil;
    py::dict ns;
    py::dict baseline;

    py::exec("def helper():\n    return 1\ns = {1, 2}\nnan = float('nan')", ns);
    auto snapshot = snapshotLocals(ns, baseline);

    EXPECT_EQ(snapshot["helper"], "<unserializable: function>");
    EXPECT_EQ(snapshot["s"], "<unserializable: set>");
    EXPECT_EQ(snapshot["nan"], "<unserializable: float>");
}

TEST_F(SnapshotLocalsTest, OversizedValuesAreReplaced) {
    py::gil_scoped_acquire gil;
    py::dict ns;
    py::dict baseline;

    py::exec("small = 1\nbig = 'a' * 1000\nafter = [1, 2]", ns);
    auto snapshot = snapshotLocals(ns, baseline, 100);

    EXPECT_EQ(snapshot["small"], 1);
    ASSERT_TRUE(snapshot["big"].is_string());
    EXPECT_EQ(snapshot["big"].get<std::string>().rfind("<too large: str, ", 0), 0u);
    EXPECT_EQ(snapshot["after"], nlohmann::json::array({1, 2}));
}
