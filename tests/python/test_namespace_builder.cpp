/*
 * test_namespace_builder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_namespace_builder.cpp
 * @brief Tests for the restricted execution namespace
 */

#include <gtest/gtest.h>
#include "python/namespace_builder.hpp"
#include "python/runtime.hpp"

#include <pybind11/embed.h>

#include <algorithm>

using namespace warden::python;
namespace py = pybind11;

class NamespaceBuilderTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ASSERT_TRUE(PythonRuntime::instance().ensureInitialized());
    }

    void SetUp() override {
        warden::config::RegistryConfig config;
        config.libraryHandles = {{"m", "math"}, {"missing", "no_such_module_xyz"}};
        registry_ = warden::sandbox::Registry::create(config);
    }

    static bool contains(const std::vector<std::string>& list, const std::string& name) {
        return std::find(list.begin(), list.end(), name) != list.end();
    }

    std::shared_ptr<const warden::sandbox::Registry> registry_;
};

TEST_F(NamespaceBuilderTest, IsDunder) {
    EXPECT_TRUE(isDunder("__import__"));
    EXPECT_FALSE(isDunder("__"));
    EXPECT_FALSE(isDunder("____"));
    EXPECT_FALSE(isDunder("_private"));
    EXPECT_FALSE(isDunder("__half"));
}

TEST_F(NamespaceBuilderTest, ReservedNames) {
    RestrictedNamespaceBuilder builder(registry_);
    EXPECT_TRUE(builder.isReservedName("print"));
    EXPECT_TRUE(builder.isReservedName("m"));
    EXPECT_TRUE(builder.isReservedName("eval"));
    EXPECT_TRUE(builder.isReservedName("__builtins__"));
    EXPECT_FALSE(builder.isReservedName("price"));
}

TEST_F(NamespaceBuilderTest, BuiltinsAreAllowListed) {
    py::gil_scoped_acquire gil;
    RestrictedNamespaceBuilder builder(registry_);
    auto builtins = builder.buildBuiltins();

    EXPECT_TRUE(builtins.contains("print"));
    EXPECT_TRUE(builtins.contains("len"));
    EXPECT_TRUE(builtins.contains("__import__"));
    EXPECT_FALSE(builtins.contains("open"));
    EXPECT_FALSE(builtins.contains("eval"));
    EXPECT_FALSE(builtins.contains("exec"));
    EXPECT_FALSE(builtins.contains("compile"));
    EXPECT_FALSE(builtins.contains("globals"));
}

TEST_F(NamespaceBuilderTest, ImportHookEnforcesAllowList) {
    py::gil_scoped_acquire gil;
    RestrictedNamespaceBuilder builder(registry_);
    auto builtins = builder.buildBuiltins();
    py::object hook = builtins["__import__"];

    EXPECT_NO_THROW(hook("math"));
    EXPECT_NO_THROW(hook("collections.abc"));
    try {
        hook("os");
        FAIL() << "import of os was allowed";
    } catch (const py::error_already_set& e) {
        EXPECT_TRUE(e.matches(PyExc_ImportError));
    }
}

TEST_F(NamespaceBuilderTest, LibraryHandlesAndMissingLibraries) {
    py::gil_scoped_acquire gil;
    RestrictedNamespaceBuilder builder(registry_);
    auto ns = builder.build(nlohmann::json::object(), nlohmann::json::object());

    EXPECT_TRUE(ns.globals.contains("m"));
    EXPECT_FALSE(ns.globals.contains("missing"));
    EXPECT_TRUE(contains(ns.missingLibraries, "no_such_module_xyz"));
    EXPECT_EQ(py::str(ns.globals["__name__"]).cast<std::string>(), "__sandbox__");
}

TEST_F(NamespaceBuilderTest, InjectedValuesAreConverted) {
    py::gil_scoped_acquire gil;
    RestrictedNamespaceBuilder builder(registry_);
    auto ns = builder.build({{"prices", {1.5, 2.5}}, {"symbol", "AAPL"}},
                            {{"count", 3}});

    EXPECT_EQ(py::len(ns.globals["prices"]), 2u);
    EXPECT_EQ(ns.globals["symbol"].cast<std::string>(), "AAPL");
    EXPECT_EQ(ns.globals["count"].cast<int>(), 3);
    EXPECT_TRUE(ns.baseline.contains("symbol"));
    EXPECT_FALSE(ns.baseline.contains("count"));
}

TEST_F(NamespaceBuilderTest, RestrictedNamesWin) {
    py::gil_scoped_acquire gil;
    RestrictedNamespaceBuilder builder(registry_);
    auto ns = builder.build({{"print", 1}, {"__builtins__", {}}, {"m", "x"}},
                            {{"eval", "x"}, {"ok", true}});

    EXPECT_TRUE(contains(ns.dropped, "print"));
    EXPECT_TRUE(contains(ns.dropped, "__builtins__"));
    EXPECT_TRUE(contains(ns.dropped, "m"));
    EXPECT_TRUE(contains(ns.dropped, "eval"));
    EXPECT_FALSE(contains(ns.dropped, "ok"));

    EXPECT_TRUE(py::isinstance<py::dict>(ns.globals["__builtins__"]));
    EXPECT_FALSE(py::isinstance<py::str>(ns.globals["m"]));
}
