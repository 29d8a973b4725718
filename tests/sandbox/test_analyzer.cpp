/*
 * test_analyzer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_analyzer.cpp
 * @brief Tests for AST-based static analysis
 */

#include <gtest/gtest.h>
#include "python/runtime.hpp"
#include "sandbox/analyzer.hpp"

#include <string>

using namespace warden::sandbox;

class StaticAnalyzerTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ASSERT_TRUE(warden::python::PythonRuntime::instance().ensureInitialized());
    }

    void SetUp() override {
        registry_ = Registry::create();
        analyzer_ = std::make_unique<StaticAnalyzer>(registry_,
                                                     warden::config::AnalyzerConfig{});
    }

    static bool hasIssue(const ValidationResult& result, std::string_view code) {
        for (const auto& issue : result.issues) {
            if (issue.code == code) {
                return true;
            }
        }
        return false;
    }

    static std::string nestedIfs(int depth) {
        std::string code;
        for (int i = 0; i < depth; ++i) {
            code += std::string(static_cast<size_t>(i) * 4, ' ') + "if True:\n";
        }
        code += std::string(static_cast<size_t>(depth) * 4, ' ') + "pass\n";
        return code;
    }

    std::shared_ptr<const Registry> registry_;
    std::unique_ptr<StaticAnalyzer> analyzer_;
};

// ============================================================================
// Safe code
// ============================================================================

TEST_F(StaticAnalyzerTest, SafeCode) {
    auto result = analyzer_->analyze("x = 1\nprint(x)\n");
    EXPECT_EQ(result.status, ValidationStatus::Safe);
    EXPECT_TRUE(result.isSafe);
    EXPECT_FALSE(result.syntaxError);
    EXPECT_TRUE(result.issues.empty());
    EXPECT_EQ(result.complexity.linesOfCode, 2);
    EXPECT_EQ(result.complexity.cyclomaticComplexity, 1);
    EXPECT_EQ(result.complexity.nestingDepth, 0);
}

TEST_F(StaticAnalyzerTest, AllowedImportsRecordRoot) {
    auto result = analyzer_->analyze("import numpy.linalg\nfrom math import sqrt\n");
    EXPECT_TRUE(result.isSafe);
    EXPECT_TRUE(result.imports.contains("numpy"));
    EXPECT_TRUE(result.imports.contains("math"));
    EXPECT_TRUE(result.forbiddenImports.empty());
}

// ============================================================================
// Imports
// ============================================================================

TEST_F(StaticAnalyzerTest, ForbiddenImport) {
    auto result = analyzer_->analyze("import os\n");
    EXPECT_EQ(result.status, ValidationStatus::Dangerous);
    EXPECT_FALSE(result.isSafe);
    EXPECT_TRUE(result.forbiddenImports.contains("os"));
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].code, issue_code::kForbiddenImport);
    EXPECT_EQ(result.issues[0].severity, Severity::Critical);
    EXPECT_EQ(result.issues[0].line, 1);
    EXPECT_EQ(result.issues[0].column, 0);
}

TEST_F(StaticAnalyzerTest, FromImportOfSubmodule) {
    auto result = analyzer_->analyze("from os.path import join\n");
    EXPECT_FALSE(result.isSafe);
    EXPECT_TRUE(result.forbiddenImports.contains("os"));
}

TEST_F(StaticAnalyzerTest, NotWhitelistedImport) {
    auto result = analyzer_->analyze("import json\n");
    EXPECT_FALSE(result.isSafe);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].severity, Severity::High);
}

TEST_F(StaticAnalyzerTest, MultipleNamesInOneImport) {
    auto result = analyzer_->analyze("import math, socket\n");
    EXPECT_TRUE(result.imports.contains("math"));
    EXPECT_TRUE(result.imports.contains("socket"));
    EXPECT_EQ(result.forbiddenImports, std::set<std::string>{"socket"});
}

TEST_F(StaticAnalyzerTest, RelativeImport) {
    auto result = analyzer_->analyze("from . import helpers\n");
    EXPECT_FALSE(result.isSafe);
    EXPECT_TRUE(hasIssue(result, issue_code::kRelativeImport));
}

// ============================================================================
// Calls and attributes
// ============================================================================

TEST_F(StaticAnalyzerTest, DottedForbiddenCall) {
    auto result = analyzer_->analyze("os.system('ls')\n");
    EXPECT_EQ(result.status, ValidationStatus::Dangerous);
    EXPECT_TRUE(result.dangerousCalls.contains("os.system"));
    EXPECT_TRUE(hasIssue(result, issue_code::kForbiddenCall));
}

TEST_F(StaticAnalyzerTest, BuiltinForbiddenCalls) {
    auto result = analyzer_->analyze("eval('1')\nexec('x=1')\n");
    EXPECT_TRUE(result.dangerousCalls.contains("eval"));
    EXPECT_TRUE(result.dangerousCalls.contains("exec"));
    EXPECT_FALSE(result.isSafe);
}

TEST_F(StaticAnalyzerTest, PatternForbiddenCall) {
    auto result = analyzer_->analyze("subprocess.run(['ls'])\n");
    EXPECT_TRUE(result.dangerousCalls.contains("subprocess.run"));
}

TEST_F(StaticAnalyzerTest, CallsInsideFunctionsAreFound) {
    auto result = analyzer_->analyze("def f():\n    return open('/etc/passwd')\n");
    EXPECT_TRUE(result.dangerousCalls.contains("open"));
    EXPECT_EQ(result.issues[0].line, 2);
}

TEST_F(StaticAnalyzerTest, ForbiddenAttribute) {
    auto result = analyzer_->analyze("x = ().__class__.__bases__[0].__subclasses__()\n");
    EXPECT_FALSE(result.isSafe);
    EXPECT_TRUE(hasIssue(result, issue_code::kForbiddenAttribute));
    EXPECT_GE(result.issues.size(), 3u);
}

TEST_F(StaticAnalyzerTest, IssuesOrderedByPosition) {
    auto result = analyzer_->analyze("x = 1\nimport os\neval('1')\n");
    ASSERT_EQ(result.issues.size(), 2u);
    EXPECT_EQ(result.issues[0].line, 2);
    EXPECT_EQ(result.issues[1].line, 3);
}

// ============================================================================
// Syntax errors
// ============================================================================

TEST_F(StaticAnalyzerTest, SyntaxError) {
    auto result = analyzer_->analyze("x = 1\ndef f(:\n    pass\n");
    EXPECT_TRUE(result.syntaxError);
    EXPECT_EQ(result.status, ValidationStatus::Dangerous);
    EXPECT_FALSE(result.isSafe);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].code, issue_code::kSyntaxError);
    EXPECT_EQ(result.issues[0].line, 2);
    EXPECT_GE(result.issues[0].column, 0);
    EXPECT_NE(result.issues[0].message.find("line 2"), std::string::npos);
}

TEST_F(StaticAnalyzerTest, NulByteIsSyntaxError) {
    auto result = analyzer_->analyze(std::string("x = 1\0", 6));
    EXPECT_TRUE(result.syntaxError);
    EXPECT_FALSE(result.isSafe);
}

// ============================================================================
// Complexity
// ============================================================================

TEST_F(StaticAnalyzerTest, NestingWithinLimit) {
    auto result = analyzer_->analyze(nestedIfs(6));
    EXPECT_EQ(result.complexity.nestingDepth, 6);
    EXPECT_EQ(result.status, ValidationStatus::Safe);
}

TEST_F(StaticAnalyzerTest, NestingBeyondLimitWarns) {
    auto result = analyzer_->analyze(nestedIfs(7));
    EXPECT_EQ(result.complexity.nestingDepth, 7);
    EXPECT_EQ(result.status, ValidationStatus::Warning);
    EXPECT_TRUE(result.isSafe);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].code, issue_code::kNestingDepth);
    EXPECT_EQ(result.issues[0].severity, Severity::Medium);
}

TEST_F(StaticAnalyzerTest, CyclomaticComplexityCounting) {
    EXPECT_EQ(analyzer_->analyze("x = a and b and c\n").complexity.cyclomaticComplexity, 3);
    EXPECT_EQ(analyzer_->analyze("y = [i for i in r if i]\n").complexity.cyclomaticComplexity,
              3);
    EXPECT_EQ(analyzer_->analyze("if a:\n    pass\nelif b:\n    pass\n")
                  .complexity.cyclomaticComplexity,
              3);
}

TEST_F(StaticAnalyzerTest, CyclomaticComplexityThreshold) {
    warden::config::AnalyzerConfig config;
    config.maxCyclomaticComplexity = 3;
    StaticAnalyzer analyzer(registry_, config);

    auto result = analyzer.analyze("a = 1\nif a: pass\nif a: pass\nif a: pass\n");
    EXPECT_EQ(result.complexity.cyclomaticComplexity, 4);
    EXPECT_EQ(result.status, ValidationStatus::Warning);
    EXPECT_TRUE(hasIssue(result, issue_code::kCyclomaticComplexity));
}

TEST_F(StaticAnalyzerTest, CodeLengthWarning) {
    StaticAnalyzer analyzer(registry_, warden::config::AnalyzerConfig{}, 10);
    auto result = analyzer.analyze("x = 1234567890\n");
    EXPECT_EQ(result.status, ValidationStatus::Warning);
    EXPECT_TRUE(hasIssue(result, issue_code::kCodeLength));
}

TEST_F(StaticAnalyzerTest, CountLinesOfCode) {
    EXPECT_EQ(countLinesOfCode(""), 0);
    EXPECT_EQ(countLinesOfCode("a\n\n   # comment\nb\n"), 2);
    EXPECT_EQ(countLinesOfCode("x = 1  # trailing\n"), 1);
}

TEST_F(StaticAnalyzerTest, Statistics) {
    EXPECT_EQ(analyzer_->getTotalAnalyzed(), 0u);
    EXPECT_EQ(analyzer_->getAverageAnalysisTime(), 0.0);
    (void)analyzer_->analyze("x = 1\n");
    (void)analyzer_->analyze("import os\n");
    EXPECT_EQ(analyzer_->getTotalAnalyzed(), 2u);
    EXPECT_GT(analyzer_->getAverageAnalysisTime(), 0.0);
}

TEST_F(StaticAnalyzerTest, AnalysisIsDeterministic) {
    const std::string code = "import os\nx = eval('2')\n";
    auto first = analyzer_->analyze(code).toJson();
    auto second = analyzer_->analyze(code).toJson();
    EXPECT_EQ(first, second);
}

// ============================================================================
// Modules reached through other modules
// ============================================================================

TEST_F(StaticAnalyzerTest, PrivateModuleAliasIsDangerous) {
    auto result = analyzer_->analyze("import random\nrandom._os.system('id')\n");
    EXPECT_EQ(result.status, ValidationStatus::Dangerous);
    EXPECT_FALSE(result.isSafe);
    ASSERT_TRUE(hasIssue(result, issue_code::kForbiddenAttribute));
    EXPECT_EQ(result.issues[0].line, 2);
    EXPECT_EQ(result.issues[0].severity, Severity::Critical);
}

TEST_F(StaticAnalyzerTest, ForbiddenModuleAttributeIsDangerous) {
    EXPECT_FALSE(analyzer_->analyze("import typing\nm = typing.sys.modules['os']\n").isSafe);
    EXPECT_FALSE(analyzer_->analyze("import statistics\nstatistics.sys.exit(1)\n").isSafe);
    EXPECT_FALSE(analyzer_->analyze("import collections\ns = collections._sys\n").isSafe);
}

TEST_F(StaticAnalyzerTest, OrdinaryModuleAttributesAreSafe) {
    auto result = analyzer_->analyze("import math\nimport random\nx = math.pi\n"
                                     "y = random.random()\n");
    EXPECT_EQ(result.status, ValidationStatus::Safe);
}

TEST_F(StaticAnalyzerTest, StoreOnImportedModuleIsDangerous) {
    auto result = analyzer_->analyze("import math\nmath.pi = 0\n");
    EXPECT_FALSE(result.isSafe);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].code, issue_code::kForbiddenAttribute);
    EXPECT_EQ(result.issues[0].line, 2);

    EXPECT_FALSE(analyzer_->analyze("import random as r\nr.random = lambda: 4\n").isSafe);
    EXPECT_FALSE(analyzer_->analyze("import math\nmath.pi += 1\n").isSafe);
    EXPECT_FALSE(analyzer_->analyze("import math\ndel math.pi\n").isSafe);
}

TEST_F(StaticAnalyzerTest, StoreOnLibraryHandleIsDangerous) {
    EXPECT_FALSE(analyzer_->analyze("np.random.seed = None\n").isSafe);
    EXPECT_FALSE(analyzer_->analyze("math.tau = 1\n").isSafe);
}

TEST_F(StaticAnalyzerTest, StoreOnOwnObjectsIsSafe) {
    auto result = analyzer_->analyze("class Box:\n    pass\nb = Box()\nb.value = 3\n");
    EXPECT_EQ(result.status, ValidationStatus::Safe);
}
