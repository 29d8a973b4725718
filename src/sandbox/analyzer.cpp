/*
 * analyzer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "analyzer.hpp"
#include "exception.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>
#include <mutex>
#include <optional>
#include <tuple>
#include <unordered_set>
#include <utility>
#include <vector>

#include <pybind11/pybind11.h>
#include <spdlog/spdlog.h>

#include "../python/bounded_buffer.hpp"
#include "../python/runtime.hpp"

namespace py = pybind11;

namespace warden::sandbox {

namespace {

const std::unordered_set<std::string> kCompoundStatements = {
    "If",          "For",      "AsyncFor",    "While",
    "With",        "AsyncWith", "Try",        "TryStar",
    "FunctionDef", "AsyncFunctionDef", "ClassDef", "Match"};

const std::unordered_set<std::string> kBranchNodes = {
    "If", "For", "AsyncFor", "While", "IfExp", "ExceptHandler", "Assert",
    "match_case"};

std::string nodeType(py::handle node) {
    return py::str(node.attr("__class__").attr("__name__")).cast<std::string>();
}

int intAttr(py::handle node, const char* name) {
    if (!py::hasattr(node, name)) {
        return 0;
    }
    py::object value = node.attr(name);
    return value.is_none() ? 0 : value.cast<int>();
}

/**
 * @brief Static dotted name of a call target
 *
 * `a.b.c` resolves fully; `f().b.c` resolves to the attribute tail `b.c`.
 * Callees that are neither a Name nor an Attribute chain yield nullopt.
 */
std::optional<std::string> resolveCallee(py::handle func) {
    std::vector<std::string> parts;
    py::object current = py::reinterpret_borrow<py::object>(func);

    while (nodeType(current) == "Attribute") {
        parts.push_back(current.attr("attr").cast<std::string>());
        current = current.attr("value");
    }
    if (nodeType(current) == "Name") {
        parts.push_back(current.attr("id").cast<std::string>());
    }
    if (parts.empty()) {
        return std::nullopt;
    }

    std::string dotted;
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        if (!dotted.empty()) {
            dotted += '.';
        }
        dotted += *it;
    }
    return dotted;
}

/**
 * @brief Name at the root of an attribute chain (`np` for `np.random.seed`)
 */
std::optional<std::string> chainRoot(py::handle node) {
    py::object current = py::reinterpret_borrow<py::object>(node);
    while (nodeType(current) == "Attribute") {
        current = current.attr("value");
    }
    if (nodeType(current) == "Name") {
        return current.attr("id").cast<std::string>();
    }
    return std::nullopt;
}

bool isStoreContext(py::handle node) {
    if (!py::hasattr(node, "ctx")) {
        return false;
    }
    auto ctx = nodeType(node.attr("ctx"));
    return ctx == "Store" || ctx == "Del";
}

void finalize(ValidationResult& result) {
    std::stable_sort(result.issues.begin(), result.issues.end(),
                     [](const SecurityIssue& a, const SecurityIssue& b) {
                         return std::tie(a.line, a.column) < std::tie(b.line, b.column);
                     });

    bool dangerous = result.syntaxError || !result.dangerousCalls.empty() ||
                     !result.forbiddenImports.empty();
    bool warning = false;
    for (const auto& issue : result.issues) {
        if (issue.severity == Severity::High || issue.severity == Severity::Critical) {
            dangerous = true;
        } else {
            warning = true;
        }
    }

    if (dangerous) {
        result.status = ValidationStatus::Dangerous;
    } else if (warning) {
        result.status = ValidationStatus::Warning;
    } else {
        result.status = ValidationStatus::Safe;
    }
    result.isSafe = result.status != ValidationStatus::Dangerous;
}

}  // namespace

int countLinesOfCode(std::string_view code) noexcept {
    int count = 0;
    size_t pos = 0;
    while (pos <= code.size()) {
        size_t end = code.find('\n', pos);
        if (end == std::string_view::npos) {
            end = code.size();
        }
        auto line = code.substr(pos, end - pos);
        auto first = line.find_first_not_of(" \t\r\f\v");
        if (first != std::string_view::npos && line[first] != '#') {
            ++count;
        }
        pos = end + 1;
    }
    return count;
}

// ============================================================================
// StaticAnalyzerImpl
// ============================================================================

class StaticAnalyzerImpl {
public:
    StaticAnalyzerImpl(std::shared_ptr<const Registry> registry,
                       config::AnalyzerConfig config, size_t maxCodeLength)
        : registry_(std::move(registry)),
          config_(config),
          maxCodeLength_(maxCodeLength) {}

    ValidationResult analyze(std::string_view code) {
        auto start = std::chrono::steady_clock::now();

        if (!python::PythonRuntime::instance().ensureInitialized()) {
            THROW_SANDBOX_FAULT("Embedded Python interpreter is unavailable");
        }

        ValidationResult result;
        result.complexity.linesOfCode = countLinesOfCode(code);

        {
            py::gil_scoped_acquire gil;
            auto tree = parse(code, result);
            if (tree) {
                try {
                    walk(*tree, result);
                } catch (const py::error_already_set& e) {
                    spdlog::error("AST walk failed: {}", e.what());
                    THROW_SANDBOX_FAULT("Static analysis failed: " + std::string(e.what()));
                }
            }
        }

        if (!result.syntaxError) {
            checkLimits(code, result);
        }
        finalize(result);

        auto elapsed = std::chrono::duration<double, std::milli>(
                           std::chrono::steady_clock::now() - start)
                           .count();
        {
            std::lock_guard lock(statsMutex_);
            totalAnalyzed_++;
            totalAnalysisTime_ += elapsed;
        }

        spdlog::debug("Analysis finished: status={}, issues={}, {:.2f} ms",
                      validationStatusToString(result.status),
                      result.issues.size(), elapsed);
        return result;
    }

    size_t getTotalAnalyzed() const {
        std::lock_guard lock(statsMutex_);
        return totalAnalyzed_;
    }

    double getAverageAnalysisTime() const {
        std::lock_guard lock(statsMutex_);
        return totalAnalyzed_ > 0 ? totalAnalysisTime_ / totalAnalyzed_ : 0.0;
    }

private:
    std::optional<py::object> parse(std::string_view code, ValidationResult& result) {
        try {
            py::str source(code.data(), code.size());
            return py::module_::import("ast").attr("parse")(source, "<sandbox>", "exec");
        } catch (const py::error_already_set& e) {
            reportSyntaxError(e, result);
            return std::nullopt;
        }
    }

    void reportSyntaxError(const py::error_already_set& e, ValidationResult& result) {
        SecurityIssue issue;
        issue.severity = Severity::Critical;
        issue.code = std::string(issue_code::kSyntaxError);
        issue.suggestion = "Fix the syntax error before submitting";

        if (e.matches(PyExc_SyntaxError)) {
            py::object value = e.value();
            std::string msg = py::str(value.attr("msg")).cast<std::string>();
            issue.line = intAttr(value, "lineno");
            issue.column = std::max(0, intAttr(value, "offset") - 1);
            issue.message = std::format("syntax error: {} (line {})", msg, issue.line);
        } else {
            // ValueError for NUL bytes, RecursionError or MemoryError for
            // pathological nesting, UnicodeDecodeError for invalid UTF-8
            std::string what;
            try {
                what = py::str(e.value()).cast<std::string>();
            } catch (const py::error_already_set&) {
                what = "unparseable source";
            }
            issue.line = 1;
            issue.message = std::format("syntax error: {}", what);
        }

        result.syntaxError = true;
        result.issues.push_back(std::move(issue));
    }

    /// Names bound to modules and attribute stores seen during one walk
    struct ModuleBindings {
        std::unordered_set<std::string> names;
        std::vector<std::pair<py::object, std::string>> stores;
    };

    void walk(const py::object& tree, ValidationResult& result) {
        auto iterChildNodes = py::module_::import("ast").attr("iter_child_nodes");
        ModuleBindings bindings;

        std::vector<std::pair<py::object, int>> stack;
        stack.emplace_back(tree, 0);
        bool nestingReported = false;

        while (!stack.empty()) {
            auto [node, depth] = std::move(stack.back());
            stack.pop_back();

            auto type = nodeType(node);
            int childDepth = depth;

            if (kCompoundStatements.contains(type)) {
                childDepth = depth + 1;
                result.complexity.nestingDepth =
                    std::max(result.complexity.nestingDepth, childDepth);
                if (childDepth > config_.maxNestingDepth && !nestingReported) {
                    nestingReported = true;
                    addIssue(result, Severity::Medium, node,
                             issue_code::kNestingDepth,
                             std::format("Nesting depth exceeds {}",
                                         config_.maxNestingDepth),
                             "Extract deeply nested blocks into functions");
                }
            }

            countBranches(type, node, result);

            if (type == "Import") {
                checkImport(node, result, bindings);
            } else if (type == "ImportFrom") {
                checkImportFrom(node, result, bindings);
            } else if (type == "Call") {
                checkCall(node, result);
            } else if (type == "Attribute") {
                checkAttribute(node, result, bindings);
            }

            // Reverse so siblings are visited in source order
            std::vector<py::object> children;
            for (auto child : iterChildNodes(node)) {
                children.push_back(py::reinterpret_borrow<py::object>(child));
            }
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                stack.emplace_back(std::move(*it), childDepth);
            }
        }

        checkModuleStores(bindings, result);
    }

    void countBranches(const std::string& type, const py::object& node,
                       ValidationResult& result) {
        auto& cc = result.complexity.cyclomaticComplexity;
        if (kBranchNodes.contains(type)) {
            cc += 1;
        } else if (type == "comprehension") {
            cc += 1 + static_cast<int>(py::len(node.attr("ifs")));
        } else if (type == "BoolOp") {
            cc += static_cast<int>(py::len(node.attr("values"))) - 1;
        }
    }

    void checkImport(const py::object& node, ValidationResult& result,
                     ModuleBindings& bindings) {
        for (auto alias : node.attr("names")) {
            auto name = alias.attr("name").cast<std::string>();
            auto root = std::string(Registry::rootModule(name));
            py::object asname = alias.attr("asname");
            bindings.names.insert(asname.is_none() ? root : asname.cast<std::string>());
            checkRoot(node, root, name, result);
        }
    }

    void checkImportFrom(const py::object& node, ValidationResult& result,
                         ModuleBindings& bindings) {
        for (auto alias : node.attr("names")) {
            py::object asname = alias.attr("asname");
            bindings.names.insert(asname.is_none() ? alias.attr("name").cast<std::string>()
                                                   : asname.cast<std::string>());
        }

        int level = intAttr(node, "level");
        py::object module = node.attr("module");
        std::string name = module.is_none() ? "" : module.cast<std::string>();

        if (level > 0) {
            addIssue(result, Severity::High, node, issue_code::kRelativeImport,
                     std::format("Relative import '{}{}' is not allowed",
                                 std::string(static_cast<size_t>(level), '.'), name),
                     "Import modules by their absolute name");
            return;
        }
        checkRoot(node, std::string(Registry::rootModule(name)), name, result);
    }

    void checkRoot(const py::object& node, const std::string& root,
                   const std::string& fullName, ValidationResult& result) {
        result.imports.insert(root);
        if (registry_->isImportAllowed(root)) {
            return;
        }

        bool forbidden = registry_->isForbiddenImport(root);
        result.forbiddenImports.insert(root);
        addIssue(result, forbidden ? Severity::Critical : Severity::High, node,
                 issue_code::kForbiddenImport,
                 forbidden ? std::format("Import of forbidden module '{}'", fullName)
                           : std::format("Import of '{}' is not whitelisted", fullName),
                 "Use only whitelisted data-analysis modules");
    }

    void checkCall(const py::object& node, ValidationResult& result) {
        auto callee = resolveCallee(node.attr("func"));
        if (!callee) {
            return;
        }
        auto match = registry_->matchBlacklistedCall(*callee);
        if (!match) {
            return;
        }
        result.dangerousCalls.insert(*callee);
        addIssue(result, Severity::Critical, node, issue_code::kForbiddenCall,
                 std::format("Call to '{}' is forbidden (matches '{}')", *callee, *match),
                 "Remove the call; it is not available in the sandbox");
    }

    void checkAttribute(const py::object& node, ValidationResult& result,
                        ModuleBindings& bindings) {
        auto attr = node.attr("attr").cast<std::string>();

        if (isStoreContext(node)) {
            if (auto root = chainRoot(node.attr("value"))) {
                bindings.stores.emplace_back(node, *root);
            }
        }

        if (registry_->isForbiddenAttribute(attr)) {
            addIssue(result, Severity::Critical, node, issue_code::kForbiddenAttribute,
                     std::format("Access to attribute '{}' is forbidden", attr),
                     "Interpreter internals cannot be accessed from sandboxed code");
        } else if (registry_->isForbiddenModuleReference(attr)) {
            addIssue(result, Severity::Critical, node, issue_code::kForbiddenAttribute,
                     std::format("Attribute '{}' exposes a forbidden module", attr),
                     "Forbidden modules cannot be reached through other modules");
        }
    }

    void checkModuleStores(const ModuleBindings& bindings, ValidationResult& result) {
        for (const auto& [node, root] : bindings.stores) {
            if (!bindings.names.contains(root) && !registry_->isHandleAlias(root)) {
                continue;
            }
            auto attr = node.attr("attr").cast<std::string>();
            addIssue(result, Severity::Critical, node, issue_code::kForbiddenAttribute,
                     std::format("Assignment to '{}' on module '{}' is not allowed",
                                 attr, root),
                     "Bind a local name instead of modifying a module");
        }
    }

    void checkLimits(std::string_view code, ValidationResult& result) const {
        if (result.complexity.cyclomaticComplexity > config_.maxCyclomaticComplexity) {
            SecurityIssue issue{Severity::Medium, 1, 0,
                                std::string(issue_code::kCyclomaticComplexity),
                                std::format("Cyclomatic complexity {} exceeds {}",
                                            result.complexity.cyclomaticComplexity,
                                            config_.maxCyclomaticComplexity),
                                "Split the code into smaller functions"};
            result.issues.push_back(std::move(issue));
        }

        auto length = python::utf8Length(code);
        if (length > maxCodeLength_) {
            SecurityIssue issue{Severity::Medium, 1, 0,
                                std::string(issue_code::kCodeLength),
                                std::format("Code length {} exceeds {} characters",
                                            length, maxCodeLength_),
                                "Shorten the code"};
            result.issues.push_back(std::move(issue));
        }
    }

    static void addIssue(ValidationResult& result, Severity severity,
                         const py::object& node, std::string_view code,
                         std::string message, std::string suggestion) {
        SecurityIssue issue;
        issue.severity = severity;
        issue.line = intAttr(node, "lineno");
        issue.column = intAttr(node, "col_offset");
        issue.code = std::string(code);
        issue.message = std::move(message);
        issue.suggestion = std::move(suggestion);
        result.issues.push_back(std::move(issue));
    }

    std::shared_ptr<const Registry> registry_;
    config::AnalyzerConfig config_;
    size_t maxCodeLength_;

    mutable std::mutex statsMutex_;
    size_t totalAnalyzed_{0};
    double totalAnalysisTime_{0.0};
};

// ============================================================================
// StaticAnalyzer
// ============================================================================

StaticAnalyzer::StaticAnalyzer(std::shared_ptr<const Registry> registry,
                               config::AnalyzerConfig config, size_t maxCodeLength)
    : impl_(std::make_unique<StaticAnalyzerImpl>(std::move(registry), config,
                                                 maxCodeLength)) {}

StaticAnalyzer::~StaticAnalyzer() = default;

ValidationResult StaticAnalyzer::analyze(std::string_view code) const {
    return impl_->analyze(code);
}

size_t StaticAnalyzer::getTotalAnalyzed() const { return impl_->getTotalAnalyzed(); }

double StaticAnalyzer::getAverageAnalysisTime() const {
    return impl_->getAverageAnalysisTime();
}

}  // namespace warden::sandbox
