/*
 * analyzer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file analyzer.hpp
 * @brief AST-based pre-execution analysis of user code
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_SANDBOX_ANALYZER_HPP
#define WARDEN_SANDBOX_ANALYZER_HPP

#include <memory>
#include <string_view>

#include "atom/type/noncopyable.hpp"

#include "../config/sandbox_config.hpp"
#include "registry.hpp"
#include "types.hpp"

namespace warden::sandbox {

class StaticAnalyzerImpl;

/**
 * @brief Static security analyzer
 *
 * Parses code with the embedded interpreter's `ast` module and walks the
 * tree. The code is never compiled to bytecode or executed.
 *
 * Import checks use the root module only: `import numpy.linalg` is judged
 * by `numpy`.
 */
class StaticAnalyzer : public NonCopyable {
public:
    /**
     * @param registry Security tables
     * @param config Complexity thresholds
     * @param maxCodeLength Code points above which a code-length issue is added
     */
    StaticAnalyzer(std::shared_ptr<const Registry> registry,
                   config::AnalyzerConfig config, size_t maxCodeLength = 50000);
    ~StaticAnalyzer() override;

    /**
     * @brief Analyze code
     *
     * Pure and idempotent. Malformed input yields a DANGEROUS result with
     * syntax_error set, never an exception.
     *
     * @throw SandboxFault if the embedded interpreter cannot be started
     */
    [[nodiscard]] ValidationResult analyze(std::string_view code) const;

    /**
     * @brief Number of analyze() calls so far
     */
    [[nodiscard]] size_t getTotalAnalyzed() const;

    /**
     * @brief Mean analyze() time in milliseconds
     */
    [[nodiscard]] double getAverageAnalysisTime() const;

private:
    std::unique_ptr<StaticAnalyzerImpl> impl_;
};

/**
 * @brief Count non-blank, non-comment lines
 */
[[nodiscard]] int countLinesOfCode(std::string_view code) noexcept;

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_ANALYZER_HPP
