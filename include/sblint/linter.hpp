#pragma once

#include "sblint/document.hpp"
#include "sblint/logger.hpp"
#include "sblint/validator.hpp"

#include <chrono>
#include <string>

namespace sblint {

// ============================================================================
// Lint Options
// ============================================================================

struct LintOptions {
    bool inplace = false;               // overwrite the descriptor on success
    bool shellcheck = true;             // run shellcheck over x_exec.run
    std::string shellcheck_path = "shellcheck";
    bool pkgver = false;                // run x_exec.pkgver and record its output
    std::chrono::seconds timeout{30};   // budget for the pkgver check
};

// ============================================================================
// Linter
// ============================================================================

/**
 * Lints one descriptor file.
 *
 * Pipeline: read, parse, validate, shellcheck x_exec.run, optionally run the
 * pkgver check, then write the validated descriptor to "<file>.validated"
 * (or over the original with inplace). All output goes to the logger.
 */
class Linter {
public:
    Linter(Logger logger, LintOptions options);

    // True if the file passed every enabled step
    bool lint(const std::string& path) const;

private:
    bool run_shellcheck(const std::string& path, const ValidatedConfig& config) const;
    bool run_pkgver(const std::string& path, const ValidatedConfig& config) const;

    Logger logger_;
    LintOptions options_;
    DocumentValidator validator_;
};

} // namespace sblint
