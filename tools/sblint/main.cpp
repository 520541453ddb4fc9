/**
 * sblint CLI - Entry Point
 *
 * Validates SBUILD package descriptors, optionally in parallel.
 */

#include <sblint/linter.hpp>
#include <sblint/logger.hpp>
#include <sblint/orchestrator.hpp>
#include <sblint/platform.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifndef SBLINT_VERSION
#define SBLINT_VERSION "unknown"
#endif

namespace {

struct CliOptions {
    bool pkgver = false;
    bool no_shellcheck = false;
    std::string shellcheck = "shellcheck";
    std::optional<std::size_t> parallel;
    bool inplace = false;
    std::string success_path;
    std::string fail_path;
    unsigned timeout = 30;
    bool verbose = false;
    std::vector<std::string> files;
};

std::optional<std::shared_ptr<sblint::ResultList>> open_result_list(const std::string& path) {
    if (path.empty()) {
        return std::shared_ptr<sblint::ResultList>();
    }
    auto opened = sblint::ResultList::open(path);
    if (!opened.ok) {
        spdlog::error("{}", opened.error);
        return std::nullopt;
    }
    return opened.list;
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{"sblint - A linter for SBUILD package files"};
    app.set_version_flag("-V,--version", SBLINT_VERSION);

    CliOptions opts;

    app.add_flag("-p,--pkgver", opts.pkgver, "Enable pkgver mode");
    app.add_flag("--no-shellcheck", opts.no_shellcheck, "Disable shellcheck");
    app.add_option("--shellcheck", opts.shellcheck, "shellcheck executable")
        ->envname("SBLINT_SHELLCHECK");
    app.add_option("--parallel", opts.parallel, "Run N jobs in parallel")
        ->check(CLI::PositiveNumber);
    app.add_flag("-i,--inplace", opts.inplace, "Replace the original file on success");
    app.add_option("--success", opts.success_path, "File to store successful packages list");
    app.add_option("--fail", opts.fail_path, "File to store failed packages list");
    app.add_option("--timeout", opts.timeout,
                   "Timeout in seconds after which the pkgver check exits")
        ->capture_default_str();
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_option("files", opts.files, "One or more package files to validate")->required();

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("%^%v%$");

    sblint::LintOptions lint_opts;
    lint_opts.inplace = opts.inplace;
    lint_opts.shellcheck = !opts.no_shellcheck;
    lint_opts.pkgver = opts.pkgver;
    lint_opts.timeout = std::chrono::seconds(opts.timeout);

    if (lint_opts.shellcheck) {
        auto shellcheck = sblint::find_executable(opts.shellcheck);
        if (!shellcheck) {
            spdlog::error("{} not found. Please install.", opts.shellcheck);
            return 1;
        }
        lint_opts.shellcheck_path = *shellcheck;
    }

    auto success_list = open_result_list(opts.success_path);
    auto fail_list = open_result_list(opts.fail_path);
    if (!success_list || !fail_list) {
        return 1;
    }

    spdlog::info("sblint v{}", SBLINT_VERSION);

    // Streaming per-file detail only makes sense when jobs run one at a time
    sblint::LogAggregator aggregator(sblint::make_console_sink(), !opts.parallel.has_value());
    aggregator.start();

    sblint::OrchestratorOptions orchestrator_opts;
    orchestrator_opts.parallel = opts.parallel.value_or(1);
    orchestrator_opts.success_list = *success_list;
    orchestrator_opts.fail_list = *fail_list;

    sblint::Orchestrator orchestrator(orchestrator_opts, aggregator);
    auto summary = orchestrator.run(
        opts.files, [&lint_opts](const std::string& file, const sblint::Logger& logger) {
            sblint::Linter linter(logger, lint_opts);
            return linter.lint(file);
        });

    aggregator.finish();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(summary.elapsed);
    spdlog::info("");
    spdlog::info("[+] {} files validated successfully", summary.succeeded);
    spdlog::info("[+] {} files failed to pass validation", summary.failed);
    spdlog::info("[+] Evaluated {}/{} file(s) in {}ms", summary.succeeded + summary.failed,
                 summary.total, elapsed.count());

    return summary.failed > 0 ? 1 : 0;
}
