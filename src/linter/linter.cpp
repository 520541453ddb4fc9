#include "sblint/linter.hpp"

#include "sblint/platform.hpp"

#include <cctype>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace sblint {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

void log_output(const Logger& logger, const std::string& output) {
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        logger.custom(line);
    }
}

// "/usr/bin/bash" -> "bash"
std::string shell_name(const std::string& shell) {
    return fs::path(shell).filename().string();
}

std::string x_exec_string(const ValidatedConfig& config, const std::string& key) {
    const Value* x_exec = config.find("x_exec");
    if (!x_exec) {
        return "";
    }
    const Value* value = x_exec->find(key);
    if (!value || !value->is_string()) {
        return "";
    }
    return value->as_string();
}

} // anonymous namespace

Linter::Linter(Logger logger, LintOptions options)
    : logger_(std::move(logger)), options_(std::move(options)) {}

bool Linter::lint(const std::string& path) const {
    logger_.info("Linting " + path);

    auto content = read_file(path);
    if (!content) {
        logger_.error("Failed to read file: " + path);
        return false;
    }

    auto parsed = parse_document(*content);
    if (!parsed.ok) {
        logger_.error(path + ": " + parsed.error);
        return false;
    }

    auto result = validator_.validate(parsed.document, logger_);
    if (!result.ok) {
        logger_.error(result.error);
        return false;
    }

    if (options_.shellcheck && !run_shellcheck(path, result.config)) {
        return false;
    }

    if (options_.pkgver && !run_pkgver(path, result.config)) {
        return false;
    }

    std::string output_path = options_.inplace ? path : path + ".validated";
    auto written = atomic_write_file(output_path, to_json(result.config).dump(2) + "\n");
    if (!written.ok) {
        logger_.error("Failed to write " + output_path + ": " + written.error);
        return false;
    }

    logger_.success("Validation successful: " + path);
    return true;
}

bool Linter::run_shellcheck(const std::string& path, const ValidatedConfig& config) const {
    std::string script = x_exec_string(config, "run");
    if (script.empty()) {
        return true;
    }

    std::error_code ec;
    fs::path temp_dir = fs::temp_directory_path(ec);
    if (ec) {
        temp_dir = "/tmp";
    }
    std::string script_path = make_temp_filename((temp_dir / "sblint-x_exec").string());

    auto written = atomic_write_file(script_path, script);
    if (!written.ok) {
        logger_.error("Failed to write x_exec.run for shellcheck: " + written.error);
        return false;
    }

    auto check = run_process({options_.shellcheck_path,
                              "--shell=" + shell_name(x_exec_string(config, "shell")),
                              script_path});
    fs::remove(script_path, ec);

    if (!check.ok) {
        logger_.error("shellcheck failed to run: " + check.error);
        return false;
    }
    if (check.exit_code != 0) {
        log_output(logger_, check.output);
        logger_.error(path + ": shellcheck reported issues in x_exec.run");
        return false;
    }
    return true;
}

bool Linter::run_pkgver(const std::string& path, const ValidatedConfig& config) const {
    std::string script = x_exec_string(config, "pkgver");
    if (script.empty()) {
        return true;
    }

    std::string shell = x_exec_string(config, "shell");
    auto check = run_process({shell, "-c", script},
                             std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout));

    if (check.timed_out) {
        logger_.error(path + ": pkgver check timed out after " +
                      std::to_string(options_.timeout.count()) + "s");
        return false;
    }
    if (!check.ok) {
        logger_.error(path + ": pkgver check failed to run: " + check.error);
        return false;
    }
    if (check.exit_code != 0) {
        log_output(logger_, check.output);
        logger_.error(path + ": pkgver check exited with status " +
                      std::to_string(check.exit_code));
        return false;
    }

    std::string version = trim(check.output);
    if (version.empty()) {
        logger_.error(path + ": pkgver check produced no output");
        return false;
    }

    auto written = atomic_write_file(path + ".pkgver", version + "\n");
    if (!written.ok) {
        logger_.error("Failed to write " + path + ".pkgver: " + written.error);
        return false;
    }
    logger_.info("pkgver: " + version);
    return true;
}

} // namespace sblint
