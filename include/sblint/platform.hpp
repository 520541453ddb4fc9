#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sblint {

// ============================================================================
// File Operations
// ============================================================================

// Read entire file contents, nullopt if the file cannot be opened
std::optional<std::string> read_file(const std::string& path);

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Unique sibling path "<base>.tmp.<8 hex>"
std::string make_temp_filename(const std::string& base);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// ============================================================================
// Processes
// ============================================================================

// Absolute path of an executable found on PATH (or the name itself when it
// already contains a '/'), nullopt if not found
std::optional<std::string> find_executable(const std::string& name);

struct ProcessResult {
    bool ok = false;          // process ran to completion
    bool timed_out = false;
    int exit_code = -1;
    std::string output;       // stdout and stderr, interleaved
    std::string error;
};

/**
 * Run argv[0] (looked up on PATH) with stdout and stderr captured.
 *
 * The child runs in its own process group. When the timeout expires the
 * whole group is killed, so grandchildren holding the output pipe do not
 * keep the caller waiting.
 */
ProcessResult run_process(const std::vector<std::string>& argv,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

} // namespace sblint
