#pragma once

#include "sblint/logger.hpp"

#include <chrono>
#include <cstddef>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sblint {

// ============================================================================
// Result List
// ============================================================================

// Append-only list of file paths, safe to share between workers
class ResultList {
public:
    struct OpenResult {
        bool ok = false;
        std::string error;
        std::shared_ptr<ResultList> list;
    };

    // Opens (creating if needed) path for appending
    static OpenResult open(const std::string& path);

    void append(const std::string& entry);

    const std::string& path() const { return path_; }

private:
    ResultList(std::string path, std::ofstream stream)
        : path_(std::move(path)), stream_(std::move(stream)) {}

    std::string path_;
    std::mutex mutex_;
    std::ofstream stream_;
};

// ============================================================================
// Orchestrator
// ============================================================================

struct OrchestratorOptions {
    std::size_t parallel = 1;                   // concurrent jobs
    std::shared_ptr<ResultList> success_list;   // optional
    std::shared_ptr<ResultList> fail_list;      // optional
};

struct RunSummary {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t total = 0;  // distinct input files
    std::chrono::steady_clock::duration elapsed{};
};

/**
 * Runs one job per input file on its own thread, at most `parallel` at a
 * time.
 *
 * Each worker gets its own Logger; workers share nothing else but the tally
 * counters and the result lists. A job's permit is released however the job
 * ends, so a failing or throwing job never stalls the queue.
 */
class Orchestrator {
public:
    // Returns true when the file passed
    using Job = std::function<bool(const std::string& file, const Logger& logger)>;

    Orchestrator(OrchestratorOptions options, LogAggregator& aggregator);

    RunSummary run(const std::vector<std::string>& files, const Job& job);

private:
    OrchestratorOptions options_;
    LogAggregator& aggregator_;
};

// Input order preserved, repeated paths dropped
std::vector<std::string> unique_files(const std::vector<std::string>& files);

} // namespace sblint
