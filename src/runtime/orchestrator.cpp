#include "sblint/orchestrator.hpp"

#include "sblint/semaphore.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <exception>
#include <thread>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace sblint {

// ============================================================================
// ResultList Implementation
// ============================================================================

ResultList::OpenResult ResultList::open(const std::string& path) {
    OpenResult result;

    std::ofstream stream(path, std::ios::out | std::ios::app);
    if (!stream) {
        result.error = "failed to open '" + path + "': " + std::string(std::strerror(errno));
        return result;
    }

    result.list.reset(new ResultList(path, std::move(stream)));
    result.ok = true;
    return result;
}

void ResultList::append(const std::string& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ << entry << '\n';
    stream_.flush();
    if (!stream_) {
        spdlog::error("failed to append to {}", path_);
        stream_.clear();
    }
}

// ============================================================================
// Orchestrator Implementation
// ============================================================================

std::vector<std::string> unique_files(const std::vector<std::string>& files) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto& file : files) {
        if (seen.insert(file).second) {
            result.push_back(file);
        }
    }
    return result;
}

Orchestrator::Orchestrator(OrchestratorOptions options, LogAggregator& aggregator)
    : options_(std::move(options)), aggregator_(aggregator) {
    if (options_.parallel == 0) {
        options_.parallel = 1;
    }
}

RunSummary Orchestrator::run(const std::vector<std::string>& input, const Job& job) {
    RunSummary summary;
    auto start = std::chrono::steady_clock::now();

    auto files = unique_files(input);
    summary.total = files.size();

    std::atomic<std::size_t> succeeded{0};
    std::atomic<std::size_t> failed{0};
    Semaphore semaphore(options_.parallel);
    std::vector<std::thread> workers;

    for (const auto& file : files) {
        Permit permit(semaphore);
        spdlog::debug("dispatching {}", file);

        Logger logger = aggregator_.create_logger();
        workers.emplace_back([this, file, logger, &job, &succeeded, &failed,
                              permit = std::move(permit)]() mutable {
            bool passed = false;
            try {
                passed = job(file, logger);
            } catch (const std::exception& e) {
                logger.error(file + ": " + e.what());
                passed = false;
            }

            if (passed) {
                if (options_.success_list) {
                    options_.success_list->append(file);
                }
                succeeded.fetch_add(1);
            } else {
                if (options_.fail_list) {
                    options_.fail_list->append(file);
                }
                failed.fetch_add(1);
            }
            permit.reset();
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    summary.succeeded = succeeded.load();
    summary.failed = failed.load();
    summary.elapsed = std::chrono::steady_clock::now() - start;
    return summary;
}

} // namespace sblint
