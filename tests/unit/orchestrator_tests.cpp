#include <doctest/doctest.h>
#include <sblint/linter.hpp>
#include <sblint/orchestrator.hpp>
#include <sblint/platform.hpp>

#include "test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sblint;

namespace {

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    auto content = read_file(path);
    if (!content) {
        return lines;
    }
    std::istringstream iss(*content);
    std::string line;
    while (std::getline(iss, line)) {
        lines.push_back(line);
    }
    std::sort(lines.begin(), lines.end());
    return lines;
}

} // namespace

TEST_CASE("unique_files keeps the first occurrence") {
    auto files = unique_files({"b", "a", "b", "c", "a"});
    CHECK(files == std::vector<std::string>{"b", "a", "c"});
}

TEST_CASE("ResultList::open fails in a missing directory") {
    auto opened = ResultList::open("/nonexistent/sblint/success.txt");
    CHECK_FALSE(opened.ok);
    CHECK_FALSE(opened.error.empty());
    CHECK(opened.list == nullptr);
}

TEST_CASE("Orchestrator lints a mixed batch with a timeout") {
    TempTestDir dir;
    std::string good_a = dir.write("a.json", valid_descriptor("echo 1.0"));
    std::string good_b = dir.write("b.json", valid_descriptor("echo 2.0"));
    std::string invalid = dir.write("c.json", "{\"pkg\": \"c\"}");
    std::string slow = dir.write("d.json", valid_descriptor("sleep 5"));

    auto success = ResultList::open(dir.path + "/success.txt");
    auto fail = ResultList::open(dir.path + "/fail.txt");
    REQUIRE(success.ok);
    REQUIRE(fail.ok);

    LintOptions lint_opts;
    lint_opts.shellcheck = false;
    lint_opts.pkgver = true;
    lint_opts.timeout = std::chrono::seconds(1);

    OrchestratorOptions options;
    options.parallel = 2;
    options.success_list = success.list;
    options.fail_list = fail.list;

    LogAggregator aggregator(nullptr, false);
    aggregator.start();

    Orchestrator orchestrator(options, aggregator);
    auto summary = orchestrator.run(
        {good_a, good_b, invalid, slow},
        [&lint_opts](const std::string& file, const Logger& logger) {
            return Linter(logger, lint_opts).lint(file);
        });
    aggregator.finish();

    CHECK(summary.total == 4);
    CHECK(summary.succeeded == 2);
    CHECK(summary.failed == 2);

    auto succeeded = std::vector<std::string>{good_a, good_b};
    auto failed = std::vector<std::string>{invalid, slow};
    std::sort(succeeded.begin(), succeeded.end());
    std::sort(failed.begin(), failed.end());
    CHECK(read_lines(dir.path + "/success.txt") == succeeded);
    CHECK(read_lines(dir.path + "/fail.txt") == failed);

    CHECK(*read_file(good_a + ".pkgver") == "1.0\n");
    CHECK(*read_file(good_b + ".pkgver") == "2.0\n");
}

TEST_CASE("Orchestrator counts a throwing job as failed") {
    std::vector<std::string> errors;
    LogAggregator aggregator(
        [&errors](const LogMessage& m) {
            if (m.kind == LogKind::Error) errors.push_back(m.text);
        },
        true);
    aggregator.start();

    Orchestrator orchestrator(OrchestratorOptions{}, aggregator);
    auto summary = orchestrator.run({"ok", "boom"}, [](const std::string& file, const Logger&) {
        if (file == "boom") {
            throw std::runtime_error("exploded");
        }
        return true;
    });
    aggregator.finish();

    CHECK(summary.succeeded == 1);
    CHECK(summary.failed == 1);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0] == "boom: exploded");
}

TEST_CASE("Orchestrator runs each distinct file once") {
    LogAggregator aggregator(nullptr, false);
    aggregator.start();

    std::atomic<int> calls{0};
    Orchestrator orchestrator(OrchestratorOptions{}, aggregator);
    auto summary = orchestrator.run({"a", "b", "a", "a"},
                                    [&calls](const std::string&, const Logger&) {
                                        ++calls;
                                        return false;
                                    });
    aggregator.finish();

    CHECK(calls.load() == 2);
    CHECK(summary.total == 2);
    CHECK(summary.failed == 2);
}

TEST_CASE("Orchestrator never exceeds the parallel limit") {
    LogAggregator aggregator(nullptr, false);
    aggregator.start();

    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    OrchestratorOptions options;
    options.parallel = 2;
    Orchestrator orchestrator(options, aggregator);

    std::vector<std::string> files;
    for (int i = 0; i < 8; ++i) {
        files.push_back("file" + std::to_string(i));
    }

    auto summary = orchestrator.run(files, [&](const std::string&, const Logger&) {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --active;
        return true;
    });
    aggregator.finish();

    CHECK(summary.succeeded == 8);
    CHECK(peak.load() <= 2);
    CHECK(peak.load() >= 1);
}
