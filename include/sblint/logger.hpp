#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sblint {

// ============================================================================
// Log Messages
// ============================================================================

enum class LogKind {
    Info,
    Success,
    Warn,
    Error,
    Custom,  // raw text: source excerpts, tool output
    Done     // terminates the aggregator
};

struct LogMessage {
    LogKind kind = LogKind::Info;
    std::string text;
};

// ============================================================================
// Log Channel
// ============================================================================

// Unbounded multi-producer, single-consumer queue
class LogChannel {
public:
    void send(LogMessage message);

    // Blocks until a message is available
    LogMessage receive();

private:
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<LogMessage> queue_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * Send-only handle to a LogChannel, one per worker. A default-constructed
 * Logger discards everything.
 */
class Logger {
public:
    Logger() = default;
    explicit Logger(std::shared_ptr<LogChannel> channel) : channel_(std::move(channel)) {}

    void info(const std::string& text) const { send(LogKind::Info, text); }
    void success(const std::string& text) const { send(LogKind::Success, text); }
    void warn(const std::string& text) const { send(LogKind::Warn, text); }
    void error(const std::string& text) const { send(LogKind::Error, text); }
    void custom(const std::string& text) const { send(LogKind::Custom, text); }

private:
    void send(LogKind kind, const std::string& text) const;

    std::shared_ptr<LogChannel> channel_;
};

// ============================================================================
// Log Aggregator
// ============================================================================

/**
 * Drains a LogChannel on a single consumer thread.
 *
 * Workers may emit in any interleaving; the sink sees messages one at a time
 * and all of them have been handed to it once finish() returns. With
 * show_detail disabled messages are drained but not forwarded.
 */
class LogAggregator {
public:
    using Sink = std::function<void(const LogMessage&)>;

    LogAggregator(Sink sink, bool show_detail);
    ~LogAggregator();

    LogAggregator(const LogAggregator&) = delete;
    LogAggregator& operator=(const LogAggregator&) = delete;

    void start();

    Logger create_logger() const { return Logger(channel_); }

    // Sends the Done sentinel and joins the consumer
    void finish();

private:
    void run();

    std::shared_ptr<LogChannel> channel_;
    Sink sink_;
    bool show_detail_;
    std::thread consumer_;
};

// spdlog color console rendering: info/success to stdout, the rest to stderr
LogAggregator::Sink make_console_sink();

} // namespace sblint
