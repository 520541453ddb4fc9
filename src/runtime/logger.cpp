#include "sblint/logger.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sblint {

// ============================================================================
// LogChannel Implementation
// ============================================================================

void LogChannel::send(LogMessage message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(message));
    }
    ready_.notify_one();
}

LogMessage LogChannel::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return !queue_.empty(); });
    LogMessage message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

void Logger::send(LogKind kind, const std::string& text) const {
    if (channel_) {
        channel_->send(LogMessage{kind, text});
    }
}

// ============================================================================
// LogAggregator Implementation
// ============================================================================

LogAggregator::LogAggregator(Sink sink, bool show_detail)
    : channel_(std::make_shared<LogChannel>()),
      sink_(std::move(sink)),
      show_detail_(show_detail) {}

LogAggregator::~LogAggregator() {
    if (consumer_.joinable()) {
        finish();
    }
}

void LogAggregator::start() {
    consumer_ = std::thread([this] { run(); });
}

void LogAggregator::finish() {
    channel_->send(LogMessage{LogKind::Done, {}});
    if (consumer_.joinable()) {
        consumer_.join();
    }
}

void LogAggregator::run() {
    for (;;) {
        LogMessage message = channel_->receive();
        if (message.kind == LogKind::Done) {
            break;
        }
        if (show_detail_ && sink_) {
            sink_(message);
        }
    }
}

// ============================================================================
// Console sink
// ============================================================================

LogAggregator::Sink make_console_sink() {
    auto out = spdlog::get("sblint.out");
    if (!out) {
        out = spdlog::stdout_color_mt("sblint.out");
        out->set_pattern("%^%v%$");
    }
    auto err = spdlog::get("sblint.err");
    if (!err) {
        err = spdlog::stderr_color_mt("sblint.err");
        err->set_pattern("%^%v%$");
    }

    return [out, err](const LogMessage& message) {
        switch (message.kind) {
            case LogKind::Info:
                out->info(message.text);
                break;
            case LogKind::Success:
                out->info("[✔] {}", message.text);
                break;
            case LogKind::Warn:
                err->warn("[⚠️] {}", message.text);
                break;
            case LogKind::Error:
                err->error("[〤] {}", message.text);
                break;
            case LogKind::Custom:
                err->info(message.text);
                break;
            case LogKind::Done:
                break;
        }
    };
}

} // namespace sblint
