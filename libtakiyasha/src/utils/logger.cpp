#include "../../include/logger.hpp"

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
LogLevel Logger::threshold_ = LogLevel::Debug;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::set_threshold(const LogLevel level) {
    std::lock_guard lock(mtx_);
    threshold_ = level;
}

LogLevel Logger::threshold() {
    std::lock_guard lock(mtx_);
    return threshold_;
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    if (level < threshold_) {
        return;
    }
    for (const auto& sink : sinks_) {
        if (sink) {
            sink->log(level, msg, tag);
        }
    }
}
