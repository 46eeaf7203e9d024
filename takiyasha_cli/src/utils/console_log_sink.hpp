#ifndef TAKIYASHA_CONSOLE_LOG_SINK_HPP
#define TAKIYASHA_CONSOLE_LOG_SINK_HPP

#include "../../../libtakiyasha/include/log_sink.hpp"
#include <iostream>

/**
 * @brief Prints messages at or above a threshold to stderr.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) {
            return;
        }
        switch (level) {
            case LogLevel::Debug:
                std::cerr << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cerr << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // TAKIYASHA_CONSOLE_LOG_SINK_HPP
