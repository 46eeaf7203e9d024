/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * The library never installs a sink on its own: without sinks every
 * message is dropped. Front-ends (the CLI, tests) decide where logs go.
 */

#ifndef TAKIYASHA_LOGGER_HPP
#define TAKIYASHA_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for takiyasha.
 *
 * Delegates every message to all registered ILogSink implementations.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of it.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Drop messages below @p level before they reach any sink.
     *
     * Defaults to LogLevel::Debug, i.e. nothing is filtered. Library code
     * logs capability failures at Debug, so front-ends usually raise it.
     */
    static void set_threshold(LogLevel level);

    static LogLevel threshold();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "takiyasha").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "takiyasha");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a --log-level value to its LogLevel.
     * Accepts both "WARNING" and the short "WARN" printed by level_to_string.
     * Case-sensitive. Returns LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static LogLevel threshold_;
    static std::mutex mtx_;
};

#endif // TAKIYASHA_LOGGER_HPP
