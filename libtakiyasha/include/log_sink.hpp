/**
 * @file log_sink.hpp
 * @brief Severity levels and the abstract sink used by Logger.
 */

#ifndef TAKIYASHA_LOG_SINK_HPP
#define TAKIYASHA_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Probe details (capability failures, opened streams)
    Info,    ///< Normal progress of a probe run
    Warning, ///< Inputs that were skipped or could not be classified
    Error    ///< Failures that stop processing of an input
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages end up (console, file, ...).
 * The Logger facade fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // TAKIYASHA_LOG_SINK_HPP
