#ifndef UNROLL_LOG_SINK_HPP
#define UNROLL_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use the level to filter or format output.
 */
enum class LogLevel {
    Debug,   ///< Diagnostic detail (per-entry walk decisions, subprocess argv)
    Info,    ///< Normal operation (request accepted, workspace created)
    Warning, ///< Recoverable problems (cleanup failure, depth cap reached)
    Error    ///< A request failed
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define how log messages are delivered
 * (console, file, ...). The Logger class fans messages out to every
 * registered sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // UNROLL_LOG_SINK_HPP
