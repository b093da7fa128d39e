/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Logger is the single entry point for all logging in libunroll. It
 * delegates messages to one or more registered ILogSink implementations;
 * with no sinks installed, messages are dropped.
 */

#ifndef UNROLL_LOGGER_HPP
#define UNROLL_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "unroll").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "unroll");

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
     * @brief Parses a level name (DEBUG, INFO, WARNING/WARN, ERROR).
     * @return The level, or std::nullopt for "NONE" or an unknown name.
     */
    static std::optional<LogLevel> string_to_level(const std::string& level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

#endif // UNROLL_LOGGER_HPP
