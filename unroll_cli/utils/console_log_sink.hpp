#ifndef UNROLL_CONSOLE_LOG_SINK_HPP
#define UNROLL_CONSOLE_LOG_SINK_HPP

#include "../../libunroll/include/log_sink.hpp"
#include "../../libunroll/include/logger.hpp"
#include <iostream>
#include <mutex>

// stdout carries the JSON report, so every level goes to stderr
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Warning; ///< Minimum level printed

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case LogLevel::Debug:   std::cerr << "[DEBUG]"; break;
            case LogLevel::Info:    std::cerr << "[INFO ]"; break;
            case LogLevel::Warning: std::cerr << "[WARN ]"; break;
            case LogLevel::Error:   std::cerr << "[ERROR]"; break;
        }
        std::cerr << "[" << tag << "] " << message << std::endl;
    }

private:
    std::mutex mtx_;
};

#endif // UNROLL_CONSOLE_LOG_SINK_HPP
