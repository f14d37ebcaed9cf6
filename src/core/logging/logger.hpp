#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace transpiler::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    // stdout carries the JSON-RPC stream, so every line goes to stderr unless a
    // test swaps the sink.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void set_sink(std::ostream& sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = &sink;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }
            *sink_ << "[" << level_to_string(level) << "] " << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::cerr;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define LOG_DEBUG(msg) transpiler::core::logging::Logger::get().log(transpiler::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  transpiler::core::logging::Logger::get().log(transpiler::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  transpiler::core::logging::Logger::get().log(transpiler::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) transpiler::core::logging::Logger::get().log(transpiler::core::logging::LogLevel::ERROR, msg)

} // namespace transpiler::core::logging
