#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace coderunner::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::string to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO:  return "info";
            case LogLevel::WARN:  return "warn";
            case LogLevel::ERROR: return "error";
            default: return "unknown";
        }
    }

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info")  return LogLevel::INFO;
        if (text == "warn")  return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    // Writes to stderr: stdout carries the event stream of the serve loop.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            tag_ = tag;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (tag_.empty() ? "" : "[" + tag_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string tag_;
        LogLevel min_level_ = LogLevel::INFO;

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

    // 3. Helper macros used everywhere else in the code
    #define LOG_DEBUG(msg) coderunner::core::logging::Logger::get().log(coderunner::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  coderunner::core::logging::Logger::get().log(coderunner::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  coderunner::core::logging::Logger::get().log(coderunner::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) coderunner::core::logging::Logger::get().log(coderunner::core::logging::LogLevel::ERROR, msg)

} // namespace coderunner::core::logging
