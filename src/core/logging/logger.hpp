#pragma once
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace hookguard::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    // Diagnostics go to stderr: stdout belongs to the host protocol.
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

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }
            std::cerr << "[hookguard] [" << level_to_string(level) << "] "
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::WARN;

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
    #define LOG_DEBUG(msg) hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) hookguard::core::logging::Logger::get().log(hookguard::core::logging::LogLevel::ERROR, msg)

} // namespace hookguard::core::logging
