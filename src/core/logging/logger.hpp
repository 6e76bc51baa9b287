#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace cmdgate::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr; stdout is reserved for decisions.
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

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << "[cmdgate] " << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define CMDGATE_LOG_DEBUG(msg) cmdgate::core::logging::Logger::get().log(cmdgate::core::logging::LogLevel::DEBUG, msg)
    #define CMDGATE_LOG_INFO(msg)  cmdgate::core::logging::Logger::get().log(cmdgate::core::logging::LogLevel::INFO, msg)
    #define CMDGATE_LOG_WARN(msg)  cmdgate::core::logging::Logger::get().log(cmdgate::core::logging::LogLevel::WARN, msg)
    #define CMDGATE_LOG_ERROR(msg) cmdgate::core::logging::Logger::get().log(cmdgate::core::logging::LogLevel::ERROR, msg)

} // namespace cmdgate::core::logging
