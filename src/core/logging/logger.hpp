#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace pokeme::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // Output goes to stderr: stdout belongs to answers printed by `pokeme ask`.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_component(const std::string& component) {
            std::lock_guard<std::mutex> lock(mutex_);
            component_ = component;
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

            std::clog << "[" << level_to_string(level) << "] "
                      << (component_.empty() ? "" : "[" + component_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string component_;
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

    // 3. Helper macros for clean syntax everywhere else in the code
    #define POKEME_LOG_DEBUG(msg) pokeme::core::logging::Logger::get().log(pokeme::core::logging::LogLevel::DEBUG, msg)
    #define POKEME_LOG_INFO(msg)  pokeme::core::logging::Logger::get().log(pokeme::core::logging::LogLevel::INFO, msg)
    #define POKEME_LOG_WARN(msg)  pokeme::core::logging::Logger::get().log(pokeme::core::logging::LogLevel::WARN, msg)
    #define POKEME_LOG_ERROR(msg) pokeme::core::logging::Logger::get().log(pokeme::core::logging::LogLevel::ERROR, msg)

} // namespace pokeme::core::logging
