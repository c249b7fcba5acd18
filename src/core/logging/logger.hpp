#pragma once
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace sqlbridge::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one sink
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            tag_ = tag;
        }

        void set_min_level(const LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // The stream must outlive every subsequent log call.
        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        bool enabled(const LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Pump threads log too
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] "
                  << (tag_.empty() ? "" : "[" + tag_ + "] ")
                  << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string tag_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cout;

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
    #define LOG_DEBUG(msg) sqlbridge::core::logging::Logger::get().log(sqlbridge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  sqlbridge::core::logging::Logger::get().log(sqlbridge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  sqlbridge::core::logging::Logger::get().log(sqlbridge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) sqlbridge::core::logging::Logger::get().log(sqlbridge::core::logging::LogLevel::ERROR, msg)

} // namespace sqlbridge::core::logging
