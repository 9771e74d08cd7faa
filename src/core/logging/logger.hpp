#pragma once
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace toolguard::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger shared by every executor instance.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_scope(const std::string& scope) {
            std::lock_guard<std::mutex> lock(mutex_);
            scope_ = scope;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // The stream must outlive every later log call.
        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] "
                  << (scope_.empty() ? "" : "[" + scope_ + "] ")
                  << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string scope_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::clog;

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define TOOLGUARD_LOG_DEBUG(msg) toolguard::core::logging::Logger::get().log(toolguard::core::logging::LogLevel::DEBUG, msg)
    #define TOOLGUARD_LOG_INFO(msg)  toolguard::core::logging::Logger::get().log(toolguard::core::logging::LogLevel::INFO, msg)
    #define TOOLGUARD_LOG_WARN(msg)  toolguard::core::logging::Logger::get().log(toolguard::core::logging::LogLevel::WARN, msg)
    #define TOOLGUARD_LOG_ERROR(msg) toolguard::core::logging::Logger::get().log(toolguard::core::logging::LogLevel::ERROR, msg)

} // namespace toolguard::core::logging
