#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace docanalyst::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr; stdout is reserved for results.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_request_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            request_tag_ = tag;
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
                      << (request_tag_.empty() ? "" : "[" + request_tag_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string request_tag_;
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

    #define DOCANALYST_LOG_DEBUG(msg) docanalyst::core::logging::Logger::get().log(docanalyst::core::logging::LogLevel::DEBUG, msg)
    #define DOCANALYST_LOG_INFO(msg)  docanalyst::core::logging::Logger::get().log(docanalyst::core::logging::LogLevel::INFO, msg)
    #define DOCANALYST_LOG_WARN(msg)  docanalyst::core::logging::Logger::get().log(docanalyst::core::logging::LogLevel::WARN, msg)
    #define DOCANALYST_LOG_ERROR(msg) docanalyst::core::logging::Logger::get().log(docanalyst::core::logging::LogLevel::ERROR, msg)

} // namespace docanalyst::core::logging
