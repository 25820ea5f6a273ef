#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace turnloom::core::logging {

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

    // Process-wide logger. Every component writes through the macros below.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Context is printed in brackets before every message (e.g. a thread key).
        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // The stream must outlive every later log call.
        void set_stream(std::ostream* out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = out != nullptr ? out : &std::cout;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *out_ << timestamp() << " [" << level_to_string(level) << "] "
                  << (context_.empty() ? "" : "[" + context_ + "] ")
                  << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cout;

        // UTC, millisecond precision.
        static std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now.time_since_epoch()).count() % 1000;
            std::tm utc{};
            gmtime_r(&seconds, &utc);
            std::ostringstream out;
            out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3)
                << std::setfill('0') << millis << "Z";
            return out.str();
        }

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

    #define TURNLOOM_LOG_DEBUG(msg) turnloom::core::logging::Logger::get().log(turnloom::core::logging::LogLevel::DEBUG, msg)
    #define TURNLOOM_LOG_INFO(msg)  turnloom::core::logging::Logger::get().log(turnloom::core::logging::LogLevel::INFO, msg)
    #define TURNLOOM_LOG_WARN(msg)  turnloom::core::logging::Logger::get().log(turnloom::core::logging::LogLevel::WARN, msg)
    #define TURNLOOM_LOG_ERROR(msg) turnloom::core::logging::Logger::get().log(turnloom::core::logging::LogLevel::ERROR, msg)

} // namespace turnloom::core::logging
