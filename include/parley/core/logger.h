/**
 * @file logger.h
 * @brief Parley - Internal Logger
 *
 * Process-wide logger used by the core and the backends. Output goes to an
 * external callback when one is installed (host UI, test capture), otherwise
 * to stdout/stderr.
 *
 * Usage:
 *   PARLEY_LOG_INFO("Controller", "State %s -> %s", from, to);
 *   PARLEY_LOG_ERROR("ALSA", "Cannot open device: %s", err);
 */

#ifndef PARLEY_CORE_LOGGER_H
#define PARLEY_CORE_LOGGER_H

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace parley {

// =============================================================================
// LOG LEVELS
// =============================================================================

enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warning = 3, Error = 4, Fatal = 5 };

// =============================================================================
// LOG CALLBACK TYPE
// =============================================================================

/**
 * External log callback type.
 *
 * @param level Log level
 * @param category Log category (e.g., "Controller")
 * @param message Formatted message
 * @param user_data Optional user context
 */
using LogCallback = void (*)(LogLevel level, const char* category, const char* message,
                             void* user_data);

// =============================================================================
// LOGGER CLASS
// =============================================================================

class Logger {
   public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    // Route logs to an external sink; nullptr restores the console fallback
    void set_callback(LogCallback callback, void* user_data = nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = callback;
        user_data_ = user_data;
    }

    void set_min_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel min_level() {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_console_fallback(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_fallback_ = enabled;
    }

    void log(LogLevel level, const char* category, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 4, 5)))
#endif
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(level) < static_cast<int>(min_level_)) {
            return;
        }

        char buffer[2048];
        va_list args;
        va_start(args, format);
        vsnprintf(buffer, sizeof(buffer), format, args);
        va_end(args);

        if (callback_) {
            callback_(level, category, buffer, user_data_);
        } else if (console_fallback_) {
            log_to_console(level, category, buffer);
        }
    }

    static const char* level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:
                return "TRACE";
            case LogLevel::Debug:
                return "DEBUG";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Warning:
                return "WARN";
            case LogLevel::Error:
                return "ERROR";
            case LogLevel::Fatal:
                return "FATAL";
            default:
                return "???";
        }
    }

    // Accepts "trace", "debug", "info", "warn"/"warning", "error", "fatal"
    static bool level_from_string(const std::string& name, LogLevel& out_level) {
        if (name == "trace") {
            out_level = LogLevel::Trace;
        } else if (name == "debug") {
            out_level = LogLevel::Debug;
        } else if (name == "info") {
            out_level = LogLevel::Info;
        } else if (name == "warn" || name == "warning") {
            out_level = LogLevel::Warning;
        } else if (name == "error") {
            out_level = LogLevel::Error;
        } else if (name == "fatal") {
            out_level = LogLevel::Fatal;
        } else {
            return false;
        }
        return true;
    }

   private:
    Logger() = default;

    static void log_to_console(LogLevel level, const char* category, const char* message) {
        FILE* stream = (level >= LogLevel::Error) ? stderr : stdout;
        fprintf(stream, "[%s][%s] %s\n", level_to_string(level), category, message);
        fflush(stream);
    }

    std::mutex mutex_;
    LogCallback callback_ = nullptr;
    void* user_data_ = nullptr;
    LogLevel min_level_ = LogLevel::Info;
    bool console_fallback_ = true;
};

// =============================================================================
// CONVENIENCE MACROS
// =============================================================================

#define PARLEY_LOG_TRACE(category, ...) \
    parley::Logger::instance().log(parley::LogLevel::Trace, category, __VA_ARGS__)

#define PARLEY_LOG_DEBUG(category, ...) \
    parley::Logger::instance().log(parley::LogLevel::Debug, category, __VA_ARGS__)

#define PARLEY_LOG_INFO(category, ...) \
    parley::Logger::instance().log(parley::LogLevel::Info, category, __VA_ARGS__)

#define PARLEY_LOG_WARNING(category, ...) \
    parley::Logger::instance().log(parley::LogLevel::Warning, category, __VA_ARGS__)

#define PARLEY_LOG_ERROR(category, ...) \
    parley::Logger::instance().log(parley::LogLevel::Error, category, __VA_ARGS__)

#define PARLEY_LOG_FATAL(category, ...) \
    parley::Logger::instance().log(parley::LogLevel::Fatal, category, __VA_ARGS__)

}  // namespace parley

#endif  // PARLEY_CORE_LOGGER_H
