/**
 * @file logger.hpp
 * @brief Logging utilities for planner diagnostics
 */

#pragma once

#include <cstdarg>
#include <cstdio>
#include <functional>
#include <utility>

namespace ramp::utils {

/**
 * @brief Log levels
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal,
    Off
};

/**
 * @brief Process-wide logger
 *
 * Messages below the configured level are discarded before formatting.
 * Output goes to stderr unless a callback is installed.
 */
class Logger {
public:
    /**
     * @brief Log output callback type
     */
    using OutputCallback = std::function<void(LogLevel, const char*)>;

    /**
     * @brief Get singleton instance
     */
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @brief Set minimum log level
     * @param level Minimum level to output
     */
    void setLevel(LogLevel level) {
        minLevel_ = level;
    }

    /**
     * @brief Get current log level
     */
    LogLevel getLevel() const { return minLevel_; }

    /**
     * @brief Set output callback (empty callback restores stderr output)
     */
    void setOutputCallback(OutputCallback callback) {
        outputCallback_ = std::move(callback);
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::Off && level >= minLevel_;
    }

    /**
     * @brief Log message at specified level
     */
    void log(LogLevel level, const char* format, ...) {
        va_list args;
        va_start(args, format);
        vlog(level, format, args);
        va_end(args);
    }

    void trace(const char* format, ...) {
        va_list args;
        va_start(args, format);
        vlog(LogLevel::Trace, format, args);
        va_end(args);
    }

    void debug(const char* format, ...) {
        va_list args;
        va_start(args, format);
        vlog(LogLevel::Debug, format, args);
        va_end(args);
    }

    void info(const char* format, ...) {
        va_list args;
        va_start(args, format);
        vlog(LogLevel::Info, format, args);
        va_end(args);
    }

    void warning(const char* format, ...) {
        va_list args;
        va_start(args, format);
        vlog(LogLevel::Warning, format, args);
        va_end(args);
    }

    void error(const char* format, ...) {
        va_list args;
        va_start(args, format);
        vlog(LogLevel::Error, format, args);
        va_end(args);
    }

    // Fatal ignores the level filter unless logging is switched off
    void fatal(const char* format, ...) {
        if (minLevel_ == LogLevel::Off) return;
        va_list args;
        va_start(args, format);
        emit(LogLevel::Fatal, format, args);
        va_end(args);
    }

    static const char* getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return "TRACE";
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO ";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Fatal:   return "FATAL";
            default:                return "?????";
        }
    }

private:
    Logger() : minLevel_(LogLevel::Info) {}

    void vlog(LogLevel level, const char* format, va_list args) {
        if (!isEnabled(level)) return;
        emit(level, format, args);
    }

    void emit(LogLevel level, const char* format, va_list args) {
        char buffer[256];
        std::vsnprintf(buffer, sizeof(buffer), format, args);

        if (outputCallback_) {
            outputCallback_(level, buffer);
        } else {
            std::fprintf(stderr, "[%s] %s\n", getLevelString(level), buffer);
        }
    }

    LogLevel minLevel_;
    OutputCallback outputCallback_;
};

// Global logging macros
#define RAMP_LOG_TRACE(...)   ramp::utils::Logger::instance().trace(__VA_ARGS__)
#define RAMP_LOG_DEBUG(...)   ramp::utils::Logger::instance().debug(__VA_ARGS__)
#define RAMP_LOG_INFO(...)    ramp::utils::Logger::instance().info(__VA_ARGS__)
#define RAMP_LOG_WARNING(...) ramp::utils::Logger::instance().warning(__VA_ARGS__)
#define RAMP_LOG_ERROR(...)   ramp::utils::Logger::instance().error(__VA_ARGS__)
#define RAMP_LOG_FATAL(...)   ramp::utils::Logger::instance().fatal(__VA_ARGS__)

}  // namespace ramp::utils
