/**
 * @file logger.hpp
 * @brief Thread-safe logging for the discovery engine and daemon.
 *
 * Structured log lines with a severity level, a component tag and a
 * timestamp. Records go to stderr unless a sink is installed, which
 * is how tests capture what the engine reports.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/utils/export.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace sdcdisco {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Parse a level name (case-sensitive, upper case).
 * @return The parsed level, INFO for unknown names.
 */
SDCDISCO_UTILS_API LogLevel parseLogLevel(const std::string& name);

/**
 * @brief Receives every record that passes the level filter.
 */
using LogSink = std::function<void(LogLevel level,
                                   const std::string& component,
                                   const std::string& message)>;

/**
 * @class Logger
 * @brief Thread-safe singleton logger.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Discovery", "Published {} on {} addresses", epr, count);
 * @endcode
 */
class SDCDISCO_UTILS_API Logger {
public:
    static Logger& instance();

    /**
     * @brief Printable name of a level ("INFO", "WARN", ...).
     */
    static std::string levelName(LogLevel level);

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colours on the stderr sink.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Replace the stderr output with a custom sink.
     *
     * Passing an empty function restores the stderr output.
     */
    void setSink(LogSink sink);

    /**
     * @brief Log a message; `{}` placeholders are replaced in order.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream oss;
        formatInto(oss, format, std::forward<Args>(args)...);
        write(level, component, oss.str());
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();

    void write(LogLevel level, const char* component, const std::string& message);

    static void formatInto(std::ostringstream& oss, const char* format) {
        oss << format;
    }

    template<typename T, typename... Args>
    static void formatInto(std::ostringstream& oss, const char* format, T&& value, Args&&... args) {
        while (*format) {
            if (format[0] == '{' && format[1] == '}') {
                oss << value;
                formatInto(oss, format + 2, std::forward<Args>(args)...);
                return;
            }
            oss << *format++;
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    LogSink sink_;
};

}  // namespace utils
}  // namespace sdcdisco

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::sdcdisco::utils::Logger::instance().log(::sdcdisco::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::sdcdisco::utils::Logger::instance().log(::sdcdisco::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::sdcdisco::utils::Logger::instance().log(::sdcdisco::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::sdcdisco::utils::Logger::instance().log(::sdcdisco::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::sdcdisco::utils::Logger::instance().log(::sdcdisco::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::sdcdisco::utils::Logger::instance().log(::sdcdisco::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Arguments are only evaluated when the condition holds and the level is enabled
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::sdcdisco::utils::Logger::instance().isEnabled(level)) { \
            ::sdcdisco::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)
