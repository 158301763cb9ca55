/**
 * @file logger.cpp
 * @brief Logger output and level parsing.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/utils/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace sdcdisco {
namespace utils {

namespace {

const char* colorCode(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        default:              return "";
    }
}

}  // namespace

LogLevel parseLogLevel(const std::string& name) {
    if (name == "TRACE") return LogLevel::TRACE;
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO") return LogLevel::INFO;
    if (name == "WARN") return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "FATAL") return LogLevel::FATAL;
    if (name == "OFF") return LogLevel::OFF;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(static_cast<int>(LogLevel::INFO))
    , colorEnabled_(true)
{}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "?????";
}

void Logger::setSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::write(LogLevel level, const char* component, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            sink_(level, component, message);
        } else {
            auto now = std::chrono::system_clock::now();
            auto timeNow = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            std::tm tmBuf{};
#ifdef _WIN32
            localtime_s(&tmBuf, &timeNow);
#else
            localtime_r(&timeNow, &tmBuf);
#endif
            bool color = colorEnabled_.load(std::memory_order_relaxed);

            std::ostringstream oss;
            oss << "[" << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
                << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
            if (color) {
                oss << colorCode(level);
            }
            oss << "[" << std::left << std::setfill(' ') << std::setw(5) << levelName(level) << "]";
            if (color) {
                oss << "\033[0m";
            }
            oss << " [" << component << "] " << message;
            std::cerr << oss.str() << std::endl;
        }
    }

    if (level == LogLevel::FATAL) {
        std::abort();
    }
}

}  // namespace utils
}  // namespace sdcdisco
