/**
 * @file vxs_logger.cpp
 * @brief VoxStream Core - Logger implementation
 */

#include "voxstream/core/vxs_logger.h"

#include <cstdarg>
#include <cstdio>

namespace voxstream {

const char* log_level_to_string(LogLevel level) {
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

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::setCallback(LogCallback callback, void* user_data) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = callback;
    user_data_ = user_data;
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::minLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::setConsoleFallback(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_fallback_ = enabled;
}

void Logger::log(LogLevel level, const char* category, const char* format, ...) {
    if (static_cast<int>(level) < static_cast<int>(minLevel())) {
        return;
    }

    char buffer[2048];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(mutex_);
    if (callback_) {
        callback_(level, category ? category : "", buffer, user_data_);
    } else if (console_fallback_) {
        logToConsole(level, category ? category : "", buffer);
    }
}

void Logger::logToConsole(LogLevel level, const char* category, const char* message) {
    FILE* stream = (level >= LogLevel::Error) ? stderr : stdout;
    fprintf(stream, "[%s][%s] %s\n", log_level_to_string(level), category, message);
    fflush(stream);
}

}  // namespace voxstream
