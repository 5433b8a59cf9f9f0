/**
 * @file vxs_logger.h
 * @brief VoxStream Core - Logger
 *
 * Process-wide logger that can be connected to the host application's
 * logging system. Without a callback, records go to stdout/stderr.
 *
 * Usage:
 *   VXS_LOG_INFO("Streaming.Parser", "Emitted chunk %lld", seq);
 *   VXS_LOG_ERROR("Streaming.Playback", "Sink failed: %s", msg);
 */

#ifndef VOXSTREAM_CORE_LOGGER_H
#define VOXSTREAM_CORE_LOGGER_H

#include <mutex>

namespace voxstream {

// =============================================================================
// LOG LEVELS
// =============================================================================

enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warning = 3, Error = 4, Fatal = 5 };

const char* log_level_to_string(LogLevel level);

// =============================================================================
// LOG CALLBACK TYPE
// =============================================================================

/**
 * External log callback type.
 *
 * @param level Log level
 * @param category Log category (e.g., "Streaming.Synthesis")
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
    static Logger& instance();

    void setCallback(LogCallback callback, void* user_data = nullptr);
    void setMinLevel(LogLevel level);
    LogLevel minLevel() const;

    // When disabled and no callback is set, records are dropped
    void setConsoleFallback(bool enabled);

    void log(LogLevel level, const char* category, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

   private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logToConsole(LogLevel level, const char* category, const char* message);

    mutable std::mutex mutex_;
    LogCallback callback_ = nullptr;
    void* user_data_ = nullptr;
    LogLevel min_level_ = LogLevel::Info;
    bool console_fallback_ = true;
};

}  // namespace voxstream

// =============================================================================
// CONVENIENCE MACROS
// =============================================================================

#define VXS_LOG_TRACE(category, ...) \
    voxstream::Logger::instance().log(voxstream::LogLevel::Trace, category, __VA_ARGS__)

#define VXS_LOG_DEBUG(category, ...) \
    voxstream::Logger::instance().log(voxstream::LogLevel::Debug, category, __VA_ARGS__)

#define VXS_LOG_INFO(category, ...) \
    voxstream::Logger::instance().log(voxstream::LogLevel::Info, category, __VA_ARGS__)

#define VXS_LOG_WARNING(category, ...) \
    voxstream::Logger::instance().log(voxstream::LogLevel::Warning, category, __VA_ARGS__)

#define VXS_LOG_ERROR(category, ...) \
    voxstream::Logger::instance().log(voxstream::LogLevel::Error, category, __VA_ARGS__)

#define VXS_LOG_FATAL(category, ...) \
    voxstream::Logger::instance().log(voxstream::LogLevel::Fatal, category, __VA_ARGS__)

#endif  // VOXSTREAM_CORE_LOGGER_H
