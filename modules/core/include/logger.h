#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <functional>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Protocol traces (timers, frames)
    INFO = 1,      // Session lifecycle events
    WARNING = 2,   // Recoverable problems
    ERROR = 3,     // Failures
    NONE = 4,      // Disable all logging
};

// Tag prepended to every log line, e.g. the local device name.
void setLogTag(const std::string& tag);

void nativeLog(LogLevel level, const std::string& message);

// Redirect log lines (already formatted) to a callback instead of stderr.
// Pass an empty function to restore stderr output.
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses "debug", "info", "warning"/"warn", "error", "none" (case-insensitive).
// Unknown names map to INFO.
LogLevel log_level_from_string(const std::string& name);
const char* log_level_to_string(LogLevel level);

// Async mode pushes lines to a queue drained by a background thread.
// disable_async_logging() flushes the queue before returning.
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) nativeLog(LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) nativeLog(LogLevel::INFO, msg)
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) nativeLog(LogLevel::WARNING, msg)
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) nativeLog(LogLevel::ERROR, msg)

#endif // LOGGER_H
