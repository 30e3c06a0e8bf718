#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <functional>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Session transitions, scans
    WARNING = 2,   // Recoverable problems
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

// Tag printed in front of every line (e.g. local device name)
void setLogTag(const std::string& tag);

// Writes a message at INFO level regardless of the macros below.
void nativeLog(const std::string& message);
void logAt(LogLevel level, const std::string& message);

// Set a callback for log lines (the desktop node prints them itself).
// Passing an empty function restores the default sink.
// The callback runs under the logger lock and must not log itself.
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses debug|info|warn|warning|error|none, falls back to INFO.
LogLevel parse_log_level(const std::string& value);

// Async logging: lines go to a queue drained by a background thread
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) logAt(LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) logAt(LogLevel::INFO, msg)
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) logAt(LogLevel::WARNING, msg)
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) logAt(LogLevel::ERROR, msg)

#endif // LOGGER_H
