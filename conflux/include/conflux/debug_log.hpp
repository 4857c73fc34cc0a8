#ifndef CONFLUX_DEBUG_LOG_HPP
#define CONFLUX_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <thread>

namespace conflux {
namespace log {

enum class Level {
    Debug = 0,
    Info,
    Warn,
    Error
};

inline const char* level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "LOG";
}

// Callback function type for log routing.
// The callback receives the level and a formatted string (no newline at end).
using LogCallback = void (*)(Level level, const char* message);

// Process-wide sink. When null, messages go to stdout (debug/info) or stderr (warn/error).
inline std::atomic<LogCallback> g_log_callback{nullptr};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

// Internal: format and output a message
inline void log_output(Level level, const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[%s][T%s] %s",
             level_tag(level), oss.str().c_str(), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
    } else if (level >= Level::Warn) {
        fprintf(stderr, "%s\n", full_message);
        fflush(stderr);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

} // namespace log
} // namespace conflux

// Debug output is compiled out unless CONFLUX_ENABLE_DEBUG_OUTPUT is defined
#ifdef CONFLUX_ENABLE_DEBUG_OUTPUT
    #define CONFLUX_LOG_DEBUG(fmt, ...) ::conflux::log::log_output(::conflux::log::Level::Debug, fmt, ##__VA_ARGS__)
#else
    #define CONFLUX_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define CONFLUX_LOG_INFO(fmt, ...) ::conflux::log::log_output(::conflux::log::Level::Info, fmt, ##__VA_ARGS__)
#define CONFLUX_LOG_WARN(fmt, ...) ::conflux::log::log_output(::conflux::log::Level::Warn, fmt, ##__VA_ARGS__)
#define CONFLUX_LOG_ERROR(fmt, ...) ::conflux::log::log_output(::conflux::log::Level::Error, fmt, ##__VA_ARGS__)

#endif // CONFLUX_DEBUG_LOG_HPP
