#ifndef CCMATCH_LOG_HPP
#define CCMATCH_LOG_HPP

#include <cstdio>
#include <thread>
#include <sstream>
#include <cstdarg>
#include <atomic>

namespace ccmatch {
namespace log {

enum class Level {
    Debug,
    Notice,
    Warning
};

inline const char* level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Notice: return "NOTICE";
        case Level::Warning: return "WARN";
    }
    return "LOG";
}

// Callback function type for log output routing
// The callback receives a formatted string (no newline at end)
using LogCallback = void (*)(Level level, const char* message);

// When null, messages go to stderr
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
             level_name(level), oss.str().c_str(), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
    } else {
        fprintf(stderr, "%s\n", full_message);
        fflush(stderr);
    }
}

} // namespace log
} // namespace ccmatch

#ifdef CCMATCH_ENABLE_DEBUG_OUTPUT
    #define CCMATCH_DEBUG(fmt, ...) ::ccmatch::log::log_output(::ccmatch::log::Level::Debug, fmt, ##__VA_ARGS__)
#else
    #define CCMATCH_DEBUG(fmt, ...) ((void)0)
#endif

#define CCMATCH_NOTICE(fmt, ...) ::ccmatch::log::log_output(::ccmatch::log::Level::Notice, fmt, ##__VA_ARGS__)
#define CCMATCH_WARN(fmt, ...) ::ccmatch::log::log_output(::ccmatch::log::Level::Warning, fmt, ##__VA_ARGS__)

#endif // CCMATCH_LOG_HPP
