#ifndef RELICRANDO_DEBUG_LOG_HPP
#define RELICRANDO_DEBUG_LOG_HPP

#include <cstdio>
#include <thread>
#include <sstream>
#include <cstdarg>
#include <atomic>

namespace relicrando {
namespace debug {

enum class Level : int {
    Info = 0,   // Search outcome
    Debug = 1,  // Dispatch, cancellation, winner selection
    Trace = 2   // Per-attempt detail from the placement search
};

// Callback receives the formatted line without a trailing newline.
// When none is set, output goes to stdout.
using DebugCallback = void (*)(const char* message);

inline std::atomic<DebugCallback> g_debug_callback{nullptr};
inline std::atomic<int> g_debug_level{static_cast<int>(Level::Debug)};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

// Messages above this level are dropped
inline void set_debug_level(Level level) {
    g_debug_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

inline bool level_enabled(Level level) {
    return static_cast<int>(level) <= g_debug_level.load(std::memory_order_relaxed);
}

inline const char* level_tag(Level level) {
    switch (level) {
        case Level::Info: return "INFO";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?";
}

inline void debug_output(Level level, const char* fmt, ...) {
    if (!level_enabled(level)) return;

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

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(full_message);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace relicrando

// Compiled out unless RELICRANDO_ENABLE_DEBUG_OUTPUT is defined
#ifdef RELICRANDO_ENABLE_DEBUG_OUTPUT
    #define RELICRANDO_INFO_LOG(fmt, ...) \
        ::relicrando::debug::debug_output(::relicrando::debug::Level::Info, fmt, ##__VA_ARGS__)
    #define RELICRANDO_DEBUG_LOG(fmt, ...) \
        ::relicrando::debug::debug_output(::relicrando::debug::Level::Debug, fmt, ##__VA_ARGS__)
    #define RELICRANDO_TRACE_LOG(fmt, ...) \
        ::relicrando::debug::debug_output(::relicrando::debug::Level::Trace, fmt, ##__VA_ARGS__)
#else
    #define RELICRANDO_INFO_LOG(fmt, ...) ((void)0)
    #define RELICRANDO_DEBUG_LOG(fmt, ...) ((void)0)
    #define RELICRANDO_TRACE_LOG(fmt, ...) ((void)0)
#endif

#endif // RELICRANDO_DEBUG_LOG_HPP
