#pragma once

#include <cstdio>
#include <atomic>

// Diagnostics for the mapping core. Each component logs under its own tag
// ("db", "mapper", "migrate", "processor", "wire", "store"), one line per
// event on stderr:
//
//   [migrate] Created table articles for type article (3 columns)
//
// Nothing is printed until a level is set, either directly or through
// configuration::log when a store opens.

namespace trellis {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Shared by every store in the process; defined in store.cpp.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

}  // namespace trellis

#define TRELLIS_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(trellis::g_log_level.load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

// Failed statements and schema build failures
#define LOG_ERROR(tag, fmt, ...) TRELLIS_LOG(trellis::log_level::error, tag, fmt, ##__VA_ARGS__)
// Rolled-back batches and malformed wire payloads
#define LOG_WARN(tag, fmt, ...)  TRELLIS_LOG(trellis::log_level::warn, tag, fmt, ##__VA_ARGS__)
// Store open/close and table creation
#define LOG_INFO(tag, fmt, ...)  TRELLIS_LOG(trellis::log_level::info, tag, fmt, ##__VA_ARGS__)

// Per-operation and per-statement tracing; compiled out of release builds
#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) TRELLIS_LOG(trellis::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif
