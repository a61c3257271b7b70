#pragma once

#ifdef __cplusplus

#include <cstdio>
#include <atomic>

namespace strata {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Process-wide log level, defined in strata.cpp.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

}  // namespace strata

#define STRATA_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(strata::g_log_level.load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define STRATA_LOG_ERROR(tag, fmt, ...) STRATA_LOG(strata::log_level::error, tag, fmt, ##__VA_ARGS__)
#define STRATA_LOG_WARN(tag, fmt, ...)  STRATA_LOG(strata::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define STRATA_LOG_INFO(tag, fmt, ...)  STRATA_LOG(strata::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define STRATA_LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define STRATA_LOG_DEBUG(tag, fmt, ...) STRATA_LOG(strata::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
