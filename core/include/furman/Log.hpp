// Minimal logging utility (header-only) for the Furman transfer engine.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>

namespace furman {

inline bool logEnabled() {
    const char* v = std::getenv("FURMAN_LOG");
    return v && *v && *v != '0';
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[Furman][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace furman

#define LOGI(fmt, ...) \
    do { \
        if (furman::logEnabled()) \
            furman::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (furman::logEnabled()) \
            furman::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (furman::logEnabled()) \
            furman::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
