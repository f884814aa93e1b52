// Minimal logging utility (header-only) for the OpenDeploy core.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>

namespace opendeploy {

inline bool logEnabled() {
    const char* v = std::getenv("OPEN_DEPLOY_LOG");
    return v && *v && *v != '0';
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[OpenDeploy][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace opendeploy

#define LOGI(fmt, ...) \
    do { \
        if (opendeploy::logEnabled()) \
            opendeploy::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (opendeploy::logEnabled()) \
            opendeploy::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (opendeploy::logEnabled()) \
            opendeploy::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
