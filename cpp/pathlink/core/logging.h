#pragma once

#include <cstdio>

#ifndef PATHLINK_ENABLE_LOGGING
#define PATHLINK_ENABLE_LOGGING 0
#endif

#if PATHLINK_ENABLE_LOGGING
#define PATHLINK_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[DEBUG] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define PATHLINK_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[WARN] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define PATHLINK_LOG_DEBUG(...) do { } while (0)
#define PATHLINK_LOG_WARN(...) do { } while (0)
#endif
