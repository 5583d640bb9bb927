#pragma once

#include <cstdio>

#ifndef LAYOUT_ENABLE_LOGGING
#define LAYOUT_ENABLE_LOGGING 0
#endif

#if LAYOUT_ENABLE_LOGGING
#define LAYOUT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[layout] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define LAYOUT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[layout][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define LAYOUT_LOG_DEBUG(...) do { } while (0)
#define LAYOUT_LOG_WARN(...) do { } while (0)
#endif
