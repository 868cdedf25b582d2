#pragma once

#include <cstdio>

#ifndef MEMHIST_ENABLE_LOGGING
#define MEMHIST_ENABLE_LOGGING 0
#endif

#if MEMHIST_ENABLE_LOGGING
#define MEMHIST_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[memhist] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define MEMHIST_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[memhist][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define MEMHIST_LOG_DEBUG(...) do { } while (0)
#define MEMHIST_LOG_WARN(...) do { } while (0)
#endif
