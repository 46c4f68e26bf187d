#pragma once

#include <cstdio>

#ifndef FREQCARD_ENABLE_LOGGING
#define FREQCARD_ENABLE_LOGGING 0
#endif

#if FREQCARD_ENABLE_LOGGING
#define FREQCARD_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[freqcard] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define FREQCARD_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[freqcard] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define FREQCARD_LOG_DEBUG(...) do { } while (0)
#define FREQCARD_LOG_WARN(...) do { } while (0)
#endif
