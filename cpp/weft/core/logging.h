#pragma once

#include <cstdio>

#ifndef WEFT_ENABLE_LOGGING
#define WEFT_ENABLE_LOGGING 0
#endif

#if WEFT_ENABLE_LOGGING
#define WEFT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[weft] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define WEFT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[weft] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define WEFT_LOG_DEBUG(...) do { } while (0)
#define WEFT_LOG_WARN(...) do { } while (0)
#endif
