#pragma once

#include <cstdio>

#ifndef ARPLACE_ENABLE_LOGGING
#define ARPLACE_ENABLE_LOGGING 0
#endif

#if ARPLACE_ENABLE_LOGGING
#define ARPLACE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[arplace] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define ARPLACE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[arplace][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define ARPLACE_LOG_DEBUG(...) do { } while (0)
#define ARPLACE_LOG_WARN(...) do { } while (0)
#endif
