#pragma once

#include <cstdio>

#ifndef CIVCAD_ENABLE_LOGGING
#define CIVCAD_ENABLE_LOGGING 0
#endif

#if CIVCAD_ENABLE_LOGGING
#define CIVCAD_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[civcad] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define CIVCAD_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[civcad][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define CIVCAD_LOG_DEBUG(...) do { } while (0)
#define CIVCAD_LOG_WARN(...) do { } while (0)
#endif
