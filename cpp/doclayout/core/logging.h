#pragma once

#include <cstdio>

#ifndef DOCLAYOUT_ENABLE_LOGGING
#define DOCLAYOUT_ENABLE_LOGGING 0
#endif

#if DOCLAYOUT_ENABLE_LOGGING
#define DOCLAYOUT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[doclayout] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define DOCLAYOUT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[doclayout][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define DOCLAYOUT_LOG_DEBUG(...) do { } while (0)
#define DOCLAYOUT_LOG_WARN(...) do { } while (0)
#endif
