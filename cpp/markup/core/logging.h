#pragma once

#include <cstdio>

#ifndef MARKUP_ENABLE_LOGGING
#define MARKUP_ENABLE_LOGGING 0
#endif

#if MARKUP_ENABLE_LOGGING
#define MARKUP_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[markup] " __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define MARKUP_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[markup:warn] " __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define MARKUP_LOG_DEBUG(...) do { } while (0)
#define MARKUP_LOG_WARN(...) do { } while (0)
#endif
