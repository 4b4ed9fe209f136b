#pragma once

#include <cstdio>

#ifndef SEGMENT_RESHAPE_ENABLE_LOGGING
#define SEGMENT_RESHAPE_ENABLE_LOGGING 0
#endif

#if SEGMENT_RESHAPE_ENABLE_LOGGING
#define SEGMENT_RESHAPE_LOG_DEBUG(...) \
  do { \
    std::fprintf(stderr, "[segment_reshape] "); \
    std::fprintf(stderr, __VA_ARGS__); \
    std::fprintf(stderr, "\n"); \
  } while (0)
#define SEGMENT_RESHAPE_LOG_WARN(...) \
  do { \
    std::fprintf(stderr, "[segment_reshape] warning: "); \
    std::fprintf(stderr, __VA_ARGS__); \
    std::fprintf(stderr, "\n"); \
  } while (0)
#else
#define SEGMENT_RESHAPE_LOG_DEBUG(...) do { } while (0)
#define SEGMENT_RESHAPE_LOG_WARN(...) do { } while (0)
#endif
