#pragma once

/// Logging macros for the rendering engine.
/// Messages go to stderr. Debug output is compiled in only when
/// DOCPRINT_DEBUG_LOG is defined, since layout logs once per line.

#include <cstdio>

#ifdef DOCPRINT_DEBUG_LOG
#define DP_LOGD(fmt, ...) fprintf(stderr, "[docprint D] " fmt "\n", ##__VA_ARGS__)
#else
#define DP_LOGD(fmt, ...) ((void)0)
#endif

#define DP_LOGI(fmt, ...) fprintf(stderr, "[docprint I] " fmt "\n", ##__VA_ARGS__)
#define DP_LOGW(fmt, ...) fprintf(stderr, "[docprint W] " fmt "\n", ##__VA_ARGS__)
