// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <cstdint>

// Per-callsite sampled logging for the 20 Hz simulation drivers.
// Emits every Nth invocation only; the level check happens inside the log call.
// Usage: TTT_LOG_EVERY_N(debug, 200, "[enemy] alive={}", count);
#define TTT_LOG_EVERY_N(level, N, ...) \
    do { \
        static uint64_t ttt_log_every_n_counter = 0; \
        if ((ttt_log_every_n_counter++ % (N)) == 0) { \
            ttt::log::level(__VA_ARGS__); \
        } \
    } while (0)
