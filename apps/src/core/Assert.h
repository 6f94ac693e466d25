#pragma once

#include <spdlog/spdlog.h>
#include <cstdlib>

/**
 * Runtime assertion that works in both debug and release builds.
 *
 * Unlike standard assert(), FLAPEVO_ASSERT is never compiled out.
 * Use for caller bugs that the engine cannot recover from.
 *
 * When an assertion fails:
 * - Logs a CRITICAL message with file, line, and condition
 * - Aborts the program immediately
 *
 * Example:
 *   FLAPEVO_ASSERT(inputs.size() == NetworkParameters::INPUT_SIZE,
 *                  "Policy expects exactly four inputs");
 */
#define FLAPEVO_ASSERT(condition, message)                                                  \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
