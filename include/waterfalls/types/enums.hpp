#pragma once
/**
 * @file enums.hpp
 * @brief Enum definitions
 */

#include <cstdint>

namespace waterfalls {

/**
 * @brief Lineage of the process a Timer was created in.
 *
 * Main writes `waterfalls.json`; Child writes `waterfalls.<pid>.json` and
 * flushes its report on every stop() because forked children cannot rely
 * on the parent's exit hook.
 */
enum class ProcessRole : uint8_t {
    Main  = 0,
    Child = 1
};

/**
 * @brief Display unit of the chart time axis.
 */
enum class TimeUnit : uint8_t {
    Nanoseconds  = 0,
    Microseconds = 1,
    Milliseconds = 2,
    Seconds      = 3,
    Minutes      = 4,
    Hours        = 5
};

enum class Severity : uint8_t {
    Info    = 0,
    Warning = 1,
    Error   = 2
};

enum class DiagnosticKind : uint8_t {
    DoubleStart       = 0,  ///< start() while already running
    StopWithoutStart  = 1,  ///< stop() while idle
    EmptyReport       = 2,  ///< save requested, timers exist but no block completed
    ReportSaved       = 3,  ///< report file written
    ReportWriteFailed = 4,  ///< directory or file could not be written
    ConfigWarning     = 5   ///< config file missing or malformed line
};

} // namespace waterfalls
