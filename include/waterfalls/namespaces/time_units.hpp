#pragma once
/**
 * @file time_units.hpp
 * @brief Chart time-unit selection and unit-code parsing.
 */

#include <cstdint>
#include <optional>
#include <string>

#include "../types/enums.hpp"
#include "ini_parser.hpp"

namespace waterfalls {
namespace time_units {

constexpr int64_t kMicrosecond = 1000LL;
constexpr int64_t kMillisecond = 1000LL * kMicrosecond;
constexpr int64_t kSecond      = 1000LL * kMillisecond;
constexpr int64_t kMinute      = 60LL * kSecond;
constexpr int64_t kHour        = 60LL * kMinute;

/**
 * @brief Full lowercase name of a unit ("milliseconds").
 */
inline const char* name(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Nanoseconds:  return "nanoseconds";
        case TimeUnit::Microseconds: return "microseconds";
        case TimeUnit::Milliseconds: return "milliseconds";
        case TimeUnit::Seconds:      return "seconds";
        case TimeUnit::Minutes:      return "minutes";
        case TimeUnit::Hours:        return "hours";
    }
    return "nanoseconds";
}

/**
 * @brief Canonical short code used on the command line ("msec").
 */
inline const char* code(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Nanoseconds:  return "nsec";
        case TimeUnit::Microseconds: return "usec";
        case TimeUnit::Milliseconds: return "msec";
        case TimeUnit::Seconds:      return "sec";
        case TimeUnit::Minutes:      return "min";
        case TimeUnit::Hours:        return "hour";
    }
    return "nsec";
}

/**
 * @brief Axis suffix ("ms").
 */
inline const char* symbol(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Nanoseconds:  return "ns";
        case TimeUnit::Microseconds: return "us";
        case TimeUnit::Milliseconds: return "ms";
        case TimeUnit::Seconds:      return "s";
        case TimeUnit::Minutes:      return "min";
        case TimeUnit::Hours:        return "h";
    }
    return "ns";
}

/**
 * @brief Number of nanoseconds in one unit.
 */
inline int64_t nanoseconds_per(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Nanoseconds:  return 1;
        case TimeUnit::Microseconds: return kMicrosecond;
        case TimeUnit::Milliseconds: return kMillisecond;
        case TimeUnit::Seconds:      return kSecond;
        case TimeUnit::Minutes:      return kMinute;
        case TimeUnit::Hours:        return kHour;
    }
    return 1;
}

/**
 * @brief Convert a nanosecond quantity into @p unit.
 */
inline double convert(int64_t ns, TimeUnit unit) {
    return (double)ns / (double)nanoseconds_per(unit);
}

/**
 * @brief Parse a unit code (case-insensitive).
 *
 * Accepts the canonical codes plus common abbreviations and full names:
 * ns/nsec/nanoseconds, us/usec/microseconds, ms/msec/milliseconds,
 * s/sec/seconds, m/min/minutes, h/hour/hours.
 *
 * @return The unit, or std::nullopt for an unknown code
 */
inline std::optional<TimeUnit> parse(const std::string& text) {
    const std::string c = ini_parser::to_lower(ini_parser::trim(text));

    if (c == "ns" || c == "nsec" || c == "nanosecond" || c == "nanoseconds") return TimeUnit::Nanoseconds;
    if (c == "us" || c == "usec" || c == "microsecond" || c == "microseconds") return TimeUnit::Microseconds;
    if (c == "ms" || c == "msec" || c == "millisecond" || c == "milliseconds") return TimeUnit::Milliseconds;
    if (c == "s" || c == "sec" || c == "second" || c == "seconds") return TimeUnit::Seconds;
    if (c == "m" || c == "min" || c == "minute" || c == "minutes") return TimeUnit::Minutes;
    if (c == "h" || c == "hour" || c == "hours") return TimeUnit::Hours;
    return std::nullopt;
}

/**
 * @brief Pick the display unit for a chart spanning @p time_total ns.
 *
 * An explicit @p user_unit always wins. Otherwise the largest unit whose
 * size does not exceed the span is chosen; a zero or negative span falls
 * back to nanoseconds.
 */
inline TimeUnit resolve(int64_t time_total, std::optional<TimeUnit> user_unit = std::nullopt) {
    if (user_unit) return *user_unit;

    if (time_total >= kHour)        return TimeUnit::Hours;
    if (time_total >= kMinute)      return TimeUnit::Minutes;
    if (time_total >= kSecond)      return TimeUnit::Seconds;
    if (time_total >= kMillisecond) return TimeUnit::Milliseconds;
    if (time_total >= kMicrosecond) return TimeUnit::Microseconds;
    return TimeUnit::Nanoseconds;
}

} // namespace time_units
} // namespace waterfalls
