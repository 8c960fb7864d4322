#pragma once

#include "time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Granularity — native or target sampling period of a series
// ---------------------------------------------------------------------------
enum class Granularity {
    MINUTE,
    FIVE_MINUTE,
    FIFTEEN_MINUTE,
    HOUR,
    FOUR_HOUR,
    DAY,
    WEEK,
};

inline uint64_t granularity_ns(Granularity g) {
    switch (g) {
        case Granularity::MINUTE:         return time_utils::NS_PER_MIN;
        case Granularity::FIVE_MINUTE:    return 5ULL * time_utils::NS_PER_MIN;
        case Granularity::FIFTEEN_MINUTE: return 15ULL * time_utils::NS_PER_MIN;
        case Granularity::HOUR:           return time_utils::NS_PER_HOUR;
        case Granularity::FOUR_HOUR:      return 4ULL * time_utils::NS_PER_HOUR;
        case Granularity::DAY:            return time_utils::NS_PER_DAY;
        case Granularity::WEEK:           return time_utils::NS_PER_WEEK;
    }
    return time_utils::NS_PER_HOUR;
}

inline std::string granularity_name(Granularity g) {
    switch (g) {
        case Granularity::MINUTE:         return "1min";
        case Granularity::FIVE_MINUTE:    return "5min";
        case Granularity::FIFTEEN_MINUTE: return "15min";
        case Granularity::HOUR:           return "1h";
        case Granularity::FOUR_HOUR:      return "4h";
        case Granularity::DAY:            return "1d";
        case Granularity::WEEK:           return "1w";
    }
    return "unknown";
}

// True when `a` samples at least as often as `b`.
inline bool is_finer_or_equal(Granularity a, Granularity b) {
    return granularity_ns(a) <= granularity_ns(b);
}

// Periods of `g` in one calendar day (fractional for weekly).
inline double periods_per_day(Granularity g) {
    return static_cast<double>(time_utils::NS_PER_DAY) /
           static_cast<double>(granularity_ns(g));
}

// Snap a timestamp down onto the granularity grid.
inline uint64_t snap_to_grid(uint64_t ts, Granularity g) {
    if (g == Granularity::WEEK) return time_utils::floor_to_week(ts);
    return time_utils::floor_to(ts, granularity_ns(g));
}

inline Granularity parse_granularity(const std::string& text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "1min" || s == "m1" || s == "minute") return Granularity::MINUTE;
    if (s == "5min" || s == "m5") return Granularity::FIVE_MINUTE;
    if (s == "15min" || s == "m15") return Granularity::FIFTEEN_MINUTE;
    if (s == "1h" || s == "h1" || s == "h" || s == "hourly") return Granularity::HOUR;
    if (s == "4h" || s == "h4") return Granularity::FOUR_HOUR;
    if (s == "1d" || s == "d" || s == "daily") return Granularity::DAY;
    if (s == "1w" || s == "w" || s == "weekly") return Granularity::WEEK;
    throw std::invalid_argument("Unknown granularity: '" + text + "'");
}
