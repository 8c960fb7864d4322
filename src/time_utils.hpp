#pragma once

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Time constants and utilities for timezone-naive nanosecond timestamps
// (nanoseconds since 1970-01-01 00:00:00, read as UTC wall clock)
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr uint64_t NS_PER_SEC  = 1'000'000'000ULL;
constexpr uint64_t NS_PER_MIN  = 60ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_HOUR = 3600ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_DAY  = 24ULL * NS_PER_HOUR;
constexpr uint64_t NS_PER_WEEK = 7ULL * NS_PER_DAY;

// 1970-01-01 was a Thursday; Monday-aligned weeks start 3 days later.
constexpr uint64_t FIRST_MONDAY_NS = 4ULL * NS_PER_DAY;

struct CivilTime {
    int year = 1970;
    int month = 1;   // 1..12
    int day = 1;     // 1..31
    int hour = 0;
    int minute = 0;
    int second = 0;
};

// Days since epoch for a proleptic Gregorian date.
inline int64_t days_from_civil(int y, int m, int d) {
    y -= (m <= 2) ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (m + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

inline void civil_from_days(int64_t z, int& y, int& m, int& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

inline uint64_t from_civil(int year, int month, int day,
                           int hour = 0, int minute = 0, int second = 0) {
    int64_t days = days_from_civil(year, month, day);
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;
    if (secs < 0) return 0;
    return static_cast<uint64_t>(secs) * NS_PER_SEC;
}

inline CivilTime to_civil(uint64_t ts) {
    CivilTime ct;
    int64_t days = static_cast<int64_t>(ts / NS_PER_DAY);
    uint64_t rem = ts % NS_PER_DAY;
    civil_from_days(days, ct.year, ct.month, ct.day);
    ct.hour = static_cast<int>(rem / NS_PER_HOUR);
    ct.minute = static_cast<int>((rem % NS_PER_HOUR) / NS_PER_MIN);
    ct.second = static_cast<int>((rem % NS_PER_MIN) / NS_PER_SEC);
    return ct;
}

// Monday = 0 ... Sunday = 6
inline int day_of_week(uint64_t ts) {
    int64_t days = static_cast<int64_t>(ts / NS_PER_DAY);
    return static_cast<int>((days + 3) % 7);
}

inline int hour_of_day(uint64_t ts) {
    return static_cast<int>((ts % NS_PER_DAY) / NS_PER_HOUR);
}

// ISO-8601 week number (1..53).
inline int iso_week(uint64_t ts) {
    int64_t days = static_cast<int64_t>(ts / NS_PER_DAY);
    int dow = static_cast<int>((days + 3) % 7);
    // Thursday of the same ISO week decides the ISO year.
    int64_t thursday = days - dow + 3;
    int y, m, d;
    civil_from_days(thursday, y, m, d);
    int64_t jan1 = days_from_civil(y, 1, 1);
    return static_cast<int>((thursday - jan1) / 7 + 1);
}

inline uint64_t floor_to(uint64_t ts, uint64_t period_ns) {
    return ts - ts % period_ns;
}

// Weeks are anchored on Monday 00:00.
inline uint64_t floor_to_week(uint64_t ts) {
    if (ts < FIRST_MONDAY_NS) return 0;
    return ts - (ts - FIRST_MONDAY_NS) % NS_PER_WEEK;
}

inline bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline int days_in_month(int y, int m) {
    static constexpr int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return DAYS[m - 1];
}

// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM", "YYYY-MM-DD HH:MM:SS",
// the same with a 'T' separator, an optional trailing 'Z' or fractional
// seconds, "YYYYMMDD" integer dates, and plain integer epoch seconds.
inline std::optional<uint64_t> parse_timestamp(const std::string& text) {
    std::string s = text;
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    size_t first = 0;
    while (first < s.size() && std::isspace(static_cast<unsigned char>(s[first]))) ++first;
    s = s.substr(first);
    if (s.empty()) return std::nullopt;

    bool all_digits = true;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) { all_digits = false; break; }
    }
    if (all_digits && s.size() == 8) {
        // YYYYMMDD integer date
        int date = std::stoi(s);
        int y = date / 10000, mo = (date / 100) % 100, d = date % 100;
        if (y < 1970 || mo < 1 || mo > 12 || d < 1 || d > days_in_month(y, mo)) return std::nullopt;
        return from_civil(y, mo, d);
    }
    if (all_digits) {
        if (s.size() > 12) return std::nullopt;
        return static_cast<uint64_t>(std::stoull(s)) * NS_PER_SEC;
    }

    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) s.pop_back();
    auto dot = s.find('.');
    if (dot != std::string::npos && dot > 10) {
        for (size_t i = dot + 1; i < s.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
        }
        s = s.substr(0, dot);
    }

    // Each layout must consume the whole string.
    const int len = static_cast<int>(s.size());
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    char sep = ' ';
    int used = -1;
    bool matched = false;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &used) == 3 && used == len) {
        matched = true;
    } else {
        used = -1;
        if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d%n", &y, &mo, &d, &sep, &h, &mi, &used) == 6 &&
            used == len) {
            matched = true;
        } else {
            used = -1;
            matched = std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                                  &y, &mo, &d, &sep, &h, &mi, &sec, &used) == 7 && used == len;
        }
        if (matched && sep != ' ' && sep != 'T') return std::nullopt;
    }
    if (!matched) return std::nullopt;
    if (y < 1970 || mo < 1 || mo > 12 || d < 1 || d > days_in_month(y, mo)) return std::nullopt;
    if (h < 0 || h > 23 || mi < 0 || mi > 59 || sec < 0 || sec > 60) return std::nullopt;
    return from_civil(y, mo, d, h, mi, sec);
}

inline std::string format_timestamp(uint64_t ts) {
    CivilTime ct = to_civil(ts);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                  ct.year, ct.month, ct.day, ct.hour, ct.minute, ct.second);
    return buf;
}

}  // namespace time_utils
