#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// Calendar utilities for YYYYMMDD integer dates.
// Serial day numbers count days since 1970-01-01 (proleptic Gregorian).
// ---------------------------------------------------------------------------
namespace date_utils {

constexpr int DAYS_PER_YEAR    = 365;
constexpr int DAYS_PER_QUARTER = 90;

inline int year_of(int date)  { return date / 10000; }
inline int month_of(int date) { return (date / 100) % 100; }
inline int day_of(int date)   { return date % 100; }

inline bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

inline int days_in_month(int y, int m) {
    static constexpr int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return DAYS[m - 1];
}

inline bool is_valid_date(int date) {
    if (date <= 0) return false;
    int y = year_of(date);
    int m = month_of(date);
    int d = day_of(date);
    if (y < 1900 || y > 9999) return false;
    if (m < 1 || m > 12) return false;
    return d >= 1 && d <= days_in_month(y, m);
}

// Howard Hinnant's days_from_civil.
inline int64_t to_serial(int date) {
    int64_t y = year_of(date);
    int64_t m = month_of(date);
    int64_t d = day_of(date);
    y -= (m <= 2) ? 1 : 0;
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

inline int from_serial(int64_t z) {
    z += 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t d = doy - (153 * mp + 2) / 5 + 1;
    int64_t m = mp + (mp < 10 ? 3 : -9);
    y += (m <= 2) ? 1 : 0;
    return static_cast<int>(y * 10000 + m * 100 + d);
}

inline int add_days(int date, int days) {
    return from_serial(to_serial(date) + days);
}

// Calendar days from `from` to `to` (negative when `to` precedes `from`).
inline int days_between(int from, int to) {
    return static_cast<int>(to_serial(to) - to_serial(from));
}

inline std::string date_to_string(int date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  year_of(date), month_of(date), day_of(date));
    return buf;
}

// Parses "YYYY-MM-DD" or "YYYYMMDD". Returns 0 on malformed or invalid input.
inline int parse_date(const std::string& s) {
    int y = 0, m = 0, d = 0;
    if (s.size() == 10 && s[4] == '-' && s[7] == '-') {
        if (std::sscanf(s.c_str(), "%4d-%2d-%2d", &y, &m, &d) != 3) return 0;
    } else if (s.size() == 8) {
        for (char c : s) {
            if (c < '0' || c > '9') return 0;
        }
        int v = std::stoi(s);
        y = v / 10000;
        m = (v / 100) % 100;
        d = v % 100;
    } else {
        return 0;
    }
    int date = y * 10000 + m * 100 + d;
    return is_valid_date(date) ? date : 0;
}

}  // namespace date_utils
