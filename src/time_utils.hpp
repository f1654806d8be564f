#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// Time constants and utilities for ET (Eastern Time) nanosecond timestamps
//
// ET follows the US rule since 2007: EDT (UTC-4) from 02:00 local on the
// second Sunday of March until 02:00 local on the first Sunday of November,
// EST (UTC-5) otherwise.
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr uint64_t NS_PER_SEC         = 1'000'000'000ULL;
constexpr uint64_t NS_PER_MIN         = 60ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_HOUR        = 3600ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_DAY         = 24ULL * NS_PER_HOUR;
constexpr uint64_t EST_OFFSET_NS      = 5ULL * NS_PER_HOUR;
constexpr uint64_t EDT_OFFSET_NS      = 4ULL * NS_PER_HOUR;

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's algorithm).
inline int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

inline int date_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return static_cast<int>(y * 10000 + m * 100 + d);
}

// Day of month of the n-th Sunday (n >= 1) of a month.
inline int nth_sunday(int year, int month, int n) {
    int64_t first = days_from_civil(year, month, 1);
    int weekday = static_cast<int>((first + 4) % 7);  // 0 = Sunday; 1970-01-01 was a Thursday
    int first_sunday = 1 + (7 - weekday) % 7;
    return first_sunday + 7 * (n - 1);
}

// UTC instants at which daylight saving time starts and ends in a given year.
inline uint64_t dst_start_ns(int year) {
    return static_cast<uint64_t>(days_from_civil(year, 3, nth_sunday(year, 3, 2))) * NS_PER_DAY +
           2ULL * NS_PER_HOUR + EST_OFFSET_NS;
}

inline uint64_t dst_end_ns(int year) {
    return static_cast<uint64_t>(days_from_civil(year, 11, nth_sunday(year, 11, 1))) * NS_PER_DAY +
           2ULL * NS_PER_HOUR + EDT_OFFSET_NS;
}

inline bool is_dst(uint64_t ts) {
    int year = date_from_days(static_cast<int64_t>(ts / NS_PER_DAY)) / 10000;
    return ts >= dst_start_ns(year) && ts < dst_end_ns(year);
}

// Offset of ET behind UTC at an instant.
inline uint64_t et_offset_ns(uint64_t ts) {
    return is_dst(ts) ? EDT_OFFSET_NS : EST_OFFSET_NS;
}

// Nanoseconds since 1970-01-01 00:00 on the ET wall clock.
inline uint64_t et_local_ns(uint64_t ts) { return ts - et_offset_ns(ts); }

// ET calendar date (YYYYMMDD) of a timestamp.
inline int et_date(uint64_t ts) {
    return date_from_days(static_cast<int64_t>(et_local_ns(ts) / NS_PER_DAY));
}

// ET wall-clock time on a date -> UTC nanoseconds. A time skipped by the
// March transition lands one hour early; a time repeated in November
// resolves to its EST occurrence.
inline uint64_t et_clock_ns(int date, int hour, int minute, int second = 0) {
    int y = date / 10000, m = (date / 100) % 100, d = date % 100;
    uint64_t local = static_cast<uint64_t>(days_from_civil(y, m, d)) * NS_PER_DAY +
                     static_cast<uint64_t>(hour) * NS_PER_HOUR +
                     static_cast<uint64_t>(minute) * NS_PER_MIN +
                     static_cast<uint64_t>(second) * NS_PER_SEC;
    uint64_t as_est = local + EST_OFFSET_NS;
    return is_dst(as_est) ? local + EDT_OFFSET_NS : as_est;
}

// YYYYMMDD -> ET midnight in UTC nanoseconds.
inline uint64_t date_to_midnight_ns(int date) { return et_clock_ns(date, 0, 0); }

inline uint64_t midnight_et_ns(uint64_t ts) { return date_to_midnight_ns(et_date(ts)); }

// Minutes since ET midnight on the wall clock, truncated.
inline int minutes_of_day(uint64_t ts) {
    return static_cast<int>((et_local_ns(ts) % NS_PER_DAY) / NS_PER_MIN);
}

// "HH:MM:SS" in ET.
inline std::string clock_string(uint64_t ts) {
    uint64_t secs = (et_local_ns(ts) % NS_PER_DAY) / NS_PER_SEC;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d",
                  static_cast<int>(secs / 3600), static_cast<int>((secs / 60) % 60),
                  static_cast<int>(secs % 60));
    return buf;
}

}  // namespace time_utils
