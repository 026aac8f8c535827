#pragma once

#include <cstdint>

// ---------------------------------------------------------------------------
// Time constants and utilities for ET (Eastern Time) nanosecond timestamps.
// ET follows the US rule for America/New_York: EDT (UTC-4) from 02:00 local
// on the second Sunday of March until 02:00 local on the first Sunday of
// November, EST (UTC-5) otherwise.
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr uint64_t NS_PER_SEC         = 1'000'000'000ULL;
constexpr uint64_t NS_PER_MIN         = 60ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_HOUR        = 3600ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_DAY         = 24ULL * NS_PER_HOUR;
constexpr int64_t  SEC_PER_DAY        = 86400LL;
constexpr int64_t  EST_OFFSET_SEC     = -5LL * 3600LL;
constexpr int64_t  EDT_OFFSET_SEC     = -4LL * 3600LL;
// 2022-01-03 00:00:00 ET in UTC nanoseconds (reference epoch)
constexpr uint64_t REF_MIDNIGHT_ET_NS = 1641186000ULL * NS_PER_SEC;

constexpr int64_t floor_div(int64_t a, int64_t b) {
    return a / b - ((a % b != 0 && ((a < 0) != (b < 0))) ? 1 : 0);
}

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's algorithm).
constexpr int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

// Inverse of days_from_civil, year only.
constexpr int64_t year_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    return mp >= 10 ? y + 1 : y;
}

// 0 = Sunday.
constexpr int weekday_from_days(int64_t z) {
    return static_cast<int>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}

// Days since 1970-01-01 of the n-th Sunday (1-based) of a month.
constexpr int64_t nth_sunday(int64_t y, unsigned m, int n) {
    const int64_t first = days_from_civil(y, m, 1);
    return first + (7 - weekday_from_days(first)) % 7 + 7LL * (n - 1);
}

// ---------------------------------------------------------------------------
// UTC offset lookups
// ---------------------------------------------------------------------------

// Offset of ET from UTC at a UTC instant, in seconds.
constexpr int64_t et_offset_at_utc(int64_t utc_sec) {
    const int64_t y = year_from_days(floor_div(utc_sec, SEC_PER_DAY));
    const int64_t start = nth_sunday(y, 3, 2) * SEC_PER_DAY + 2 * 3600 - EST_OFFSET_SEC;
    const int64_t end   = nth_sunday(y, 11, 1) * SEC_PER_DAY + 2 * 3600 - EDT_OFFSET_SEC;
    return (utc_sec >= start && utc_sec < end) ? EDT_OFFSET_SEC : EST_OFFSET_SEC;
}

// Offset for an ET wall-clock time expressed as seconds since 1970-01-01
// local. The skipped hour in March and the repeated hour in November both
// resolve to EDT.
constexpr int64_t et_offset_at_local(int64_t local_sec) {
    const int64_t y = year_from_days(floor_div(local_sec, SEC_PER_DAY));
    const int64_t start = nth_sunday(y, 3, 2) * SEC_PER_DAY + 2 * 3600;
    const int64_t end   = nth_sunday(y, 11, 1) * SEC_PER_DAY + 2 * 3600;
    return (local_sec >= start && local_sec < end) ? EDT_OFFSET_SEC : EST_OFFSET_SEC;
}

inline int64_t et_local_seconds(uint64_t ts) {
    const int64_t utc = static_cast<int64_t>(ts / NS_PER_SEC);
    return utc + et_offset_at_utc(utc);
}

// Whole minutes since ET midnight, 0..1439.
inline int minute_of_day_et(uint64_t ts) {
    const int64_t local = et_local_seconds(ts);
    return static_cast<int>((local - floor_div(local, SEC_PER_DAY) * SEC_PER_DAY) / 60);
}

// ET wall-clock date/time to UTC nanoseconds.
inline uint64_t et_wall_clock_to_ns(int year, int month, int day,
                                    int hour = 0, int minute = 0, int second = 0) {
    int64_t days = days_from_civil(year, static_cast<unsigned>(month),
                                   static_cast<unsigned>(day));
    int64_t local = days * SEC_PER_DAY + hour * 3600LL + minute * 60LL + second;
    int64_t secs = local - et_offset_at_local(local);
    return static_cast<uint64_t>(secs) * NS_PER_SEC;
}

}  // namespace time_utils
