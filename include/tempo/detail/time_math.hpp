// include/tempo/detail/time_math.hpp
#pragma once

#include <numeric>
#include <optional>
#include <utility>

#include <cstdint>

namespace tempo::detail {

/**
 * Centralized time arithmetic for Period and Instant.
 *
 * - Single source of truth for unit weights and nanosecond carry
 * - Checked arithmetic: every helper that can overflow returns std::optional and the
 *   caller reports the failure; nothing here wraps or saturates silently
 * - Proleptic Gregorian calendar conversions (days since 1970-01-01) for any
 *   int64_t day count reachable from int64_t seconds
 */

/// Nanoseconds per second (10^9)
inline constexpr uint64_t NANOS_PER_SEC = 1'000'000'000ULL;
inline constexpr uint64_t NANOS_PER_MILLI = 1'000'000ULL;
inline constexpr uint64_t NANOS_PER_MICRO = 1'000ULL;

/// Unit weights in seconds. A year is a fixed 365.25 days.
inline constexpr uint64_t SECS_PER_YEAR = 31'557'600ULL;
inline constexpr uint64_t SECS_PER_WEEK = 604'800ULL;
inline constexpr uint64_t SECS_PER_DAY = 86'400ULL;
inline constexpr uint64_t SECS_PER_HOUR = 3'600ULL;
inline constexpr uint64_t SECS_PER_MINUTE = 60ULL;

constexpr std::optional<uint64_t> checked_mul(uint64_t a, uint64_t b) noexcept {
    uint64_t result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        return std::nullopt;
    }
    return result;
}

constexpr std::optional<uint64_t> checked_add(uint64_t a, uint64_t b) noexcept {
    uint64_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        return std::nullopt;
    }
    return result;
}

constexpr std::optional<int64_t> checked_mul(int64_t a, int64_t b) noexcept {
    int64_t result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        return std::nullopt;
    }
    return result;
}

constexpr std::optional<int64_t> checked_add(int64_t a, int64_t b) noexcept {
    int64_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        return std::nullopt;
    }
    return result;
}

/**
 * Carry whole seconds out of a nanosecond count.
 *
 * @param sec Seconds accumulated so far
 * @param nanos Nanoseconds, may exceed one second
 * @return (seconds, nanoseconds) with nanoseconds in [0, 10^9), or nullopt if the
 *         carry overflows the seconds
 */
constexpr auto carry_nanos(uint64_t sec, uint64_t nanos) noexcept
    -> std::optional<std::pair<uint64_t, uint32_t>> {
    auto total = checked_add(sec, nanos / NANOS_PER_SEC);
    if (!total) {
        return std::nullopt;
    }
    return std::pair<uint64_t, uint32_t>{*total, static_cast<uint32_t>(nanos % NANOS_PER_SEC)};
}

/// Whole seconds and nanoseconds of a non-negative std::chrono tick count
struct TickSplit {
    uint64_t seconds;
    uint32_t nanos;  // [0, 10^9), truncated
    bool truncated;  // a sub-nanosecond remainder was dropped
};

/**
 * Split ticks of Ratio seconds into seconds and nanoseconds without forming
 * ticks * Ratio::num, so no intermediate product can wrap.
 *
 * @return nullopt if the seconds do not fit uint64_t, or for a ratio whose
 *         sub-second part cannot be scaled to nanoseconds in 64 bits
 */
template <typename Ratio>
constexpr std::optional<TickSplit> split_ticks(uint64_t ticks) noexcept {
    static_assert(Ratio::num > 0 && Ratio::den > 0, "tick period must be positive");
    constexpr auto NUM = static_cast<uint64_t>(Ratio::num);
    constexpr auto DEN = static_cast<uint64_t>(Ratio::den);

    auto whole = checked_mul(ticks / DEN, NUM);
    auto part = checked_mul(ticks % DEN, NUM);
    auto seconds = whole && part ? checked_add(*whole, *part / DEN) : std::nullopt;
    if (!seconds) {
        return std::nullopt;
    }

    // Remaining fraction is (part % DEN) / DEN of a second
    constexpr uint64_t GCD = std::gcd(NANOS_PER_SEC, DEN);
    constexpr uint64_t SCALE = NANOS_PER_SEC / GCD;
    constexpr uint64_t DIVISOR = DEN / GCD;
    auto scaled = checked_mul(*part % DEN, SCALE);
    if (!scaled) {
        return std::nullopt;
    }
    return TickSplit{*seconds, static_cast<uint32_t>(*scaled / DIVISOR), *scaled % DIVISOR != 0};
}

/// Floor division (rounds toward negative infinity)
constexpr int64_t floor_div(int64_t a, int64_t b) noexcept {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

/// Floor modulo, result has the sign of b
constexpr int64_t floor_mod(int64_t a, int64_t b) noexcept {
    int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) {
        r += b;
    }
    return r;
}

constexpr bool is_leap_year(int64_t year) noexcept {
    return (year % 4 == 0) && (year % 100 != 0 || year % 400 == 0);
}

constexpr unsigned days_in_month(int64_t year, unsigned month) noexcept {
    constexpr unsigned DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

struct CivilDate {
    int64_t year;
    unsigned month; // [1, 12]
    unsigned day;   // [1, 31]
};

/**
 * Days since 1970-01-01 for a proleptic Gregorian date.
 *
 * Era-based (400-year cycle) so it is exact for negative years. The caller must
 * keep |year| well below 2^62 / 366; the strict timestamp grammar caps expanded
 * years at 12 digits.
 */
constexpr int64_t days_from_civil(int64_t year, unsigned month, unsigned day) noexcept {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = floor_div(year, 400);
    const int64_t yoe = year - era * 400;                                      // [0, 399]
    const int64_t mp = (static_cast<int64_t>(month) + 9) % 12;                 // March == 0
    const int64_t doy = (153 * mp + 2) / 5 + static_cast<int64_t>(day) - 1;    // [0, 365]
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;                 // [0, 146096]
    return era * 146'097 + doe - 719'468;
}

/// Inverse of days_from_civil()
constexpr CivilDate civil_from_days(int64_t days) noexcept {
    days += 719'468;
    const int64_t era = floor_div(days, 146'097);
    const int64_t doe = days - era * 146'097;                                  // [0, 146096]
    const int64_t yoe = (doe - doe / 1'460 + doe / 36'524 - doe / 146'096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);               // [0, 365]
    const int64_t mp = (5 * doy + 2) / 153;                                    // [0, 11]
    const auto day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    const auto month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    const int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);
    return CivilDate{year, month, day};
}

} // namespace tempo::detail
