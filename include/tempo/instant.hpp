#pragma once

#include "tempo/detail/iso8601_grammar.hpp"
#include "tempo/detail/rfc3339.hpp"
#include "tempo/detail/time_math.hpp"
#include "tempo/error.hpp"
#include "tempo/expected.hpp"
#include "tempo/log.hpp"

#include <chrono>
#include <compare>
#include <concepts>
#include <iterator>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <cstdint>

#include <fmt/format.h>

namespace tempo {

/**
 * Civil (wall clock) fields of an Instant in its own offset.
 *
 * second is 60 only during a leap second.
 */
struct CivilTime {
    int64_t year;
    unsigned month;
    unsigned day;
    unsigned hour;
    unsigned minute;
    unsigned second;
    uint32_t nanosecond;

    bool operator==(const CivilTime&) const = default;
};

/**
 * Point in time with a fixed UTC offset.
 *
 * ## Storage
 * int64_t seconds since 1970-01-01T00:00:00Z + uint32_t nanoseconds + int32_t offset
 * in minutes. During a leap second the seconds field holds second 59 of the minute and
 * nanoseconds run from 10^9 to 2*10^9 - 1.
 *
 * ## Comparison
 * Equality and ordering use the absolute point in time only: "03:23:38-08:00" equals
 * "11:23:38Z". The offset only selects how to_string() renders the Instant.
 *
 * ## Text Form
 * Parses strict RFC 3339 first and falls back to a flexible ISO 8601 subset
 * ("20150218 235960,234567 −05"). Always formats RFC 3339,
 * e.g. "2018-10-11T03:23:38+00:00".
 *
 * Instant has no now(): every Instant is supplied by the caller.
 */
class Instant {
public:
    static constexpr uint32_t NANOSECONDS_PER_SECOND = static_cast<uint32_t>(detail::NANOS_PER_SEC);

    /// Offsets must stay strictly within one day
    static constexpr int32_t MAX_OFFSET_MINUTES = 24 * 60 - 1;

    /// Infallible construction from unix seconds, expressed in UTC
    static constexpr Instant from_unix_seconds(int64_t seconds) noexcept {
        return Instant(seconds, 0, 0);
    }

    /**
     * Build from a system_clock time point, displayed at the given offset.
     *
     * Fails if the offset is a day or more in either direction, or if the time point
     * lies beyond int64_t seconds from the epoch. Sub-nanosecond ticks round toward
     * the past.
     */
    template <typename Dur>
        requires std::integral<typename Dur::rep>
    static expected<Instant, InvalidSpecification>
    from_chrono(std::chrono::time_point<std::chrono::system_clock, Dur> tp,
                std::chrono::minutes offset = std::chrono::minutes::zero()) {
        if (!valid_offset(offset)) {
            return make_unexpected(offset_error(offset));
        }
        using Rep = typename Dur::rep;
        const Rep ticks = tp.time_since_epoch().count();
        auto floored = floor_ticks<typename Dur::period>(ticks);
        if (!floored) {
            return make_unexpected(InvalidSpecification(fmt::format(
                "Overflow of seconds in time point of {} ticks of {}/{}s",
                static_cast<std::common_type_t<Rep, std::intmax_t>>(ticks), Dur::period::num,
                Dur::period::den)));
        }
        return Instant(floored->first, floored->second, static_cast<int32_t>(offset.count()));
    }

    /// Parse RFC 3339, or the flexible ISO 8601 subset
    static expected<Instant, InvalidSpecification> parse(std::string_view text);

    /// The same point in time, displayed at another offset
    expected<Instant, InvalidSpecification> with_offset(std::chrono::minutes offset) const {
        if (!valid_offset(offset)) {
            return make_unexpected(offset_error(offset));
        }
        return Instant(seconds_, nanos_, static_cast<int32_t>(offset.count()));
    }

    // Accessors
    constexpr int64_t unix_seconds() const noexcept { return seconds_; }
    constexpr uint32_t subsec_nanos() const noexcept { return nanos_ % NANOSECONDS_PER_SECOND; }
    constexpr bool is_leap_second() const noexcept { return nanos_ >= NANOSECONDS_PER_SECOND; }
    constexpr std::chrono::minutes offset() const noexcept {
        return std::chrono::minutes(offset_minutes_);
    }

    /// Wall clock fields at this Instant's offset
    constexpr CivilTime local_time() const noexcept {
        constexpr int64_t DAY = static_cast<int64_t>(detail::SECS_PER_DAY);
        // Split before applying the offset so extreme seconds cannot overflow
        const int64_t shifted = detail::floor_mod(seconds_, DAY) + int64_t{offset_minutes_} * 60;
        const int64_t days = detail::floor_div(seconds_, DAY) + detail::floor_div(shifted, DAY);
        const int64_t sod = detail::floor_mod(shifted, DAY);

        const detail::CivilDate date = detail::civil_from_days(days);
        return CivilTime{date.year,
                         date.month,
                         date.day,
                         static_cast<unsigned>(sod / 3'600),
                         static_cast<unsigned>(sod % 3'600 / 60),
                         static_cast<unsigned>(sod % 60) + (is_leap_second() ? 1U : 0U),
                         subsec_nanos()};
    }

    /// Whole seconds as a system_clock time point; a leap second reads as second 59
    constexpr std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>
    to_sys_seconds() const noexcept {
        return std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>(
            std::chrono::seconds(seconds_));
    }

    /**
     * Nanosecond system_clock time point, or nullopt outside its range (~1677..2262).
     *
     * system_clock has no leap seconds: second 60 maps onto the first second of the
     * following minute.
     */
    constexpr std::optional<std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>>
    to_chrono() const noexcept {
        auto scaled = detail::checked_mul(seconds_, static_cast<int64_t>(NANOSECONDS_PER_SECOND));
        auto total = scaled ? detail::checked_add(*scaled, static_cast<int64_t>(nanos_))
                            : std::nullopt;
        if (!total) {
            return std::nullopt;
        }
        return std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>(
            std::chrono::nanoseconds(*total));
    }

    /// Canonical RFC 3339 form; never fails
    std::string to_string() const;

    // Comparison - absolute point in time, offset ignored
    constexpr bool operator==(const Instant& other) const noexcept {
        return seconds_ == other.seconds_ && nanos_ == other.nanos_;
    }

    constexpr std::strong_ordering operator<=>(const Instant& other) const noexcept {
        if (seconds_ != other.seconds_) {
            return seconds_ <=> other.seconds_;
        }
        return nanos_ <=> other.nanos_;
    }

private:
    int64_t seconds_{0};
    uint32_t nanos_{0};         // [0, 2 * 10^9); >= 10^9 only during a leap second
    int32_t offset_minutes_{0}; // [-MAX_OFFSET_MINUTES, MAX_OFFSET_MINUTES]

    constexpr Instant(int64_t sec, uint32_t nanos, int32_t offset_minutes) noexcept
        : seconds_(sec),
          nanos_(nanos),
          offset_minutes_(offset_minutes) {}

    static constexpr bool valid_offset(std::chrono::minutes offset) noexcept {
        return offset.count() >= -MAX_OFFSET_MINUTES && offset.count() <= MAX_OFFSET_MINUTES;
    }

    static InvalidSpecification offset_error(std::chrono::minutes offset) {
        return InvalidSpecification(fmt::format(
            "Offset of {} minutes is outside +/-{} minutes", static_cast<int64_t>(offset.count()),
            MAX_OFFSET_MINUTES));
    }

    /// Signed ticks floored to (seconds, nanoseconds in [0, 10^9)); nullopt beyond int64_t
    template <typename Ratio, typename Rep>
    static constexpr std::optional<std::pair<int64_t, uint32_t>> floor_ticks(Rep ticks) noexcept {
        constexpr uint64_t LIMIT = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

        bool negative = false;
        uint64_t magnitude = 0;
        if constexpr (std::is_signed_v<Rep>) {
            negative = ticks < 0;
            magnitude = negative ? static_cast<uint64_t>(-(ticks + 1)) + 1
                                 : static_cast<uint64_t>(ticks);
        } else {
            magnitude = static_cast<uint64_t>(ticks);
        }

        auto split = detail::split_ticks<Ratio>(magnitude);
        if (!split) {
            return std::nullopt;
        }
        if (!negative) {
            if (split->seconds > LIMIT) {
                return std::nullopt;
            }
            return std::pair<int64_t, uint32_t>{static_cast<int64_t>(split->seconds), split->nanos};
        }
        if (split->nanos == 0 && !split->truncated) {
            if (split->seconds > LIMIT + 1) {
                return std::nullopt;
            }
            // seconds may be 2^63 here
            return std::pair<int64_t, uint32_t>{
                split->seconds == 0 ? 0 : -static_cast<int64_t>(split->seconds - 1) - 1, 0};
        }
        // Borrow a second: -(s + f) == -(s + 1) + (1 - f)
        if (split->seconds > LIMIT) {
            return std::nullopt;
        }
        const uint64_t ceil_nanos = split->nanos + (split->truncated ? 1U : 0U);
        return std::pair<int64_t, uint32_t>{-static_cast<int64_t>(split->seconds) - 1,
                                            static_cast<uint32_t>(detail::NANOS_PER_SEC - ceil_nanos)};
    }

    static std::optional<Instant> from_fields(const detail::Rfc3339Fields& f) noexcept;
};

inline std::optional<Instant> Instant::from_fields(const detail::Rfc3339Fields& f) noexcept {
    const bool leap = f.second == 60;
    const int64_t local_sod = int64_t{f.hour} * 3'600 + int64_t{f.minute} * 60 +
                              (leap ? 59 : int64_t{f.second});

    constexpr int64_t DAY = static_cast<int64_t>(detail::SECS_PER_DAY);
    // Fold the offset into the day count first so that neither partial product
    // leaves int64_t when the sum itself fits
    const int64_t utc_sod = local_sod - int64_t{f.offset_minutes} * 60;
    int64_t days = detail::days_from_civil(f.year, f.month, f.day) + detail::floor_div(utc_sod, DAY);
    int64_t within_day = detail::floor_mod(utc_sod, DAY);
    // Anchor negative days one day later so the earliest representable day fits
    if (days < 0) {
        days += 1;
        within_day -= DAY;
    }
    auto day_start = detail::checked_mul(days, DAY);
    auto seconds = day_start ? detail::checked_add(*day_start, within_day) : std::nullopt;
    if (!seconds) {
        return std::nullopt;
    }
    return Instant(*seconds, f.nanosecond + (leap ? NANOSECONDS_PER_SECOND : 0), f.offset_minutes);
}

inline expected<Instant, InvalidSpecification> Instant::parse(std::string_view text) {
    // Fast path: well-formed RFC 3339
    if (auto fields = detail::parse_rfc3339(text)) {
        if (auto instant = from_fields(*fields)) {
            return *instant;
        }
    }

    log::logger()->debug("Timestamp \"{}\" is not RFC 3339, trying ISO 8601 forms", text);
    auto strict = detail::Iso8601Grammar::instance().normalize(text);
    if (!strict) {
        return make_unexpected(InvalidSpecification(
            fmt::format("Failed to find RFC 3339 or ISO 8601 timestamp in \"{}\"", text)));
    }

    auto fields = detail::parse_rfc3339(*strict);
    auto instant = fields ? from_fields(*fields) : std::nullopt;
    if (!instant) {
        log::logger()->debug("Normalized timestamp \"{}\" failed validation", *strict);
        return make_unexpected(InvalidSpecification(fmt::format(
            "Attempting to convert RFC 3339 timestamp \"{}\" from ISO 8601 \"{}\" to an Instant",
            *strict, text)));
    }
    return *instant;
}

inline std::string Instant::to_string() const {
    const CivilTime t = local_time();
    std::string out;
    auto it = std::back_inserter(out);

    if (t.year >= 0 && t.year <= 9999) {
        fmt::format_to(it, "{:04}", t.year);
    } else {
        fmt::format_to(it, "{:+05}", t.year);
    }
    fmt::format_to(it, "-{:02}-{:02}T{:02}:{:02}:{:02}", t.month, t.day, t.hour, t.minute,
                   t.second);

    // Shortest of 3, 6 or 9 digits that is exact
    if (t.nanosecond == 0) {
        // no fraction
    } else if (t.nanosecond % 1'000'000 == 0) {
        fmt::format_to(it, ".{:03}", t.nanosecond / 1'000'000);
    } else if (t.nanosecond % 1'000 == 0) {
        fmt::format_to(it, ".{:06}", t.nanosecond / 1'000);
    } else {
        fmt::format_to(it, ".{:09}", t.nanosecond);
    }

    const int32_t magnitude = offset_minutes_ < 0 ? -offset_minutes_ : offset_minutes_;
    fmt::format_to(it, "{}{:02}:{:02}", offset_minutes_ < 0 ? '-' : '+', magnitude / 60,
                   magnitude % 60);
    return out;
}

inline std::ostream& operator<<(std::ostream& os, const Instant& instant) {
    return os << instant.to_string();
}

/// 2018-10-11T03:23:38+00:00, a fixed Instant for examples and tests
constexpr Instant sample_instant() noexcept {
    return Instant::from_unix_seconds(1'539'228'218);
}

} // namespace tempo
