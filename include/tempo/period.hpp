#pragma once

#include "tempo/detail/period_grammar.hpp"
#include "tempo/detail/time_math.hpp"
#include "tempo/error.hpp"
#include "tempo/expected.hpp"
#include "tempo/log.hpp"

#include <charconv>
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

#include <cstdint>

#include <fmt/format.h>

namespace tempo {

/**
 * Non-negative elapsed time with exact nanosecond precision.
 *
 * ## Storage
 * uint64_t whole seconds + uint32_t nanoseconds in [0, 10^9).
 *
 * ## Text Form
 * Parses a human-friendly spelling ("2 years 18 Weeks 4 dy 12 hrs 0.000456 SEC",
 * "1y60000ms25us", ".5s") and always formats one canonical spelling ("2y18w4d12h456us").
 * parse(to_string()) is exact for every value.
 *
 * Units, largest first: y (31,557,600 s, a 365.25-day year), w, d, h, m, s. Values
 * below one second format as a single integer in the finest unit carrying data
 * ("123ms", "120us", "100ns"); whole seconds with millisecond data format as a
 * decimal ("1w1.123s").
 *
 * ## Overflow Policy
 * Unlike arithmetic types that saturate, every Period factory that can overflow
 * reports InvalidSpecification. A Period never wraps.
 */
class Period {
public:
    static constexpr uint64_t NANOSECONDS_PER_SECOND = detail::NANOS_PER_SEC;

    /// Maximum valid nanoseconds value (one less than a full second)
    static constexpr uint32_t MAX_NANOSECONDS = static_cast<uint32_t>(NANOSECONDS_PER_SECOND - 1);

    static constexpr Period zero() noexcept { return Period(0, 0); }

    static constexpr Period max() noexcept {
        return Period(std::numeric_limits<uint64_t>::max(), MAX_NANOSECONDS);
    }

    // Default construction - zero period
    constexpr Period() noexcept = default;

    // Direct factories - infallible, every count fits after division
    static constexpr Period from_seconds(uint64_t s) noexcept { return Period(s, 0); }

    static constexpr Period from_milliseconds(uint64_t ms) noexcept {
        return Period(ms / 1'000, static_cast<uint32_t>(ms % 1'000 * detail::NANOS_PER_MILLI));
    }

    static constexpr Period from_microseconds(uint64_t us) noexcept {
        return Period(us / 1'000'000,
                      static_cast<uint32_t>(us % 1'000'000 * detail::NANOS_PER_MICRO));
    }

    static constexpr Period from_nanoseconds(uint64_t ns) noexcept {
        return Period(ns / NANOSECONDS_PER_SECOND, static_cast<uint32_t>(ns % NANOSECONDS_PER_SECOND));
    }

    /**
     * Build from seconds plus nanoseconds. Nanoseconds of one second or more are
     * carried into the seconds; a carry that overflows the seconds fails.
     */
    static expected<Period, InvalidSpecification> from_parts(uint64_t seconds,
                                                             uint64_t nanoseconds) {
        auto carried = detail::carry_nanos(seconds, nanoseconds);
        if (!carried) {
            return make_unexpected(InvalidSpecification(fmt::format(
                "Overflow of seconds in period of {}s {}ns", seconds, nanoseconds)));
        }
        return Period(carried->first, carried->second);
    }

    /**
     * Convert a std::chrono duration. Negative durations are not Periods, and a
     * duration whose whole seconds exceed uint64_t fails instead of wrapping.
     * Sub-nanosecond ticks are truncated.
     */
    template <typename Rep, typename Ratio>
        requires std::integral<Rep>
    static expected<Period, InvalidSpecification>
    from_chrono(std::chrono::duration<Rep, Ratio> d) {
        if (d < std::chrono::duration<Rep, Ratio>::zero()) {
            return make_unexpected(InvalidSpecification(fmt::format(
                "Negative duration of {} ticks cannot be a Period", static_cast<int64_t>(d.count()))));
        }
        auto split = detail::split_ticks<Ratio>(static_cast<uint64_t>(d.count()));
        if (!split) {
            return make_unexpected(InvalidSpecification(fmt::format(
                "Overflow of seconds in period of {} ticks of {}/{}s",
                static_cast<std::common_type_t<Rep, std::intmax_t>>(d.count()), Ratio::num,
                Ratio::den)));
        }
        return Period(split->seconds, split->nanos);
    }

    /// Parse a Period specification, e.g. "1w2d3h4.567s" or "600 millis 25 us"
    static expected<Period, InvalidSpecification> parse(std::string_view text);

    // Primary accessors
    constexpr uint64_t seconds() const noexcept { return seconds_; }
    constexpr uint32_t nanoseconds() const noexcept { return nanos_; }

    constexpr bool is_zero() const noexcept { return seconds_ == 0 && nanos_ == 0; }

    /// Total nanoseconds, or nullopt beyond the std::chrono::nanoseconds range (~292 years)
    constexpr std::optional<std::chrono::nanoseconds> to_chrono() const noexcept {
        constexpr uint64_t MAX_SAFE_SEC =
            static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) / NANOSECONDS_PER_SECOND;
        if (seconds_ > MAX_SAFE_SEC) {
            return std::nullopt;
        }
        auto total = detail::checked_add(
            static_cast<int64_t>(seconds_ * NANOSECONDS_PER_SECOND), static_cast<int64_t>(nanos_));
        if (!total) {
            return std::nullopt;
        }
        return std::chrono::nanoseconds(*total);
    }

    /// Canonical text form; never fails
    std::string to_string() const;

    // Comparison - by total length
    constexpr auto operator<=>(const Period&) const noexcept = default;
    constexpr bool operator==(const Period&) const noexcept = default;

private:
    uint64_t seconds_{0};
    uint32_t nanos_{0}; // Always in [0, NANOSECONDS_PER_SECOND)

    constexpr Period(uint64_t sec, uint32_t nanos) noexcept : seconds_(sec), nanos_(nanos) {}
};

namespace detail {

inline InvalidSpecification period_error(std::string_view what, std::string_view field,
                                         std::string_view text) {
    return InvalidSpecification(fmt::format("{} {} in period \"{}\"", what, field, text));
}

/// Decimal digits to uint64_t; absent fields are zero
inline expected<uint64_t, InvalidSpecification> period_field(std::string_view digits,
                                                             std::string_view field,
                                                             std::string_view text) {
    if (digits.empty()) {
        return 0;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return make_unexpected(period_error("Invalid", field, text));
    }
    return value;
}

/// Accumulate weight * digits into total, reporting the field on overflow
inline expected<uint64_t, InvalidSpecification>
add_weighted(uint64_t total, std::string_view digits, uint64_t weight, std::string_view field,
             std::string_view text) {
    auto count = period_field(digits, field, text);
    if (!count) {
        return make_unexpected(count.error());
    }
    auto product = checked_mul(*count, weight);
    auto sum = product ? checked_add(total, *product) : std::nullopt;
    if (!sum) {
        return make_unexpected(period_error("Overflow of", field, text));
    }
    return *sum;
}

/// ".5" means 500,000,000 ns: right-pad to 9 digits, truncate anything finer
inline uint64_t fraction_nanos(std::string_view digits) noexcept {
    uint64_t nanos = 0;
    for (std::size_t i = 0; i < 9; ++i) {
        nanos = nanos * 10 + (i < digits.size() ? static_cast<uint64_t>(digits[i] - '0') : 0);
    }
    return nanos;
}

} // namespace detail

inline expected<Period, InvalidSpecification> Period::parse(std::string_view text) {
    auto fields = detail::PeriodGrammar::instance().match(text);
    if (!fields || fields->empty()) {
        log::logger()->debug("Rejected period specification \"{}\"", text);
        return make_unexpected(InvalidSpecification(
            fmt::format("Failed to find Period specification in \"{}\"", text)));
    }

    struct Term {
        std::string_view digits;
        uint64_t weight;
        std::string_view field;
    };

    const Term second_terms[] = {
        {fields->years, detail::SECS_PER_YEAR, "year(s)"},
        {fields->weeks, detail::SECS_PER_WEEK, "week(s)"},
        {fields->days, detail::SECS_PER_DAY, "day(s)"},
        {fields->hours, detail::SECS_PER_HOUR, "hour(s)"},
        {fields->minutes, detail::SECS_PER_MINUTE, "minute(s)"},
        {fields->whole_seconds, 1, "seconds"},
    };
    const Term nano_terms[] = {
        {fields->millis, detail::NANOS_PER_MILLI, "milliseconds"},
        {fields->micros, detail::NANOS_PER_MICRO, "microseconds"},
        {fields->nanos, 1, "nanoseconds"},
    };

    uint64_t seconds = 0;
    for (const Term& term : second_terms) {
        auto sum = detail::add_weighted(seconds, term.digits, term.weight, term.field, text);
        if (!sum) {
            return make_unexpected(sum.error());
        }
        seconds = *sum;
    }

    uint64_t nanos = detail::fraction_nanos(fields->fraction);
    for (const Term& term : nano_terms) {
        auto sum = detail::add_weighted(nanos, term.digits, term.weight, term.field, text);
        if (!sum) {
            return make_unexpected(sum.error());
        }
        nanos = *sum;
    }

    // Sub-second units may exceed one second ("60000ms"); carry them into seconds
    auto carried = detail::carry_nanos(seconds, nanos);
    if (!carried) {
        return make_unexpected(detail::period_error("Overflow of", "seconds", text));
    }
    return Period(carried->first, carried->second);
}

inline std::string Period::to_string() const {
    std::string out;
    auto it = std::back_inserter(out);

    struct Unit {
        uint64_t weight;
        char suffix;
    };
    constexpr Unit units[] = {
        {detail::SECS_PER_YEAR, 'y'}, {detail::SECS_PER_WEEK, 'w'},
        {detail::SECS_PER_DAY, 'd'},  {detail::SECS_PER_HOUR, 'h'},
        {detail::SECS_PER_MINUTE, 'm'},
    };

    uint64_t remaining = seconds_;
    for (const Unit& unit : units) {
        const uint64_t count = remaining / unit.weight;
        remaining %= unit.weight;
        if (count > 0) {
            fmt::format_to(it, "{}{}", count, unit.suffix);
        }
    }

    const bool has_ns = nanos_ % 1'000 > 0;
    const bool has_us = nanos_ / 1'000 % 1'000 > 0;
    const bool has_ms = nanos_ / 1'000'000 > 0;

    if ((remaining > 0 && has_ms) || (has_ms && has_ns)) {
        // Decimal seconds: "000002100" -> "0000021"
        std::string fraction = fmt::format("{:09}", nanos_);
        fraction.erase(fraction.find_last_not_of('0') + 1);
        fmt::format_to(it, "{}.{}s", remaining, fraction);
    } else {
        if (remaining > 0) {
            fmt::format_to(it, "{}s", remaining);
        }
        // Finest unit that carries data
        if (has_ns) {
            fmt::format_to(it, "{}ns", nanos_);
        } else if (has_us) {
            fmt::format_to(it, "{}us", nanos_ / 1'000);
        } else if (has_ms) {
            fmt::format_to(it, "{}ms", nanos_ / 1'000'000);
        }
    }

    if (out.empty()) {
        out = "0s";
    }
    return out;
}

inline std::ostream& operator<<(std::ostream& os, const Period& p) {
    return os << p.to_string();
}

} // namespace tempo
