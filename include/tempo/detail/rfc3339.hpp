#pragma once

#include "tempo/detail/time_math.hpp"

#include <optional>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace tempo::detail {

/**
 * @brief Validated fields of a strict RFC 3339 timestamp
 *
 * All ranges are already checked, including the day against the month length.
 * second == 60 denotes a leap second.
 */
struct Rfc3339Fields {
    int64_t year{0};
    unsigned month{1};
    unsigned day{1};
    unsigned hour{0};
    unsigned minute{0};
    unsigned second{0};
    uint32_t nanosecond{0};    // [0, 10^9), digits past the ninth are truncated
    int32_t offset_minutes{0}; // (-1440, 1440)
};

/// Longest expanded year accepted after an explicit sign ("+292277026596")
inline constexpr std::size_t MAX_EXPANDED_YEAR_DIGITS = 12;

/**
 * @brief Cursor over timestamp text
 *
 * Every read either consumes what it asked for or fails without a partial result.
 */
class Rfc3339Cursor {
public:
    explicit constexpr Rfc3339Cursor(std::string_view text) noexcept : text_(text) {}

    constexpr bool at_end() const noexcept { return pos_ == text_.size(); }

    constexpr bool peek(char c) const noexcept { return pos_ < text_.size() && text_[pos_] == c; }

    constexpr bool accept(char c) noexcept {
        if (!peek(c)) {
            return false;
        }
        ++pos_;
        return true;
    }

    constexpr bool accept_any(char a, char b) noexcept { return accept(a) || accept(b); }

    /// Exactly width digits
    constexpr std::optional<unsigned> digits(std::size_t width) noexcept {
        if (text_.size() - pos_ < width) {
            return std::nullopt;
        }
        unsigned value = 0;
        for (std::size_t i = 0; i < width; ++i) {
            const char c = text_[pos_ + i];
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + static_cast<unsigned>(c - '0');
        }
        pos_ += width;
        return value;
    }

    /// Length of the run of digits at the cursor, without consuming it
    constexpr std::size_t digit_run() const noexcept {
        std::size_t n = 0;
        while (pos_ + n < text_.size() && text_[pos_ + n] >= '0' && text_[pos_ + n] <= '9') {
            ++n;
        }
        return n;
    }

    /// One or more fraction digits as nanoseconds
    constexpr std::optional<uint32_t> fraction() noexcept {
        const std::size_t run = digit_run();
        if (run == 0) {
            return std::nullopt;
        }
        uint32_t nanos = 0;
        for (std::size_t i = 0; i < 9; ++i) {
            nanos = nanos * 10 + (i < run ? static_cast<uint32_t>(text_[pos_ + i] - '0') : 0);
        }
        pos_ += run;
        return nanos;
    }

private:
    std::string_view text_;
    std::size_t pos_{0};
};

/**
 * Parse YYYY-MM-DD(T|t)hh:mm:ss[(.|,)f+](Z|z|(+|-)hh:mm).
 *
 * The year is four digits, or a sign followed by 4 to 12 digits.
 *
 * @return Validated fields, or nullopt for any syntax or range error
 */
constexpr std::optional<Rfc3339Fields> parse_rfc3339(std::string_view text) noexcept {
    Rfc3339Cursor cur(text);
    Rfc3339Fields f;

    // Year
    const bool negative_year = cur.peek('-');
    std::size_t year_width = 4;
    if (cur.accept_any('+', '-')) {
        year_width = cur.digit_run();
        if (year_width < 4 || year_width > MAX_EXPANDED_YEAR_DIGITS) {
            return std::nullopt;
        }
    }
    int64_t year = 0;
    for (std::size_t i = 0; i < year_width; ++i) {
        auto digit = cur.digits(1);
        if (!digit) {
            return std::nullopt;
        }
        year = year * 10 + *digit;
    }
    f.year = negative_year ? -year : year;

    // Date
    auto month = cur.accept('-') ? cur.digits(2) : std::nullopt;
    auto day = month && cur.accept('-') ? cur.digits(2) : std::nullopt;
    if (!day || *month < 1 || *month > 12 || *day < 1 || *day > days_in_month(f.year, *month)) {
        return std::nullopt;
    }
    f.month = *month;
    f.day = *day;

    // Time
    if (!cur.accept_any('T', 't')) {
        return std::nullopt;
    }
    auto hour = cur.digits(2);
    auto minute = hour && cur.accept(':') ? cur.digits(2) : std::nullopt;
    auto second = minute && cur.accept(':') ? cur.digits(2) : std::nullopt;
    if (!second || *hour > 23 || *minute > 59 || *second > 60) {
        return std::nullopt;
    }
    f.hour = *hour;
    f.minute = *minute;
    f.second = *second;

    if (cur.accept_any('.', ',')) {
        auto nanos = cur.fraction();
        if (!nanos) {
            return std::nullopt;
        }
        f.nanosecond = *nanos;
    }

    // Offset
    if (!cur.accept_any('Z', 'z')) {
        const bool negative = cur.peek('-');
        if (!cur.accept_any('+', '-')) {
            return std::nullopt;
        }
        auto off_hours = cur.digits(2);
        auto off_minutes = off_hours && cur.accept(':') ? cur.digits(2) : std::nullopt;
        if (!off_minutes || *off_hours > 23 || *off_minutes > 59) {
            return std::nullopt;
        }
        const auto total = static_cast<int32_t>(*off_hours * 60 + *off_minutes);
        f.offset_minutes = negative ? -total : total;
    }

    if (!cur.at_end()) {
        return std::nullopt;
    }
    return f;
}

} // namespace tempo::detail
