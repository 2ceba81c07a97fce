#pragma once

#include "tempo/log.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <re2/re2.h>

namespace tempo::detail {

/**
 * @brief Raw digit fields extracted from a Period specification
 *
 * Each view is empty when its unit was absent. whole_seconds is filled from either
 * seconds form; fraction is only set by the decimal form and the three sub-second
 * fields only by the explicit form, the grammar never sets both.
 */
struct PeriodFields {
    std::string_view years;
    std::string_view weeks;
    std::string_view days;
    std::string_view hours;
    std::string_view minutes;
    std::string_view whole_seconds;
    std::string_view fraction;
    std::string_view millis;
    std::string_view micros;
    std::string_view nanos;

    [[nodiscard]] bool empty() const noexcept {
        return years.empty() && weeks.empty() && days.empty() && hours.empty() &&
               minutes.empty() && whole_seconds.empty() && fraction.empty() && millis.empty() &&
               micros.empty() && nanos.empty();
    }
};

/**
 * @brief Compiled Period grammar, built once per process
 *
 * Units must appear in descending order: years, weeks, days, hours, minutes, then
 * either decimal seconds ("1.23s") or integer seconds followed by ms, us, ns. All
 * unit words are case-insensitive, singular or plural. Microseconds accept u, the
 * Greek mu and the micro sign.
 */
class PeriodGrammar {
public:
    static const PeriodGrammar& instance() {
        static const PeriodGrammar grammar;
        return grammar;
    }

    /// Match the whole of text; nullopt when the grammar rejects it
    [[nodiscard]] std::optional<PeriodFields> match(std::string_view text) const {
        re2::StringPiece groups[GROUP_COUNT + 1];
        if (!re_.Match(re2::StringPiece(text.data(), text.size()), 0, text.size(),
                       RE2::ANCHOR_BOTH, groups, GROUP_COUNT + 1)) {
            return std::nullopt;
        }

        auto field = [&](int index) {
            const re2::StringPiece& g = groups[index];
            return g.data() == nullptr ? std::string_view{} : std::string_view(g.data(), g.size());
        };

        PeriodFields fields;
        fields.years = field(YEARS);
        fields.weeks = field(WEEKS);
        fields.days = field(DAYS);
        fields.hours = field(HOURS);
        fields.minutes = field(MINUTES);
        fields.whole_seconds = field(SECONDS_MANTISSA);
        if (fields.whole_seconds.empty()) {
            fields.whole_seconds = field(SECONDS);
        }
        fields.fraction = field(SECONDS_FRACTION);
        fields.millis = field(MILLIS);
        fields.micros = field(MICROS);
        fields.nanos = field(NANOS);
        return fields;
    }

private:
    // Capture group numbers, in order of appearance in the pattern
    enum Group : int {
        YEARS = 1,
        WEEKS,
        DAYS,
        HOURS,
        MINUTES,
        SECONDS_MANTISSA,
        SECONDS_FRACTION,
        SECONDS,
        MILLIS,
        MICROS,
        NANOS,
    };
    static constexpr int GROUP_COUNT = NANOS;

    static std::string pattern() {
        const std::string sec = R"(s(?:ec(?:ond)?s?)?)";
        return std::string(R"(^)")
               + R"((?:\s*(\d+)\s*y(?:(?:ea)?rs?)?)?)"
               + R"((?:\s*(\d+)\s*w(?:(?:ee)?ks?)?)?)"
               + R"((?:\s*(\d+)\s*d(?:a?ys?)?)?)"
               + R"((?:\s*(\d+)\s*h(?:(?:ou)?rs?)?)?)"
               + R"((?:\s*(\d+)\s*m(?:in(?:ute)?s?)?)?)"
               + R"((?:)"
               +   R"((?:\s*(\d+)?[.,](\d+)\s*)" + sec + R"()?)"
               + R"(|)"
               +   R"((?:\s*(\d+)\s*)" + sec + R"()?)"
               +   R"((?:\s*(\d+)\s*(?:m|milli))" + sec + R"()?)"
               +   "(?:\\s*(\\d+)\\s*(?:u|\xCE\xBC|\xC2\xB5|micro)" + sec + R"()?)"
               +   R"((?:\s*(\d+)\s*(?:n|nano))" + sec + R"()?)"
               + R"())"
               + R"(\s*$)";
    }

    static RE2::Options options() {
        RE2::Options opts;
        opts.set_case_sensitive(false);
        return opts;
    }

    PeriodGrammar() : re_(pattern(), options()) {
        if (!re_.ok() || re_.NumberOfCapturingGroups() != GROUP_COUNT) {
            log::logger()->error("Period grammar failed to compile: {}", re_.error());
        }
    }

    RE2 re_;
};

} // namespace tempo::detail
