#pragma once

#include "tempo/log.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <re2/re2.h>

namespace tempo::detail {

/**
 * @brief Compiled flexible ISO 8601 grammar, built once per process
 *
 * Accepts YYYY[[-]MM[[-]DD]] [(T|t|whitespace)hh[[:]mm[[:]ss[(.|,)f+]]]] [zone],
 * surrounded by optional whitespace. The zone is Z/z, or +, -, U+2212 followed by
 * hh[[:]mm]; no zone means UTC. Field ranges enforced here are syntactic only (day
 * 01-31); calendar validity is left to the strict RFC 3339 parser.
 */
class Iso8601Grammar {
public:
    static const Iso8601Grammar& instance() {
        static const Iso8601Grammar grammar;
        return grammar;
    }

    /**
     * Re-render text in strict RFC 3339 form, filling omitted fields with their
     * defaults (month and day 01, time 00:00:00, zone Z).
     *
     * @return The strict-form text, or nullopt when the grammar rejects the input
     */
    [[nodiscard]] std::optional<std::string> normalize(std::string_view text) const {
        re2::StringPiece groups[GROUP_COUNT + 1];
        if (!re_.Match(re2::StringPiece(text.data(), text.size()), 0, text.size(),
                       RE2::ANCHOR_BOTH, groups, GROUP_COUNT + 1)) {
            return std::nullopt;
        }

        auto field = [&](int index, std::string_view fallback) {
            const re2::StringPiece& g = groups[index];
            return g.data() == nullptr ? fallback : std::string_view(g.data(), g.size());
        };

        std::string zone = "Z";
        if (groups[ZONE_SIGN].data() != nullptr) {
            // ASCII hyphen and U+2212 both mean minus
            const char sign = field(ZONE_SIGN, "+") == "+" ? '+' : '-';
            zone = fmt::format("{}{}:{}", sign, field(ZONE_HOURS, "00"), field(ZONE_MINUTES, "00"));
        }

        std::string fraction;
        if (groups[FRACTION].data() != nullptr) {
            fraction = fmt::format(".{}", field(FRACTION, ""));
        }

        return fmt::format("{}-{}-{}T{}:{}:{}{}{}", field(YEAR, "0000"), field(MONTH, "01"),
                           field(DAY, "01"), field(HOUR, "00"), field(MINUTE, "00"),
                           field(SECOND, "00"), fraction, zone);
    }

private:
    enum Group : int {
        YEAR = 1,
        MONTH,
        DAY,
        HOUR,
        MINUTE,
        SECOND,
        FRACTION,
        ZONE,
        ZONE_SIGN,
        ZONE_HOURS,
        ZONE_MINUTES,
    };
    static constexpr int GROUP_COUNT = ZONE_MINUTES;

    static std::string pattern() {
        return std::string(R"(^\s*)")
               // 4-digit year, then optional 2-digit month and day with optional dashes
               + R"((\d{4}))"
               + R"((?:-?(0[1-9]|1[012])?(?:-?(0[1-9]|[12][0-9]|3[01])?)?)?)"
               // Optional time: hour, then minute, then second (60 is a leap second)
               + R"((?:(?:[Tt]|\s+))"
               +   R"(([01][0-9]|2[0-3]))"
               +   R"((?::?([0-5][0-9]))"
               +     R"((?::?([0-5][0-9]|60)(?:[.,](\d+))?)?)"
               +   R"()?)"
               + R"()?)"
               // Optional zone; the sign may be an ASCII hyphen or U+2212 MINUS SIGN
               + R"(\s*([Zz]|(\+|-|)" "\xE2\x88\x92" R"()(\d{2})(?::?(\d{2}))?)?)"
               + R"(\s*$)";
    }

    Iso8601Grammar() : re_(pattern()) {
        if (!re_.ok() || re_.NumberOfCapturingGroups() != GROUP_COUNT) {
            log::logger()->error("ISO 8601 grammar failed to compile: {}", re_.error());
        }
    }

    RE2 re_;
};

} // namespace tempo::detail
