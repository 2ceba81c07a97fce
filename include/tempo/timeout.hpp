#pragma once

#include "tempo/period.hpp"

#include <chrono>
#include <limits>

#include <cstddef>
#include <cstdint>

namespace tempo {

/**
 * Millisecond timeout for operations that wait.
 *
 * Defaults to 60 seconds. Convertible to and from Period; the Period conversion
 * saturates instead of failing.
 */
class Timeout {
public:
    static constexpr std::size_t DEFAULT_MILLISECONDS = 60'000;

    constexpr Timeout() noexcept = default;
    constexpr explicit Timeout(std::size_t milliseconds) noexcept : millis_(milliseconds) {}

    static constexpr Timeout max() noexcept {
        return Timeout(std::numeric_limits<std::size_t>::max());
    }

    /**
     * Lossy but infallible conversion from a Period.
     *
     * Sub-millisecond precision is truncated. A Period whose milliseconds do not fit
     * std::size_t becomes Timeout::max(), which is effectively "forever" on 64-bit
     * targets and about 49 days on 32-bit ones.
     */
    static constexpr Timeout from_period(const Period& p) noexcept {
        constexpr std::size_t MAX = std::numeric_limits<std::size_t>::max();
        // With seconds >= MAX / 1000, seconds * 1000 + 999 may not fit
        if (p.seconds() >= MAX / 1'000) {
            return max();
        }
        return Timeout(static_cast<std::size_t>(p.seconds()) * 1'000 +
                       static_cast<std::size_t>(p.nanoseconds() / detail::NANOS_PER_MILLI));
    }

    constexpr std::size_t milliseconds() const noexcept { return millis_; }

    /// Exact conversion back to a Period
    constexpr Period to_period() const noexcept {
        return Period::from_milliseconds(static_cast<uint64_t>(millis_));
    }

    /// Saturates to std::chrono::milliseconds::max() when the count does not fit
    constexpr std::chrono::milliseconds to_chrono() const noexcept {
        using rep = std::chrono::milliseconds::rep;
        if (static_cast<uintmax_t>(millis_) >
            static_cast<uintmax_t>(std::numeric_limits<rep>::max())) {
            return std::chrono::milliseconds::max();
        }
        return std::chrono::milliseconds(static_cast<rep>(millis_));
    }

    constexpr auto operator<=>(const Timeout&) const noexcept = default;
    constexpr bool operator==(const Timeout&) const noexcept = default;

private:
    std::size_t millis_{DEFAULT_MILLISECONDS};
};

} // namespace tempo
