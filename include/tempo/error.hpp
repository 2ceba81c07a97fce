#pragma once

#include <string>
#include <utility>

namespace tempo {

/**
 * @brief The single error produced by tempo parsers
 *
 * Covers grammar mismatches, out-of-range fields, mixed seconds forms, arithmetic
 * overflow while summing units, and malformed serialized scalars. The message always
 * names the offending input text.
 */
struct InvalidSpecification {
    std::string detail; ///< Human-readable description, including the rejected input

    InvalidSpecification() = default;
    explicit InvalidSpecification(std::string msg) : detail(std::move(msg)) {}

    /**
     * @brief Get the human-readable error message
     */
    [[nodiscard]] const std::string& message() const noexcept { return detail; }

    bool operator==(const InvalidSpecification&) const = default;
};

} // namespace tempo
