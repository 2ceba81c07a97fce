#pragma once

#include "tempo/error.hpp"
#include "tempo/expected.hpp"

#include <concepts>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <simdjson.h>

namespace tempo {

/**
 * Concept for values with a canonical text form
 *
 * Satisfied by Period and Instant: to_string() gives the canonical text and
 * T::parse() accepts it back.
 */
template <typename T>
concept TextValue = requires(const T& value, std::string_view text) {
    { value.to_string() } -> std::convertible_to<std::string>;
    { T::parse(text) } -> std::same_as<expected<T, InvalidSpecification>>;
};

namespace detail {

inline void append_json_string(std::string& out, std::string_view s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
}

} // namespace detail

/// Serialize as a JSON document holding one string scalar: the canonical text
template <TextValue T>
std::string to_json(const T& value) {
    std::string out;
    detail::append_json_string(out, value.to_string());
    return out;
}

/**
 * Deserialize a value embedded in a larger document, e.g. one field of an object.
 *
 * The value must be a JSON string; its content goes through T::parse() and fails
 * exactly as direct parsing would.
 */
template <TextValue T>
expected<T, InvalidSpecification> from_json(simdjson::ondemand::value value) {
    std::string_view text;
    if (auto error = value.get_string().get(text); error) {
        return make_unexpected(InvalidSpecification(
            fmt::format("Expected a JSON string: {}", simdjson::error_message(error))));
    }
    return T::parse(text);
}

/// Deserialize a JSON document that is a single string scalar
template <TextValue T>
expected<T, InvalidSpecification> from_json(std::string_view json) {
    thread_local simdjson::ondemand::parser parser;

    simdjson::padded_string padded(json);
    simdjson::ondemand::document doc;
    if (auto error = parser.iterate(padded).get(doc); error) {
        return make_unexpected(InvalidSpecification(
            fmt::format("Invalid JSON \"{}\": {}", json, simdjson::error_message(error))));
    }

    std::string_view text;
    if (auto error = doc.get_string().get(text); error) {
        return make_unexpected(InvalidSpecification(fmt::format(
            "Expected a JSON string scalar in \"{}\": {}", json, simdjson::error_message(error))));
    }
    if (!doc.at_end()) {
        return make_unexpected(
            InvalidSpecification(fmt::format("Trailing content after JSON string in \"{}\"", json)));
    }
    return T::parse(text);
}

} // namespace tempo
