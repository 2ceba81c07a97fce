#pragma once

// TEMPO Expected Type
//
// Exposes tl::expected in the tempo namespace for consistent error handling.
// This provides a std::expected-compatible API (C++23) using the TartanLlama
// implementation for C++20 compatibility.
//
// Usage:
//   tempo::expected<Period, InvalidSpecification> result = Period::parse("1w2d");
//   if (result.has_value()) {
//       use(*result);
//   } else {
//       report(result.error().message());
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - chain on error
//   result.map_error(f) - transform error

#include <tl/expected.hpp>

namespace tempo {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace tempo
