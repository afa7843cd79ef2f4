#pragma once

// TEMPO Expected Type
//
// Exposes tl::expected in the tempo namespace for consistent error handling.
// Every recoverable failure in tempo (formatting, parsing, duration literals,
// timezone lookup, configuration) is returned as expected<T, SomeError>.
//
// Usage:
//   tempo::expected<Timestamp, ParseError> result = tempo::parse(text);
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
