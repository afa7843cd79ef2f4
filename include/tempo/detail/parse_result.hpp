#pragma once

#include "../expected.hpp"
#include "parse_error.hpp"

namespace tempo {

/**
 * @brief Result type for timestamp parsing operations
 *
 * Alias for expected<T, ParseError>.
 *
 * Usage:
 * @code
 *   auto result = parse("2012-04-21 11:00:00");
 *   if (result.has_value()) {
 *       std::cout << *result << "\n";
 *   } else {
 *       std::cerr << result.error().message() << "\n";
 *   }
 * @endcode
 *
 * @tparam T The successfully parsed value
 */
template <typename T>
using ParseResult = expected<T, ParseError>;

/**
 * @brief Factory function for creating parse errors
 *
 * @param code The parse error code
 * @param position Offset into the text where parsing stopped
 * @param pattern The pattern being matched
 * @return unexpected<ParseError> suitable for returning from parse functions
 */
inline auto make_parse_error(ParseErrorCode code, std::size_t position,
                             std::string_view pattern = {}) {
    return unexpected(
        ParseError{.code = code, .position = position, .pattern = std::string(pattern)});
}

} // namespace tempo
