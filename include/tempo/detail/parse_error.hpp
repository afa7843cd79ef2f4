#pragma once

#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace tempo {

/// Reasons a text fails to parse as a timestamp
enum class ParseErrorCode : uint8_t {
    literal_mismatch,     ///< Literal pattern character not found in the text
    expected_digits,      ///< Numeric field has no digits
    field_overflow,       ///< Numeric field wider than its directive allows
    fraction_too_precise, ///< More than 9 fractional digits
    invalid_offset,       ///< Malformed UTC offset
    unknown_name,         ///< Month/weekday name or AM/PM marker not recognized
    unknown_directive,    ///< Pattern uses a letter the parser does not know
    trailing_input,       ///< Text left over after the pattern was consumed
    unexpected_end,       ///< Text ended while the pattern still expects input
    missing_date,         ///< Year, month or day was not parsed
    invalid_date,         ///< Parsed date does not exist in the calendar
    field_out_of_range,   ///< Hour, minute, second or day-of-year outside its range
    no_pattern_matched    ///< None of the candidate patterns matched
};

/**
 * @brief Get a human-readable string for a parse error code
 */
constexpr const char* parse_error_string(ParseErrorCode code) noexcept {
    switch (code) {
        case ParseErrorCode::literal_mismatch:
            return "text does not match the pattern";
        case ParseErrorCode::expected_digits:
            return "expected digits";
        case ParseErrorCode::field_overflow:
            return "numeric field is too wide";
        case ParseErrorCode::fraction_too_precise:
            return "fractional seconds exceed 9 digits";
        case ParseErrorCode::invalid_offset:
            return "invalid UTC offset";
        case ParseErrorCode::unknown_name:
            return "unrecognized name";
        case ParseErrorCode::unknown_directive:
            return "unknown parse directive";
        case ParseErrorCode::trailing_input:
            return "trailing input after pattern";
        case ParseErrorCode::unexpected_end:
            return "input ended before pattern";
        case ParseErrorCode::missing_date:
            return "year, month and day are required";
        case ParseErrorCode::invalid_date:
            return "date does not exist";
        case ParseErrorCode::field_out_of_range:
            return "time field out of range";
        case ParseErrorCode::no_pattern_matched:
            return "no candidate pattern matched";
    }
    return "unknown parse error";
}

/**
 * @brief Error information from failed timestamp parsing
 *
 * `position` is the byte offset into the parsed text where the failure was
 * detected. `pattern` is a copy of the pattern that was being matched; for
 * pattern-list parses it is the candidate that got furthest.
 */
struct ParseError {
    ParseErrorCode code;     ///< What went wrong
    std::size_t position{0}; ///< Offset into the text
    std::string pattern{};   ///< Pattern being matched

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the error code
     */
    [[nodiscard]] const char* message() const noexcept { return parse_error_string(code); }
};

} // namespace tempo
