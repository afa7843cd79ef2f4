#pragma once

#include "tempo/detail/time_math.hpp"
#include "tempo/expected.hpp"
#include "tempo/interval.hpp"

#include <array>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace tempo {

/**
 * @brief Error from parsing a duration literal such as "1d12h30m"
 *
 * `token` is the offending token (or the unit letter for ordering errors)
 * and `position` its byte offset in the literal.
 */
struct LiteralError {
    enum class Code : uint8_t {
        empty,                ///< No tokens
        unit_out_of_order,    ///< Larger unit after a smaller one, e.g. "1h2d"
        unit_repeated,        ///< Same unit twice, e.g. "1h2h"
        fraction_repeated,    ///< Two fractional-seconds tokens
        fraction_too_precise, ///< More than 9 fractional digits
        fraction_not_seconds, ///< Fraction on d, h or m
        missing_digits,       ///< Sign or unit without digits
        missing_unit,         ///< Digits without a unit letter
        unknown_unit,         ///< Unit letter other than d, h, m, s
        overflow              ///< Value exceeds the Interval range
    };

    Code code;
    std::string token;
    std::size_t position{0};

    [[nodiscard]] const char* message() const noexcept {
        switch (code) {
            case Code::empty:
                return "empty duration literal";
            case Code::unit_out_of_order:
                return "units out of order: place only larger units before smaller ones";
            case Code::unit_repeated:
                return "unit declared more than once";
            case Code::fraction_repeated:
                return "fractional seconds declared more than once";
            case Code::fraction_too_precise:
                return "fractional seconds exceed 9 digits";
            case Code::fraction_not_seconds:
                return "only seconds may have a fraction";
            case Code::missing_digits:
                return "expected digits";
            case Code::missing_unit:
                return "expected a unit (d, h, m, s)";
            case Code::unknown_unit:
                return "unknown unit";
            case Code::overflow:
                return "duration out of range";
        }
        return "unknown duration literal error";
    }
};

namespace detail {

/// Units of the literal grammar, largest first
struct LiteralUnit {
    char letter;
    int64_t seconds;
};

inline constexpr std::array<LiteralUnit, 4> literal_units{{
    {'d', 86'400},
    {'h', 3'600},
    {'m', 60},
    {'s', 1},
}};

constexpr std::optional<std::size_t> literal_unit_index(char letter) noexcept {
    for (std::size_t i = 0; i < literal_units.size(); ++i) {
        if (literal_units[i].letter == letter) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace detail

/**
 * Parse a compact duration literal into an Interval.
 *
 * Grammar: `sign? token+`, where a token is `digits unit` or
 * `digits '.' digits 's'` and unit is one of d, h, m, s. Spaces may
 * separate tokens.
 *
 * - units appear in strictly decreasing magnitude, each at most once
 * - one fractional-seconds token, at most 9 digits, zero-extended
 * - the leading sign applies to the whole literal
 *
 * Examples:
 * @code
 *   parse_duration_literal("1d12h30m");  // {131400, 0}
 *   parse_duration_literal("1.5s");      // {1, 500'000'000}
 *   parse_duration_literal("-1.5s");     // {-2, 500'000'000}
 *   parse_duration_literal("1h2d");      // LiteralError::Code::unit_out_of_order
 * @endcode
 */
inline expected<Interval, LiteralError> parse_duration_literal(std::string_view literal) {
    using Code = LiteralError::Code;

    std::size_t pos = 0;
    auto skip_spaces = [&] {
        while (pos < literal.size() && literal[pos] == ' ') {
            ++pos;
        }
    };
    auto error = [&](Code code, std::size_t start, std::size_t end) {
        return unexpected(
            LiteralError{code, std::string(literal.substr(start, end - start)), start});
    };

    skip_spaces();
    if (pos == literal.size()) {
        return error(Code::empty, 0, literal.size());
    }

    bool negative = false;
    if (literal[pos] == '+' || literal[pos] == '-') {
        const std::size_t sign = pos;
        negative = literal[pos] == '-';
        ++pos;
        skip_spaces();
        if (pos == literal.size()) {
            return error(Code::missing_digits, sign, sign + 1);
        }
    }

    // Magnitudes accumulate unsigned; the sign is applied at the end
    detail::wide_int total_seconds = 0;
    uint32_t nanos = 0;
    std::optional<std::size_t> last_unit;
    bool fraction_seen = false;

    auto read_digits = [&](uint64_t& value) -> std::size_t {
        const std::size_t start = pos;
        value = 0;
        while (pos < literal.size() && literal[pos] >= '0' && literal[pos] <= '9') {
            const uint64_t digit = static_cast<uint64_t>(literal[pos] - '0');
            if (value > (UINT64_MAX - digit) / 10) {
                value = UINT64_MAX;
            } else {
                value = value * 10 + digit;
            }
            ++pos;
        }
        return pos - start;
    };

    while (pos < literal.size()) {
        const std::size_t token_start = pos;
        uint64_t whole = 0;
        if (read_digits(whole) == 0) {
            return error(Code::missing_digits, token_start, pos + 1);
        }
        if (whole == UINT64_MAX) {
            return error(Code::overflow, token_start, pos);
        }

        std::optional<uint32_t> fraction;
        if (pos < literal.size() && literal[pos] == '.') {
            ++pos;
            uint64_t digits = 0;
            const std::size_t count = read_digits(digits);
            if (count == 0) {
                return error(Code::missing_digits, token_start, pos);
            }
            if (count > detail::MAX_FRACTION_DIGITS) {
                return error(Code::fraction_too_precise, token_start, pos + 1);
            }
            fraction = static_cast<uint32_t>(digits) *
                       detail::pow10(static_cast<int>(detail::MAX_FRACTION_DIGITS - count));
        }

        if (pos == literal.size() || literal[pos] == ' ') {
            return error(Code::missing_unit, token_start, pos);
        }
        const char letter = literal[pos];
        auto unit = detail::literal_unit_index(letter);
        if (!unit) {
            return error(Code::unknown_unit, token_start, pos + 1);
        }
        ++pos;

        if (fraction) {
            if (letter != 's') {
                return error(Code::fraction_not_seconds, token_start, pos);
            }
            if (fraction_seen) {
                return error(Code::fraction_repeated, token_start, pos);
            }
            fraction_seen = true;
        }
        if (last_unit) {
            if (*unit == *last_unit) {
                return error(Code::unit_repeated, token_start, pos);
            }
            if (*unit < *last_unit) {
                return error(Code::unit_out_of_order, pos - 1, pos);
            }
        }
        last_unit = unit;

        total_seconds +=
            static_cast<detail::wide_int>(whole) * detail::literal_units[*unit].seconds;
        if (fraction) {
            nanos = *fraction;
        }
        skip_spaces();
    }

    // Negative: borrow one second so the residue stays non-negative
    detail::wide_int seconds = negative ? -total_seconds : total_seconds;
    if (negative && nanos != 0) {
        seconds -= 1;
        nanos = detail::NANOS_PER_SEC - nanos;
    }
    if (seconds > detail::SECONDS_MAX || seconds < detail::SECONDS_MIN) {
        return error(Code::overflow, 0, literal.size());
    }
    return Interval(static_cast<int64_t>(seconds), nanos);
}

/**
 * Canonical literal for an Interval: largest units first, zero units
 * omitted, fraction trimmed of trailing zeros, "0s" for zero.
 *
 * parse_duration_literal(to_literal(i)) == i for every Interval.
 */
inline std::string to_literal(const Interval& interval) {
    if (interval.is_zero()) {
        return "0s";
    }

    detail::wide_int magnitude = interval.as_nanoseconds();
    std::string out;
    if (magnitude < 0) {
        out.push_back('-');
        magnitude = -magnitude;
    }
    auto seconds = static_cast<uint64_t>(magnitude / detail::NANOS_PER_SEC);
    const auto fraction = static_cast<uint32_t>(magnitude % detail::NANOS_PER_SEC);

    for (const auto& unit : detail::literal_units) {
        const auto per = static_cast<uint64_t>(unit.seconds);
        const uint64_t count = seconds / per;
        seconds %= per;
        if (unit.letter == 's') {
            if (count == 0 && fraction == 0) {
                break;
            }
            out += std::to_string(count);
            if (fraction != 0) {
                std::string digits = std::to_string(fraction);
                digits.insert(0, detail::MAX_FRACTION_DIGITS - digits.size(), '0');
                digits.erase(digits.find_last_not_of('0') + 1);
                out += '.';
                out += digits;
            }
            out += 's';
        } else if (count != 0) {
            out += std::to_string(count);
            out += unit.letter;
        }
    }
    return out;
}

inline std::ostream& operator<<(std::ostream& os, const Interval& interval) {
    return os << to_literal(interval);
}

} // namespace tempo
