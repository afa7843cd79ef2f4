#pragma once

#include "tempo/calendar.hpp"
#include "tempo/detail/time_math.hpp"
#include "tempo/expected.hpp"
#include "tempo/timestamp.hpp"
#include "tempo/timezone.hpp"

#include <charconv>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <cstdint>
#include <cstdlib>

namespace tempo {

/**
 * @brief Error from rendering a Timestamp with a pattern
 *
 * `position` is the offset of the directive's '%' within the pattern.
 */
struct FormatError {
    enum class Code : uint8_t {
        unknown_directive, ///< Directive letter not in the table
        invalid_modifier,  ///< '.', '3', '6' or '9' applied to a directive other than 'f'
        dangling_escape,   ///< Pattern ends inside a directive
        timezone_lookup    ///< Attached zone has no offset for the instant
    };

    Code code;
    std::size_t position{0};
    char directive{'\0'};
    std::optional<TimeZoneError> timezone{}; ///< Set for Code::timezone_lookup

    [[nodiscard]] const char* message() const noexcept {
        switch (code) {
            case Code::unknown_directive:
                return "unknown format directive";
            case Code::invalid_modifier:
                return "fraction modifier only allowed on 'f' (fractional seconds)";
            case Code::dangling_escape:
                return "format pattern ends inside a directive";
            case Code::timezone_lookup:
                return timezone ? timezone->message() : "timezone lookup failed";
        }
        return "unknown format error";
    }
};

namespace detail {

/// Padding modifier of a numeric directive
enum class Padding : uint8_t {
    standard, ///< Directive default (zero padding for numeric fields)
    zero,     ///< '0'
    space,    ///< '_'
    none      ///< '-'
};

template <typename OutputIt>
OutputIt write_text(OutputIt out, std::string_view text) {
    for (char c : text) {
        *out++ = c;
    }
    return out;
}

/**
 * Write a signed integer padded to `width` characters (sign included).
 *
 * Formats into a stack buffer; nothing is allocated.
 */
template <typename OutputIt>
OutputIt write_number(OutputIt out, int64_t value, int width, Padding pad) {
    char digits[24];
    uint64_t magnitude = value < 0 ? 0ULL - static_cast<uint64_t>(value)
                                   : static_cast<uint64_t>(value);
    auto [end, ec] = std::to_chars(digits, digits + sizeof(digits), magnitude);
    (void)ec; // 24 bytes always holds a uint64_t
    const int length = static_cast<int>(end - digits) + (value < 0 ? 1 : 0);
    const int fill = pad == Padding::none ? 0 : (width > length ? width - length : 0);

    if (pad == Padding::space) {
        for (int i = 0; i < fill; ++i) {
            *out++ = ' ';
        }
    }
    if (value < 0) {
        *out++ = '-';
    }
    if (pad == Padding::standard || pad == Padding::zero) {
        for (int i = 0; i < fill; ++i) {
            *out++ = '0';
        }
    }
    return write_text(out, std::string_view(digits, static_cast<std::size_t>(end - digits)));
}

/// Zero-padded two-digit field used by the compound directives
template <typename OutputIt>
OutputIt write_2(OutputIt out, int64_t value) {
    return write_number(out, value, 2, Padding::zero);
}

/// Offset as ±HHMM
template <typename OutputIt>
OutputIt write_offset(OutputIt out, int32_t offset) {
    *out++ = offset < 0 ? '-' : '+';
    const int32_t magnitude = std::abs(offset);
    out = write_2(out, magnitude / 3'600);
    return write_2(out, magnitude % 3'600 / 60);
}

constexpr int hour_12(uint8_t hour) noexcept {
    if (hour == 0) {
        return 12;
    }
    return hour > 12 ? hour - 12 : hour;
}

} // namespace detail

/**
 * Render a Timestamp through a strftime-like pattern.
 *
 * Single left-to-right scan. Characters are copied verbatim until '%', which
 * starts a directive: zero or more modifiers, then a directive letter.
 *
 * Padding modifiers: '0' zero pad (default for numeric fields), '-' no
 * padding, '_' space pad.
 * Fraction modifiers ('f' only): '.' emit a decimal point, '3' millis,
 * '6' micros, '9' nanos (default).
 *
 * | Letter | Output                              | Width |
 * |--------|-------------------------------------|-------|
 * | Y      | year                                | 4     |
 * | C      | year / 100                          | 2     |
 * | y      | year % 100                          | 2     |
 * | m      | month                               | 2     |
 * | b, h   | month abbreviation                  |       |
 * | B      | month name                          |       |
 * | d      | day                                 | 2     |
 * | a      | weekday abbreviation                |       |
 * | A      | weekday name                        |       |
 * | w      | weekday 0-6, Sunday = 0             |       |
 * | u      | ISO weekday 1-7, Sunday = 7         |       |
 * | j      | day of year                         | 3     |
 * | H      | hour (24h)                          | 2     |
 * | I      | hour (12h, 0 -> 12)                 | 2     |
 * | M      | minute                              | 2     |
 * | S      | second                              | 2     |
 * | z      | offset ±HHMM                        |       |
 * | P, p   | AM/PM, am/pm                        |       |
 * | s      | epoch seconds                       |       |
 * | f      | fractional seconds                  | 9     |
 * | D      | MM/DD/YY                            |       |
 * | F      | YYYY-MM-DD                          |       |
 * | v      | DD-Mon-YYYY                         |       |
 * | R      | HH:MM                               |       |
 * | T      | HH:MM:SS                            |       |
 * | t, n   | tab, newline                        |       |
 * | %      | literal '%'                         |       |
 *
 * Wall-clock fields come from the Timestamp's attached zone. The zone is
 * resolved at the first directive that needs it; a lookup failure aborts
 * formatting with Code::timezone_lookup.
 *
 * @return The advanced output iterator, or the first FormatError
 */
template <typename OutputIt>
expected<OutputIt, FormatError> format_to(OutputIt out, const Timestamp& ts,
                                          std::string_view pattern) {
    using detail::Padding;

    std::optional<CivilDateTime> civil_cache;
    std::size_t directive_start = 0;

    auto resolve = [&]() -> expected<const CivilDateTime*, FormatError> {
        if (!civil_cache) {
            auto civil = ts.civil();
            if (!civil) {
                return unexpected(FormatError{FormatError::Code::timezone_lookup, directive_start,
                                              '\0', civil.error()});
            }
            civil_cache = *civil;
        }
        return &*civil_cache;
    };

    bool in_directive = false;
    Padding pad = Padding::standard;
    bool decimal_point = false;
    int fraction_width = 0;

    for (std::size_t pos = 0; pos < pattern.size(); ++pos) {
        const char c = pattern[pos];
        if (!in_directive) {
            if (c == '%') {
                in_directive = true;
                directive_start = pos;
                pad = Padding::standard;
                decimal_point = false;
                fraction_width = 0;
            } else {
                *out++ = c;
            }
            continue;
        }

        // Modifiers
        switch (c) {
            case '0':
                pad = Padding::zero;
                continue;
            case '-':
                pad = Padding::none;
                continue;
            case '_':
                pad = Padding::space;
                continue;
            case '.':
                decimal_point = true;
                continue;
            case '3':
            case '6':
            case '9':
                fraction_width = c - '0';
                continue;
            default:
                break;
        }

        in_directive = false;
        if (c != 'f' && (decimal_point || fraction_width != 0)) {
            return unexpected(FormatError{FormatError::Code::invalid_modifier, directive_start, c});
        }

        // Directives that need no calendar fields
        switch (c) {
            case 's':
                out = detail::write_number(out, ts.seconds(), 1, pad);
                continue;
            case 'f': {
                if (decimal_point) {
                    *out++ = '.';
                }
                const int width = fraction_width == 0 ? 9 : fraction_width;
                out = detail::write_number(out, ts.nanos() / detail::pow10(9 - width), width,
                                           Padding::zero);
                continue;
            }
            case 't':
                *out++ = '\t';
                continue;
            case 'n':
                *out++ = '\n';
                continue;
            case '%':
                *out++ = '%';
                continue;
            default:
                break;
        }

        auto fields = resolve();
        if (!fields) {
            return unexpected(fields.error());
        }
        const CivilDateTime& dt = **fields;

        switch (c) {
            case 'Y':
                out = detail::write_number(out, dt.year, 4, pad);
                break;
            case 'C':
                out = detail::write_number(out, dt.year / 100, 2, pad);
                break;
            case 'y':
                out = detail::write_number(out, dt.year % 100, 2, pad);
                break;
            case 'm':
                out = detail::write_number(out, dt.month, 2, pad);
                break;
            case 'b':
            case 'h':
                out = detail::write_text(out, Calendar::month_abbreviation(dt.month));
                break;
            case 'B':
                out = detail::write_text(out, Calendar::month_name(dt.month));
                break;
            case 'd':
                out = detail::write_number(out, dt.day, 2, pad);
                break;
            case 'a':
                out = detail::write_text(out, Calendar::weekday_abbreviation(dt.weekday));
                break;
            case 'A':
                out = detail::write_text(out, Calendar::weekday_name(dt.weekday));
                break;
            case 'w':
                out = detail::write_number(out, static_cast<int64_t>(dt.weekday), 1, pad);
                break;
            case 'u': {
                const auto weekday = static_cast<int64_t>(dt.weekday);
                out = detail::write_number(out, weekday == 0 ? 7 : weekday, 1, pad);
                break;
            }
            case 'j':
                out = detail::write_number(out, dt.day_of_year, 3, pad);
                break;
            case 'H':
                out = detail::write_number(out, dt.hour, 2, pad);
                break;
            case 'I':
                out = detail::write_number(out, detail::hour_12(dt.hour), 2, pad);
                break;
            case 'M':
                out = detail::write_number(out, dt.minute, 2, pad);
                break;
            case 'S':
                out = detail::write_number(out, dt.second, 2, pad);
                break;
            case 'z':
                out = detail::write_offset(out, dt.utc_offset);
                break;
            case 'P':
                out = detail::write_text(out, dt.hour >= 12 ? "PM" : "AM");
                break;
            case 'p':
                out = detail::write_text(out, dt.hour >= 12 ? "pm" : "am");
                break;
            case 'D':
                out = detail::write_2(out, dt.month);
                *out++ = '/';
                out = detail::write_2(out, dt.day);
                *out++ = '/';
                out = detail::write_2(out, dt.year % 100);
                break;
            case 'F':
                out = detail::write_number(out, dt.year, 4, Padding::zero);
                *out++ = '-';
                out = detail::write_2(out, dt.month);
                *out++ = '-';
                out = detail::write_2(out, dt.day);
                break;
            case 'v':
                out = detail::write_2(out, dt.day);
                *out++ = '-';
                out = detail::write_text(out, Calendar::month_abbreviation(dt.month));
                *out++ = '-';
                out = detail::write_number(out, dt.year, 4, Padding::zero);
                break;
            case 'R':
                out = detail::write_2(out, dt.hour);
                *out++ = ':';
                out = detail::write_2(out, dt.minute);
                break;
            case 'T':
                out = detail::write_2(out, dt.hour);
                *out++ = ':';
                out = detail::write_2(out, dt.minute);
                *out++ = ':';
                out = detail::write_2(out, dt.second);
                break;
            default:
                return unexpected(
                    FormatError{FormatError::Code::unknown_directive, directive_start, c});
        }
    }

    if (in_directive) {
        return unexpected(FormatError{FormatError::Code::dangling_escape, directive_start});
    }
    return out;
}

/// Render into a new string
inline expected<std::string, FormatError> format(const Timestamp& ts, std::string_view pattern) {
    std::string result;
    result.reserve(pattern.size() + 16);
    return format_to(std::back_inserter(result), ts, pattern).map([&result](auto) {
        return std::move(result);
    });
}

/**
 * Most compact lossless default pattern for a Timestamp.
 *
 * - no residue:              %Y-%m-%dT%H:%M:%S
 * - residue multiple of 1us: %Y-%m-%dT%H:%M:%S%.6f
 * - otherwise:               %Y-%m-%dT%H:%M:%S%.9f
 * with %z appended when a zone is attached.
 */
inline std::string_view default_pattern(const Timestamp& ts) noexcept {
    const bool zoned = !ts.timezone().is_unspecified();
    if (ts.nanos() == 0) {
        return zoned ? "%Y-%m-%dT%H:%M:%S%z" : "%Y-%m-%dT%H:%M:%S";
    }
    if (ts.nanos() % 1'000 == 0) {
        return zoned ? "%Y-%m-%dT%H:%M:%S%.6f%z" : "%Y-%m-%dT%H:%M:%S%.6f";
    }
    return zoned ? "%Y-%m-%dT%H:%M:%S%.9f%z" : "%Y-%m-%dT%H:%M:%S%.9f";
}

/// Default text serialization, e.g. "2024-07-04T15:30:45.123456-0400"
inline expected<std::string, FormatError> to_string(const Timestamp& ts) {
    return format(ts, default_pattern(ts));
}

/**
 * Display form: the default serialization.
 *
 * When the attached zone cannot be resolved, the UTC form is written
 * followed by the lookup error, so the failure stays visible.
 */
inline std::ostream& operator<<(std::ostream& os, const Timestamp& ts) {
    auto text = to_string(ts);
    if (text) {
        return os << *text;
    }
    const Timestamp bare = ts.with_timezone(TimeZone::unspecified());
    auto fallback = format(bare, default_pattern(bare));
    return os << fallback.value_or(std::string{}) << " [" << text.error().message() << "]";
}

} // namespace tempo
