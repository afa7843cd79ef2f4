#pragma once

#include "tempo/calendar.hpp"
#include "tempo/detail/parse_result.hpp"
#include "tempo/detail/time_math.hpp"
#include "tempo/timestamp.hpp"
#include "tempo/timezone.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <cctype>
#include <cstdint>

namespace tempo {

/**
 * Raw date/time components recovered from text.
 *
 * Fields are unvalidated: a month of 13 parses fine here and is rejected by
 * assemble(). Only the fields a pattern names are set.
 */
struct RawDateTime {
    std::optional<int64_t> year;
    std::optional<uint8_t> month;
    std::optional<uint8_t> day;
    std::optional<uint16_t> day_of_year;
    std::optional<uint8_t> hour;
    std::optional<uint8_t> hour12; ///< %I, combined with `pm` by assemble()
    std::optional<bool> pm;
    std::optional<uint8_t> minute;
    std::optional<uint8_t> second;
    std::optional<uint32_t> nanos;
    std::optional<int32_t> utc_offset;    ///< Seconds east of UTC
    std::optional<int64_t> epoch_seconds; ///< %s, used directly as the instant

    bool operator==(const RawDateTime&) const = default;
};

namespace detail {

/// Digits of the widest %Y accepted when no directive follows (Calendar::MAX_YEAR)
inline constexpr std::size_t MAX_YEAR_DIGITS = 12;

/// Years 69-99 map to 19xx, 00-68 to 20xx
inline constexpr int32_t TWO_DIGIT_YEAR_PIVOT = 69;

constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

constexpr char to_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

constexpr bool starts_with_icase(std::string_view text, std::string_view prefix) noexcept {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (to_lower(text[i]) != to_lower(prefix[i])) {
            return false;
        }
    }
    return true;
}

/**
 * Single-pattern matcher behind parse_components().
 *
 * Walks the pattern once, consuming text as it goes. Compound directives
 * (%F, %T, %R, %D) recurse into their expansion with the same state.
 */
class PatternScanner {
public:
    PatternScanner(std::string_view text, std::string_view pattern) noexcept
        : text_(text),
          pattern_(pattern) {}

    ParseResult<RawDateTime> run() {
        if (auto status = scan(pattern_); !status) {
            return unexpected(status.error());
        }
        if (pos_ < text_.size()) {
            return fail(ParseErrorCode::trailing_input);
        }
        resolve_year();
        return raw_;
    }

private:
    using Status = expected<void, ParseError>;

    std::string_view text_;
    std::string_view pattern_;
    std::size_t pos_{0};
    RawDateTime raw_;
    std::optional<int64_t> century_;
    std::optional<int64_t> year_of_century_;

    unexpected<ParseError> fail(ParseErrorCode code) const {
        return make_parse_error(code, pos_, pattern_);
    }

    bool at_end() const noexcept { return pos_ >= text_.size(); }

    char peek() const noexcept { return text_[pos_]; }

    std::size_t digits_ahead() const noexcept {
        std::size_t n = 0;
        while (pos_ + n < text_.size() && is_digit(text_[pos_ + n])) {
            ++n;
        }
        return n;
    }

    void skip_whitespace() noexcept {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) {
            ++pos_;
        }
    }

    /**
     * Read an unsigned field of 1 to `max_digits` digits, greedily.
     *
     * When the field is not directly followed by another directive, a digit
     * after `max_digits` means the field is too wide.
     */
    expected<int64_t, ParseError> read_unsigned(std::size_t max_digits, bool bounded) {
        const std::size_t available = digits_ahead();
        if (available == 0) {
            return fail(at_end() ? ParseErrorCode::unexpected_end
                                 : ParseErrorCode::expected_digits);
        }
        if (available > max_digits && !bounded) {
            pos_ += max_digits;
            return fail(ParseErrorCode::field_overflow);
        }
        const std::size_t count = std::min(available, max_digits);
        wide_int value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            value = value * 10 + (text_[pos_ + i] - '0');
        }
        if (value > static_cast<wide_int>(SECONDS_MAX)) {
            return fail(ParseErrorCode::field_overflow);
        }
        pos_ += count;
        return static_cast<int64_t>(value);
    }

    expected<int64_t, ParseError> read_signed(std::size_t max_digits, bool bounded) {
        bool negative = false;
        if (!at_end() && (peek() == '-' || peek() == '+')) {
            negative = peek() == '-';
            ++pos_;
        }
        return read_unsigned(max_digits, bounded).map([negative](int64_t v) {
            return negative ? -v : v;
        });
    }

    Status read_fraction(bool decimal_point, std::size_t width) {
        if (decimal_point) {
            if (at_end()) {
                return fail(ParseErrorCode::unexpected_end);
            }
            if (peek() != '.') {
                return fail(ParseErrorCode::literal_mismatch);
            }
            ++pos_;
        }
        const std::size_t count = digits_ahead();
        if (count > MAX_FRACTION_DIGITS) {
            return fail(ParseErrorCode::fraction_too_precise);
        }
        if (count == 0 || (width != 0 && count < width)) {
            return fail(at_end() ? ParseErrorCode::unexpected_end
                                 : ParseErrorCode::expected_digits);
        }
        if (width != 0 && count > width) {
            pos_ += width;
            return fail(ParseErrorCode::field_overflow);
        }
        uint32_t value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            value = value * 10 + static_cast<uint32_t>(text_[pos_ + i] - '0');
        }
        raw_.nanos = value * pow10(static_cast<int>(MAX_FRACTION_DIGITS - count));
        pos_ += count;
        return {};
    }

    /// 'Z', ±HHMM or ±HH:MM
    Status read_offset() {
        if (at_end()) {
            return fail(ParseErrorCode::unexpected_end);
        }
        if (peek() == 'Z' || peek() == 'z') {
            ++pos_;
            raw_.utc_offset = 0;
            return {};
        }
        if (peek() != '+' && peek() != '-') {
            return fail(ParseErrorCode::invalid_offset);
        }
        const int32_t sign = peek() == '-' ? -1 : 1;
        ++pos_;

        auto two_digits = [this]() -> std::optional<int32_t> {
            if (pos_ + 2 > text_.size() || !is_digit(text_[pos_]) || !is_digit(text_[pos_ + 1])) {
                return std::nullopt;
            }
            int32_t v = (text_[pos_] - '0') * 10 + (text_[pos_ + 1] - '0');
            pos_ += 2;
            return v;
        };

        auto hours = two_digits();
        if (!hours) {
            return fail(ParseErrorCode::invalid_offset);
        }
        if (!at_end() && peek() == ':') {
            ++pos_;
        }
        auto minutes = two_digits();
        if (!minutes || *hours >= 24 || *minutes >= 60) {
            return fail(ParseErrorCode::invalid_offset);
        }
        raw_.utc_offset = sign * (*hours * 3'600 + *minutes * 60);
        return {};
    }

    /// Match one of `names` case-insensitively; returns its index
    template <std::size_t N>
    std::optional<std::size_t> match_name(const std::array<std::string_view, N>& names,
                                          std::size_t prefix = 0) {
        const std::string_view rest = text_.substr(pos_);
        for (std::size_t i = 0; i < N; ++i) {
            std::string_view name = prefix == 0 ? names[i] : names[i].substr(0, prefix);
            if (starts_with_icase(rest, name)) {
                pos_ += name.size();
                return i;
            }
        }
        return std::nullopt;
    }

    /// Full name first, then the three-letter abbreviation
    template <std::size_t N>
    std::optional<std::size_t> match_full_or_abbreviated(
        const std::array<std::string_view, N>& names) {
        if (auto full = match_name(names)) {
            return full;
        }
        return match_name(names, 3);
    }

    Status set_field(std::optional<uint8_t>& field, std::size_t max_digits, bool bounded) {
        auto value = read_unsigned(max_digits, bounded);
        if (!value) {
            return unexpected(value.error());
        }
        field = static_cast<uint8_t>(*value);
        return {};
    }

    Status directive(char letter, bool decimal_point, std::size_t fraction_width, bool bounded) {
        if (letter != 'f' && (decimal_point || fraction_width != 0)) {
            return fail(ParseErrorCode::unknown_directive);
        }

        switch (letter) {
            case 'Y': {
                auto year = read_signed(bounded ? 4 : MAX_YEAR_DIGITS, bounded);
                if (!year) {
                    return unexpected(year.error());
                }
                raw_.year = *year;
                return {};
            }
            case 'C': {
                auto century = read_signed(2, bounded);
                if (!century) {
                    return unexpected(century.error());
                }
                century_ = *century;
                return {};
            }
            case 'y': {
                auto year = read_unsigned(2, bounded);
                if (!year) {
                    return unexpected(year.error());
                }
                year_of_century_ = *year;
                return {};
            }
            case 'm':
                return set_field(raw_.month, 2, bounded);
            case 'd':
            case 'e':
                return set_field(raw_.day, 2, bounded);
            case 'H':
                return set_field(raw_.hour, 2, bounded);
            case 'I':
                return set_field(raw_.hour12, 2, bounded);
            case 'M':
                return set_field(raw_.minute, 2, bounded);
            case 'S':
                return set_field(raw_.second, 2, bounded);
            case 'j': {
                auto day = read_unsigned(3, bounded);
                if (!day) {
                    return unexpected(day.error());
                }
                raw_.day_of_year = static_cast<uint16_t>(*day);
                return {};
            }
            case 'b':
            case 'h':
            case 'B': {
                auto month = match_full_or_abbreviated(month_names);
                if (!month) {
                    return fail(ParseErrorCode::unknown_name);
                }
                raw_.month = static_cast<uint8_t>(*month + 1);
                return {};
            }
            case 'a':
            case 'A':
                if (!match_full_or_abbreviated(weekday_names)) {
                    return fail(ParseErrorCode::unknown_name);
                }
                return {};
            case 'p':
            case 'P':
                if (starts_with_icase(text_.substr(pos_), "AM")) {
                    raw_.pm = false;
                } else if (starts_with_icase(text_.substr(pos_), "PM")) {
                    raw_.pm = true;
                } else {
                    return fail(ParseErrorCode::unknown_name);
                }
                pos_ += 2;
                return {};
            case 'f':
                return read_fraction(decimal_point, fraction_width);
            case 'z':
                return read_offset();
            case 's': {
                auto seconds = read_signed(19, bounded);
                if (!seconds) {
                    return unexpected(seconds.error());
                }
                raw_.epoch_seconds = *seconds;
                return {};
            }
            case 'F':
                return scan("%Y-%m-%d");
            case 'T':
                return scan("%H:%M:%S");
            case 'R':
                return scan("%H:%M");
            case 'D':
                return scan("%m/%d/%y");
            case 't':
            case 'n':
                skip_whitespace();
                return {};
            case '%':
                return literal('%');
            default:
                return fail(ParseErrorCode::unknown_directive);
        }
    }

    Status literal(char expected_char) {
        if (expected_char == ' ') {
            // One or more whitespace characters
            if (at_end()) {
                return fail(ParseErrorCode::unexpected_end);
            }
            if (!std::isspace(static_cast<unsigned char>(peek()))) {
                return fail(ParseErrorCode::literal_mismatch);
            }
            skip_whitespace();
            return {};
        }
        if (at_end()) {
            return fail(ParseErrorCode::unexpected_end);
        }
        if (peek() != expected_char) {
            return fail(ParseErrorCode::literal_mismatch);
        }
        ++pos_;
        return {};
    }

    Status scan(std::string_view pattern) {
        for (std::size_t i = 0; i < pattern.size(); ++i) {
            if (pattern[i] != '%') {
                if (auto status = literal(pattern[i]); !status) {
                    return status;
                }
                continue;
            }

            bool decimal_point = false;
            std::size_t fraction_width = 0;
            ++i;
            for (; i < pattern.size(); ++i) {
                const char c = pattern[i];
                if (c == '.') {
                    decimal_point = true;
                } else if (c == '3' || c == '6' || c == '9') {
                    fraction_width = static_cast<std::size_t>(c - '0');
                } else if (c != '-' && c != '0' && c != '_') {
                    break;
                }
            }
            if (i >= pattern.size()) {
                return fail(ParseErrorCode::unknown_directive);
            }
            // A directive directly after this one delimits the field by width
            const bool bounded = i + 1 < pattern.size() && pattern[i + 1] == '%';
            if (auto status = directive(pattern[i], decimal_point, fraction_width, bounded);
                !status) {
                return status;
            }
        }
        return {};
    }

    void resolve_year() noexcept {
        if (raw_.year || !year_of_century_) {
            if (!raw_.year && century_) {
                raw_.year = *century_ * 100;
            }
            return;
        }
        if (century_) {
            raw_.year = *century_ * 100 + *year_of_century_;
        } else {
            raw_.year = *year_of_century_ +
                        (*year_of_century_ >= TWO_DIGIT_YEAR_PIVOT ? 1900 : 2000);
        }
    }
};

} // namespace detail

/**
 * Match `text` against a single strptime-like pattern.
 *
 * Literal characters match exactly; a space matches one or more whitespace
 * characters. Numeric fields are read greedily up to their width. The whole
 * text must be consumed.
 *
 * | Letter    | Accepts                                   |
 * |-----------|-------------------------------------------|
 * | Y         | year, optional sign                       |
 * | C, y      | century, year of century (69-99 -> 19xx)  |
 * | m, d      | month, day (1-2 digits)                   |
 * | H, I      | hour 24h, hour 12h (1-2 digits)           |
 * | M, S      | minute, second (1-2 digits)               |
 * | j         | day of year (1-3 digits)                  |
 * | b, h, B   | English month name or abbreviation        |
 * | a, A      | English weekday name (ignored)            |
 * | p, P      | AM / PM, any case                         |
 * | f         | fraction; '.' needs a decimal point, 3/6/9 fix the width |
 * | z         | Z, ±HHMM, ±HH:MM                          |
 * | s         | signed epoch seconds                      |
 * | F, T, R, D| %Y-%m-%d, %H:%M:%S, %H:%M, %m/%d/%y        |
 * | t, n      | any whitespace                            |
 * | %         | literal '%'                               |
 */
inline ParseResult<RawDateTime> parse_components(std::string_view text,
                                                 std::string_view pattern) {
    return detail::PatternScanner(text, pattern).run();
}

/**
 * Validate raw components and build a Timestamp.
 *
 * - %s present: the epoch value is the instant (plus any fraction)
 * - otherwise year plus month/day (or day of year) are required
 * - time fields default to midnight; %I combines with %p
 * - a parsed offset is attached as a fixed zone; wall clock is preserved
 *
 * Errors carry position 0 and no pattern; parse() fills them in.
 */
inline ParseResult<Timestamp> assemble(const RawDateTime& raw) {
    const uint32_t nanos = raw.nanos.value_or(0);
    const TimeZone zone =
        raw.utc_offset ? TimeZone::fixed(*raw.utc_offset) : TimeZone::unspecified();

    if (raw.epoch_seconds) {
        return Timestamp(*raw.epoch_seconds, nanos, zone);
    }

    if (!raw.year) {
        return make_parse_error(ParseErrorCode::missing_date, 0);
    }
    const int64_t year = *raw.year;
    if (year < Calendar::MIN_YEAR || year > Calendar::MAX_YEAR) {
        return make_parse_error(ParseErrorCode::field_out_of_range, 0);
    }
    uint8_t month = 0;
    uint8_t day = 0;
    if (raw.month && raw.day) {
        month = *raw.month;
        day = *raw.day;
        if (!Calendar::is_valid_date(year, month, day)) {
            return make_parse_error(ParseErrorCode::invalid_date, 0);
        }
    } else if (raw.day_of_year) {
        const int days_in_year = Calendar::is_leap_year(year) ? 366 : 365;
        if (*raw.day_of_year < 1 || *raw.day_of_year > days_in_year) {
            return make_parse_error(ParseErrorCode::field_out_of_range, 0);
        }
        const CalendarDate date =
            Calendar::from_days(Calendar::days_from_civil(year, 1, 1) + *raw.day_of_year - 1);
        month = date.month;
        day = date.day;
    } else {
        return make_parse_error(ParseErrorCode::missing_date, 0);
    }

    uint8_t hour = raw.hour.value_or(0);
    if (!raw.hour && raw.hour12) {
        if (*raw.hour12 < 1 || *raw.hour12 > 12) {
            return make_parse_error(ParseErrorCode::field_out_of_range, 0);
        }
        hour = static_cast<uint8_t>(*raw.hour12 % 12 + (raw.pm.value_or(false) ? 12 : 0));
    }
    const uint8_t minute = raw.minute.value_or(0);
    const uint8_t second = raw.second.value_or(0);
    if (hour >= 24 || minute >= 60 || second >= 60) {
        return make_parse_error(ParseErrorCode::field_out_of_range, 0);
    }

    auto builder = Timestamp::ymd(year, month, day).hms(hour, minute, second).nanos(nanos);
    if (raw.utc_offset) {
        builder = builder.utc_offset(*raw.utc_offset);
    }
    return builder.build();
}

/// Parse `text` with one explicit pattern
inline ParseResult<Timestamp> parse(std::string_view text, std::string_view pattern) {
    return parse_components(text, pattern)
        .and_then([](const RawDateTime& raw) { return assemble(raw); })
        .map_error([&](ParseError error) {
            if (error.pattern.empty()) {
                error.position = text.size();
                error.pattern = std::string(pattern);
            }
            return error;
        });
}

/**
 * Parse `text` with the first pattern of `patterns` that matches it.
 *
 * Candidates are tried in order and the first one whose components parse
 * wins; a later candidate is never consulted, even if the winner then
 * fails assembly. When nothing matches the error is no_pattern_matched,
 * positioned at the furthest point any candidate reached.
 */
inline ParseResult<Timestamp> parse(std::string_view text,
                                    std::span<const std::string_view> patterns) {
    ParseError furthest{ParseErrorCode::no_pattern_matched};
    for (std::string_view pattern : patterns) {
        auto raw = parse_components(text, pattern);
        if (raw) {
            return parse(text, pattern);
        }
        if (raw.error().position >= furthest.position) {
            furthest.position = raw.error().position;
            furthest.pattern = std::string(pattern);
        }
    }
    return unexpected(furthest);
}

/// Candidate patterns for free-form parsing, in the order they are tried
inline constexpr std::array<std::string_view, 13> default_parse_patterns{
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%d %H:%M:%S%.6f",
    "%Y-%m-%d %H:%M:%S%.9f",
    "%Y-%m-%dT%H:%M:%S",
    "%Y-%m-%dT%H:%M:%S%.6f",
    "%Y-%m-%dT%H:%M:%S%.9f",
    "%Y-%m-%d %H:%M:%S%z",
    "%Y-%m-%dT%H:%M:%S%z",
    "%Y-%m-%d %H:%M:%S%.f%z",
    "%Y-%m-%dT%H:%M:%S%.f%z",
    "%Y-%m-%d %H:%M:%S%.f",
    "%Y-%m-%dT%H:%M:%S%.f",
    "%Y-%m-%d",
};

/// Free-form parse over default_parse_patterns
inline ParseResult<Timestamp> parse(std::string_view text) {
    return parse(text, std::span<const std::string_view>(default_parse_patterns));
}

} // namespace tempo
