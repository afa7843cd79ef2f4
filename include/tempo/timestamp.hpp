#pragma once

#include "tempo/calendar.hpp"
#include "tempo/detail/time_math.hpp"
#include "tempo/expected.hpp"
#include "tempo/interval.hpp"
#include "tempo/precision.hpp"
#include "tempo/timezone.hpp"

#include <chrono>
#include <compare>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

#include <cstdint>

namespace tempo {

class TimestampBuilder;

/**
 * Wall-clock view of a Timestamp in its attached zone.
 *
 * Produced by Timestamp::civil() / Timestamp::utc(); never stored.
 */
struct CivilDateTime {
    int64_t year{1970};
    uint8_t month{1};
    uint8_t day{1};
    uint8_t hour{0};
    uint8_t minute{0};
    uint8_t second{0};
    uint32_t nanosecond{0};
    Weekday weekday{Weekday::thursday};
    uint16_t day_of_year{1};
    int32_t utc_offset{0}; ///< Seconds east of UTC used to derive the fields

    constexpr bool operator==(const CivilDateTime&) const noexcept = default;
};

namespace detail {

/// Civil fields of (seconds, nanos) seen at `offset` seconds east of UTC
constexpr CivilDateTime civil_at(int64_t seconds, uint32_t nanos, int32_t offset) noexcept {
    // Split before applying the offset so extreme instants cannot overflow
    int64_t days = floor_div(seconds, SECONDS_PER_DAY);
    int64_t of_day = floor_mod(seconds, SECONDS_PER_DAY) + offset;
    days += floor_div(of_day, SECONDS_PER_DAY);
    of_day = floor_mod(of_day, SECONDS_PER_DAY);
    const CalendarDate date = Calendar::from_days(days);

    CivilDateTime civil;
    civil.year = date.year;
    civil.month = date.month;
    civil.day = date.day;
    civil.hour = static_cast<uint8_t>(of_day / 3'600);
    civil.minute = static_cast<uint8_t>(of_day % 3'600 / 60);
    civil.second = static_cast<uint8_t>(of_day % 60);
    civil.nanosecond = nanos;
    civil.weekday = date.weekday;
    civil.day_of_year = date.day_of_year;
    civil.utc_offset = offset;
    return civil;
}

} // namespace detail

/**
 * Absolute instant with exact nanosecond precision.
 *
 * ## Storage
 * int64_t seconds since 1970-01-01T00:00:00Z + uint32_t nanoseconds in
 * [0, 10^9), plus a TimeZone tag.
 *
 * ## Timezone Tag
 * The tag never changes the instant. It selects which wall-clock fields
 * civil() and the formatter report. Equality, ordering and hashing use
 * (seconds, nanos) only: the same instant in two zones compares equal.
 *
 * ## Overflow Policy
 * Arithmetic with Interval saturates to the int64_t seconds range, like
 * Interval itself.
 *
 * ## Construction
 * - Timestamp(seconds, nanos): epoch offset, excess nanos carry into seconds
 * - Timestamp::ymd(y, m, d).hms(h, mi, s).nanos(n).build(): staged builder,
 *   each stage throws std::invalid_argument on out-of-range input
 */
class Timestamp {
public:
    static constexpr uint32_t NANOSECONDS_PER_SECOND = detail::NANOS_PER_SEC;
    static constexpr uint32_t MAX_NANOSECONDS = detail::MAX_NANOS;

    Timestamp() noexcept = default;

    Timestamp(int64_t seconds, uint32_t nanos, TimeZone tz = {}) noexcept : tz_(std::move(tz)) {
        auto [sec, ns] = detail::normalize(seconds, static_cast<int64_t>(nanos));
        seconds_ = sec;
        nanos_ = ns;
    }

    /// Instant from a Unix epoch offset
    static Timestamp from_epoch(int64_t seconds, uint32_t nanos = 0) noexcept {
        return Timestamp(seconds, nanos);
    }

    /// Start a staged build from a calendar date (defined after TimestampBuilder)
    static TimestampBuilder ymd(int64_t year, uint8_t month, uint8_t day);

    static Timestamp now() noexcept { return from_chrono(std::chrono::system_clock::now()); }

    static Timestamp from_chrono(std::chrono::system_clock::time_point tp) noexcept {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
        auto [sec, nanos] = detail::split_nanos(ns.count());
        return Timestamp(sec, nanos);
    }

    std::chrono::system_clock::time_point to_chrono() const noexcept {
        auto since_epoch = std::chrono::seconds(seconds_) + std::chrono::nanoseconds(nanos_);
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
    }

    // Accessors
    int64_t seconds() const noexcept { return seconds_; }
    uint32_t nanos() const noexcept { return nanos_; }
    const TimeZone& timezone() const noexcept { return tz_; }
    Precision precision() const noexcept { return precision_of(nanos_); }

    /// Same instant, different zone tag
    Timestamp with_timezone(TimeZone tz) const noexcept {
        Timestamp result = *this;
        result.tz_ = std::move(tz);
        return result;
    }

    /// Offset east of UTC of the attached zone at this instant
    expected<int32_t, TimeZoneError> utc_offset() const { return tz_.offset_seconds(seconds_); }

    /// Civil fields at UTC, ignoring the zone tag
    CivilDateTime utc() const noexcept { return detail::civil_at(seconds_, nanos_, 0); }

    /// Civil fields in the attached zone
    expected<CivilDateTime, TimeZoneError> civil() const {
        return utc_offset().map(
            [this](int32_t offset) { return detail::civil_at(seconds_, nanos_, offset); });
    }

    // Arithmetic with Interval (saturates on overflow); zone tag is kept
    Timestamp& operator+=(Interval i) noexcept {
        assign(detail::add_time(seconds_, nanos_, i.seconds(), i.nanoseconds()));
        return *this;
    }

    Timestamp& operator-=(Interval i) noexcept {
        assign(detail::sub_time(seconds_, nanos_, i.seconds(), i.nanoseconds()));
        return *this;
    }

    friend Timestamp operator+(Timestamp ts, Interval i) noexcept {
        ts += i;
        return ts;
    }

    friend Timestamp operator-(Timestamp ts, Interval i) noexcept {
        ts -= i;
        return ts;
    }

    // Timestamp difference returns a signed Interval
    friend Interval operator-(const Timestamp& lhs, const Timestamp& rhs) noexcept {
        auto [sec, nanos] = detail::sub_time(lhs.seconds_, lhs.nanos_, rhs.seconds_, rhs.nanos_);
        return Interval(sec, nanos);
    }

    // Comparison on the instant only
    bool operator==(const Timestamp& other) const noexcept {
        return seconds_ == other.seconds_ && nanos_ == other.nanos_;
    }

    std::strong_ordering operator<=>(const Timestamp& other) const noexcept {
        if (seconds_ != other.seconds_) {
            return seconds_ <=> other.seconds_;
        }
        return nanos_ <=> other.nanos_;
    }

private:
    int64_t seconds_{0};
    uint32_t nanos_{0}; // Always in [0, NANOSECONDS_PER_SECOND)
    TimeZone tz_{};

    void assign(detail::split_time parts) noexcept {
        seconds_ = parts.first;
        nanos_ = parts.second;
    }
};

/**
 * Staged builder for Timestamp.
 *
 * Each stage validates its own input and fails fast, so the error names the
 * stage that received bad data:
 * - constructor (via Timestamp::ymd): invalid calendar date, or a year
 *   outside [Calendar::MIN_YEAR, Calendar::MAX_YEAR]
 * - hms(): hour >= 24, minute >= 60, second >= 60
 * - nanos(): nanos >= 10^9
 * - utc_offset(): |offset| >= 24h
 * These are programmer errors and throw std::invalid_argument.
 *
 * tz() resolves a zone's offset for the wall-clock time and reports lookup
 * failures through expected<>.
 *
 * Wall-clock fields are preserved; the zone offset shifts the absolute
 * instant: build() returns day_count + time_of_day - offset, saturating at
 * the Timestamp range like the arithmetic operators.
 *
 * Example:
 * @code
 *   auto ts = Timestamp::ymd(2012, 4, 21).hms(11, 0, 0).nanos(500'000'000).build();
 * @endcode
 */
class [[nodiscard]] TimestampBuilder {
public:
    TimestampBuilder(int64_t year, uint8_t month, uint8_t day)
        : year_(year),
          month_(month),
          day_(day) {
        if (year < Calendar::MIN_YEAR || year > Calendar::MAX_YEAR) {
            throw std::invalid_argument("year out of bounds: " + std::to_string(year));
        }
        if (month < 1 || month > 12) {
            throw std::invalid_argument("month out of bounds: " + std::to_string(month));
        }
        if (!Calendar::is_valid_date(year, month, day)) {
            throw std::invalid_argument("day out of bounds: " + std::to_string(day));
        }
    }

    TimestampBuilder hms(uint8_t hour, uint8_t minute, uint8_t second) const {
        if (hour >= 24) {
            throw std::invalid_argument("hour out of bounds: " + std::to_string(hour));
        }
        if (minute >= 60) {
            throw std::invalid_argument("minute out of bounds: " + std::to_string(minute));
        }
        if (second >= 60) {
            throw std::invalid_argument("second out of bounds: " + std::to_string(second));
        }
        TimestampBuilder next = *this;
        next.time_of_day_ = int64_t{hour} * 3'600 + int64_t{minute} * 60 + second;
        return next;
    }

    TimestampBuilder nanos(uint32_t nanos) const {
        if (nanos >= detail::NANOS_PER_SEC) {
            throw std::invalid_argument("nanos out of bounds: " + std::to_string(nanos));
        }
        TimestampBuilder next = *this;
        next.nanos_ = nanos;
        return next;
    }

    /// Attach a fixed offset (seconds east of UTC)
    TimestampBuilder utc_offset(int32_t offset_seconds) const {
        TimestampBuilder next = *this;
        next.tz_ = TimeZone::fixed(offset_seconds);
        next.offset_ = offset_seconds;
        return next;
    }

    /**
     * Attach a zone, resolving its offset for the wall-clock time.
     *
     * The offset is first looked up at the wall-clock time read as UTC, then
     * confirmed at the instant that offset produces; the confirmed offset
     * wins when the two disagree near a transition.
     */
    expected<TimestampBuilder, TimeZoneError> tz(TimeZone zone) const {
        const detail::wide_int wall = local_seconds();
        uint32_t lookup_nanos = 0;
        auto guess = zone.offset_seconds(detail::clamp_seconds(wall, lookup_nanos));
        if (!guess) {
            return unexpected(guess.error());
        }
        auto confirmed = zone.offset_seconds(detail::clamp_seconds(wall - *guess, lookup_nanos));
        if (!confirmed) {
            return unexpected(confirmed.error());
        }
        TimestampBuilder next = *this;
        next.offset_ = *confirmed;
        next.tz_ = std::move(zone);
        return next;
    }

    Timestamp build() const {
        uint32_t nanos = nanos_;
        const int64_t seconds = detail::clamp_seconds(local_seconds() - offset_, nanos);
        return Timestamp(seconds, nanos, tz_);
    }

private:
    int64_t year_;
    uint8_t month_;
    uint8_t day_;
    int64_t time_of_day_{0};
    uint32_t nanos_{0};
    int32_t offset_{0};
    TimeZone tz_{};

    detail::wide_int local_seconds() const noexcept {
        return static_cast<detail::wide_int>(Calendar::days_from_civil(year_, month_, day_)) *
                   detail::SECONDS_PER_DAY +
               time_of_day_;
    }
};

inline TimestampBuilder Timestamp::ymd(int64_t year, uint8_t month, uint8_t day) {
    return TimestampBuilder(year, month, day);
}

} // namespace tempo

template <>
struct std::hash<tempo::Timestamp> {
    std::size_t operator()(const tempo::Timestamp& ts) const noexcept {
        std::size_t h = std::hash<int64_t>{}(ts.seconds());
        return h ^ (std::hash<uint32_t>{}(ts.nanos()) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};
