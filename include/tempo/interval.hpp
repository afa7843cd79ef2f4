#pragma once

#include "tempo/detail/time_math.hpp"
#include "tempo/precision.hpp"

#include <compare>
#include <functional>

#include <cstdint>

namespace tempo {

/**
 * Signed time interval with exact nanosecond precision.
 *
 * ## Storage
 * int64_t seconds + uint32_t nanoseconds.
 *
 * ## Negative Value Representation (Floor Semantics)
 * Negative intervals use floor representation with always-positive nanos:
 * - `-2.5 seconds` = `{seconds: -3, nanos: 500'000'000}`
 * - `-0.5 seconds` = `{seconds: -1, nanos: 500'000'000}`
 *
 * The residue is always added, never subtracted, when reconstructing the
 * total. Every constructor and operator preserves nanos() in [0, 10^9).
 *
 * ## Overflow Policy
 * Arithmetic is carried out in 128-bit integers and saturates to min()/max()
 * when the seconds field would overflow. Use `saturated(interval)` to detect.
 *
 * This is a core library type: noexcept, no allocation.
 */
class Interval {
public:
    static constexpr uint32_t NANOSECONDS_PER_SECOND = detail::NANOS_PER_SEC;
    static constexpr uint32_t NANOSECONDS_PER_MILLISECOND = 1'000'000U;
    static constexpr uint32_t NANOSECONDS_PER_MICROSECOND = 1'000U;

    /// Maximum valid nanoseconds value (one less than a full second)
    static constexpr uint32_t MAX_NANOSECONDS = detail::MAX_NANOS;

    // Named constants
    static constexpr Interval min() noexcept { return Interval(detail::SECONDS_MIN, 0); }

    static constexpr Interval max() noexcept {
        return Interval(detail::SECONDS_MAX, MAX_NANOSECONDS);
    }

    static constexpr Interval zero() noexcept { return Interval(); }

    // Default construction - zero interval
    constexpr Interval() noexcept = default;

    /// Construct from seconds and nanoseconds; excess nanos carry into seconds
    constexpr Interval(int64_t seconds, uint32_t nanos) noexcept {
        auto [sec, ns] = detail::normalize(seconds, static_cast<int64_t>(nanos));
        seconds_ = sec;
        nanos_ = ns;
    }

    // Direct factories - Euclidean decomposition, exact for negative values
    static constexpr Interval from_seconds(int64_t s) noexcept { return Interval(s, 0); }

    static constexpr Interval from_milliseconds(int64_t ms) noexcept {
        return from_split(detail::split_nanos(static_cast<detail::wide_int>(ms) *
                                              NANOSECONDS_PER_MILLISECOND));
    }

    static constexpr Interval from_microseconds(int64_t us) noexcept {
        return from_split(detail::split_nanos(static_cast<detail::wide_int>(us) *
                                              NANOSECONDS_PER_MICROSECOND));
    }

    static constexpr Interval from_nanoseconds(int64_t ns) noexcept {
        return from_split(detail::split_nanos(ns));
    }

    /// Factory from a widened nanosecond count (saturates beyond int64_t seconds)
    static constexpr Interval from_total_nanoseconds(detail::wide_int ns) noexcept {
        return from_split(detail::split_nanos(ns));
    }

    // Primary accessors - direct access to components
    constexpr int64_t seconds() const noexcept { return seconds_; }
    constexpr uint32_t nanoseconds() const noexcept { return nanos_; }

    // Widened conversions: seconds * 10^k + nanos / 10^(9-k), saturating at int64_t
    constexpr int64_t as_milliseconds() const noexcept {
        return detail::clamp_int64(static_cast<detail::wide_int>(seconds_) * 1'000 +
                                   nanos_ / NANOSECONDS_PER_MILLISECOND);
    }

    constexpr int64_t as_microseconds() const noexcept {
        return detail::clamp_int64(static_cast<detail::wide_int>(seconds_) * 1'000'000 +
                                   nanos_ / NANOSECONDS_PER_MICROSECOND);
    }

    constexpr detail::wide_int as_nanoseconds() const noexcept {
        return detail::total_nanos(seconds_, nanos_);
    }

    // Full precision conversion to double
    constexpr double to_seconds() const noexcept {
        return static_cast<double>(seconds_) +
               static_cast<double>(nanos_) / static_cast<double>(NANOSECONDS_PER_SECOND);
    }

    constexpr Precision precision() const noexcept { return precision_of(nanos_); }

    // Predicates
    constexpr bool is_zero() const noexcept { return seconds_ == 0 && nanos_ == 0; }
    constexpr bool is_negative() const noexcept { return seconds_ < 0; }
    constexpr bool is_positive() const noexcept {
        return seconds_ > 0 || (seconds_ == 0 && nanos_ > 0);
    }

    // Absolute value (saturates for min())
    constexpr Interval abs() const noexcept { return is_negative() ? -(*this) : *this; }

    // Unary negation (saturates for min())
    constexpr Interval operator-() const noexcept {
        if (*this == min()) {
            return max(); // Saturate: -MIN would overflow
        }
        // {sec, nanos} negates to {-sec - 1, 10^9 - nanos} when nanos > 0
        if (nanos_ == 0) {
            return Interval(-seconds_, 0);
        }
        return Interval(-(seconds_ + 1), NANOSECONDS_PER_SECOND - nanos_);
    }

    // Arithmetic operators (saturate on overflow)
    constexpr Interval& operator+=(Interval other) noexcept {
        assign(detail::add_time(seconds_, nanos_, other.seconds_, other.nanos_));
        return *this;
    }

    constexpr Interval& operator-=(Interval other) noexcept {
        assign(detail::sub_time(seconds_, nanos_, other.seconds_, other.nanos_));
        return *this;
    }

    constexpr Interval& operator*=(int64_t scalar) noexcept {
        assign(detail::mul_time(seconds_, nanos_, scalar));
        return *this;
    }

    constexpr Interval& operator/=(int64_t scalar) noexcept {
        assign(detail::div_time(seconds_, nanos_, scalar));
        return *this;
    }

    friend constexpr Interval operator+(Interval lhs, Interval rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    friend constexpr Interval operator-(Interval lhs, Interval rhs) noexcept {
        lhs -= rhs;
        return lhs;
    }

    friend constexpr Interval operator*(Interval i, int64_t scalar) noexcept {
        i *= scalar;
        return i;
    }

    friend constexpr Interval operator*(int64_t scalar, Interval i) noexcept {
        i *= scalar;
        return i;
    }

    friend constexpr Interval operator/(Interval i, int64_t scalar) noexcept {
        i /= scalar;
        return i;
    }

    // Division of intervals yields a ratio of total nanoseconds
    friend constexpr double operator/(Interval lhs, Interval rhs) noexcept {
        return detail::ratio(lhs.seconds_, lhs.nanos_, rhs.seconds_, rhs.nanos_);
    }

    // Comparison
    constexpr auto operator<=>(const Interval&) const noexcept = default;
    constexpr bool operator==(const Interval&) const noexcept = default;

private:
    int64_t seconds_{0};
    uint32_t nanos_{0}; // Always in [0, NANOSECONDS_PER_SECOND)

    static constexpr Interval from_split(detail::split_time parts) noexcept {
        Interval result;
        result.assign(parts);
        return result;
    }

    constexpr void assign(detail::split_time parts) noexcept {
        seconds_ = parts.first;
        nanos_ = parts.second;
    }
};

/**
 * Check if an Interval has saturated to min() or max().
 *
 * Note: This cannot distinguish between a legitimate max/min value and
 * overflow saturation.
 */
constexpr bool saturated(const Interval& i) noexcept {
    return i == Interval::max() || i == Interval::min();
}

} // namespace tempo

template <>
struct std::hash<tempo::Interval> {
    std::size_t operator()(const tempo::Interval& i) const noexcept {
        std::size_t h = std::hash<int64_t>{}(i.seconds());
        return h ^ (std::hash<uint32_t>{}(i.nanoseconds()) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};
