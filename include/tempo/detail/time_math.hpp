// include/tempo/detail/time_math.hpp
#pragma once

#include <limits>
#include <utility>

#include <cstddef>

#include <cstdint>

namespace tempo::detail {

/**
 * Centralized time arithmetic for Interval and Timestamp.
 *
 * Both types store (int64_t seconds, uint32_t nanos) with nanos in [0, 10^9).
 * All carry/borrow and Euclidean decomposition lives here so the two types
 * cannot diverge.
 *
 * Arithmetic is performed in 128-bit integers and then clamped to the int64_t
 * seconds range. Overflow policy: saturate to the min/max sentinel (no
 * exceptions, no expected<>).
 */

using wide_int = __int128;

/// Nanoseconds per second (10^9)
inline constexpr uint32_t NANOS_PER_SEC = 1'000'000'000U;

/// Maximum valid nanoseconds value (one less than a full second)
inline constexpr uint32_t MAX_NANOS = NANOS_PER_SEC - 1;

/// Decimal digits of a full nanosecond fraction
inline constexpr std::size_t MAX_FRACTION_DIGITS = 9;

inline constexpr int64_t SECONDS_MAX = std::numeric_limits<int64_t>::max();
inline constexpr int64_t SECONDS_MIN = std::numeric_limits<int64_t>::min();

/// Time split into whole seconds and a non-negative nanosecond residue
using split_time = std::pair<int64_t, uint32_t>;

/**
 * Clamp wide seconds to int64_t range.
 *
 * On overflow/underflow, also sets nanos to the boundary value so that
 * min() and max() are well-defined sentinels.
 */
constexpr int64_t clamp_seconds(wide_int sec, uint32_t& nanos) noexcept {
    if (sec > static_cast<wide_int>(SECONDS_MAX)) {
        nanos = MAX_NANOS;
        return SECONDS_MAX;
    }
    if (sec < static_cast<wide_int>(SECONDS_MIN)) {
        nanos = 0;
        return SECONDS_MIN;
    }
    return static_cast<int64_t>(sec);
}

/// Saturate a wide count to the int64_t range
constexpr int64_t clamp_int64(wide_int value) noexcept {
    if (value > static_cast<wide_int>(SECONDS_MAX)) {
        return SECONDS_MAX;
    }
    if (value < static_cast<wide_int>(SECONDS_MIN)) {
        return SECONDS_MIN;
    }
    return static_cast<int64_t>(value);
}

/**
 * Floor division and Euclidean remainder of a total nanosecond count.
 *
 * -2.5s (-2'500'000'000 ns) decomposes to {-3, 500'000'000}.
 */
constexpr split_time split_nanos(wide_int total) noexcept {
    constexpr wide_int per_sec = NANOS_PER_SEC;
    wide_int sec = total / per_sec;
    wide_int rem = total % per_sec;
    if (rem < 0) {
        rem += per_sec;
        sec -= 1;
    }
    uint32_t nanos = static_cast<uint32_t>(rem);
    int64_t clamped = clamp_seconds(sec, nanos);
    return {clamped, nanos};
}

/// Total nanoseconds represented by (sec, nanos); never overflows 128 bits.
constexpr wide_int total_nanos(int64_t sec, uint32_t nanos) noexcept {
    return static_cast<wide_int>(sec) * NANOS_PER_SEC + nanos;
}

/**
 * Normalize (seconds, nanos) where nanos may be out of range in either
 * direction. Used by factories that accept unnormalized input.
 */
constexpr split_time normalize(int64_t sec, int64_t nanos) noexcept {
    return split_nanos(total_nanos(sec, 0) + nanos);
}

/**
 * Add two time values.
 *
 * Both residues are below 10^9, so their sum is below 2 * 10^9 and a single
 * carry restores the invariant.
 */
constexpr split_time add_time(int64_t sec_a, uint32_t nanos_a, int64_t sec_b,
                              uint32_t nanos_b) noexcept {
    wide_int sec = static_cast<wide_int>(sec_a) + sec_b;
    uint32_t nanos = nanos_a + nanos_b;
    if (nanos >= NANOS_PER_SEC) {
        nanos -= NANOS_PER_SEC;
        sec += 1;
    }
    int64_t clamped = clamp_seconds(sec, nanos);
    return {clamped, nanos};
}

/**
 * Subtract two time values: (sec_a, nanos_a) - (sec_b, nanos_b).
 *
 * If the residue would go negative, borrow one second first. A single borrow
 * suffices because both residues are in [0, 10^9).
 */
constexpr split_time sub_time(int64_t sec_a, uint32_t nanos_a, int64_t sec_b,
                              uint32_t nanos_b) noexcept {
    wide_int sec = static_cast<wide_int>(sec_a) - sec_b;
    uint32_t nanos;
    if (nanos_a >= nanos_b) {
        nanos = nanos_a - nanos_b;
    } else {
        sec -= 1;
        nanos = nanos_a + NANOS_PER_SEC - nanos_b;
    }
    int64_t clamped = clamp_seconds(sec, nanos);
    return {clamped, nanos};
}

/**
 * Multiply a time value by a scalar.
 *
 * Works on the total nanosecond count in 128 bits and decomposes the product
 * with floor semantics. Saturates if even the 128-bit product overflows.
 */
constexpr split_time mul_time(int64_t sec, uint32_t nanos, int64_t scalar) noexcept {
    if (scalar == 0) {
        return {0, 0};
    }
    wide_int product = 0;
    if (__builtin_mul_overflow(total_nanos(sec, nanos), static_cast<wide_int>(scalar),
                               &product)) {
        bool negative = (sec < 0) != (scalar < 0);
        return negative ? split_time{SECONDS_MIN, 0} : split_time{SECONDS_MAX, MAX_NANOS};
    }
    return split_nanos(product);
}

/**
 * Divide a time value by a scalar.
 *
 * The quotient of the total nanosecond count truncates toward zero (integer
 * division), then decomposes with floor semantics. Division by zero
 * saturates based on the sign of the numerator.
 */
constexpr split_time div_time(int64_t sec, uint32_t nanos, int64_t scalar) noexcept {
    if (scalar == 0) {
        if (sec > 0 || (sec == 0 && nanos > 0)) {
            return {SECONDS_MAX, MAX_NANOS};
        } else if (sec < 0) {
            return {SECONDS_MIN, 0};
        } else {
            return {0, 0};
        }
    }
    return split_nanos(total_nanos(sec, nanos) / static_cast<wide_int>(scalar));
}

/// Ratio of two time values as a double; sign follows the operands.
constexpr double ratio(int64_t sec_a, uint32_t nanos_a, int64_t sec_b, uint32_t nanos_b) noexcept {
    return static_cast<double>(total_nanos(sec_a, nanos_a)) /
           static_cast<double>(total_nanos(sec_b, nanos_b));
}

/// 10^exp for exp in [0, 9]
constexpr uint32_t pow10(int exp) noexcept {
    uint32_t value = 1;
    for (int i = 0; i < exp; ++i) {
        value *= 10;
    }
    return value;
}

} // namespace tempo::detail
