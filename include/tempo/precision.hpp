#pragma once

#include <cstdint>

namespace tempo {

/**
 * Most compact lossless sub-second precision of a nanosecond residue.
 *
 * Derived from trailing zero digits, never stored:
 * - whole second              -> second
 * - multiple of 1'000'000 ns  -> millisecond
 * - multiple of 1'000 ns      -> microsecond
 * - otherwise                 -> nanosecond
 */
enum class Precision : uint8_t { second, millisecond, microsecond, nanosecond };

constexpr Precision precision_of(uint32_t nanos) noexcept {
    if (nanos == 0) {
        return Precision::second;
    }
    if (nanos % 1'000'000 == 0) {
        return Precision::millisecond;
    }
    if (nanos % 1'000 == 0) {
        return Precision::microsecond;
    }
    return Precision::nanosecond;
}

/// Number of fractional digits needed for a precision (0, 3, 6 or 9)
constexpr int fraction_digits(Precision p) noexcept {
    switch (p) {
        case Precision::second:
            return 0;
        case Precision::millisecond:
            return 3;
        case Precision::microsecond:
            return 6;
        case Precision::nanosecond:
            return 9;
    }
    return 9;
}

constexpr const char* precision_string(Precision p) noexcept {
    switch (p) {
        case Precision::second:
            return "second";
        case Precision::millisecond:
            return "millisecond";
        case Precision::microsecond:
            return "microsecond";
        case Precision::nanosecond:
            return "nanosecond";
    }
    return "unknown";
}

} // namespace tempo
