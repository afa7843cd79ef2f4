#pragma once

#include <array>
#include <string_view>

#include <cstdint>

namespace tempo {

/// Day of the week, numbered from Sunday = 0
enum class Weekday : uint8_t { sunday, monday, tuesday, wednesday, thursday, friday, saturday };

/// Calendar fields of a single day
struct CalendarDate {
    int64_t year{1970};
    uint8_t month{1};
    uint8_t day{1};
    Weekday weekday{Weekday::thursday};
    uint16_t day_of_year{1};

    constexpr bool operator==(const CalendarDate&) const noexcept = default;
};

namespace detail {

inline constexpr std::array<std::string_view, 12> month_names{
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

inline constexpr std::array<std::string_view, 12> month_abbreviations{
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

inline constexpr std::array<std::string_view, 7> weekday_names{
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

inline constexpr int64_t SECONDS_PER_DAY = 86'400;

constexpr int64_t floor_div(int64_t a, int64_t b) noexcept {
    int64_t q = a / b;
    return (a % b != 0 && (a < 0) != (b < 0)) ? q - 1 : q;
}

constexpr int64_t floor_mod(int64_t a, int64_t b) noexcept {
    return a - floor_div(a, b) * b;
}

} // namespace detail

/**
 * Proleptic Gregorian calendar.
 *
 * Converts between civil dates and seconds since 1970-01-01 using the
 * days-from-civil / civil-from-days era algorithm (400-year eras of
 * 146097 days). All functions are pure.
 */
class Calendar {
public:
    /// Year range accepted by TimestampBuilder; covers every int64_t instant at any offset
    static constexpr int64_t MIN_YEAR = -999'999'999'999;
    static constexpr int64_t MAX_YEAR = 999'999'999'999;

    static constexpr bool is_leap_year(int64_t year) noexcept {
        return (year % 4 == 0) && (year % 100 != 0 || year % 400 == 0);
    }

    /// Days in the given month; 0 for a month outside [1, 12]
    static constexpr uint8_t days_in_month(int64_t year, uint8_t month) noexcept {
        constexpr uint8_t table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month < 1 || month > 12) {
            return 0;
        }
        if (month == 2 && is_leap_year(year)) {
            return 29;
        }
        return table[month - 1];
    }

    static constexpr bool is_valid_date(int64_t year, int month, int day) noexcept {
        return month >= 1 && month <= 12 && day >= 1 &&
               day <= days_in_month(year, static_cast<uint8_t>(month));
    }

    /// Days since 1970-01-01 for a civil date (no validation)
    static constexpr int64_t days_from_civil(int64_t year, uint8_t month, uint8_t day) noexcept {
        int64_t y = year - (month <= 2 ? 1 : 0);
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const auto yoe = static_cast<uint32_t>(y - era * 400);
        const uint32_t doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
        const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    /**
     * Seconds since the epoch at midnight of the given civil date.
     *
     * Only years whose midnight fits in int64_t seconds (about +/-2.9e11)
     * are representable; TimestampBuilder widens instead of calling this.
     */
    static constexpr int64_t to_day_count(int64_t year, uint8_t month, uint8_t day) noexcept {
        return days_from_civil(year, month, day) * detail::SECONDS_PER_DAY;
    }

    /**
     * Calendar fields of the day containing `seconds` since the epoch.
     *
     * Negative inputs resolve to the day that contains them, e.g. -1 is
     * 1969-12-31.
     */
    static constexpr CalendarDate from_day_count(int64_t seconds) noexcept {
        return from_days(detail::floor_div(seconds, detail::SECONDS_PER_DAY));
    }

    /// Calendar fields of the day `days` after 1970-01-01
    static constexpr CalendarDate from_days(int64_t days) noexcept {
        int64_t z = days + 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const auto doe = static_cast<uint32_t>(z - era * 146097);
        const uint32_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const uint32_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const uint32_t mp = (5 * doy + 2) / 153;
        const uint32_t d = doy - (153 * mp + 2) / 5 + 1;
        const uint32_t m = mp < 10 ? mp + 3 : mp - 9;

        CalendarDate date;
        date.year = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
        date.month = static_cast<uint8_t>(m);
        date.day = static_cast<uint8_t>(d);
        // 1970-01-01 was a Thursday
        date.weekday = static_cast<Weekday>(detail::floor_mod(days + 4, 7));
        date.day_of_year = static_cast<uint16_t>(days - days_from_civil(date.year, 1, 1) + 1);
        return date;
    }

    static constexpr std::string_view month_name(uint8_t month) noexcept {
        return month >= 1 && month <= 12 ? detail::month_names[month - 1] : std::string_view{};
    }

    static constexpr std::string_view month_abbreviation(uint8_t month) noexcept {
        return month >= 1 && month <= 12 ? detail::month_abbreviations[month - 1]
                                         : std::string_view{};
    }

    static constexpr std::string_view weekday_name(Weekday weekday) noexcept {
        return detail::weekday_names[static_cast<uint8_t>(weekday)];
    }

    /// First three letters of the weekday name
    static constexpr std::string_view weekday_abbreviation(Weekday weekday) noexcept {
        return weekday_name(weekday).substr(0, 3);
    }
};

} // namespace tempo
