#include <limits>

#include <gtest/gtest.h>
#include <tempo.hpp>

using namespace tempo;

class CalendarTest : public ::testing::Test {
protected:
    static constexpr int64_t DAY = 86'400;
    // 2012-04-21T00:00:00Z
    static constexpr int64_t APRIL_21_2012 = 1'334'966'400;
};

// ==============================================================================
// Leap Years and Month Lengths
// ==============================================================================

TEST_F(CalendarTest, LeapYears) {
    EXPECT_TRUE(Calendar::is_leap_year(2000));
    EXPECT_TRUE(Calendar::is_leap_year(2024));
    EXPECT_FALSE(Calendar::is_leap_year(1900));
    EXPECT_FALSE(Calendar::is_leap_year(2023));
    EXPECT_TRUE(Calendar::is_leap_year(-4));
}

TEST_F(CalendarTest, DaysInMonth) {
    EXPECT_EQ(Calendar::days_in_month(2024, 2), 29);
    EXPECT_EQ(Calendar::days_in_month(2023, 2), 28);
    EXPECT_EQ(Calendar::days_in_month(2023, 4), 30);
    EXPECT_EQ(Calendar::days_in_month(2023, 12), 31);
    EXPECT_EQ(Calendar::days_in_month(2023, 0), 0);
    EXPECT_EQ(Calendar::days_in_month(2023, 13), 0);
}

TEST_F(CalendarTest, ValidDates) {
    EXPECT_TRUE(Calendar::is_valid_date(2024, 2, 29));
    EXPECT_FALSE(Calendar::is_valid_date(2023, 2, 29));
    EXPECT_FALSE(Calendar::is_valid_date(2023, 4, 31));
    EXPECT_FALSE(Calendar::is_valid_date(2023, 1, 0));
    EXPECT_FALSE(Calendar::is_valid_date(2023, 13, 1));
}

// ==============================================================================
// Day Count Conversion
// ==============================================================================

TEST_F(CalendarTest, Epoch) {
    EXPECT_EQ(Calendar::days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(Calendar::to_day_count(1970, 1, 1), 0);

    auto date = Calendar::from_day_count(0);
    EXPECT_EQ(date.year, 1970);
    EXPECT_EQ(date.month, 1);
    EXPECT_EQ(date.day, 1);
    EXPECT_EQ(date.weekday, Weekday::thursday);
    EXPECT_EQ(date.day_of_year, 1);
}

TEST_F(CalendarTest, KnownDates) {
    EXPECT_EQ(Calendar::days_from_civil(2000, 3, 1), 11'017);
    EXPECT_EQ(Calendar::to_day_count(2012, 4, 21), APRIL_21_2012);

    auto date = Calendar::from_day_count(APRIL_21_2012 + 39'600);
    EXPECT_EQ(date.year, 2012);
    EXPECT_EQ(date.month, 4);
    EXPECT_EQ(date.day, 21);
    EXPECT_EQ(date.weekday, Weekday::saturday);
    EXPECT_EQ(date.day_of_year, 112);
}

TEST_F(CalendarTest, NegativeSecondsBelongToPreviousDay) {
    auto date = Calendar::from_day_count(-1);
    EXPECT_EQ(date.year, 1969);
    EXPECT_EQ(date.month, 12);
    EXPECT_EQ(date.day, 31);
    EXPECT_EQ(date.weekday, Weekday::wednesday);
    EXPECT_EQ(date.day_of_year, 365);
}

TEST_F(CalendarTest, LeapDay) {
    auto date = Calendar::from_day_count(Calendar::to_day_count(2024, 2, 29));
    EXPECT_EQ(date.month, 2);
    EXPECT_EQ(date.day, 29);
    EXPECT_EQ(date.day_of_year, 60);
    EXPECT_EQ(date.weekday, Weekday::thursday);
}

TEST_F(CalendarTest, RoundTripAcrossEras) {
    for (int64_t days = -800'000; days <= 800'000; days += 997) {
        auto date = Calendar::from_day_count(days * DAY);
        EXPECT_TRUE(Calendar::is_valid_date(date.year, date.month, date.day));
        EXPECT_EQ(Calendar::days_from_civil(date.year, date.month, date.day), days);
    }
}

TEST_F(CalendarTest, ProlepticNegativeYear) {
    auto seconds = Calendar::to_day_count(-44, 3, 15);
    auto date = Calendar::from_day_count(seconds);
    EXPECT_EQ(date.year, -44);
    EXPECT_EQ(date.month, 3);
    EXPECT_EQ(date.day, 15);
}

TEST_F(CalendarTest, FarFutureYearsDoNotWrap) {
    auto date = Calendar::from_day_count(100'000'000'000'000'000);
    EXPECT_EQ(date.year, 3'168'875'820);
    EXPECT_EQ(date.month, 9);
    EXPECT_EQ(date.day, 6);
    EXPECT_EQ(Calendar::to_day_count(date.year, date.month, date.day), 99'999'999'999'964'800);
}

TEST_F(CalendarTest, ExtremeDayCounts) {
    auto latest = Calendar::from_day_count(std::numeric_limits<int64_t>::max());
    EXPECT_EQ(latest.year, 292'277'026'596);
    EXPECT_EQ(latest.month, 12);
    EXPECT_EQ(latest.day, 4);

    auto earliest = Calendar::from_day_count(std::numeric_limits<int64_t>::min());
    EXPECT_EQ(earliest.year, -292'277'022'657);
    EXPECT_EQ(earliest.month, 1);
    EXPECT_EQ(earliest.day, 27);
    EXPECT_EQ(Calendar::days_from_civil(earliest.year, 1, 27), -106'751'991'167'301);
}

// ==============================================================================
// Name Tables
// ==============================================================================

TEST_F(CalendarTest, Names) {
    EXPECT_EQ(Calendar::month_name(4), "April");
    EXPECT_EQ(Calendar::month_abbreviation(7), "Jul");
    EXPECT_EQ(Calendar::month_name(13), "");
    EXPECT_EQ(Calendar::weekday_name(Weekday::saturday), "Saturday");
    EXPECT_EQ(Calendar::weekday_abbreviation(Weekday::wednesday), "Wed");
}
