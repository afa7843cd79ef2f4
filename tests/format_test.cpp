#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <gtest/gtest.h>
#include <tempo.hpp>

using namespace tempo;

class FormatTest : public ::testing::Test {
protected:
    // 2012-04-21 11:00:00, a Saturday
    Timestamp date = Timestamp::ymd(2012, 4, 21).hms(11, 0, 0).build();

    static std::string render(const Timestamp& ts, std::string_view pattern) {
        auto text = format(ts, pattern);
        EXPECT_TRUE(text.has_value()) << "pattern: " << pattern;
        return text.value_or(std::string{});
    }

    static Timestamp at(uint8_t hour, uint8_t minute, uint32_t nanos = 0) {
        return Timestamp::ymd(2012, 4, 21).hms(hour, minute, 0).nanos(nanos).build();
    }
};

// ==============================================================================
// Directive Table
// ==============================================================================

TEST_F(FormatTest, DirectiveTable) {
    struct Case {
        std::string_view pattern;
        std::string_view expected;
    };
    const Case cases[] = {
        {"%Y-%m-%d", "2012-04-21"},
        {"%F", "2012-04-21"},
        {"%v", "21-Apr-2012"},
        {"%Y-%m-%d %H:%M:%S", "2012-04-21 11:00:00"},
        {"%Y-%m-%d %I:%M:%S %P", "2012-04-21 11:00:00 AM"},
        {"%H:%M:%S", "11:00:00"},
        {"%B %-d, %Y", "April 21, 2012"},
        {"%B %-d, %C%y", "April 21, 2012"},
        {"%A, %B %-d, %Y", "Saturday, April 21, 2012"},
        {"%d %h %Y", "21 Apr 2012"},
        {"%a %d %b %Y", "Sat 21 Apr 2012"},
        {"%m/%d/%y", "04/21/12"},
        {"%D", "04/21/12"},
        {"%R", "11:00"},
        {"%T", "11:00:00"},
        {"year: %Y / day: %j", "year: 2012 / day: 112"},
        {"%%", "%"},
        {"%w %u", "6 6"},
        {"%t %n", "\t \n"},
        {"%s", "1335006000"},
        {"no directives", "no directives"},
    };
    for (const auto& c : cases) {
        EXPECT_EQ(render(date, c.pattern), c.expected) << "pattern: " << c.pattern;
    }
}

TEST_F(FormatTest, Padding) {
    auto july = Timestamp::ymd(2024, 7, 4).hms(17, 30, 0).build();
    EXPECT_EQ(render(july, "%Y-%m-%d"), "2024-07-04");
    EXPECT_EQ(render(july, "%B %-d, %Y"), "July 4, 2024");
    EXPECT_EQ(render(july, "%-d-%h-%Y"), "4-Jul-2024");
    EXPECT_EQ(render(july, "%_d|%_m|%0d"), " 4| 7|04");
    EXPECT_EQ(render(july, "%-m/%-d"), "7/4");
    EXPECT_EQ(render(july, "%-j"), "186");
    EXPECT_EQ(render(july, "%a %u %w"), "Thu 4 4");
}

TEST_F(FormatTest, YearPadding) {
    EXPECT_EQ(render(Timestamp::ymd(5, 1, 1).build(), "%Y"), "0005");
    EXPECT_EQ(render(Timestamp::ymd(-44, 3, 15).build(), "%Y"), "-044");
    EXPECT_EQ(render(Timestamp::ymd(12345, 1, 1).build(), "%Y"), "12345");
}

TEST_F(FormatTest, SundayWeekdays) {
    auto sunday = Timestamp::ymd(2012, 4, 22).build();
    EXPECT_EQ(render(sunday, "%a %A %w %u"), "Sun Sunday 0 7");
}

// ==============================================================================
// 12-Hour Clock
// ==============================================================================

TEST_F(FormatTest, TwelveHourClock) {
    EXPECT_EQ(render(at(0, 30), "%I:%M %P"), "12:30 AM");
    EXPECT_EQ(render(at(11, 59), "%I:%M %P"), "11:59 AM");
    EXPECT_EQ(render(at(12, 0), "%I:%M %P"), "12:00 PM");
    EXPECT_EQ(render(at(13, 5), "%I:%M %p"), "01:05 pm");
    EXPECT_EQ(render(at(23, 0), "%-I%p"), "11pm");
}

// ==============================================================================
// Fractional Seconds
// ==============================================================================

TEST_F(FormatTest, Fractions) {
    auto ts = at(11, 0, 123'456'789);
    EXPECT_EQ(render(ts, "%f"), "123456789");
    EXPECT_EQ(render(ts, "%.f"), ".123456789");
    EXPECT_EQ(render(ts, "%.3f"), ".123");
    EXPECT_EQ(render(ts, "%6f"), "123456");
    EXPECT_EQ(render(ts, "%.9f"), ".123456789");
}

TEST_F(FormatTest, FractionsKeepLeadingZeros) {
    EXPECT_EQ(render(at(11, 0, 500'000'000), "%.3f"), ".500");
    EXPECT_EQ(render(at(11, 0, 5'000'000), "%.3f"), ".005");
    EXPECT_EQ(render(at(11, 0, 1), "%.9f"), ".000000001");
    EXPECT_EQ(render(at(11, 0), "%.6f"), ".000000");
}

// ==============================================================================
// Offsets and Zones
// ==============================================================================

TEST_F(FormatTest, Offsets) {
    auto eastern = Timestamp::ymd(2012, 4, 21).hms(11, 0, 0).utc_offset(-14'400).build();
    EXPECT_EQ(render(eastern, "%H:%M%z"), "11:00-0400");

    auto india = Timestamp::ymd(2012, 4, 21).hms(11, 0, 0).utc_offset(19'800).build();
    EXPECT_EQ(render(india, "%z"), "+0530");

    EXPECT_EQ(render(date, "%z"), "+0000");
}

TEST_F(FormatTest, ZoneLookupFailureIsReported) {
    auto rules = std::make_shared<const ZoneRules>(
        ZoneRules("Late/Zone", {{2'000'000'000, 3'600}}));
    Timestamp ts(0, 0, TimeZone::named(rules));

    auto result = format(ts, "at %H");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FormatError::Code::timezone_lookup);
    EXPECT_EQ(result.error().position, 3U);
    ASSERT_TRUE(result.error().timezone.has_value());
    EXPECT_EQ(result.error().timezone->code, TimeZoneError::Code::out_of_range);

    // Epoch seconds need no wall clock
    EXPECT_EQ(render(ts, "%s.%3f"), "0.000");
}

// ==============================================================================
// Errors
// ==============================================================================

TEST_F(FormatTest, UnknownDirective) {
    auto result = format(date, "%Y %Q");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FormatError::Code::unknown_directive);
    EXPECT_EQ(result.error().position, 3U);
    EXPECT_EQ(result.error().directive, 'Q');
}

TEST_F(FormatTest, FractionModifierOnlyOnFraction) {
    for (std::string_view pattern : {"abc %.3Y", "abc %.S", "abc %6d", "abc %9H"}) {
        auto result = format(date, pattern);
        ASSERT_FALSE(result.has_value()) << pattern;
        EXPECT_EQ(result.error().code, FormatError::Code::invalid_modifier) << pattern;
        EXPECT_EQ(result.error().position, 4U) << pattern;
    }
}

TEST_F(FormatTest, DanglingEscape) {
    for (std::string_view pattern : {"abc%", "abc%-", "abc%.3"}) {
        auto result = format(date, pattern);
        ASSERT_FALSE(result.has_value()) << pattern;
        EXPECT_EQ(result.error().code, FormatError::Code::dangling_escape) << pattern;
        EXPECT_EQ(result.error().position, 3U) << pattern;
    }
}

// ==============================================================================
// Output Sinks
// ==============================================================================

TEST_F(FormatTest, FormatToRawBuffer) {
    char buffer[32] = {};
    auto end = format_to(buffer, date, "%F");
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(std::string_view(buffer, static_cast<std::size_t>(*end - buffer)), "2012-04-21");
}

TEST_F(FormatTest, FormatToAppends) {
    std::string out = "date=";
    auto end = format_to(std::back_inserter(out), date, "%F");
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(out, "date=2012-04-21");
}

// ==============================================================================
// Default Serialization
// ==============================================================================

TEST_F(FormatTest, DefaultSerializationPicksPrecision) {
    EXPECT_EQ(to_string(at(11, 0)).value(), "2012-04-21T11:00:00");
    EXPECT_EQ(to_string(at(11, 0, 500'000'000)).value(), "2012-04-21T11:00:00.500000");
    EXPECT_EQ(to_string(at(11, 0, 123'456'000)).value(), "2012-04-21T11:00:00.123456");
    EXPECT_EQ(to_string(at(11, 0, 123'456'789)).value(), "2012-04-21T11:00:00.123456789");
}

TEST_F(FormatTest, DefaultSerializationAppendsOffset) {
    auto eastern = Timestamp::ymd(2012, 4, 21).hms(11, 0, 0).utc_offset(-14'400).build();
    EXPECT_EQ(to_string(eastern).value(), "2012-04-21T11:00:00-0400");
    EXPECT_EQ(to_string(date.with_timezone(TimeZone::utc())).value(),
              "2012-04-21T11:00:00+0000");
}

TEST_F(FormatTest, StreamOutput) {
    std::ostringstream os;
    os << at(11, 0, 250'000'000);
    EXPECT_EQ(os.str(), "2012-04-21T11:00:00.250000");
}

TEST_F(FormatTest, StreamOutputShowsZoneError) {
    auto rules = std::make_shared<const ZoneRules>(
        ZoneRules("Late/Zone", {{2'000'000'000, 3'600}}));
    std::ostringstream os;
    os << Timestamp(0, 0, TimeZone::named(rules));
    EXPECT_EQ(os.str(), "1970-01-01T00:00:00 [instant outside the timezone's offset table]");
}
