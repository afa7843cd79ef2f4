#include <sstream>
#include <string>
#include <string_view>

#include <gtest/gtest.h>
#include <tempo.hpp>

using namespace tempo;

class DurationLiteralTest : public ::testing::Test {
protected:
    static constexpr uint32_t HALF_SECOND = 500'000'000;

    static Interval literal(std::string_view text) {
        auto result = parse_duration_literal(text);
        EXPECT_TRUE(result.has_value())
            << text << ": " << (result ? "" : result.error().message());
        return result.value_or(Interval{});
    }

    static LiteralError rejected(std::string_view text) {
        auto result = parse_duration_literal(text);
        EXPECT_FALSE(result.has_value()) << text;
        return result ? LiteralError{LiteralError::Code::empty, {}, 0} : result.error();
    }
};

// ==============================================================================
// Valid Literals
// ==============================================================================

TEST_F(DurationLiteralTest, Units) {
    EXPECT_EQ(literal("1d"), Interval(86'400, 0));
    EXPECT_EQ(literal("2h"), Interval(7'200, 0));
    EXPECT_EQ(literal("3m"), Interval(180, 0));
    EXPECT_EQ(literal("4s"), Interval(4, 0));
    EXPECT_EQ(literal("0s"), Interval::zero());
}

TEST_F(DurationLiteralTest, Combined) {
    EXPECT_EQ(literal("1d12h30m"), Interval(131'400, 0));
    EXPECT_EQ(literal("1h30m15s"), Interval(5'415, 0));
    EXPECT_EQ(literal("1d1s"), Interval(86'401, 0));
    EXPECT_EQ(literal("1h 30m"), Interval(5'400, 0));
    EXPECT_EQ(literal("  2m 0.25s  "), Interval(120, 250'000'000));
}

TEST_F(DurationLiteralTest, LargeValuesWithinAUnit) {
    // Only unit order is enforced; a unit may exceed the next larger one
    EXPECT_EQ(literal("90s"), Interval(90, 0));
    EXPECT_EQ(literal("48h"), Interval(172'800, 0));
}

TEST_F(DurationLiteralTest, FractionalSeconds) {
    auto i = literal("1.5s");
    EXPECT_EQ(i.seconds(), 1);
    EXPECT_EQ(i.nanoseconds(), HALF_SECOND);

    EXPECT_EQ(literal("0.5s"), Interval(0, HALF_SECOND));
    EXPECT_EQ(literal("1.000000001s"), Interval(1, 1));
    EXPECT_EQ(literal("1m2.25s"), Interval(62, 250'000'000));
}

TEST_F(DurationLiteralTest, NegativeLiterals) {
    auto i = literal("-1.5s");
    EXPECT_EQ(i.seconds(), -2);
    EXPECT_EQ(i.nanoseconds(), HALF_SECOND);

    EXPECT_EQ(literal("-0.5s"), Interval(-1, HALF_SECOND));
    EXPECT_EQ(literal("-1h"), Interval(-3'600, 0));
    EXPECT_EQ(literal("-1h30m"), Interval(-5'400, 0));
    EXPECT_EQ(literal("-2.5s").to_seconds(), -2.5);
    EXPECT_EQ(literal("-0s"), Interval::zero());
    EXPECT_EQ(literal("+2m"), Interval(120, 0));
}

// ==============================================================================
// Rejected Literals
// ==============================================================================

TEST_F(DurationLiteralTest, UnitsOutOfOrder) {
    auto error = rejected("1h2d");
    EXPECT_EQ(error.code, LiteralError::Code::unit_out_of_order);
    EXPECT_EQ(error.token, "d");
    EXPECT_EQ(error.position, 3U);
    EXPECT_NE(std::string(error.message()).find("place only larger units before"),
              std::string::npos);

    EXPECT_EQ(rejected("30s1m").code, LiteralError::Code::unit_out_of_order);
}

TEST_F(DurationLiteralTest, UnitRepeated) {
    auto error = rejected("1h2h");
    EXPECT_EQ(error.code, LiteralError::Code::unit_repeated);
    EXPECT_EQ(error.token, "2h");
    EXPECT_EQ(error.position, 2U);
}

TEST_F(DurationLiteralTest, FractionErrors) {
    EXPECT_EQ(rejected("1.5s2.5s").code, LiteralError::Code::fraction_repeated);
    EXPECT_EQ(rejected("1.5h").code, LiteralError::Code::fraction_not_seconds);
    EXPECT_EQ(rejected("1.1234567890s").code, LiteralError::Code::fraction_too_precise);
    EXPECT_EQ(rejected("1.s").code, LiteralError::Code::missing_digits);
}

TEST_F(DurationLiteralTest, MalformedTokens) {
    EXPECT_EQ(rejected("").code, LiteralError::Code::empty);
    EXPECT_EQ(rejected("   ").code, LiteralError::Code::empty);
    EXPECT_EQ(rejected("-").code, LiteralError::Code::missing_digits);
    EXPECT_EQ(rejected("h").code, LiteralError::Code::missing_digits);
    EXPECT_EQ(rejected("15").code, LiteralError::Code::missing_unit);
    EXPECT_EQ(rejected("1 s").code, LiteralError::Code::missing_unit);
    EXPECT_EQ(rejected("1s .").code, LiteralError::Code::missing_digits);

    auto error = rejected("1h5x");
    EXPECT_EQ(error.code, LiteralError::Code::unknown_unit);
    EXPECT_EQ(error.token, "5x");
    EXPECT_EQ(error.position, 2U);
}

TEST_F(DurationLiteralTest, Overflow) {
    EXPECT_EQ(rejected("99999999999999999999d").code, LiteralError::Code::overflow);
    EXPECT_EQ(rejected("200000000000000d").code, LiteralError::Code::overflow);
}

// ==============================================================================
// Canonical Rendering
// ==============================================================================

TEST_F(DurationLiteralTest, ToLiteral) {
    EXPECT_EQ(to_literal(Interval(131'400, 0)), "1d12h30m");
    EXPECT_EQ(to_literal(Interval(-2, HALF_SECOND)), "-1.5s");
    EXPECT_EQ(to_literal(Interval::zero()), "0s");
    EXPECT_EQ(to_literal(Interval(0, 1)), "0.000000001s");
    EXPECT_EQ(to_literal(Interval(3'601, 0)), "1h1s");
    EXPECT_EQ(to_literal(Interval(86'400, 0)), "1d");
    EXPECT_EQ(to_literal(Interval(62, 250'000'000)), "1m2.25s");
}

TEST_F(DurationLiteralTest, ToLiteralParsesBack) {
    const Interval intervals[] = {Interval::min(),     Interval::max(),   Interval(-1, 1),
                                  Interval(90'061, 7), Interval(-5'400, 0)};
    for (const auto& i : intervals) {
        auto text = to_literal(i);
        EXPECT_EQ(literal(text), i) << text;
    }
}

TEST_F(DurationLiteralTest, StreamOutput) {
    std::ostringstream os;
    os << Interval(5'400, 0);
    EXPECT_EQ(os.str(), "1h30m");
}
