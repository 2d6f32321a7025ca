/// @file tests/money/test_decimal.cpp
/// @brief Unit tests for the exact Decimal type.
///
/// Test categories:
///   - Literal parsing (accepted and rejected forms)
///   - Canonical form: trailing zeros, negative zero
///   - Ordering across different scales
///   - Half-away-from-zero rounding
///   - Grouped rendering

#include <gtest/gtest.h>
#include "pricenorm/decimal.hpp"

#include <string>

using pricenorm::money::Decimal;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Decimal dec(const std::string& s) {
    auto d = Decimal::from_string(s);
    EXPECT_TRUE(d.has_value()) << "bad literal in test: " << s;
    return d.value_or(Decimal{});
}

// ─── from_string ─────────────────────────────────────────────────────────────

TEST(Decimal_FromString, AcceptsPlainForms) {
    EXPECT_EQ(dec("1234.56").to_string(), "1234.56");
    EXPECT_EQ(dec("-7").to_string(), "-7");
    EXPECT_EQ(dec("+7").to_string(), "7");
    EXPECT_EQ(dec(".5").to_string(), "0.5");
    EXPECT_EQ(dec("5.").to_string(), "5");
    EXPECT_EQ(dec("007.10").to_string(), "7.1");
}

TEST(Decimal_FromString, RejectsMalformed) {
    EXPECT_FALSE(Decimal::from_string("").has_value());
    EXPECT_FALSE(Decimal::from_string("-").has_value());
    EXPECT_FALSE(Decimal::from_string(".").has_value());
    EXPECT_FALSE(Decimal::from_string("1.2.3").has_value());
    EXPECT_FALSE(Decimal::from_string("1,000").has_value());
    EXPECT_FALSE(Decimal::from_string(" 1").has_value());
    EXPECT_FALSE(Decimal::from_string("1e5").has_value());
    EXPECT_FALSE(Decimal::from_string("--1").has_value());
}

TEST(Decimal_FromString, BeyondSixtyFourBits) {
    const auto big = dec("123456789012345678901234567890.12");
    EXPECT_EQ(big.to_string(), "123456789012345678901234567890.12");
    EXPECT_EQ(big.scale(), 2u);
}

// ─── Canonical form ──────────────────────────────────────────────────────────

TEST(Decimal_Canonical, TrailingZerosDoNotAffectEquality) {
    EXPECT_EQ(dec("1.50"), dec("1.5"));
    EXPECT_EQ(dec("100.000"), Decimal(100));
    EXPECT_EQ(dec("1.50").scale(), 1u);
}

TEST(Decimal_Canonical, NegativeZeroIsZero) {
    const auto z = dec("-0.00");
    EXPECT_TRUE(z.is_zero());
    EXPECT_FALSE(z.is_negative());
    EXPECT_EQ(z, Decimal{});
    EXPECT_EQ(z.to_string(), "0");
}

// ─── Ordering ────────────────────────────────────────────────────────────────

TEST(Decimal_Ordering, ComparesAcrossScales) {
    EXPECT_LT(dec("1.234"), Decimal(1234));
    EXPECT_LT(dec("9.99"), Decimal(10));
    EXPECT_GT(dec("10.001"), Decimal(10));
    EXPECT_LT(dec("-2.5"), dec("-2.49"));
    EXPECT_EQ(dec("2.50") <=> dec("2.5"), std::strong_ordering::equal);
}

TEST(Decimal_Ordering, NegatedFlipsSign) {
    EXPECT_EQ(dec("12.5").negated(), dec("-12.5"));
    EXPECT_EQ(Decimal{}.negated(), Decimal{});
}

// ─── Rounding ────────────────────────────────────────────────────────────────

TEST(Decimal_Rounding, HalfAwayFromZero) {
    EXPECT_EQ(dec("2.345").rounded(2), dec("2.35"));
    EXPECT_EQ(dec("2.344").rounded(2), dec("2.34"));
    EXPECT_EQ(dec("-2.345").rounded(2), dec("-2.35"));
    EXPECT_EQ(dec("0.5").rounded(0), Decimal(1));
    EXPECT_EQ(dec("-0.5").rounded(0), Decimal(-1));
}

TEST(Decimal_Rounding, NoOpWhenAlreadyShort) {
    EXPECT_EQ(dec("2.3").rounded(2), dec("2.3"));
    EXPECT_EQ(Decimal(42).rounded(2), Decimal(42));
}

TEST(Decimal_Rounding, TinyNegativeRoundsToUnsignedZero) {
    const auto r = dec("-0.001").rounded(2);
    EXPECT_TRUE(r.is_zero());
    EXPECT_FALSE(r.is_negative());
}

// ─── Grouped rendering ───────────────────────────────────────────────────────

TEST(Decimal_Grouped, ThousandsAndTwoDecimals) {
    EXPECT_EQ(dec("1234.56").to_grouped_string(2), "1,234.56");
    EXPECT_EQ(dec("1234567.5").to_grouped_string(2), "1,234,567.50");
    EXPECT_EQ(Decimal(100).to_grouped_string(2), "100.00");
    EXPECT_EQ(Decimal{}.to_grouped_string(2), "0.00");
    EXPECT_EQ(dec("0.005").to_grouped_string(2), "0.01");
    EXPECT_EQ(dec("999.995").to_grouped_string(2), "1,000.00");
}

TEST(Decimal_Grouped, NegativeValues) {
    EXPECT_EQ(dec("-1234.5").to_grouped_string(2), "-1,234.50");
    EXPECT_EQ(dec("-0.001").to_grouped_string(2), "0.00");
}

TEST(Decimal_Grouped, CustomSeparatorsAndZeroPlaces) {
    EXPECT_EQ(dec("1234567.891").to_grouped_string(2, '.', ','), "1.234.567,89");
    EXPECT_EQ(dec("1234.5").to_grouped_string(0), "1,235");
}
