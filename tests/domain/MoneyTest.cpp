/**
 * @file MoneyTest.cpp
 * @brief Unit tests for Money
 */

#include <gtest/gtest.h>
#include "domain/Money.hpp"

using namespace penny::domain;

// ============================================================================
// PARSE / FORMAT
// ============================================================================

TEST(MoneyTest, Parse_Decimal_KeepsExactDigits) {
    EXPECT_EQ(Money::parse("12.345").toString(), "12.345");
    EXPECT_EQ(Money::parse("100").toString(), "100.00");
    EXPECT_EQ(Money::parse(".5").toString(), "0.50");
    EXPECT_EQ(Money::parse(" 42.10 ").toString(), "42.10");
}

TEST(MoneyTest, Parse_Negative_KeepsSign) {
    auto value = Money::parse("-0.50");

    EXPECT_TRUE(value.isNegative());
    EXPECT_EQ(value.units, 0);
    EXPECT_EQ(value.nano, -500000000);
    EXPECT_EQ(value.toString(), "-0.50");
}

TEST(MoneyTest, Parse_Garbage_Throws) {
    EXPECT_THROW(Money::parse("abc"), ValidationError);
    EXPECT_THROW(Money::parse(""), ValidationError);
    EXPECT_THROW(Money::parse("1.2.3"), ValidationError);
    EXPECT_THROW(Money::parse("-"), ValidationError);
}

TEST(MoneyTest, Parse_TooManyDecimals_Throws) {
    EXPECT_THROW(Money::parse("1.0000000001"), ValidationError);
    EXPECT_NO_THROW(Money::parse("1.000000001"));
}

TEST(MoneyTest, IsValid) {
    EXPECT_TRUE(Money::isValid("500"));
    EXPECT_TRUE(Money::isValid("-3.14"));
    EXPECT_FALSE(Money::isValid("five"));
}

// ============================================================================
// ARITHMETIC
// ============================================================================

TEST(MoneyTest, Add_CarriesIntoUnits_NoDrift) {
    auto result = Money::parse("999999.99") + Money::parse("0.01");

    EXPECT_EQ(result.toString(), "1000000.00");
    EXPECT_EQ(result.units, 1000000);
    EXPECT_EQ(result.nano, 0);
}

TEST(MoneyTest, Add_TenthTenTimes_IsExactlyOne) {
    Money sum;
    for (int i = 0; i < 10; ++i) {
        sum += Money::parse("0.1");
    }

    EXPECT_EQ(sum, Money::parse("1"));
    EXPECT_EQ(sum.toString(), "1.00");
}

TEST(MoneyTest, Add_MixedSigns_Normalizes) {
    auto result = Money::parse("5.30") + Money::parse("-2.70");

    EXPECT_EQ(result.toString(), "2.60");
    EXPECT_EQ(result.units, 2);
    EXPECT_EQ(result.nano, 600000000);
}

TEST(MoneyTest, Subtract_CrossesZero) {
    auto result = Money::parse("10.00") - Money::parse("10.01");

    EXPECT_EQ(result, Money::parse("-0.01"));
    EXPECT_EQ(result.toString(), "-0.01");
}

TEST(MoneyTest, Abs_And_Predicates) {
    EXPECT_EQ(Money::parse("-7.25").abs().toString(), "7.25");
    EXPECT_TRUE(Money().isZero());
    EXPECT_TRUE(Money::parse("0.01").isPositive());
    EXPECT_FALSE(Money::parse("0").isPositive());
}

TEST(MoneyTest, Comparison) {
    EXPECT_LT(Money::parse("-1.5"), Money::parse("0.1"));
    EXPECT_GT(Money::parse("600"), Money::parse("500"));
    EXPECT_LE(Money::parse("500.00"), Money::parse("500"));
    EXPECT_NE(Money::parse("0.10"), Money::parse("0.01"));
}
