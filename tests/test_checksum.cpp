/**
 * @file test_checksum.cpp
 * @brief Unit tests for the Luhn and weighted sum checksums
 */

#include <gtest/gtest.h>
#include <checksum/checksum.hpp>

#include <string>

using namespace taxid::checksum;

namespace {

const weighted_sum_spec tin_spec{{6, 7, 8, 9, 4, 5, 6, 7, 8, 9}, 11};

} // namespace

TEST(LuhnTest, KnownValidNumbers) {
    EXPECT_TRUE(luhn_validate("79927398713"));
    // Random mastercard and visa
    EXPECT_TRUE(luhn_validate("5425233430109903"));
    EXPECT_TRUE(luhn_validate("4000000000001000"));
    // Random IMEI
    EXPECT_TRUE(luhn_validate("350009218041876"));
    EXPECT_TRUE(luhn_validate("1234566"));
    EXPECT_TRUE(luhn_validate("0000000"));
}

TEST(LuhnTest, KnownInvalidNumbers) {
    EXPECT_FALSE(luhn_validate("5427625793410839"));
    EXPECT_FALSE(luhn_validate("1213981928372"));
    EXPECT_FALSE(luhn_validate("1234567"));
    EXPECT_FALSE(luhn_validate("1"));
}

TEST(LuhnTest, PayloadWithoutCheckDigit) {
    // "7992739871" is the payload of "79927398713", its own Luhn sum is 6
    EXPECT_EQ(luhn_checksum("7992739871"), 6u);
    EXPECT_FALSE(luhn_validate("7992739871"));
    EXPECT_EQ(luhn_calc_check_digit("7992739871"), '3');
}

TEST(LuhnTest, RejectsNonDigitsAndEmpty) {
    EXPECT_FALSE(luhn_checksum("").has_value());
    EXPECT_FALSE(luhn_checksum("1234 566").has_value());
    EXPECT_FALSE(luhn_validate(""));
    EXPECT_FALSE(luhn_validate("12a4566"));
    EXPECT_FALSE(luhn_calc_check_digit("12a").has_value());
}

TEST(LuhnTest, DetectsEverySingleDigitError) {
    const std::string number{"79927398713"};

    for (size_t position = 0; position < number.size(); ++position) {
        for (char digit = '0'; digit <= '9'; ++digit) {
            if (digit == number[position]) {
                continue;
            }

            std::string mutated{number};
            mutated[position] = digit;

            EXPECT_FALSE(luhn_validate(mutated)) << mutated;
        }
    }
}

TEST(LuhnTest, CalculatedCheckDigitValidates) {
    for (std::string payload : {"0", "123456", "542523343010990", "35000921804187"}) {
        auto check_digit = luhn_calc_check_digit(payload);

        ASSERT_TRUE(check_digit.has_value()) << payload;
        EXPECT_TRUE(luhn_validate(payload + *check_digit)) << payload;
    }

    EXPECT_EQ(luhn_calc_check_digit("123456"), '6');
}

TEST(WeightedSumTest, GoldenValue) {
    // 0*6 + 1*7 + 2*8 + 3*9 + 4*4 + 5*5 + 6*6 + 7*7 + 8*8 + 9*9 = 321 = 29 * 11 + 2
    EXPECT_EQ(weighted_sum("0123456789", tin_spec), 2u);
}

TEST(WeightedSumTest, RemainderCanNeedTwoDigits) {
    EXPECT_EQ(weighted_sum("9000000000", tin_spec), 10u);
    EXPECT_EQ(weighted_sum("0000000000", tin_spec), 0u);
}

TEST(WeightedSumTest, PositionMatters) {
    EXPECT_EQ(weighted_sum("1000000000", tin_spec), 6u);
    EXPECT_EQ(weighted_sum("0000000001", tin_spec), 9u);
}

TEST(WeightedSumTest, RejectsMalformedInput) {
    EXPECT_FALSE(weighted_sum("012345678", tin_spec).has_value());
    EXPECT_FALSE(weighted_sum("01234567890", tin_spec).has_value());
    EXPECT_FALSE(weighted_sum("01234A6789", tin_spec).has_value());
    EXPECT_FALSE(weighted_sum("12", weighted_sum_spec{{1, 2}, 0}).has_value());
}

TEST(WeightedSumTest, OtherModulus) {
    EXPECT_EQ(weighted_sum("123", weighted_sum_spec{{1, 3, 7}, 10}), 8u);
}

TEST(CheckValueTest, ComparesDecimalRendering) {
    EXPECT_TRUE(matches_check_value(2, "2"));
    EXPECT_FALSE(matches_check_value(2, "3"));
    EXPECT_FALSE(matches_check_value(2, "02"));
}

TEST(CheckValueTest, TwoDigitRemainderNeverMatchesSingleCharacter) {
    for (char check = '0'; check <= '9'; ++check) {
        EXPECT_FALSE(matches_check_value(10, std::string(1, check)));
    }

    EXPECT_TRUE(matches_check_value(10, "10"));
}
