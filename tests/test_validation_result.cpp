/**
 * @file test_validation_result.cpp
 * @brief Unit tests for the validation outcome and its json representation
 */

#include <gtest/gtest.h>
#include <validation/validation_result.hpp>

#include <stdexcept>

using namespace taxid;

TEST(ValidationResultTest, ValidCompany) {
    auto result = validation_result::valid("D059888N", entity_type::COMPANY);

    EXPECT_TRUE(result.is_valid());
    EXPECT_EQ(result.compact(), "D059888N");
    EXPECT_TRUE(result.is_company());
    EXPECT_FALSE(result.is_individual());
    EXPECT_FALSE(result.error().has_value());
}

TEST(ValidationResultTest, ValidIndividual) {
    auto result = validation_result::valid("F123456X", entity_type::INDIVIDUAL);

    EXPECT_TRUE(result.is_individual());
    EXPECT_FALSE(result.is_company());
}

TEST(ValidationResultTest, InvalidCarriesOnlyErrorKind) {
    auto result = validation_result::invalid(error_kind::INVALID_CHECKSUM);

    EXPECT_FALSE(result.is_valid());
    EXPECT_EQ(result.error(), error_kind::INVALID_CHECKSUM);
    EXPECT_FALSE(result.is_individual());
    EXPECT_FALSE(result.is_company());
    EXPECT_THROW(result.compact(), std::logic_error);
}

TEST(ValidationResultTest, ValidToJson) {
    auto result = validation_result::valid("01234567892", entity_type::COMPANY);

    EXPECT_EQ(
        json::serialize(to_json(result)),
        R"({"isValid":true,"compact":"01234567892","isIndividual":false,"isCompany":true})");
}

TEST(ValidationResultTest, InvalidToJson) {
    auto result = validation_result::invalid(error_kind::INVALID_LENGTH);

    EXPECT_EQ(json::serialize(to_json(result)), R"({"isValid":false,"error":"INVALID_LENGTH"})");
}

TEST(ValidationErrorTest, MessageNamesErrorKind) {
    validation_error error{error_kind::INVALID_FORMAT};

    EXPECT_EQ(error.kind(), error_kind::INVALID_FORMAT);
    EXPECT_STREQ(error.what(), "INVALID_FORMAT");
}
