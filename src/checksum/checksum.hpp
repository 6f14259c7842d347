#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP

//internal
#include <optional>
#include <string_view>
#include <vector>

namespace taxid::checksum
{
    // Weights for each digit position (left to right) and the modulus the sum is reduced by
    struct weighted_sum_spec
    {
        std::vector<unsigned> weights;
        unsigned modulus;
    };

    // Return the Luhn sum of the given digits modulo 10
    // The rightmost digit is not doubled, every second digit to the left of it is
    // Return nullopt if the string is empty or contains a non-digit
    std::optional<unsigned> luhn_checksum(std::string_view digits);

    // Determine if the given digits pass the Luhn check i.e. the Luhn sum modulo 10 is 0
    bool luhn_validate(std::string_view digits);

    // Return the digit that makes the given payload Luhn-valid when appended to it
    std::optional<char> luhn_calc_check_digit(std::string_view payload);

    // Return sum(digits[i] * spec.weights[i]) % spec.modulus
    // Return nullopt if the string contains a non-digit, the weights number differs 
    // from the digits number or the modulus is 0
    std::optional<unsigned> weighted_sum(std::string_view digits, const weighted_sum_spec& spec);

    // Compare the decimal representation of the remainder with the check field
    // No zero padding is applied so a two-digit remainder never matches a one-character field
    bool matches_check_value(unsigned remainder, std::string_view check_field);
}

#endif
