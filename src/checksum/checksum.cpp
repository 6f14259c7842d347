#include <checksum/checksum.hpp>

//internal
#include <array>
#include <string>

namespace taxid::checksum
{
    std::optional<unsigned> luhn_checksum(std::string_view digits)
    {
        // Precomputed doubled values
        //   for digit from 0 to 9: (2 * digit) / 10 + (2 * digit) % 10
        static constexpr std::array<unsigned, 10> doubled{0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

        if (digits.empty())
        {
            return {};
        }

        unsigned sum{0};
        bool should_double{false};

        for (auto it = digits.rbegin(); it != digits.rend(); ++it)
        {
            if (*it < '0' || *it > '9')
            {
                return {};
            }

            const auto digit = static_cast<unsigned>(*it - '0');
            sum += should_double ? doubled[digit] : digit;
            should_double = !should_double;
        }

        return sum % 10;
    }

    bool luhn_validate(std::string_view digits)
    {
        std::optional<unsigned> checksum{luhn_checksum(digits)};

        return checksum && *checksum == 0;
    }

    std::optional<char> luhn_calc_check_digit(std::string_view payload)
    {
        // Appending a zero shifts the doubling to the positions it will have in the full number
        std::string number{payload};
        number.push_back('0');

        std::optional<unsigned> checksum{luhn_checksum(number)};

        if (!checksum)
        {
            return {};
        }

        return static_cast<char>('0' + (10 - *checksum) % 10);
    }

    std::optional<unsigned> weighted_sum(std::string_view digits, const weighted_sum_spec& spec)
    {
        if (spec.modulus == 0 || digits.size() != spec.weights.size())
        {
            return {};
        }

        unsigned long long sum{0};

        for (size_t i = 0; i < digits.size(); ++i)
        {
            if (digits[i] < '0' || digits[i] > '9')
            {
                return {};
            }

            sum += static_cast<unsigned long long>(digits[i] - '0') * spec.weights[i];
        }

        return static_cast<unsigned>(sum % spec.modulus);
    }

    bool matches_check_value(unsigned remainder, std::string_view check_field)
    {
        return std::to_string(remainder) == check_field;
    }
}
