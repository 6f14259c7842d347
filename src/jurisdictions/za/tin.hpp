#ifndef ZA_TIN_HPP
#define ZA_TIN_HPP

//local
#include <checksum/checksum.hpp>
#include <validation/validation_result.hpp>

//internal
#include <optional>
#include <string>
#include <string_view>

namespace taxid::za
{
    // TIN (South African tax reference number)
    //
    // Issued to legal entities for tax purposes. The canonical form has 11 digits 
    // where the last one is the weighted sum of the first ten modulo 11
    // The legacy form has 7 digits protected by the Luhn check digit and is 
    // displayed with four leading zeros
    class tin
    {
        public:
            // Return the cleaned form, the leading "0000" of the padded legacy numbers is removed
            static std::string compact(std::string_view input);

            // Return the display form of 11 digits, e.g. "1234566" -> "0000.12.34566"
            static std::string format(std::string_view input);

            static validation_result validate(std::string_view input);

        private:
            static std::optional<std::string> clean(std::string_view input);

            static bool has_valid_checksum(std::string_view number);

            static constexpr std::string_view _separators{" -."};
            static constexpr std::string_view _pattern{"????.??.?????"};
            static constexpr std::string_view _legacy_prefix{"0000"};
            static constexpr size_t _length{11};
            static constexpr size_t _legacy_length{7};

            static const checksum::weighted_sum_spec _checksum_spec;
    };
}

#endif
