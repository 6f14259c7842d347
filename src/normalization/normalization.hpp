#ifndef NORMALIZATION_HPP
#define NORMALIZATION_HPP

//internal
#include <stdint.h>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

//external
#include <boost/regex.hpp>
#include <boost/regex/icu.hpp>

namespace taxid
{
    // Character sets an identifier may consist of after cleaning
    enum alphabet : uint_fast8_t
    {
        DIGITS = 0,
        ALPHANUMERIC
    };

    class normalizer
    {
        public:
            // Transform the given UTF-8 string to the cleaned form:
            // compatibility forms are folded (NFKC), letters are upper-cased, 
            // Unicode dashes and spaces are mapped to '-' and ' ' and then every character 
            // from separators is erased
            //
            // Return the cleaned string or nullopt if the input can't be decoded 
            // or some character remains outside the allowed alphabet
            static std::optional<std::string> clean(
                std::string_view input,
                std::string_view separators,
                alphabet allowed_alphabet = alphabet::ALPHANUMERIC);

        private:
            // Fold compatibility forms and upper-case the given string using ICU
            static std::optional<std::string> fold(std::string_view input);

            static const boost::u32regex _dashes_regex;
            static const boost::u32regex _spaces_regex;
            static const std::unordered_map<alphabet, boost::regex> _alphabet_regexes;
    };
}

#endif
