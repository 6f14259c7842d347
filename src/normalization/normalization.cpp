#include <normalization/normalization.hpp>

//internal
#include <algorithm>

//external
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>

namespace taxid
{
    // Any dash punctuation including the minus sign which is a math symbol in Unicode
    const boost::u32regex normalizer::_dashes_regex{
        boost::make_u32regex(R"([[:Pd:]\x{2212}])")};

    // Any space separator like no-break or thin space and any whitespace
    const boost::u32regex normalizer::_spaces_regex{
        boost::make_u32regex(R"([[:Zs:]\s])")};

    const std::unordered_map<alphabet, boost::regex> normalizer::_alphabet_regexes
    {
        {alphabet::DIGITS, boost::regex{R"([0-9]*)"}},
        {alphabet::ALPHANUMERIC, boost::regex{R"([0-9A-Z]*)"}}
    };

    std::optional<std::string> normalizer::clean(
        std::string_view input,
        std::string_view separators,
        alphabet allowed_alphabet)
    {
        std::optional<std::string> folded{fold(input)};

        if (!folded)
        {
            return {};
        }

        std::string cleaned{boost::u32regex_replace(*folded, _dashes_regex, "-")};
        cleaned = boost::u32regex_replace(cleaned, _spaces_regex, " ");

        // Separators are ASCII so bytes of multibyte sequences never match them
        std::erase_if(cleaned, [separators](char symbol)
        {
            return separators.find(symbol) != std::string_view::npos;
        });

        if (!boost::regex_match(cleaned, _alphabet_regexes.at(allowed_alphabet)))
        {
            return {};
        }

        return cleaned;
    }

    std::optional<std::string> normalizer::fold(std::string_view input)
    {
        UErrorCode status{U_ZERO_ERROR};

        const icu::Normalizer2* nfkc{icu::Normalizer2::getNFKCInstance(status)};

        if (U_FAILURE(status))
        {
            return {};
        }

        // Malformed UTF-8 sequences turn into U+FFFD which is rejected by any alphabet later
        icu::UnicodeString string_to_fold{icu::UnicodeString::fromUTF8(
            icu::StringPiece{input.data(), static_cast<int32_t>(input.size())})};

        icu::UnicodeString folded{nfkc->normalize(string_to_fold, status)};

        if (U_FAILURE(status))
        {
            return {};
        }

        // Transform the string to the upper case independently of the default locale
        // as the Turkish one maps 'i' to U+0130
        folded.toUpper(icu::Locale::getRoot());

        std::string result;
        folded.toUTF8String(result);

        return result;
    }
}
