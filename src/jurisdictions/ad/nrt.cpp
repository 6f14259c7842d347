#include <jurisdictions/ad/nrt.hpp>

//local
#include <formatting/formatting.hpp>
#include <normalization/normalization.hpp>
#include <utils/string_utils/string_utils.hpp>

namespace taxid::ad
{
    std::optional<std::string> nrt::clean(std::string_view input)
    {
        return normalizer::clean(input, _separators, alphabet::ALPHANUMERIC);
    }

    std::string nrt::compact(std::string_view input)
    {
        std::optional<std::string> value{clean(input)};

        if (!value)
        {
            throw validation_error{error_kind::INVALID_FORMAT};
        }

        return *value;
    }

    std::string nrt::format(std::string_view input)
    {
        return format_pattern(_pattern, compact(input));
    }

    validation_result nrt::validate(std::string_view input)
    {
        std::optional<std::string> value{clean(input)};

        if (!value)
        {
            return validation_result::invalid(error_kind::INVALID_FORMAT);
        }

        if (value->size() != _length)
        {
            return validation_result::invalid(error_kind::INVALID_LENGTH);
        }

        const std::string_view number{*value};
        const char leading{number.front()};
        const std::string_view middle{number.substr(1, _length - 2)};

        // The entity letter and the check letter surround 6 digits
        if (!string_utils::is_alpha(number.substr(0, 1)) || 
            !string_utils::is_alpha(number.substr(_length - 1)) ||
            !string_utils::is_digits(middle))
        {
            return validation_result::invalid(error_kind::INVALID_FORMAT);
        }

        if (_entity_letters.find(leading) == std::string_view::npos)
        {
            return validation_result::invalid(error_kind::INVALID_COMPONENT);
        }

        // Middle digits have the fixed width so the lexicographical comparison is numeric
        if (leading == 'F' && middle > "699999")
        {
            return validation_result::invalid(error_kind::INVALID_COMPONENT);
        }

        if ((leading == 'A' || leading == 'L') && middle > "699999" && middle < "800000")
        {
            return validation_result::invalid(error_kind::INVALID_COMPONENT);
        }

        return validation_result::valid(
            *value,
            _individual_letters.find(leading) != std::string_view::npos 
                ? entity_type::INDIVIDUAL 
                : entity_type::COMPANY);
    }
}
