#include <jurisdictions/za/tin.hpp>

//local
#include <formatting/formatting.hpp>
#include <normalization/normalization.hpp>
#include <utils/string_utils/string_utils.hpp>

namespace taxid::za
{
    const checksum::weighted_sum_spec tin::_checksum_spec
    {
        {6, 7, 8, 9, 4, 5, 6, 7, 8, 9},
        11
    };

    std::optional<std::string> tin::clean(std::string_view input)
    {
        std::optional<std::string> value{normalizer::clean(input, _separators, alphabet::ALPHANUMERIC)};

        // Legacy numbers are often written padded to the canonical length
        // Only that padded form is stripped so compacting stays idempotent
        if (value && value->size() == _length && value->starts_with(_legacy_prefix))
        {
            value->erase(0, _legacy_prefix.size());
        }

        return value;
    }

    std::string tin::compact(std::string_view input)
    {
        std::optional<std::string> value{clean(input)};

        if (!value)
        {
            throw validation_error{error_kind::INVALID_FORMAT};
        }

        return *value;
    }

    std::string tin::format(std::string_view input)
    {
        return format_pattern(_pattern, compact(input));
    }

    bool tin::has_valid_checksum(std::string_view number)
    {
        if (number.size() == _legacy_length)
        {
            return checksum::luhn_validate(number);
        }

        const auto parts = string_utils::split_at(number, {-1});
        std::optional<unsigned> remainder{checksum::weighted_sum(parts[0], _checksum_spec)};

        return remainder && checksum::matches_check_value(*remainder, parts[1]);
    }

    validation_result tin::validate(std::string_view input)
    {
        std::optional<std::string> value{clean(input)};

        if (!value)
        {
            return validation_result::invalid(error_kind::INVALID_FORMAT);
        }

        if (value->size() != _length && value->size() != _legacy_length)
        {
            return validation_result::invalid(error_kind::INVALID_LENGTH);
        }

        if (!string_utils::is_digits(*value))
        {
            return validation_result::invalid(error_kind::INVALID_FORMAT);
        }

        if (!has_valid_checksum(*value))
        {
            return validation_result::invalid(error_kind::INVALID_CHECKSUM);
        }

        return validation_result::valid(*value, entity_type::COMPANY);
    }
}
