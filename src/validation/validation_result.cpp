#include <validation/validation_result.hpp>

//internal
#include <stdexcept>

namespace taxid
{
    validation_result::validation_result(std::variant<valid_identifier, error_kind> outcome)
        : _outcome{std::move(outcome)}
    {
    }

    validation_result validation_result::valid(std::string compact, entity_type entity)
    {
        return validation_result{valid_identifier{std::move(compact), entity}};
    }

    validation_result validation_result::invalid(error_kind error)
    {
        return validation_result{error};
    }

    bool validation_result::is_valid() const noexcept
    {
        return std::holds_alternative<valid_identifier>(_outcome);
    }

    const std::string& validation_result::compact() const
    {
        if (const auto* identifier = std::get_if<valid_identifier>(&_outcome))
        {
            return identifier->compact;
        }

        throw std::logic_error{"Compact form is absent in the invalid result"};
    }

    bool validation_result::is_individual() const noexcept
    {
        const auto* identifier = std::get_if<valid_identifier>(&_outcome);

        return identifier && identifier->entity == entity_type::INDIVIDUAL;
    }

    bool validation_result::is_company() const noexcept
    {
        const auto* identifier = std::get_if<valid_identifier>(&_outcome);

        return identifier && identifier->entity == entity_type::COMPANY;
    }

    std::optional<error_kind> validation_result::error() const noexcept
    {
        if (const auto* error = std::get_if<error_kind>(&_outcome))
        {
            return *error;
        }

        return {};
    }

    json::object to_json(const validation_result& result)
    {
        if (!result.is_valid())
        {
            return json::object
            {
                {"isValid", false},
                {"error", magic_enum::enum_name(*result.error())}
            };
        }

        return json::object
        {
            {"isValid", true},
            {"compact", result.compact()},
            {"isIndividual", result.is_individual()},
            {"isCompany", result.is_company()}
        };
    }
}
