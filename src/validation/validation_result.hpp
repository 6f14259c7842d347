#ifndef VALIDATION_RESULT_HPP
#define VALIDATION_RESULT_HPP

//local
#include <errors/validation_error.hpp>

//internal
#include <stdint.h>
#include <optional>
#include <string>
#include <variant>

//external
#include <boost/json.hpp>

namespace json = boost::json;

namespace taxid
{
    // Kind of the holder the identifier is issued to
    enum entity_type : uint_fast8_t
    {
        INDIVIDUAL = 0,
        COMPANY
    };

    // Outcome of validate: either the compact form with its classification or a single error kind
    class validation_result
    {
        public:
            static validation_result valid(std::string compact, entity_type entity);

            static validation_result invalid(error_kind error);

            bool is_valid() const noexcept;

            // Throw std::logic_error if the result is invalid
            const std::string& compact() const;

            // Both flags are derived from the single entity type so exactly one of them 
            // is true for a valid result and both are false for an invalid one
            bool is_individual() const noexcept;

            bool is_company() const noexcept;

            std::optional<error_kind> error() const noexcept;

        private:
            struct valid_identifier
            {
                std::string compact;
                entity_type entity;
            };

            explicit validation_result(std::variant<valid_identifier, error_kind> outcome);

            std::variant<valid_identifier, error_kind> _outcome;
    };

    // Represent the given result as {"isValid":true,"compact":"...","isIndividual":false,"isCompany":true}
    // or {"isValid":false,"error":"INVALID_LENGTH"}
    json::object to_json(const validation_result& result);
}

#endif
