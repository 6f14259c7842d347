#ifndef JURISDICTION_HPP
#define JURISDICTION_HPP

//local
#include <validation/validation_result.hpp>

//internal
#include <functional>
#include <string>
#include <string_view>

namespace taxid
{
    // Uniform capability set every jurisdiction module provides
    struct jurisdiction
    {
        // ISO 3166-1 alpha-2 code in lower case
        std::string_view code;
        std::string_view name;
        std::string_view local_name;
        std::string_view abbreviation;

        // Return the cleaned form, throw validation_error on disallowed characters
        std::function<std::string(std::string_view)> compact;

        // Return the display form, throw validation_error on disallowed characters
        std::function<std::string(std::string_view)> format;

        // Never throw for malformed input
        std::function<validation_result(std::string_view)> validate;
    };
}

#endif
