#ifndef VALIDATION_ERROR_HPP
#define VALIDATION_ERROR_HPP

//internal
#include <stdint.h>
#include <stdexcept>
#include <string>

//external
#include <magic_enum.hpp>

namespace taxid
{
    // The kinds of malformation an identifier can have
    // Each validation stage reports exactly one of them
    enum error_kind : uint_fast8_t
    {
        // Characters outside the allowed alphabet after cleaning
        INVALID_FORMAT = 0,
        // Cleaned length is not among the accepted ones
        INVALID_LENGTH,
        // Leading character or numeric sub-range violates a jurisdiction rule
        INVALID_COMPONENT,
        // Embedded check value disagrees with the computed one
        INVALID_CHECKSUM
    };

    // Thrown by compact and format which assume a well-formed candidate
    // validate never throws and reports the same kinds through validation_result
    class validation_error : public std::invalid_argument
    {
        public:
            explicit validation_error(error_kind kind)
                : std::invalid_argument{std::string{magic_enum::enum_name(kind)}},
                  _kind{kind}
            {
            }

            error_kind kind() const noexcept
            {
                return _kind;
            }

        private:
            error_kind _kind;
    };
}

#endif
