#ifndef AD_NRT_HPP
#define AD_NRT_HPP

//local
#include <validation/validation_result.hpp>

//internal
#include <optional>
#include <string>
#include <string_view>

namespace taxid::ad
{
    // NRT (Número de Registre Tributari, Andorra tax number)
    //
    // Identifies legal and natural entities for tax purposes. It consists of one letter 
    // indicating the type of entity, then 6 digits, followed by a check letter
    // The check letter algorithm is not published so it is not verified
    class nrt
    {
        public:
            // Return the cleaned upper-case form, e.g. "d-059888-n" -> "D059888N"
            static std::string compact(std::string_view input);

            // Return the display form, e.g. "D059888N" -> "D-059888-N"
            static std::string format(std::string_view input);

            static validation_result validate(std::string_view input);

        private:
            static std::optional<std::string> clean(std::string_view input);

            static constexpr std::string_view _separators{" -."};
            static constexpr std::string_view _pattern{"?-??????-?"};
            static constexpr std::string_view _entity_letters{"ACDEFGLOPU"};
            static constexpr std::string_view _individual_letters{"AF"};
            static constexpr size_t _length{8};
    };
}

#endif
