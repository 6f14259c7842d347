#ifndef REGISTRY_HPP
#define REGISTRY_HPP

//local
#include <validation/jurisdiction.hpp>

//internal
#include <stdint.h>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace taxid
{
    enum country : uint_fast8_t
    {
        AD = 0,
        ZA
    };

    class registry
    {
        public:
            // Find the jurisdiction by its ISO 3166-1 alpha-2 code ignoring the case
            // Return nullptr if there is no such jurisdiction
            static const jurisdiction* find(std::string_view code);

            // Codes of all registered jurisdictions in the order of country enumeration
            static std::vector<std::string_view> codes();

            // Validate the input by the rules of the jurisdiction with the given code
            // Return nullopt only if the jurisdiction is unknown
            static std::optional<validation_result> validate(std::string_view code, std::string_view input);

        private:
            static const std::map<country, jurisdiction> _jurisdictions;
    };
}

#endif
