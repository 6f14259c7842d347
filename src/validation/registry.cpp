#include <validation/registry.hpp>

//local
#include <jurisdictions/ad/nrt.hpp>
#include <jurisdictions/za/tin.hpp>

//external
#include <boost/algorithm/string/case_conv.hpp>
#include <magic_enum.hpp>

namespace taxid
{
    const std::map<country, jurisdiction> registry::_jurisdictions
    {
        {
            country::AD,
            jurisdiction{
                "ad",
                "Andorra Tax Registration Number",
                "Número de Registre Tributari",
                "NRT",
                ad::nrt::compact,
                ad::nrt::format,
                ad::nrt::validate}
        },
        {
            country::ZA,
            jurisdiction{
                "za",
                "South Africa Tax Reference Number",
                "Tax Reference Number",
                "TIN",
                za::tin::compact,
                za::tin::format,
                za::tin::validate}
        }
    };

    const jurisdiction* registry::find(std::string_view code)
    {
        std::optional<country> parsed_code{
            magic_enum::enum_cast<country>(boost::algorithm::to_upper_copy(std::string{code}))};

        if (!parsed_code)
        {
            return nullptr;
        }

        auto it = _jurisdictions.find(*parsed_code);

        return it != _jurisdictions.end() ? &it->second : nullptr;
    }

    std::vector<std::string_view> registry::codes()
    {
        std::vector<std::string_view> codes;
        codes.reserve(_jurisdictions.size());

        for (country value : magic_enum::enum_values<country>())
        {
            if (auto it = _jurisdictions.find(value); it != _jurisdictions.end())
            {
                codes.push_back(it->second.code);
            }
        }

        return codes;
    }

    std::optional<validation_result> registry::validate(std::string_view code, std::string_view input)
    {
        const jurisdiction* found{find(code)};

        if (!found)
        {
            return {};
        }

        return found->validate(input);
    }
}
