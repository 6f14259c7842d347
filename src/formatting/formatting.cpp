#include <formatting/formatting.hpp>

//local
#include <utils/string_utils/string_utils.hpp>

namespace taxid
{
    format_template::format_template(std::string_view pattern, char placeholder)
    {
        _tokens.reserve(pattern.size());

        for (char symbol : pattern)
        {
            if (symbol == placeholder)
            {
                _tokens.push_back(token{true, '\0'});
                ++_placeholder_count;
            }
            else
            {
                _tokens.push_back(token{false, symbol});
            }
        }
    }

    std::string format_template::apply(std::string_view value, char pad) const
    {
        const std::string padded{string_utils::pad_left(value, _placeholder_count, pad)};

        std::string formatted;
        formatted.reserve(_tokens.size() + padded.size());

        size_t position{0};

        for (const token& current : _tokens)
        {
            if (!current.is_placeholder)
            {
                formatted.push_back(current.literal);
            }
            else if (position < padded.size())
            {
                formatted.push_back(padded[position++]);
            }
        }

        formatted.append(padded, position);

        return formatted;
    }

    std::string format_pattern(std::string_view pattern, std::string_view value)
    {
        return format_template{pattern}.apply(value);
    }
}
