#ifndef FORMATTING_HPP
#define FORMATTING_HPP

//internal
#include <string>
#include <string_view>
#include <vector>

namespace taxid
{
    // Display template of literal separators and placeholders
    // Example: "?-??????-?" renders "D059888N" as "D-059888-N"
    class format_template
    {
        public:
            explicit format_template(std::string_view pattern, char placeholder = '?');

            size_t placeholder_count() const noexcept
            {
                return _placeholder_count;
            }

            // Render the given cleaned value: left-pad it with pad up to the number of placeholders, 
            // then emit literals as they are and consume one character of the value for each placeholder
            // Characters of a value longer than the template are appended after the last token
            std::string apply(std::string_view value, char pad = '0') const;

        private:
            struct token
            {
                bool is_placeholder;
                char literal;
            };

            std::vector<token> _tokens;
            size_t _placeholder_count{0};
    };

    // Render the given cleaned value with the pattern where '?' is a placeholder
    std::string format_pattern(std::string_view pattern, std::string_view value);
}

#endif
