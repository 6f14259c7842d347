#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

//internal
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace taxid::string_utils
{
    // Return true if the given string is non-empty and consists of ASCII digits only
    bool is_digits(std::string_view value);

    // Return true if the given string is non-empty and consists of ASCII letters only
    bool is_alpha(std::string_view value);

    // Split the given string at the specified offsets
    // A negative offset counts from the end of the string and offsets out of range are clamped
    // Example: split_at("12345678901", {4, 6}) -> {"1234", "56", "78901"}
    //          split_at("12345678901", {-1}) -> {"1234567890", "1"}
    std::vector<std::string_view> split_at(
        std::string_view value,
        std::initializer_list<std::ptrdiff_t> offsets);

    // Left-pad the given string with fill up to width characters
    std::string pad_left(std::string_view value, size_t width, char fill = '0');
}

#endif
