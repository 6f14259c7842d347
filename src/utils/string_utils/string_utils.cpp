#include <utils/string_utils/string_utils.hpp>

//internal
#include <algorithm>

//external
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace taxid::string_utils
{
    bool is_digits(std::string_view value)
    {
        return !value.empty() && 
            boost::algorithm::all(value, boost::algorithm::is_from_range('0', '9'));
    }

    bool is_alpha(std::string_view value)
    {
        return !value.empty() && 
            boost::algorithm::all(
                value, 
                boost::algorithm::is_from_range('A', 'Z') || boost::algorithm::is_from_range('a', 'z'));
    }

    std::vector<std::string_view> split_at(
        std::string_view value,
        std::initializer_list<std::ptrdiff_t> offsets)
    {
        std::vector<std::string_view> parts;
        parts.reserve(offsets.size() + 1);

        const auto size = static_cast<std::ptrdiff_t>(value.size());
        std::ptrdiff_t start{0};

        for (std::ptrdiff_t offset : offsets)
        {
            // Negative offsets are relative to the end of the string
            if (offset < 0)
            {
                offset += size;
            }

            offset = std::clamp(offset, start, size);

            parts.push_back(value.substr(start, offset - start));
            start = offset;
        }

        parts.push_back(value.substr(start));

        return parts;
    }

    std::string pad_left(std::string_view value, size_t width, char fill)
    {
        if (value.size() >= width)
        {
            return std::string{value};
        }

        std::string padded(width - value.size(), fill);
        padded.append(value);

        return padded;
    }
}
