#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace dfixxer
{
    inline char ascii_lower(char c)
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    inline std::string to_lower(std::string_view text)
    {
        std::string ret(text);
        std::transform(ret.begin(), ret.end(), ret.begin(), ascii_lower);
        return ret;
    }

    inline bool iequals(std::string_view lhs, std::string_view rhs)
    {
        return lhs.size() == rhs.size()
            && std::equal(lhs.cbegin(), lhs.cend(), rhs.cbegin(),
                          [](char a, char b) { return ascii_lower(a) == ascii_lower(b); });
    }

    inline bool istarts_with(std::string_view text, std::string_view prefix)
    {
        return text.size() >= prefix.size() && iequals(text.substr(0, prefix.size()), prefix);
    }

    /**
     * @brief Case-insensitive strict weak ordering, for module names.
     */
    inline bool iless(std::string_view lhs, std::string_view rhs)
    {
        return std::lexicographical_compare(lhs.cbegin(), lhs.cend(), rhs.cbegin(), rhs.cend(),
                                            [](char a, char b) { return ascii_lower(a) < ascii_lower(b); });
    }

    inline bool is_horizontal_space(char c)
    {
        return c == ' ' || c == '\t';
    }

    inline bool is_line_break(char c)
    {
        return c == '\n' || c == '\r';
    }
}
