#include "kvwire/strings.h"

#include <algorithm>
#include <cctype>

namespace kvwire::utils
{
    std::string to_upper(std::string_view str)
    {
        std::string result{str};
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::toupper(c); });
        return result;
    }

    std::vector<std::string> split_whitespace(std::string_view str)
    {
        std::vector<std::string> tokens;
        size_t pos = 0;
        while (pos < str.size())
        {
            while (pos < str.size() && std::isspace(static_cast<unsigned char>(str[pos])))
            {
                ++pos;
            }
            const auto start = pos;
            while (pos < str.size() && !std::isspace(static_cast<unsigned char>(str[pos])))
            {
                ++pos;
            }
            if (pos > start)
            {
                tokens.emplace_back(str.substr(start, pos - start));
            }
        }
        return tokens;
    }
}  // namespace kvwire::utils
