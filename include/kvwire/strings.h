#ifndef KVWIRE_STRINGS_H
#define KVWIRE_STRINGS_H

#include <string>
#include <string_view>
#include <vector>

namespace kvwire::utils
{
    std::string to_upper(std::string_view str);

    // split_whitespace splits on runs of blanks, leading and trailing blanks produce no empty tokens.
    std::vector<std::string> split_whitespace(std::string_view str);
}  // namespace kvwire::utils

#endif  // KVWIRE_STRINGS_H
