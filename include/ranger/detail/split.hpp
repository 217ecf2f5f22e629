#pragma once

#include <boost/algorithm/string.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace Ranger::Detail
{
    /**
     * @brief Trims the whole string once and splits it on every occurrence of delimiter. Tokens themselves are not
     * trimmed. A blank input gives no tokens, a doubled or trailing delimiter gives an empty token.
     */
    inline std::vector<std::string> splitTokens(std::string_view rangeString, std::string const& delimiter)
    {
        const auto trimmed = boost::algorithm::trim_copy(std::string{rangeString});
        std::vector<std::string> tokens;
        if (trimmed.empty())
            return tokens;

        boost::algorithm::iter_split(tokens, trimmed, boost::algorithm::first_finder(delimiter));
        return tokens;
    }
}
