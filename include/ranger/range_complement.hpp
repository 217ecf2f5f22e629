#pragma once

#include <ranger/notation.hpp>

#include <boost/leaf.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Ranger
{
    /**
     * @brief The half open interval [start, end) a complement is taken in.
     */
    struct ComplementBounds
    {
        std::int64_t start = 0;

        /// Exclusive. When unset: one past the largest parsed integer, or start if nothing was parsed.
        std::optional<std::int64_t> end = std::nullopt;
    };

    /**
     * @brief Formats the integers of [start, end) that the range string does not contain.
     *
     * complementIntegerList("1,3,5-8,10-11,15") == "0,2,4,9,12-14"
     * An interval with start >= end gives an empty string, whatever the range string contains. Integers of the
     * range string outside of the interval have no effect.
     *
     * @param rangeString The range string.
     * @param bounds The interval.
     * @param notation Delimiters used for parsing and formatting.
     * @return boost::leaf::result<std::string> The gaps as a range string, or the errors of parseIntegerList.
     */
    boost::leaf::result<std::string>
    complementIntegerList(std::string_view rangeString, ComplementBounds bounds = {}, Notation const& notation = {});
}
