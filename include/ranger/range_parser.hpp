#pragma once

#include <ranger/bound_pair.hpp>
#include <ranger/notation.hpp>

#include <boost/leaf.hpp>

#include <string_view>

namespace Ranger
{
    /**
     * @brief Parses a range string like "1,3,5-8,10-11,15" into the set of integers it denotes.
     *
     * The input is trimmed once, then split on the delimiter. Every token must be an integer or two integers joined by
     * the range delimiter, in either order. Spans are inclusive. An empty or blank input yields an empty set, an empty
     * token (as in "1,,2" or "1,") does not.
     *
     * Every integer of every span is materialized. Limiting the size of spans is up to the caller.
     *
     * @param rangeString The range string.
     * @param notation Delimiters to split on.
     * @return boost::leaf::result<IntegerSet> The integers, or MalformedToken / InvalidNotation.
     */
    boost::leaf::result<IntegerSet> parseIntegerList(std::string_view rangeString, Notation const& notation = {});
}
