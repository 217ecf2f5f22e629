#pragma once

#include <ranger/bound_pair.hpp>
#include <ranger/notation.hpp>

#include <boost/leaf.hpp>

#include <string_view>
#include <vector>

namespace Ranger
{
    /**
     * @brief Converts a range string into its maximal runs: "1,3,5-8" -> [(1, 1), (3, 3), (5, 8)].
     *
     * The range string is normalized first, so messy input like "5,3,1-2" still yields ascending, non overlapping,
     * non adjacent pairs: [(1, 3), (5, 5)].
     *
     * @param rangeString The range string.
     * @param notation Delimiters to parse with. delimiterSpace is ignored.
     * @return boost::leaf::result<std::vector<BoundPair>> The runs in ascending order, or the errors of
     * parseIntegerList.
     */
    boost::leaf::result<std::vector<BoundPair>>
    boundPairsFromIntegerList(std::string_view rangeString, Notation const& notation = {});
}
