#pragma once

#include <ranger/bound_pair.hpp>
#include <ranger/notation.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace Ranger
{
    /**
     * @brief Formats integers as the shortest range string: [1, 3, 5, 6, 7, 8, 10, 11, 15] -> "1,3,5-8,10-11,15".
     *
     * Input may be unsorted and contain duplicates. Tokens come out ascending, every token is a singleton or a
     * maximal run of consecutive integers. Negative runs are rendered the same way: "-3--1".
     *
     * @param integers Any integers.
     * @param notation Delimiters to join with.
     * @return std::string The range string, empty for no integers.
     */
    std::string formatIntegerList(std::vector<std::int64_t> integers, Notation const& notation = {});

    /**
     * @brief Same as above, for an already ordered set.
     */
    std::string formatIntegerList(IntegerSet const& integers, Notation const& notation = {});

    /**
     * @brief Formats inclusive pairs (low <= high each) given in any order. Overlapping and adjacent pairs are merged.
     */
    std::string formatBoundPairs(std::vector<BoundPair> const& pairs, Notation const& notation = {});
}
