#pragma once

#include <cstdint>
#include <set>
#include <string>

namespace Ranger
{
    /**
     * @brief The parsed form of a range string. Ordered and free of duplicates.
     */
    using IntegerSet = std::set<std::int64_t>;

    /**
     * @brief An inclusive run of consecutive integers [low, high]. low <= high.
     */
    struct BoundPair
    {
        std::int64_t low;
        std::int64_t high;

        /**
         * @brief Amount of integers covered. Saturates at the maximum of std::uint64_t for the one run that spans
         * all of std::int64_t.
         */
        std::uint64_t size() const;

        bool isSingleton() const;

        /**
         * @brief "5" for a singleton, "5-8" for a longer run.
         *
         * @param rangeDelimiter The string put between low and high.
         */
        std::string toString(std::string const& rangeDelimiter = "-") const;

        bool operator==(BoundPair const&) const = default;
    };

    template <typename StreamT>
    StreamT& operator<<(StreamT& stream, BoundPair const& pair)
    {
        stream << '(' << pair.low << ", " << pair.high << ')';
        return stream;
    }
}
