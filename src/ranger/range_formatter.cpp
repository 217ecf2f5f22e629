#include <ranger/range_formatter.hpp>
#include <ranger/detail/run_accumulator.hpp>

#include <algorithm>

namespace Ranger
{
    // ##################################################################################################################
    std::string formatIntegerList(std::vector<std::int64_t> integers, Notation const& notation)
    {
        std::sort(std::begin(integers), std::end(integers));
        integers.erase(std::unique(std::begin(integers), std::end(integers)), std::end(integers));

        Detail::RunAccumulator accumulator{notation};
        for (auto const value : integers)
            accumulator.push(value);
        return accumulator.finish();
    }
    //------------------------------------------------------------------------------------------------------------------
    std::string formatIntegerList(IntegerSet const& integers, Notation const& notation)
    {
        Detail::RunAccumulator accumulator{notation};
        for (auto const value : integers)
            accumulator.push(value);
        return accumulator.finish();
    }
    //------------------------------------------------------------------------------------------------------------------
    std::string formatBoundPairs(std::vector<BoundPair> const& pairs, Notation const& notation)
    {
        auto sorted = pairs;
        std::sort(std::begin(sorted), std::end(sorted), [](auto const& lhs, auto const& rhs) {
            return lhs.low < rhs.low;
        });

        Detail::RunAccumulator accumulator{notation};
        for (auto const& pair : sorted)
            accumulator.pushRun(pair.low, pair.high);
        return accumulator.finish();
    }
    // ##################################################################################################################
}
