#include <ranger/range_complement.hpp>
#include <ranger/range_parser.hpp>
#include <ranger/detail/run_accumulator.hpp>

namespace Ranger
{
    boost::leaf::result<std::string>
    complementIntegerList(std::string_view rangeString, ComplementBounds bounds, Notation const& notation)
    {
        BOOST_LEAF_AUTO(integers, parseIntegerList(rangeString, notation));

        // Inclusive upper end of the interval. Kept inclusive so that max(S) == INT64_MAX needs no max(S) + 1.
        std::int64_t last = 0;
        if (bounds.end)
        {
            if (bounds.start >= *bounds.end)
                return std::string{};
            last = *bounds.end - 1;
        }
        else
        {
            if (integers.empty() || bounds.start > *integers.rbegin())
                return std::string{};
            last = *integers.rbegin();
        }

        Detail::RunAccumulator accumulator{notation};
        auto next = bounds.start;
        bool exhausted = false;
        for (auto iter = integers.lower_bound(bounds.start); iter != integers.end() && *iter <= last; ++iter)
        {
            if (*iter > next)
                accumulator.pushRun(next, *iter - 1);
            if (*iter == last)
            {
                exhausted = true;
                break;
            }
            next = *iter + 1;
        }
        if (!exhausted)
            accumulator.pushRun(next, last);
        return accumulator.finish();
    }
}
