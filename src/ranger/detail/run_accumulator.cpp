#include <ranger/detail/run_accumulator.hpp>

#include <boost/algorithm/string/join.hpp>

#include <algorithm>

namespace Ranger::Detail
{
    // ##################################################################################################################
    RunAccumulator::RunAccumulator(Notation const& notation)
        : rangeDelimiter_{notation.rangeDelimiter}
        , joiner_{notation.joiner()}
        , open_{}
        , tokens_{}
    {}
    //------------------------------------------------------------------------------------------------------------------
    void RunAccumulator::push(std::int64_t value)
    {
        pushRun(value, value);
    }
    //------------------------------------------------------------------------------------------------------------------
    void RunAccumulator::pushRun(std::int64_t low, std::int64_t high)
    {
        if (!open_)
        {
            open_ = BoundPair{.low = low, .high = high};
            return;
        }

        // low - 1 cannot underflow here: low == INT64_MIN is always <= open_->high.
        if (low <= open_->high || low - 1 == open_->high)
        {
            open_->high = std::max(open_->high, high);
            return;
        }

        flush();
        open_ = BoundPair{.low = low, .high = high};
    }
    //------------------------------------------------------------------------------------------------------------------
    std::string RunAccumulator::finish()
    {
        flush();
        auto result = boost::algorithm::join(tokens_, joiner_);
        tokens_.clear();
        return result;
    }
    //------------------------------------------------------------------------------------------------------------------
    void RunAccumulator::flush()
    {
        if (!open_)
            return;
        tokens_.push_back(open_->toString(rangeDelimiter_));
        open_.reset();
    }
    // ##################################################################################################################
}
