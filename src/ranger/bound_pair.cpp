#include <ranger/bound_pair.hpp>

#include <limits>
#include <sstream>

namespace Ranger
{
    // ##################################################################################################################
    std::uint64_t BoundPair::size() const
    {
        const auto distance = static_cast<std::uint64_t>(high) - static_cast<std::uint64_t>(low);
        if (distance == std::numeric_limits<std::uint64_t>::max())
            return distance;
        return distance + 1;
    }
    //------------------------------------------------------------------------------------------------------------------
    bool BoundPair::isSingleton() const
    {
        return low == high;
    }
    //------------------------------------------------------------------------------------------------------------------
    std::string BoundPair::toString(std::string const& rangeDelimiter) const
    {
        std::stringstream sstr;
        if (isSingleton())
            sstr << low;
        else
            sstr << low << rangeDelimiter << high;
        return sstr.str();
    }
    // ##################################################################################################################
}
