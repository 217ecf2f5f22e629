#include <ranger/range_tupleizer.hpp>
#include <ranger/range_formatter.hpp>
#include <ranger/range_parser.hpp>
#include <ranger/token.hpp>
#include <ranger/detail/split.hpp>

namespace Ranger
{
    boost::leaf::result<std::vector<BoundPair>>
    boundPairsFromIntegerList(std::string_view rangeString, Notation const& notation)
    {
        auto canonical = notation;
        canonical.delimiterSpace = false;

        BOOST_LEAF_AUTO(integers, parseIntegerList(rangeString, canonical));
        const auto normalized = formatIntegerList(integers, canonical);

        std::vector<BoundPair> pairs;
        const auto tokens = Detail::splitTokens(normalized, canonical.delimiter);
        pairs.reserve(tokens.size());
        for (std::size_t index = 0; index != tokens.size(); ++index)
        {
            BOOST_LEAF_AUTO(token, classifyToken(tokens[index], canonical.rangeDelimiter, index));
            pairs.push_back(toBoundPair(token));
        }
        return pairs;
    }
}
