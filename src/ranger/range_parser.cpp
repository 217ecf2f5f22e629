#include <ranger/range_parser.hpp>
#include <ranger/detail/split.hpp>
#include <ranger/token.hpp>

namespace Ranger
{
    boost::leaf::result<IntegerSet> parseIntegerList(std::string_view rangeString, Notation const& notation)
    {
        BOOST_LEAF_CHECK(notation.validate());

        IntegerSet integers;
        const auto tokens = Detail::splitTokens(rangeString, notation.delimiter);
        for (std::size_t index = 0; index != tokens.size(); ++index)
        {
            BOOST_LEAF_AUTO(token, classifyToken(tokens[index], notation.rangeDelimiter, index));
            expandInto(token, integers);
        }
        return integers;
    }
}
