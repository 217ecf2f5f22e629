#include <ranger/notation.hpp>
#include <ranger/error.hpp>

#include <boost/algorithm/string.hpp>

namespace Ranger
{
    namespace
    {
        boost::leaf::result<void> validateDelimiter(std::string const& delimiter, char const* name)
        {
            using namespace std::string_literals;

            if (delimiter.empty())
                return boost::leaf::new_error(InvalidNotation{.reason = name + " is empty"s});
            if (!boost::algorithm::find_token(delimiter, boost::algorithm::is_space()).empty())
                return boost::leaf::new_error(InvalidNotation{.reason = name + " contains whitespace"s});
            if (!boost::algorithm::find_token(delimiter, boost::algorithm::is_digit()).empty())
                return boost::leaf::new_error(InvalidNotation{.reason = name + " contains a digit"s});
            return {};
        }
    }
    // ##################################################################################################################
    boost::leaf::result<void> Notation::validate() const
    {
        BOOST_LEAF_CHECK(validateDelimiter(delimiter, "delimiter"));
        BOOST_LEAF_CHECK(validateDelimiter(rangeDelimiter, "range delimiter"));
        if (delimiter == rangeDelimiter)
            return boost::leaf::new_error(InvalidNotation{.reason = "delimiter and range delimiter are equal"});
        // A formatted span must never be split apart again by the delimiter.
        if (boost::algorithm::contains(rangeDelimiter, delimiter))
            return boost::leaf::new_error(InvalidNotation{.reason = "range delimiter contains the delimiter"});
        if (boost::algorithm::contains(delimiter, rangeDelimiter))
            return boost::leaf::new_error(InvalidNotation{.reason = "delimiter contains the range delimiter"});
        return {};
    }
    //------------------------------------------------------------------------------------------------------------------
    std::string Notation::joiner() const
    {
        if (delimiterSpace)
            return delimiter + ' ';
        return delimiter;
    }
    // ##################################################################################################################
}
