#include <ranger/token.hpp>
#include <ranger/error.hpp>
#include <ranger/utility/visit_overloaded.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/fusion/include/adapt_struct.hpp>
#include <boost/optional.hpp>
#include <boost/spirit/home/x3.hpp>

#include <algorithm>
#include <cstddef>

namespace Ranger::Detail
{
    struct TokenAst
    {
        std::int64_t first;
        boost::optional<std::int64_t> last;
    };
}

BOOST_FUSION_ADAPT_STRUCT(Ranger::Detail::TokenAst, first, last)

namespace Ranger
{
    namespace Parser
    {
        namespace x3 = boost::spirit::x3;

        struct IntegerTag;
        const auto integer = x3::rule<IntegerTag, std::int64_t>{"integer"} = x3::int_parser<std::int64_t, 10>{};

        struct TokenTag;
        auto makeToken(std::string const& rangeDelimiter)
        {
            return x3::rule<TokenTag, Detail::TokenAst>{"token"} =
                       integer >> -(x3::lit(rangeDelimiter) > integer) > x3::eoi;
        }
    } // namespace Parser
    // ##################################################################################################################
    boost::leaf::result<Token> classifyToken(std::string_view token, std::string const& rangeDelimiter, std::size_t index)
    {
        using namespace std::string_literals;

        auto makeError = [&](std::string reason) {
            return boost::leaf::new_error(MalformedToken{
                .token = std::string{token},
                .index = index,
                .reason = std::move(reason),
            });
        };

        if (boost::algorithm::all(token, boost::algorithm::is_space()))
            return makeError("empty token");

        auto iter = token.begin();
        const auto end = token.end();
        Detail::TokenAst ast{};
        try
        {
            using boost::spirit::x3::ascii::space;
            if (!boost::spirit::x3::phrase_parse(iter, end, Parser::makeToken(rangeDelimiter), space, ast))
                return makeError("not an integer");
        }
        catch (boost::spirit::x3::expectation_failure<std::string_view::const_iterator> const& exc)
        {
            const auto excerpt = std::min<std::ptrdiff_t>(10, end - exc.where());
            return makeError("expected "s + exc.which() + " at '" + std::string{exc.where(), exc.where() + excerpt} + "'");
        }

        if (ast.last)
            return Token{Span{.first = ast.first, .last = *ast.last}};
        return Token{Singleton{.value = ast.first}};
    }
    //------------------------------------------------------------------------------------------------------------------
    boost::leaf::result<std::int64_t> parseInteger(std::string_view text)
    {
        auto iter = text.begin();
        const auto end = text.end();
        std::int64_t value = 0;

        using boost::spirit::x3::ascii::space;
        if (!boost::spirit::x3::phrase_parse(iter, end, Parser::integer >> boost::spirit::x3::eoi, space, value))
            return boost::leaf::new_error(MalformedToken{.token = std::string{text}, .reason = "not an integer"});
        return value;
    }
    //------------------------------------------------------------------------------------------------------------------
    BoundPair toBoundPair(Token const& token)
    {
        return visitOverloaded(
            token,
            [](Singleton const& singleton) {
                return BoundPair{.low = singleton.value, .high = singleton.value};
            },
            [](Span const& span) {
                return BoundPair{.low = std::min(span.first, span.last), .high = std::max(span.first, span.last)};
            });
    }
    //------------------------------------------------------------------------------------------------------------------
    void expandInto(Token const& token, IntegerSet& integers)
    {
        const auto pair = toBoundPair(token);
        for (auto value = pair.low;; ++value)
        {
            integers.insert(integers.end(), value);
            if (value == pair.high)
                break;
        }
    }
    // ##################################################################################################################
}
