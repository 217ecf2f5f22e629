#pragma once

#include <ranger/bound_pair.hpp>

#include <boost/leaf.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace Ranger
{
    /**
     * @brief A token that is a single integer: "5".
     */
    struct Singleton
    {
        std::int64_t value;

        bool operator==(Singleton const&) const = default;
    };

    /**
     * @brief A token that is two integers joined by the range delimiter: "5-8". The ends are kept in textual order,
     * so "8-5" is Span{8, 5}.
     */
    struct Span
    {
        std::int64_t first;
        std::int64_t last;

        bool operator==(Span const&) const = default;
    };

    using Token = std::variant<Singleton, Span>;

    /**
     * @brief Classifies one token of a range string.
     *
     * A sign directly in front of a literal belongs to that literal. Only a range delimiter that follows a complete
     * first literal separates two ends. With "-" as range delimiter: "-5" is Singleton{-5}, "-5--1" is Span{-5, -1}.
     * Blanks around the literals are ignored.
     *
     * @param token The text between two delimiters.
     * @param rangeDelimiter Separates the ends of a span.
     * @param index Position of the token in its range string, reported in a MalformedToken.
     * @return boost::leaf::result<Token> The token or a MalformedToken.
     */
    boost::leaf::result<Token>
    classifyToken(std::string_view token, std::string const& rangeDelimiter, std::size_t index = 0);

    /**
     * @brief Parses a lone integer literal, like a bound given on a command line. Blanks around it are ignored.
     *
     * @return boost::leaf::result<std::int64_t> The integer or a MalformedToken.
     */
    boost::leaf::result<std::int64_t> parseInteger(std::string_view text);

    /**
     * @brief Converts a token into an ascending inclusive pair.
     */
    BoundPair toBoundPair(Token const& token);

    /**
     * @brief Inserts every integer the token stands for.
     */
    void expandInto(Token const& token, IntegerSet& integers);
}
