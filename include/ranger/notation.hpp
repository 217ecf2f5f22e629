#pragma once

#include <boost/leaf.hpp>

#include <string>

namespace Ranger
{
    /**
     * @brief Describes how a range string is written: "1,3,5-8".
     */
    struct Notation
    {
        /// Separates the tokens of a range string.
        std::string delimiter = ",";

        /// Separates the two ends of a span token.
        std::string rangeDelimiter = "-";

        /// When true, formatting puts a single space after every delimiter: "1, 3, 5-8".
        bool delimiterSpace = false;

        /**
         * @brief Checks that the delimiters can be told apart from each other and from integer literals.
         * Both must be non-empty and free of whitespace and decimal digits, and neither may contain the other.
         *
         * @return boost::leaf::result<void> Fails with InvalidNotation.
         */
        boost::leaf::result<void> validate() const;

        /**
         * @brief The string put between two formatted tokens.
         */
        std::string joiner() const;
    };
}
