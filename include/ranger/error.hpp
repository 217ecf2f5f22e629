#pragma once

#include <cstddef>
#include <string>
#include <sstream>

namespace Ranger
{
    /**
     * @brief A token of a range string that is neither an integer nor two integers joined by the range
     * delimiter.
     */
    struct MalformedToken
    {
        /// The offending token, exactly as it appeared between two delimiters.
        std::string token = {};

        /// Zero based position of the token within the range string.
        std::size_t index = 0;

        std::string reason = {};

        std::string toString() const;
    };

    /**
     * @brief A Notation whose delimiters cannot be used to parse a range string.
     */
    struct InvalidNotation
    {
        std::string reason = {};

        std::string toString() const;
    };

    template <typename StreamT>
    StreamT& operator<<(StreamT& stream, MalformedToken const& error)
    {
        stream << "Malformed token #" << error.index << " '" << error.token << "'";
        if (!error.reason.empty())
            stream << ": " << error.reason;
        return stream;
    }

    template <typename StreamT>
    StreamT& operator<<(StreamT& stream, InvalidNotation const& error)
    {
        stream << "Invalid notation";
        if (!error.reason.empty())
            stream << ": " << error.reason;
        return stream;
    }

    inline std::string MalformedToken::toString() const
    {
        std::stringstream sstr;
        sstr << *this;
        return sstr.str();
    }

    inline std::string InvalidNotation::toString() const
    {
        std::stringstream sstr;
        sstr << *this;
        return sstr.str();
    }
}
