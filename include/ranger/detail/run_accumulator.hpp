#pragma once

#include <ranger/bound_pair.hpp>
#include <ranger/notation.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Ranger::Detail
{
    /**
     * @brief Collapses ascending integers into maximal runs and renders them as range string tokens.
     *
     * Either no run is open, or one run [low, high] is open. A value or run that continues the open run extends it,
     * anything further away flushes the open run as a token and opens a new one. finish() flushes the last run.
     * Input must be ascending by low.
     */
    class RunAccumulator
    {
      public:
        explicit RunAccumulator(Notation const& notation);

        void push(std::int64_t value);
        void pushRun(std::int64_t low, std::int64_t high);

        /**
         * @brief Flushes the open run and joins all tokens.
         *
         * @return std::string The range string, empty if nothing was pushed.
         */
        std::string finish();

      private:
        void flush();

      private:
        std::string rangeDelimiter_;
        std::string joiner_;
        std::optional<BoundPair> open_;
        std::vector<std::string> tokens_;
    };
}
