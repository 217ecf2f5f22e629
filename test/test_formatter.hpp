#pragma once

#include <ranger/range_formatter.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <vector>

namespace Ranger::Tests
{
    class FormatterTests : public ::testing::Test
    {
      public:
        std::string format(std::vector<std::int64_t> integers, Notation const& notation = {}) const
        {
            return formatIntegerList(std::move(integers), notation);
        }
    };

    TEST_F(FormatterTests, CollapsesContiguousRuns)
    {
        EXPECT_EQ(format({1, 3, 5, 6, 7, 8, 10, 11, 15}), "1,3,5-8,10-11,15");
    }

    TEST_F(FormatterTests, EmptyInputIsEmptyString)
    {
        EXPECT_EQ(format({}), "");
        EXPECT_EQ(formatIntegerList(IntegerSet{}), "");
    }

    TEST_F(FormatterTests, SingleValue)
    {
        EXPECT_EQ(format({7}), "7");
    }

    TEST_F(FormatterTests, UnsortedInputWithDuplicates)
    {
        EXPECT_EQ(format({15, 3, 1, 8, 7, 7, 6, 5, 11, 10, 3}), "1,3,5-8,10-11,15");
    }

    TEST_F(FormatterTests, FinalRunIsFlushed)
    {
        EXPECT_EQ(format({1, 2, 3}), "1-3");
        EXPECT_EQ(format({1, 5, 6}), "1,5-6");
        EXPECT_EQ(format({1, 2, 9}), "1-2,9");
    }

    TEST_F(FormatterTests, TwoElementRunIsRange)
    {
        EXPECT_EQ(format({4, 5}), "4-5");
    }

    TEST_F(FormatterTests, NegativeRunsAreCollapsed)
    {
        EXPECT_EQ(format({-3, -2, -1}), "-3--1");
        EXPECT_EQ(format({-1, 0, 1, 5}), "-1-1,5");
        EXPECT_EQ(format({-10, -8}), "-10,-8");
    }

    TEST_F(FormatterTests, Int64LimitsDoNotOverflow)
    {
        constexpr auto max = std::numeric_limits<std::int64_t>::max();
        constexpr auto min = std::numeric_limits<std::int64_t>::min();
        EXPECT_EQ(format({max - 1, max}), "9223372036854775806-9223372036854775807");
        EXPECT_EQ(format({min, min + 1, max}), "-9223372036854775808--9223372036854775807,9223372036854775807");
        EXPECT_EQ(format({min, max}), "-9223372036854775808,9223372036854775807");
    }

    TEST_F(FormatterTests, CustomDelimiters)
    {
        EXPECT_EQ(format({1, 2, 3, 5}, {.delimiter = ";", .rangeDelimiter = ".."}), "1..3;5");
    }

    TEST_F(FormatterTests, DelimiterSpace)
    {
        EXPECT_EQ(format({1, 3, 4}, {.delimiterSpace = true}), "1, 3-4");
        EXPECT_EQ(format({1}, {.delimiterSpace = true}), "1");
    }

    TEST_F(FormatterTests, SetOverloadMatchesVectorOverload)
    {
        EXPECT_EQ(formatIntegerList(IntegerSet{10, 11, 1, 3}), format({10, 11, 1, 3}));
    }

    TEST_F(FormatterTests, BoundPairsAreMergedAndSorted)
    {
        EXPECT_EQ(formatBoundPairs({{10, 11}, {1, 1}, {5, 8}, {3, 3}, {15, 15}}), "1,3,5-8,10-11,15");
        EXPECT_EQ(formatBoundPairs({{1, 4}, {5, 6}, {3, 9}}), "1-9");
        EXPECT_EQ(formatBoundPairs({}), "");
    }
}
