#pragma once

#include "util/leaf_capture.hpp"

#include <ranger/range_tupleizer.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace Ranger::Tests
{
    class TupleizerTests : public ::testing::Test
    {
      public:
        std::vector<BoundPair> toPairs(std::string_view rangeString, Notation const& notation = {}) const
        {
            return boundPairsFromIntegerList(rangeString, notation).value();
        }
    };

    using ::testing::ElementsAre;

    TEST_F(TupleizerTests, CanonicalInputGivesOnePairPerToken)
    {
        EXPECT_THAT(
            toPairs("1,3,5-8,10-11,15"),
            ElementsAre(BoundPair{1, 1}, BoundPair{3, 3}, BoundPair{5, 8}, BoundPair{10, 11}, BoundPair{15, 15}));
    }

    TEST_F(TupleizerTests, EmptyInputGivesNoPairs)
    {
        EXPECT_TRUE(toPairs("").empty());
        EXPECT_TRUE(toPairs("  ").empty());
    }

    TEST_F(TupleizerTests, MessyInputIsNormalized)
    {
        EXPECT_THAT(toPairs("5,3,1-2"), ElementsAre(BoundPair{1, 3}, BoundPair{5, 5}));
        EXPECT_THAT(toPairs("9-7,1,1,2"), ElementsAre(BoundPair{1, 2}, BoundPair{7, 9}));
    }

    TEST_F(TupleizerTests, NegativeRuns)
    {
        EXPECT_THAT(toPairs("-1,-3--2,4"), ElementsAre(BoundPair{-3, -1}, BoundPair{4, 4}));
    }

    TEST_F(TupleizerTests, CustomNotationAndDelimiterSpace)
    {
        EXPECT_THAT(
            toPairs("7; 1:3", {.delimiter = ";", .rangeDelimiter = ":", .delimiterSpace = true}),
            ElementsAre(BoundPair{1, 3}, BoundPair{7, 7}));
    }

    TEST_F(TupleizerTests, PairsReportTheirSize)
    {
        const auto pairs = toPairs("1,3-7");
        ASSERT_EQ(pairs.size(), 2u);
        EXPECT_EQ(pairs[0].size(), 1u);
        EXPECT_TRUE(pairs[0].isSingleton());
        EXPECT_EQ(pairs[1].size(), 5u);
        EXPECT_EQ(pairs[1].toString(), "3-7");
        EXPECT_EQ(pairs[1].toString(".."), "3..7");
    }

    TEST_F(TupleizerTests, RangeDelimiterContainingDelimiterIsRejectedUpFront)
    {
        const auto error = captureError<InvalidNotation>([]() {
            return boundPairsFromIntegerList("1,2,3,5", {.delimiter = ",", .rangeDelimiter = ",,"});
        });
        EXPECT_TRUE(error);
    }

    TEST_F(TupleizerTests, MultiCharacterDelimitersSurviveNormalization)
    {
        EXPECT_THAT(
            toPairs("5||1..3||2", {.delimiter = "||", .rangeDelimiter = ".."}),
            ElementsAre(BoundPair{1, 3}, BoundPair{5, 5}));
    }

    TEST_F(TupleizerTests, ParseErrorsArePropagated)
    {
        const auto error = captureMalformedToken([]() {
            return boundPairsFromIntegerList("1-2-3");
        });
        ASSERT_TRUE(error);
        EXPECT_EQ(error->token, "1-2-3");
    }
}
