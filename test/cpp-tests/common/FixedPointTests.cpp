/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/common/fixed_point.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

//-------------------------------------------------------------------------

using namespace lendora;
using namespace lendora::util;

using namespace testing;

//-------------------------------------------------------------------------

TEST(FixedPointTests, MulDivTruncatesAndMulDivUpRoundsUp)
{
    EXPECT_EQ(mulDiv(10, 10, 3), 33);
    EXPECT_EQ(mulDivUp(10, 10, 3), 34);
    EXPECT_EQ(mulDivUp(10, 10, 5), 20);
    EXPECT_EQ(mulDiv(1, 1, 0).error(), ErrorCode::INVALID_PARAMETER);
}

//-------------------------------------------------------------------------

TEST(FixedPointTests, IntermediateProductsDoNotOverflow)
{
    constexpr uint64_t big = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(mulDiv(big, 10'000, 10'000), big);
    EXPECT_EQ(mulDiv(big, 2, 1).error(), ErrorCode::ARITHMETIC_OVERFLOW);
}

//-------------------------------------------------------------------------

TEST(FixedPointTests, Pow10)
{
    EXPECT_EQ(pow10(0), 1);
    EXPECT_EQ(pow10(8), 100'000'000);
    EXPECT_EQ(pow10(19), 10'000'000'000'000'000'000ull);
    EXPECT_EQ(pow10(20).error(), ErrorCode::ARITHMETIC_OVERFLOW);
}

//-------------------------------------------------------------------------

TEST(FixedPointTests, CollateralValue)
{
    // 1.5 units at 2000.00000000
    EXPECT_EQ(collateralValue(150, 200'000'000'000, 8), 300'000);
    EXPECT_EQ(collateralValue(3, 33'333'333, 8), 0);
}

//-------------------------------------------------------------------------

TEST(FixedPointTests, RatioBps)
{
    EXPECT_EQ(ratioBps(150'000, 100'000), 15'000);
    EXPECT_EQ(ratioBps(114'999, 100'000), 11'499);
    EXPECT_EQ(ratioBps(1, 0), kMaxRatioBps);
    EXPECT_EQ(ratioBps(std::numeric_limits<Amount>::max(), 1), kMaxRatioBps);
}

//-------------------------------------------------------------------------

TEST(FixedPointTests, CollateralForValueRoundsUp)
{
    EXPECT_EQ(collateralForValue(100, 100'000'000, 8), 100);
    EXPECT_EQ(collateralForValue(100, 300'000'000, 8), 34);
    EXPECT_EQ(collateralForValue(100, 0, 8).error(), ErrorCode::PRICE_UNAVAILABLE);
}

//-------------------------------------------------------------------------

TEST(FixedPointTests, ApplyBps)
{
    EXPECT_EQ(applyBps(190'827, 500), 9'541);
    EXPECT_EQ(applyBps(std::numeric_limits<Amount>::max(), kBpsScale),
        std::numeric_limits<Amount>::max());
}

//-------------------------------------------------------------------------
