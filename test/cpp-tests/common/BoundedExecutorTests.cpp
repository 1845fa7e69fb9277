/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/common/BoundedExecutor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

//-------------------------------------------------------------------------

using namespace lendora;
using namespace std::chrono_literals;

using namespace testing;

//-------------------------------------------------------------------------

TEST(BoundedExecutorTests, ReturnsResultWithinDeadline)
{
    BoundedExecutor executor{1};
    EXPECT_THAT(executor.run([] { return 42; }, 1s), Optional(42));
}

//-------------------------------------------------------------------------

TEST(BoundedExecutorTests, EmptyOnTimeout)
{
    BoundedExecutor executor{1};
    const auto res = executor.run(
        [] {
            std::this_thread::sleep_for(100ms);
            return 1;
        },
        5ms);
    EXPECT_FALSE(res.has_value());
}

//-------------------------------------------------------------------------

TEST(BoundedExecutorTests, RethrowsFromCall)
{
    BoundedExecutor executor{1};
    EXPECT_THROW(
        static_cast<void>(executor.run([]() -> int { throw std::runtime_error{"feed down"}; }, 1s)),
        std::runtime_error);
}

//-------------------------------------------------------------------------
