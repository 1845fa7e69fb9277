/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/liquidation/LiquidationEngine.hpp"
#include "test-common/TestProtocol.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>

//-------------------------------------------------------------------------

using namespace lendora;
using namespace lendora::liquidation;
using namespace lendora::test;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

// 200'000 units against 100'000 principal sits at 11'500 at this price.
constexpr Price kCrashPrice = 57'500'000;
// 12'500, above the default threshold.
constexpr Price kDipPrice = 62'500'000;

auto IsPlan(Amount seize, Amount bonus, Amount lender, Amount remainder)
{
    return AllOf(
        Field("seizeAmount", &LiquidationPlan::seizeAmount, seize),
        Field("bonusAmount", &LiquidationPlan::bonusAmount, bonus),
        Field("lenderAmount", &LiquidationPlan::lenderAmount, lender),
        Field("borrowerRemainder", &LiquidationPlan::borrowerRemainder, remainder));
}

struct LiquidationEngineTest : Test
{
    TestProtocol fixture;
    LiquidationEngine& engine = fixture.instance->engine();

    void SetUp() override { fixture.setPrice(kParPrice); }

    loan::Loan originate(const AccountId& borrower, Amount principal, Amount collateral)
    {
        const auto loanId = fixture.manager().originate(
            fixture.request(borrower, principal, collateral));
        if (!loanId) {
            throw std::runtime_error{fmt::format("origination failed: {}", loanId.error())};
        }
        return fixture.manager().loan(*loanId).value();
    }
};

}  // namespace

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, HealthyLoanReportsRatio)
{
    const auto loan = originate("alice", 100'000, 200'000);
    ASSERT_EQ(loan.outstanding(), 104'500);

    auto decision = engine.evaluate(loan, kStart);
    ASSERT_TRUE(decision.has_value());
    ASSERT_FALSE(isEligible(*decision));
    EXPECT_THAT(std::get<NoLiquidation>(*decision).ratio, Optional(20'000));

    fixture.setPrice(kDipPrice);
    decision = engine.evaluate(loan, kStart);
    ASSERT_TRUE(decision.has_value());
    ASSERT_FALSE(isEligible(*decision));
    EXPECT_THAT(std::get<NoLiquidation>(*decision).ratio, Optional(12'500));
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, UndercollateralizedLoanGetsPlan)
{
    const auto loan = originate("alice", 100'000, 200'000);
    fixture.setPrice(kCrashPrice);

    const auto decision = engine.evaluate(loan, kStart);
    ASSERT_TRUE(decision.has_value());
    ASSERT_TRUE(isEligible(*decision));
    const auto& plan = std::get<LiquidationPlan>(*decision);
    // ceil(104'500 * 1.05) = 109'725 of value is ceil(190'826.08) units.
    EXPECT_THAT(plan, IsPlan(190'827, 9'541, 181'286, 9'173));
    EXPECT_EQ(plan.triggeringRatio, 11'500);
    EXPECT_EQ(plan.price, kCrashPrice);
    EXPECT_EQ(plan.seizeAmount + plan.borrowerRemainder, 200'000);
    EXPECT_EQ(plan.bonusAmount + plan.lenderAmount, plan.seizeAmount);
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, SeizureCappedAtPledge)
{
    const auto loan = originate("alice", 100'000, 200'000);
    fixture.setPrice(kParPrice / 10);

    const auto decision = engine.evaluate(loan, kStart);
    ASSERT_TRUE(decision.has_value());
    ASSERT_TRUE(isEligible(*decision));
    EXPECT_THAT(std::get<LiquidationPlan>(*decision), IsPlan(200'000, 10'000, 190'000, 0));
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, ThresholdFollowsConfig)
{
    const auto loan = originate("alice", 100'000, 200'000);
    fixture.setPrice(kDipPrice);
    ASSERT_TRUE(fixture.manager().setLiquidationParams("admin", 13'000, 1'000));

    const auto decision = engine.evaluate(loan, kStart);
    ASSERT_TRUE(decision.has_value());
    ASSERT_TRUE(isEligible(*decision));
    const auto& plan = std::get<LiquidationPlan>(*decision);
    // ceil(104'500 * 1.10) = 114'950 at 0.625 is 183'920 units.
    EXPECT_THAT(plan, IsPlan(183'920, 18'392, 165'528, 16'080));
    EXPECT_EQ(plan.triggeringRatio, 12'500);
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, StalePriceFailsClosed)
{
    const auto loan = originate("alice", 100'000, 200'000);
    const Timestamp later = kStart + fixture.ledger().priceFreshness() + 1;
    EXPECT_EQ(engine.evaluate(loan, later).error(), ErrorCode::STALE_PRICE);
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, InactiveLoanIsNeverEligible)
{
    const loan::Loan pending{};
    const auto decision = engine.evaluate(pending, kStart);
    ASSERT_TRUE(decision.has_value());
    ASSERT_FALSE(isEligible(*decision));
    EXPECT_FALSE(std::get<NoLiquidation>(*decision).ratio.has_value());
    EXPECT_EQ(engine.settleDefault(pending, kStart).error(), ErrorCode::LOAN_NOT_ACTIVE);
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, DefaultMakesLenderWholeWithoutBonus)
{
    const auto loan = originate("alice", 100'000, 200'000);
    const auto plan = engine.settleDefault(loan, kStart);
    ASSERT_TRUE(plan.has_value());
    EXPECT_THAT(*plan, IsPlan(104'500, 0, 104'500, 95'500));
    EXPECT_EQ(plan->triggeringRatio, 20'000);
    EXPECT_EQ(plan->price, kParPrice);
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, DefaultWithoutPriceIsDeferred)
{
    const auto loan = originate("alice", 100'000, 200'000);
    const Timestamp later = kStart + fixture.ledger().priceFreshness() + 1;
    const auto plan = engine.settleDefault(loan, later);
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error(), ErrorCode::STALE_PRICE);
    EXPECT_TRUE(isRetryable(plan.error()));
    EXPECT_EQ(fixture.ledger().pledge(loan.id())->amount, 200'000);
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, SweepLiquidatesOnlyUnhealthyLoans)
{
    static_cast<void>(originate("alice", 100'000, 200'000));
    static_cast<void>(originate("bob", 100'000, 300'000));
    fixture.setPrice(kCrashPrice);

    auto report = engine.sweep("keeper");
    EXPECT_EQ(report.checked, 2);
    EXPECT_EQ(report.liquidated, 1);
    EXPECT_EQ(report.failed, 0);

    report = engine.sweep("keeper");
    EXPECT_EQ(report.checked, 1);
    EXPECT_EQ(report.liquidated, 0);

    const auto history = fixture.manager().liquidationHistory();
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history[0].borrower, "alice");
    EXPECT_EQ(history[0].liquidator, "keeper");
}

//-------------------------------------------------------------------------

TEST_F(LiquidationEngineTest, SweepCountsFailures)
{
    static_cast<void>(originate("alice", 100'000, 200'000));
    fixture.clock->advance(fixture.ledger().priceFreshness() + 1);

    const auto report = engine.sweep("keeper");
    EXPECT_EQ(report.checked, 1);
    EXPECT_EQ(report.liquidated, 0);
    EXPECT_EQ(report.failed, 1);
}

//-------------------------------------------------------------------------

TEST(LiquidationEngineTests, SweepNeedsManager)
{
    auto clock = std::make_shared<ManualClock>(kStart);
    auto registry = std::make_shared<config::ConfigRegistry>(
        "admin", config::ProtocolParameters{}, clock);
    auto ledger = std::make_shared<collateral::CollateralLedger>(collateral::CollateralLedgerDesc{
        .oracle = std::make_shared<oracle::ManualPriceOracle>(),
        .executor = std::make_shared<BoundedExecutor>(1),
        .config = registry,
        .clock = clock
    });
    LiquidationEngine engine{ledger, registry};
    EXPECT_FALSE(engine.hasManager());
    EXPECT_THROW(static_cast<void>(engine.sweep("keeper")), std::logic_error);
    EXPECT_THROW(LiquidationEngine(nullptr, registry), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(LiquidationEngineTests, ManagerUnregistersOnDestruction)
{
    auto clock = std::make_shared<ManualClock>(kStart);
    auto registry = std::make_shared<config::ConfigRegistry>(
        "admin", config::ProtocolParameters{}, clock);
    auto executor = std::make_shared<BoundedExecutor>(2);
    auto ledger = std::make_shared<collateral::CollateralLedger>(collateral::CollateralLedgerDesc{
        .oracle = std::make_shared<oracle::ManualPriceOracle>(),
        .executor = executor,
        .config = registry,
        .clock = clock
    });
    auto engine = std::make_shared<LiquidationEngine>(ledger, registry);
    const loan::LoanManagerDesc desc{
        .config = registry,
        .ledger = ledger,
        .creditGate = std::make_shared<credit::CreditGate>(
            std::make_shared<credit::AttestationRegistry>(), executor, std::chrono::milliseconds{250}),
        .engine = engine,
        .clock = clock
    };

    auto manager = std::make_unique<loan::LoanManager>(desc);
    ASSERT_TRUE(engine->hasManager());
    EXPECT_EQ(engine->sweep("keeper").checked, 0);

    manager.reset();
    EXPECT_FALSE(engine->hasManager());
    EXPECT_THROW(static_cast<void>(engine->sweep("keeper")), std::logic_error);

    // Destroying a replaced manager leaves its successor registered.
    auto first = std::make_unique<loan::LoanManager>(desc);
    const loan::LoanManager second{desc};
    first.reset();
    EXPECT_TRUE(engine->hasManager());
}

//-------------------------------------------------------------------------
