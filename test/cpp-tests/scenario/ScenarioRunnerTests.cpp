/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/common/ProtocolException.hpp"
#include "lendora/scenario/ScenarioRunner.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <pugixml.hpp>

#include <filesystem>
#include <stdexcept>

//-------------------------------------------------------------------------

using namespace lendora;
using namespace lendora::scenario;

using namespace testing;

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace
{

const fs::path kDataDir{LENDORA_TEST_DATA_DIR};

void PrintFailures(const ScenarioReport& report)
{
    for (const auto& step : report.steps) {
        if (!step.passed) {
            ADD_FAILURE() << fmt::format("{}", step);
        }
    }
}

ScenarioReport runInline(ScenarioRunner& runner, const char* xml)
{
    pugi::xml_document doc;
    if (!doc.load_string(xml)) {
        throw std::runtime_error{"malformed scenario"};
    }
    return runner.run(doc.child("Scenario"));
}

}  // namespace

//-------------------------------------------------------------------------

TEST(ScenarioRunnerTests, LifecycleScenarioPasses)
{
    ScenarioRunner runner{config::loadProtocolConfig(kDataDir / "protocol.xml")};
    const auto report = runner.runFile(kDataDir / "scenario-lifecycle.xml");
    PrintFailures(report);
    EXPECT_TRUE(report.passed());
    EXPECT_THAT(report.steps, SizeIs(Gt(20)));
    EXPECT_EQ(runner.clock().now(), 1'700'000'000 + kSecondsPerMonth);
}

//-------------------------------------------------------------------------

TEST(ScenarioRunnerTests, LiquidationScenarioPasses)
{
    ScenarioRunner runner{config::loadProtocolConfig(kDataDir / "protocol.xml")};
    const auto report = runner.runFile(kDataDir / "scenario-liquidation.xml");
    PrintFailures(report);
    EXPECT_TRUE(report.passed());

    const auto history = runner.protocol().manager().liquidationHistory();
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history[0].seizedAmount, 190'827);
    EXPECT_EQ(history[0].liquidator, "keeper");
}

//-------------------------------------------------------------------------

TEST(ScenarioRunnerTests, MismatchedExpectationIsReported)
{
    ScenarioRunner runner{config::ProtocolConfig{}, 1'000};
    const auto report = runInline(runner, R"(
        <Scenario>
          <Post borrower="alice" asset="ETH" amount="10" expect="OK"/>
          <Withdraw borrower="alice" asset="ETH" amount="11" expect="OK"/>
          <Free borrower="alice" asset="ETH" expect="10"/>
        </Scenario>)");

    ASSERT_EQ(report.steps.size(), 3);
    EXPECT_EQ(report.failures(), 1);
    EXPECT_FALSE(report.passed());
    EXPECT_EQ(report.steps[1].outcome, "INSUFFICIENT_COLLATERAL");
    EXPECT_EQ(report.steps[1].index, 2);
    EXPECT_FALSE(report.steps[1].passed);
    EXPECT_EQ(
        fmt::format("{}", report.steps[1]),
        "#2 Withdraw -> INSUFFICIENT_COLLATERAL (expected OK)");
}

//-------------------------------------------------------------------------

TEST(ScenarioRunnerTests, LiquidationParametersCanBeChanged)
{
    ScenarioRunner runner{config::ProtocolConfig{}, 1'000};
    const auto report = runInline(runner, R"(
        <Scenario>
          <Admin caller="admin" set="liquidation" threshold="13000" bonus="800" expect="OK"/>
          <Admin caller="admin" set="liquidation" threshold="16000" bonus="800" expect="INVALID_PARAMETER"/>
          <Admin caller="admin" set="riskPremiumMultiplier" value="2000" expect="OK"/>
        </Scenario>)");
    PrintFailures(report);
    EXPECT_TRUE(report.passed());

    const auto params = runner.protocol().registry().parameters();
    EXPECT_EQ(params.liquidation.threshold, 13'000);
    EXPECT_EQ(params.liquidation.bonus, 800);
    EXPECT_EQ(params.rateModel.riskPremiumMultiplier, 2'000);
    EXPECT_EQ(runner.protocol().registry().version(), 3);
}

//-------------------------------------------------------------------------

TEST(ScenarioRunnerTests, UnknownActionThrows)
{
    ScenarioRunner runner{config::ProtocolConfig{}};
    EXPECT_THROW(
        static_cast<void>(runInline(runner, R"(<Scenario><Teleport/></Scenario>)")),
        std::invalid_argument);
    EXPECT_THROW(
        static_cast<void>(runInline(runner, R"(<Scenario><Post asset="ETH" amount="1"/></Scenario>)")),
        std::invalid_argument);
    EXPECT_THROW(
        static_cast<void>(runner.runFile(kDataDir / "protocol.xml")), ProtocolException);
}

//-------------------------------------------------------------------------
