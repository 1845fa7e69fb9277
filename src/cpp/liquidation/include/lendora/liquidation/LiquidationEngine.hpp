/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/collateral/CollateralLedger.hpp"
#include "lendora/config/ConfigRegistry.hpp"
#include "lendora/liquidation/LiquidationEvent.hpp"
#include "lendora/loan/Loan.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstddef>
#include <memory>

//-------------------------------------------------------------------------

namespace lendora::loan
{
class LoanManager;
}  // namespace lendora::loan

namespace lendora::liquidation
{

//-------------------------------------------------------------------------

struct SweepReport
{
    size_t checked{};
    size_t liquidated{};
    // Loans whose check failed with an error, e.g. a stale price.
    size_t failed{};
};

//-------------------------------------------------------------------------

/**
 * Decides whether an Active loan is liquidatable and how its pledged
 * collateral is split. Holds no loan state; LoanManager applies decisions.
 */
class LiquidationEngine
{
public:
    using Ptr = std::shared_ptr<LiquidationEngine>;

    LiquidationEngine(collateral::CollateralLedger::Ptr ledger, config::ConfigRegistry::Ptr config);

    [[nodiscard]] Expected<LiquidationDecision> evaluate(
        const loan::Loan& loan, Timestamp now) const;

    // Seizure of a matured loan: no bonus, lender made whole first. Fails
    // with the price error when no fresh price is available.
    [[nodiscard]] Expected<LiquidationPlan> settleDefault(
        const loan::Loan& loan, Timestamp now) const;

    void registerManager(loan::LoanManager& manager) noexcept;
    // Clears the registration if `manager` is the one registered.
    void unregisterManager(loan::LoanManager& manager) noexcept;
    [[nodiscard]] bool hasManager() const noexcept { return m_manager.load() != nullptr; }

    // Runs checkHealth on every Active loan of the registered manager.
    SweepReport sweep(const AccountId& liquidator);

private:
    collateral::CollateralLedger::Ptr m_ledger;
    config::ConfigRegistry::Ptr m_config;
    std::atomic<loan::LoanManager*> m_manager{};
    std::shared_ptr<spdlog::logger> m_logger;
};

//-------------------------------------------------------------------------

}  // namespace lendora::liquidation

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendora::liquidation::SweepReport>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendora::liquidation::SweepReport& report, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "SweepReport{{.checked = {}, .liquidated = {}, .failed = {}}}",
            report.checked,
            report.liquidated,
            report.failed);
    }
};

//-------------------------------------------------------------------------
