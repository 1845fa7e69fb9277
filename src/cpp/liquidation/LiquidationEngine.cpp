/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/liquidation/LiquidationEngine.hpp"

#include "lendora/common/fixed_point.hpp"
#include "lendora/loan/LoanManager.hpp"
#include "lendora/logging/logging.hpp"

#include <algorithm>
#include <limits>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendora::liquidation
{

//-------------------------------------------------------------------------

LiquidationEngine::LiquidationEngine(
    collateral::CollateralLedger::Ptr ledger, config::ConfigRegistry::Ptr config)
    : m_ledger{std::move(ledger)},
      m_config{std::move(config)},
      m_logger{logging::componentLogger("LiquidationEngine")}
{
    if (!m_ledger || !m_config) {
        throw std::invalid_argument{fmt::format(
            "{}: ledger and config are required",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

Expected<LiquidationDecision> LiquidationEngine::evaluate(
    const loan::Loan& loan, Timestamp now) const
{
    if (loan.status() != loan::LoanStatus::ACTIVE) {
        return NoLiquidation{};
    }

    const auto pledge = m_ledger->pledge(loan.id());
    if (!pledge) {
        return Unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    const auto price = m_ledger->freshPrice(loan.collateralAsset(), now);
    if (!price) {
        return Unexpected{price.error()};
    }
    const uint32_t decimals = m_ledger->priceDecimals();
    const auto value = util::collateralValue(pledge->amount, price->price, decimals);
    if (!value) {
        return Unexpected{value.error()};
    }
    const Bps ratio = util::ratioBps(*value, loan.outstandingPrincipal());

    const auto params = m_config->parameters().liquidation;
    if (ratio >= params.threshold) {
        return NoLiquidation{.ratio = ratio};
    }

    // Collateral needed to cover the full balance plus the bonus; anything
    // that does not fit in 64 bits exceeds any pledge.
    const Amount required =
        util::mulDivUp(loan.outstanding(), kBpsScale + params.bonus, kBpsScale)
            .and_then([&](Amount debtWithBonus) {
                return util::collateralForValue(debtWithBonus, price->price, decimals);
            })
            .value_or(std::numeric_limits<Amount>::max());

    const Amount seize = std::min(pledge->amount, required);
    const Amount bonus = util::applyBps(seize, params.bonus);
    LiquidationPlan plan{
        .seizeAmount = seize,
        .bonusAmount = bonus,
        .lenderAmount = seize - bonus,
        .borrowerRemainder = pledge->amount - seize,
        .triggeringRatio = ratio,
        .price = price->price
    };
    m_logger->debug("LOAN {} ELIGIBLE AT {}: {}", loan.id(), ratio, plan);
    return plan;
}

//-------------------------------------------------------------------------

Expected<LiquidationPlan> LiquidationEngine::settleDefault(
    const loan::Loan& loan, Timestamp now) const
{
    if (loan.status() != loan::LoanStatus::ACTIVE) {
        return Unexpected{ErrorCode::LOAN_NOT_ACTIVE};
    }
    const auto pledge = m_ledger->pledge(loan.id());
    if (!pledge) {
        return Unexpected{ErrorCode::LOAN_NOT_FOUND};
    }

    // Without a usable price the lender's share is unknown; nothing moves.
    const auto price = m_ledger->freshPrice(loan.collateralAsset(), now);
    if (!price) {
        m_logger->warn("LOAN {} : NO DEFAULT PLAN WITHOUT PRICE ({})", loan.id(), price.error());
        return Unexpected{price.error()};
    }

    const uint32_t decimals = m_ledger->priceDecimals();
    const Amount owed = util::collateralForValue(loan.outstanding(), price->price, decimals)
        .value_or(std::numeric_limits<Amount>::max());
    const Amount lender = std::min(pledge->amount, owed);
    const Bps ratio = util::collateralValue(pledge->amount, price->price, decimals)
        .transform([&](Amount value) { return util::ratioBps(value, loan.outstandingPrincipal()); })
        .value_or(kMaxRatioBps);

    return LiquidationPlan{
        .seizeAmount = lender,
        .bonusAmount = 0,
        .lenderAmount = lender,
        .borrowerRemainder = pledge->amount - lender,
        .triggeringRatio = ratio,
        .price = price->price
    };
}

//-------------------------------------------------------------------------

void LiquidationEngine::registerManager(loan::LoanManager& manager) noexcept
{
    m_manager.store(&manager);
}

//-------------------------------------------------------------------------

void LiquidationEngine::unregisterManager(loan::LoanManager& manager) noexcept
{
    loan::LoanManager* expected = &manager;
    m_manager.compare_exchange_strong(expected, nullptr);
}

//-------------------------------------------------------------------------

SweepReport LiquidationEngine::sweep(const AccountId& liquidator)
{
    auto* manager = m_manager.load();
    if (manager == nullptr) {
        throw std::logic_error{fmt::format(
            "{}: no LoanManager registered", std::source_location::current().function_name())};
    }

    SweepReport report;
    for (const LoanId loanId : manager->activeLoanIds()) {
        ++report.checked;
        const auto decision = manager->checkHealth(loanId, liquidator);
        if (!decision) {
            // Lost a race; the loan is no longer Active.
            if (decision.error() != ErrorCode::LOAN_NOT_ACTIVE) {
                ++report.failed;
                m_logger->warn("SWEEP: LOAN {} CHECK FAILED: {}", loanId, decision.error());
            }
            continue;
        }
        if (isEligible(*decision)) {
            ++report.liquidated;
        }
    }
    m_logger->info("SWEEP BY {}: {}", liquidator, report);
    return report;
}

//-------------------------------------------------------------------------

}  // namespace lendora::liquidation

//-------------------------------------------------------------------------
