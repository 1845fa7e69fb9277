/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/collateral/LedgerTransaction.hpp"

#include "lendora/logging/logging.hpp"

//-------------------------------------------------------------------------

namespace lendora::collateral
{

//-------------------------------------------------------------------------

LedgerTransaction::~LedgerTransaction() noexcept
{
    if (!pending()) return;

    if (const auto refunded = m_ledger.refund(m_access, m_loanId); !refunded) {
        logging::componentLogger("CollateralLedger")->critical(
            "ROLLBACK OF LOAN {} FAILED: {}", m_loanId, refunded.error());
    }
    else {
        logging::componentLogger("CollateralLedger")->info(
            "ROLLED BACK LOAN {} COLLATERAL, REFUNDED {}", m_loanId, *refunded);
    }
}

//-------------------------------------------------------------------------

Expected<void> LedgerTransaction::postAndPledge(
    const AccountId& borrower, const AssetId& asset, Amount amount, Amount outstanding)
{
    if (m_armed) {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }
    auto res = m_ledger.postAndPledge(m_access, borrower, asset, m_loanId, amount, outstanding);
    m_armed = res.has_value();
    return res;
}

//-------------------------------------------------------------------------

Expected<void> LedgerTransaction::commit()
{
    if (!pending()) {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }
    auto res = m_ledger.activatePledge(m_access, m_loanId);
    m_committed = res.has_value();
    return res;
}

//-------------------------------------------------------------------------

}  // namespace lendora::collateral

//-------------------------------------------------------------------------
