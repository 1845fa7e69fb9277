/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/collateral/CollateralLedger.hpp"

//-------------------------------------------------------------------------

namespace lendora::collateral
{

//-------------------------------------------------------------------------

/**
 * Scope guard over the collateral a loan origination posts. Unless
 * committed, the posted and pledged amount is refunded on scope exit.
 */
class LedgerTransaction
{
public:
    LedgerTransaction(CollateralLedger& ledger, const LedgerAccess& access, LoanId loanId) noexcept
        : m_ledger{ledger}, m_access{access}, m_loanId{loanId}
    {}

    ~LedgerTransaction() noexcept;

    LedgerTransaction(const LedgerTransaction&) = delete;
    LedgerTransaction& operator=(const LedgerTransaction&) = delete;

    Expected<void> postAndPledge(
        const AccountId& borrower, const AssetId& asset, Amount amount, Amount outstanding);

    Expected<void> commit();

    [[nodiscard]] bool pending() const noexcept { return m_armed && !m_committed; }

private:
    CollateralLedger& m_ledger;
    LedgerAccess m_access;
    LoanId m_loanId;
    bool m_armed{};
    bool m_committed{};
};

//-------------------------------------------------------------------------

}  // namespace lendora::collateral

//-------------------------------------------------------------------------
