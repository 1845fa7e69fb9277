/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/collateral/CollateralLedger.hpp"
#include "lendora/common/ErrorCode.hpp"
#include "lendora/liquidation/LiquidationEvent.hpp"
#include "lendora/loan/Loan.hpp"

#include <ostream>

//-------------------------------------------------------------------------

namespace lendora
{

inline void PrintTo(ErrorCode ec, std::ostream* os)
{
    *os << fmt::format("{}", ec);
}

}  // namespace lendora

namespace lendora::collateral
{

inline void PrintTo(CollateralEntryKind kind, std::ostream* os)
{
    *os << magic_enum::enum_name(kind);
}

inline void PrintTo(PledgeState state, std::ostream* os)
{
    *os << magic_enum::enum_name(state);
}

}  // namespace lendora::collateral

namespace lendora::loan
{

inline void PrintTo(LoanStatus status, std::ostream* os)
{
    *os << fmt::format("{}", status);
}

inline void PrintTo(const Repayment& repayment, std::ostream* os)
{
    *os << fmt::format("{}", repayment);
}

}  // namespace lendora::loan

namespace lendora::liquidation
{

inline void PrintTo(const LiquidationPlan& plan, std::ostream* os)
{
    *os << fmt::format("{}", plan);
}

}  // namespace lendora::liquidation

//-------------------------------------------------------------------------
