/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>
#include <limits>
#include <string>

//-------------------------------------------------------------------------

namespace lendora
{

//-------------------------------------------------------------------------

using Amount = uint64_t;
using Price = uint64_t;
using Bps = uint32_t;
using Timestamp = uint64_t;
using LoanId = uint64_t;
using AccountId = std::string;
using AssetId = std::string;

inline constexpr Bps kBpsScale = 10'000;
inline constexpr Bps kMaxRatioBps = std::numeric_limits<Bps>::max();
inline constexpr uint32_t kMonthsPerYear = 12;
inline constexpr Timestamp kSecondsPerMonth = 30 * 24 * 60 * 60;
inline constexpr uint32_t kDefaultPriceDecimals = 8;
inline constexpr LoanId LOAN_ID_INVALID = 0;

//-------------------------------------------------------------------------

}  // namespace lendora

//-------------------------------------------------------------------------
