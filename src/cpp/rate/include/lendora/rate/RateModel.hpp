/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/ErrorCode.hpp"
#include "lendora/common/types.hpp"

//-------------------------------------------------------------------------

namespace lendora::rate
{

//-------------------------------------------------------------------------

inline constexpr Bps MIN_RATE = 100;
inline constexpr Bps MAX_RATE = 5000;
inline constexpr Bps MAX_RISK_PREMIUM_MULTIPLIER = 10'000;

inline constexpr Bps kPremiumTierRatio = 20'000;
inline constexpr Bps kStandardTierRatio = 15'000;
inline constexpr Bps kElevatedTierRatio = 12'000;

inline constexpr Bps kPremiumDiscount = 50;
inline constexpr Bps kElevatedSurcharge = 100;
inline constexpr Bps kHighRiskSurcharge = 200;
inline constexpr Bps kIneligibleSurcharge = 150;

//-------------------------------------------------------------------------

struct RateModelParams
{
    Bps baseRate = 500;
    // Carried and audited but not applied to the tiers.
    Bps riskPremiumMultiplier = 1000;

    [[nodiscard]] bool operator==(const RateModelParams&) const noexcept = default;
};

[[nodiscard]] Expected<RateModelParams> validateRateModelParams(const RateModelParams& params) noexcept;

//-------------------------------------------------------------------------

[[nodiscard]] Bps tierAdjustedRate(Bps collateralRatioBps, Bps baseRate) noexcept;

[[nodiscard]] Bps computeRate(
    Bps collateralRatioBps, bool creditEligible, const RateModelParams& params) noexcept;

[[nodiscard]] Expected<Amount> computeTotalInterest(
    Amount principal, Bps rateBps, uint32_t termMonths) noexcept;

//-------------------------------------------------------------------------

}  // namespace lendora::rate

//-------------------------------------------------------------------------
