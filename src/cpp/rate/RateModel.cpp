/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/rate/RateModel.hpp"

#include "lendora/common/fixed_point.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace lendora::rate
{

//-------------------------------------------------------------------------

Expected<RateModelParams> validateRateModelParams(const RateModelParams& params) noexcept
{
    if (params.baseRate < MIN_RATE || params.baseRate > MAX_RATE) {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }
    if (params.riskPremiumMultiplier > MAX_RISK_PREMIUM_MULTIPLIER) {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }
    return params;
}

//-------------------------------------------------------------------------

Bps tierAdjustedRate(Bps collateralRatioBps, Bps baseRate) noexcept
{
    if (collateralRatioBps >= kPremiumTierRatio) {
        return baseRate > kPremiumDiscount ? baseRate - kPremiumDiscount : baseRate;
    }
    if (collateralRatioBps >= kStandardTierRatio) {
        return baseRate;
    }
    if (collateralRatioBps >= kElevatedTierRatio) {
        return baseRate + kElevatedSurcharge;
    }
    return baseRate + kHighRiskSurcharge;
}

//-------------------------------------------------------------------------

Bps computeRate(
    Bps collateralRatioBps, bool creditEligible, const RateModelParams& params) noexcept
{
    Bps rate = tierAdjustedRate(collateralRatioBps, params.baseRate);
    if (!creditEligible) {
        rate += kIneligibleSurcharge;
    }
    return std::clamp(rate, MIN_RATE, MAX_RATE);
}

//-------------------------------------------------------------------------

Expected<Amount> computeTotalInterest(
    Amount principal, Bps rateBps, uint32_t termMonths) noexcept
{
    const util::wide_t numerator = util::wide_t{principal} * rateBps * termMonths;
    return util::narrow(numerator / (util::wide_t{kBpsScale} * kMonthsPerYear));
}

//-------------------------------------------------------------------------

}  // namespace lendora::rate

//-------------------------------------------------------------------------
