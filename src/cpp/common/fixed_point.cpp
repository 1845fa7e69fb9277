/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/common/fixed_point.hpp"

#include <limits>

//-------------------------------------------------------------------------

namespace lendora::util
{

//-------------------------------------------------------------------------

Expected<uint64_t> narrow(const wide_t& val) noexcept
{
    if (val > wide_t{std::numeric_limits<uint64_t>::max()}) [[unlikely]] {
        return Unexpected{ErrorCode::ARITHMETIC_OVERFLOW};
    }
    return static_cast<uint64_t>(val);
}

//-------------------------------------------------------------------------

Expected<uint64_t> mulDiv(uint64_t a, uint64_t b, uint64_t denom) noexcept
{
    if (denom == 0) [[unlikely]] {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }
    return narrow(wide_t{a} * b / denom);
}

//-------------------------------------------------------------------------

Expected<uint64_t> mulDivUp(uint64_t a, uint64_t b, uint64_t denom) noexcept
{
    if (denom == 0) [[unlikely]] {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }
    const wide_t product = wide_t{a} * b;
    wide_t quotient = product / denom;
    if (quotient * denom != product) {
        ++quotient;
    }
    return narrow(quotient);
}

//-------------------------------------------------------------------------

Expected<uint64_t> pow10(uint32_t exponent) noexcept
{
    static constexpr uint32_t kMaxExponent = 19;
    if (exponent > kMaxExponent) [[unlikely]] {
        return Unexpected{ErrorCode::ARITHMETIC_OVERFLOW};
    }
    uint64_t res = 1;
    for (uint32_t i = 0; i < exponent; ++i) {
        res *= 10;
    }
    return res;
}

//-------------------------------------------------------------------------

Expected<Amount> collateralValue(Amount amount, Price price, uint32_t priceDecimals) noexcept
{
    return pow10(priceDecimals).and_then([&](uint64_t scale) {
        return mulDiv(amount, price, scale);
    });
}

//-------------------------------------------------------------------------

Bps ratioBps(Amount value, Amount outstanding) noexcept
{
    if (outstanding == 0) {
        return kMaxRatioBps;
    }
    const wide_t ratio = wide_t{value} * kBpsScale / outstanding;
    if (ratio > wide_t{kMaxRatioBps}) {
        return kMaxRatioBps;
    }
    return static_cast<Bps>(ratio);
}

//-------------------------------------------------------------------------

Expected<Amount> collateralForValue(Amount value, Price price, uint32_t priceDecimals) noexcept
{
    if (price == 0) [[unlikely]] {
        return Unexpected{ErrorCode::PRICE_UNAVAILABLE};
    }
    return pow10(priceDecimals).and_then([&](uint64_t scale) {
        return mulDivUp(value, scale, price);
    });
}

//-------------------------------------------------------------------------

}  // namespace lendora::util

//-------------------------------------------------------------------------
