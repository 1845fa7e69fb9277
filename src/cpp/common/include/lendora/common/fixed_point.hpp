/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/ErrorCode.hpp"
#include "lendora/common/types.hpp"

#include <boost/multiprecision/cpp_int.hpp>

//-------------------------------------------------------------------------

namespace lendora::util
{

//-------------------------------------------------------------------------

using wide_t = boost::multiprecision::uint128_t;

[[nodiscard]] Expected<uint64_t> narrow(const wide_t& val) noexcept;

// a * b / denom, truncated toward zero.
[[nodiscard]] Expected<uint64_t> mulDiv(uint64_t a, uint64_t b, uint64_t denom) noexcept;

// a * b / denom, rounded up.
[[nodiscard]] Expected<uint64_t> mulDivUp(uint64_t a, uint64_t b, uint64_t denom) noexcept;

[[nodiscard]] Expected<uint64_t> pow10(uint32_t exponent) noexcept;

// Value of a collateral amount in currency units, truncated.
[[nodiscard]] Expected<Amount> collateralValue(
    Amount amount, Price price, uint32_t priceDecimals) noexcept;

// value * 10000 / outstanding, saturating at kMaxRatioBps; zero debt saturates.
[[nodiscard]] Bps ratioBps(Amount value, Amount outstanding) noexcept;

// Collateral units worth at least `value` at `price`, rounded up.
[[nodiscard]] Expected<Amount> collateralForValue(
    Amount value, Price price, uint32_t priceDecimals) noexcept;

[[nodiscard]] inline Amount applyBps(Amount amount, Bps bps) noexcept
{
    const wide_t res = wide_t{amount} * bps / kBpsScale;
    return static_cast<Amount>(res);
}

//-------------------------------------------------------------------------

}  // namespace lendora::util

//-------------------------------------------------------------------------
