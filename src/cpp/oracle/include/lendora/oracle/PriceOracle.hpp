/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/ErrorCode.hpp"
#include "lendora/common/types.hpp"

#include <memory>

//-------------------------------------------------------------------------

namespace lendora::oracle
{

//-------------------------------------------------------------------------

struct PriceObservation
{
    Price price;
    Timestamp observedAt;

    [[nodiscard]] bool operator==(const PriceObservation&) const noexcept = default;
};

//-------------------------------------------------------------------------

struct PriceOracle
{
    using Ptr = std::shared_ptr<PriceOracle>;

    virtual ~PriceOracle() noexcept = default;

    // Price is fixed point with the protocol's priceDecimals.
    [[nodiscard]] virtual Expected<PriceObservation> getPrice(const AssetId& asset) = 0;
};

//-------------------------------------------------------------------------

}  // namespace lendora::oracle

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendora::oracle::PriceObservation>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendora::oracle::PriceObservation& obs, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "PriceObservation{{.price = {}, .observedAt = {}}}", obs.price, obs.observedAt);
    }
};

//-------------------------------------------------------------------------
