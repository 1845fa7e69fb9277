/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/oracle/PriceOracle.hpp"

#include <map>
#include <shared_mutex>

//-------------------------------------------------------------------------

namespace lendora::oracle
{

//-------------------------------------------------------------------------

// In-memory feed; stablecoin-style fixed quotes and scenario replays publish here.
class ManualPriceOracle : public PriceOracle
{
public:
    [[nodiscard]] virtual Expected<PriceObservation> getPrice(const AssetId& asset) override;

    void publish(const AssetId& asset, PriceObservation observation);
    void remove(const AssetId& asset);

private:
    std::map<AssetId, PriceObservation> m_prices;
    mutable std::shared_mutex m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace lendora::oracle

//-------------------------------------------------------------------------
