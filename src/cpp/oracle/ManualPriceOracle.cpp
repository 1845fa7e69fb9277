/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/oracle/ManualPriceOracle.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace lendora::oracle
{

//-------------------------------------------------------------------------

Expected<PriceObservation> ManualPriceOracle::getPrice(const AssetId& asset)
{
    std::shared_lock lock{m_mtx};
    if (const auto it = m_prices.find(asset); it != m_prices.end()) {
        return it->second;
    }
    return Unexpected{ErrorCode::PRICE_UNAVAILABLE};
}

//-------------------------------------------------------------------------

void ManualPriceOracle::publish(const AssetId& asset, PriceObservation observation)
{
    std::unique_lock lock{m_mtx};
    m_prices.insert_or_assign(asset, observation);
}

//-------------------------------------------------------------------------

void ManualPriceOracle::remove(const AssetId& asset)
{
    std::unique_lock lock{m_mtx};
    m_prices.erase(asset);
}

//-------------------------------------------------------------------------

}  // namespace lendora::oracle

//-------------------------------------------------------------------------
