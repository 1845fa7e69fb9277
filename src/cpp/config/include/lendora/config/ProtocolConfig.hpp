/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/ErrorCode.hpp"
#include "lendora/common/types.hpp"
#include "lendora/rate/RateModel.hpp"

#include <pugixml.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>

//-------------------------------------------------------------------------

namespace lendora::config
{

//-------------------------------------------------------------------------

inline constexpr Bps kMinLiquidationThreshold = 10'000;
inline constexpr Bps kMaxLiquidationThreshold = 30'000;
inline constexpr Bps kMaxLiquidationBonus = 2'000;
inline constexpr Bps kMaxCollateralRatio = 50'000;
inline constexpr uint32_t kMaxTermMonths = 360;

//-------------------------------------------------------------------------

struct LiquidationParams
{
    Bps threshold = 12'000;
    Bps bonus = 500;

    [[nodiscard]] bool operator==(const LiquidationParams&) const noexcept = default;
};

// The runtime-mutable part of the configuration; every change is versioned.
struct ProtocolParameters
{
    rate::RateModelParams rateModel;
    LiquidationParams liquidation;
    // Origination and withdrawal floor; never below the liquidation threshold.
    Bps minCollateralRatio = 15'000;

    [[nodiscard]] bool operator==(const ProtocolParameters&) const noexcept = default;
};

struct TimeoutParams
{
    std::chrono::milliseconds oracle{250};
    std::chrono::milliseconds credit{250};
    std::chrono::milliseconds lock{100};
};

struct ProtocolConfig
{
    AccountId administrator = "admin";
    Amount minPrincipal = 1;
    uint32_t maxTermMonths = kMaxTermMonths;
    uint32_t priceDecimals = kDefaultPriceDecimals;
    Timestamp priceFreshness = 3600;
    size_t workerThreads = 2;
    TimeoutParams timeouts;
    ProtocolParameters parameters;
};

//-------------------------------------------------------------------------

[[nodiscard]] Expected<LiquidationParams> validateLiquidationParams(
    const LiquidationParams& params) noexcept;

[[nodiscard]] Expected<ProtocolParameters> validateProtocolParameters(
    const ProtocolParameters& params) noexcept;

/**
 * Expects a node of the form
 *
 *   <Protocol administrator="admin" minPrincipal="..." priceDecimals="8" priceFreshness="3600">
 *     <RateModel baseRate="500" riskPremiumMultiplier="1000"/>
 *     <Collateral minRatio="15000"/>
 *     <Liquidation threshold="12000" bonus="500"/>
 *     <Timeouts oracle="250" credit="250" lock="100" workers="2"/>
 *   </Protocol>
 *
 * Missing children keep their defaults. Throws std::invalid_argument on
 * out-of-range values.
 */
[[nodiscard]] ProtocolConfig makeProtocolConfig(pugi::xml_node node);

// Loads the <Protocol> root of an XML file; throws ProtocolException if unreadable.
[[nodiscard]] ProtocolConfig loadProtocolConfig(const std::filesystem::path& path);

//-------------------------------------------------------------------------

}  // namespace lendora::config

//-------------------------------------------------------------------------
