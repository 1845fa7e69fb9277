/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/config/ProtocolConfig.hpp"

#include "lendora/common/ProtocolException.hpp"

#include <fmt/format.h>

#include <source_location>
#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace lendora::config
{

//-------------------------------------------------------------------------

Expected<LiquidationParams> validateLiquidationParams(const LiquidationParams& params) noexcept
{
    if (params.threshold < kMinLiquidationThreshold
        || params.threshold > kMaxLiquidationThreshold) {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }
    if (params.bonus > kMaxLiquidationBonus) {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }
    return params;
}

//-------------------------------------------------------------------------

Expected<ProtocolParameters> validateProtocolParameters(const ProtocolParameters& params) noexcept
{
    return rate::validateRateModelParams(params.rateModel)
        .and_then([&](auto&&) { return validateLiquidationParams(params.liquidation); })
        .and_then([&](auto&&) -> Expected<ProtocolParameters> {
            if (params.minCollateralRatio < params.liquidation.threshold
                || params.minCollateralRatio > kMaxCollateralRatio) {
                return Unexpected{ErrorCode::INVALID_PARAMETER};
            }
            return params;
        });
}

//-------------------------------------------------------------------------

ProtocolConfig makeProtocolConfig(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    if (!node) {
        throw std::invalid_argument{fmt::format("{}: missing <Protocol> node", sl.function_name())};
    }

    ProtocolConfig config;

    if (pugi::xml_attribute attr = node.attribute("administrator")) {
        config.administrator = attr.as_string();
    }
    if (config.administrator.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: 'administrator' cannot be empty", sl.function_name())};
    }

    config.minPrincipal = node.attribute("minPrincipal").as_ullong(config.minPrincipal);
    if (config.minPrincipal == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: 'minPrincipal' must be positive", sl.function_name())};
    }

    config.maxTermMonths = node.attribute("maxTermMonths").as_uint(config.maxTermMonths);
    if (config.maxTermMonths == 0 || config.maxTermMonths > kMaxTermMonths) {
        throw std::invalid_argument{fmt::format(
            "{}: 'maxTermMonths' {} should be in [1, {}]",
            sl.function_name(), config.maxTermMonths, kMaxTermMonths)};
    }

    config.priceDecimals = node.attribute("priceDecimals").as_uint(config.priceDecimals);
    if (config.priceDecimals > 18) {
        throw std::invalid_argument{fmt::format(
            "{}: 'priceDecimals' {} should be at most 18", sl.function_name(), config.priceDecimals)};
    }

    config.priceFreshness = node.attribute("priceFreshness").as_ullong(config.priceFreshness);
    if (config.priceFreshness == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: 'priceFreshness' must be positive", sl.function_name())};
    }

    auto& params = config.parameters;
    if (pugi::xml_node rateNode = node.child("RateModel")) {
        params.rateModel.baseRate =
            rateNode.attribute("baseRate").as_uint(params.rateModel.baseRate);
        params.rateModel.riskPremiumMultiplier =
            rateNode.attribute("riskPremiumMultiplier").as_uint(params.rateModel.riskPremiumMultiplier);
    }
    if (pugi::xml_node collateralNode = node.child("Collateral")) {
        params.minCollateralRatio =
            collateralNode.attribute("minRatio").as_uint(params.minCollateralRatio);
    }
    if (pugi::xml_node liquidationNode = node.child("Liquidation")) {
        params.liquidation.threshold =
            liquidationNode.attribute("threshold").as_uint(params.liquidation.threshold);
        params.liquidation.bonus =
            liquidationNode.attribute("bonus").as_uint(params.liquidation.bonus);
    }
    if (const auto validated = validateProtocolParameters(params); !validated) {
        throw std::invalid_argument{fmt::format(
            "{}: invalid protocol parameters (baseRate {}, riskPremiumMultiplier {}, "
            "minRatio {}, threshold {}, bonus {})",
            sl.function_name(),
            params.rateModel.baseRate,
            params.rateModel.riskPremiumMultiplier,
            params.minCollateralRatio,
            params.liquidation.threshold,
            params.liquidation.bonus)};
    }

    if (pugi::xml_node timeoutsNode = node.child("Timeouts")) {
        auto& timeouts = config.timeouts;
        timeouts.oracle = std::chrono::milliseconds{
            timeoutsNode.attribute("oracle").as_uint(static_cast<unsigned>(timeouts.oracle.count()))};
        timeouts.credit = std::chrono::milliseconds{
            timeoutsNode.attribute("credit").as_uint(static_cast<unsigned>(timeouts.credit.count()))};
        timeouts.lock = std::chrono::milliseconds{
            timeoutsNode.attribute("lock").as_uint(static_cast<unsigned>(timeouts.lock.count()))};
        config.workerThreads = timeoutsNode.attribute("workers").as_uint(static_cast<unsigned>(config.workerThreads));
        if (timeouts.oracle.count() == 0 || timeouts.credit.count() == 0
            || timeouts.lock.count() == 0 || config.workerThreads == 0) {
            throw std::invalid_argument{fmt::format(
                "{}: timeouts and worker count must be positive", sl.function_name())};
        }
    }

    return config;
}

//-------------------------------------------------------------------------

ProtocolConfig loadProtocolConfig(const std::filesystem::path& path)
{
    static constexpr auto sl = std::source_location::current();

    pugi::xml_document doc;
    if (pugi::xml_parse_result result = doc.load_file(path.c_str()); !result) {
        throw ProtocolException{fmt::format(
            "{}: failed to load '{}': {}", sl.function_name(), path.string(), result.description())};
    }
    pugi::xml_node node = doc.child("Protocol");
    if (!node) {
        throw ProtocolException{fmt::format(
            "{}: missing node 'Protocol' in '{}'", sl.function_name(), path.string())};
    }
    return makeProtocolConfig(node);
}

//-------------------------------------------------------------------------

}  // namespace lendora::config

//-------------------------------------------------------------------------
