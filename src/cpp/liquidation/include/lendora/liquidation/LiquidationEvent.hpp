/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/types.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>
#include <rapidjson/document.h>

#include <optional>
#include <string>
#include <variant>

//-------------------------------------------------------------------------

namespace lendora::liquidation
{

//-------------------------------------------------------------------------

enum class LiquidationKind : uint32_t
{
    LIQUIDATION,
    DEFAULT
};

//-------------------------------------------------------------------------

struct NoLiquidation
{
    // Absent when the loan is not Active.
    std::optional<Bps> ratio;
};

struct LiquidationPlan
{
    Amount seizeAmount;
    Amount bonusAmount;
    Amount lenderAmount;
    Amount borrowerRemainder;
    Bps triggeringRatio;
    // Zero when a default settles without a price.
    Price price;
};

using LiquidationDecision = std::variant<NoLiquidation, LiquidationPlan>;

[[nodiscard]] inline bool isEligible(const LiquidationDecision& decision) noexcept
{
    return std::holds_alternative<LiquidationPlan>(decision);
}

//-------------------------------------------------------------------------

struct LiquidationEvent
{
    uint64_t sequence;
    LiquidationKind kind;
    LoanId loanId;
    AccountId borrower;
    AccountId lender;
    // Empty for defaults.
    AccountId liquidator;
    AssetId asset;
    Bps triggeringRatio;
    Amount seizedAmount;
    Amount bonusAmount;
    Amount lenderAmount;
    Amount borrowerRemainder;
    Price price;
    Timestamp timestamp;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace lendora::liquidation

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendora::liquidation::LiquidationKind>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lendora::liquidation::LiquidationKind kind, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(kind));
    }
};

template<>
struct fmt::formatter<lendora::liquidation::LiquidationPlan>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendora::liquidation::LiquidationPlan& plan, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "LiquidationPlan{{.seize = {}, .bonus = {}, .lender = {}, .remainder = {}, "
            ".ratio = {}, .price = {}}}",
            plan.seizeAmount,
            plan.bonusAmount,
            plan.lenderAmount,
            plan.borrowerRemainder,
            plan.triggeringRatio,
            plan.price);
    }
};

template<>
struct fmt::formatter<lendora::liquidation::LiquidationEvent>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendora::liquidation::LiquidationEvent& event, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{},{},{},{},{},{},{},{},{},{},{},{},{}",
            event.sequence,
            event.timestamp,
            event.kind,
            event.loanId,
            event.borrower,
            event.liquidator.empty() ? std::string{"-"} : event.liquidator,
            event.asset,
            event.triggeringRatio,
            event.seizedAmount,
            event.bonusAmount,
            event.lenderAmount,
            event.borrowerRemainder,
            event.price);
    }
};

//-------------------------------------------------------------------------
