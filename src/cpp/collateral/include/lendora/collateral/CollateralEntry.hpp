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

//-------------------------------------------------------------------------

namespace lendora::collateral
{

//-------------------------------------------------------------------------

enum class CollateralEntryKind : uint32_t
{
    POST,
    WITHDRAW,
    PLEDGE,
    REFUND,
    RELEASE,
    SEIZE
};

//-------------------------------------------------------------------------

struct CollateralEntry
{
    uint64_t sequence;
    CollateralEntryKind kind;
    AccountId borrower;
    AssetId asset;
    std::optional<LoanId> loanId;
    Amount amount;
    Timestamp timestamp;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace lendora::collateral

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendora::collateral::CollateralEntryKind>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lendora::collateral::CollateralEntryKind kind, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(kind));
    }
};

template<>
struct fmt::formatter<lendora::collateral::CollateralEntry>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendora::collateral::CollateralEntry& entry, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{},{},{},{},{},{},{}",
            entry.sequence,
            entry.timestamp,
            entry.kind,
            entry.borrower,
            entry.asset,
            entry.loanId.has_value() ? fmt::format("{}", *entry.loanId) : std::string{"-"},
            entry.amount);
    }
};

//-------------------------------------------------------------------------
