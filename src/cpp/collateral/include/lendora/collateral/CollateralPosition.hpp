/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/ErrorCode.hpp"
#include "lendora/common/types.hpp"
#include "lendora/serialization/JsonSerializable.hpp"

#include <compare>
#include <map>
#include <optional>

//-------------------------------------------------------------------------

namespace lendora::collateral
{

//-------------------------------------------------------------------------

struct PositionKey
{
    AccountId borrower;
    AssetId asset;

    [[nodiscard]] auto operator<=>(const PositionKey&) const = default;
};

//-------------------------------------------------------------------------

/**
 * A borrower's holding of one asset. The total amount is split into a free
 * part and per-loan pledges; amount == free + sum(pledges) at all times.
 */
class CollateralPosition : public JsonSerializable
{
public:
    using Pledges = std::map<LoanId, Amount>;

    CollateralPosition() noexcept = default;
    explicit CollateralPosition(PositionKey key) noexcept : m_key{std::move(key)} {}

    [[nodiscard]] const PositionKey& key() const noexcept { return m_key; }
    [[nodiscard]] const AccountId& borrower() const noexcept { return m_key.borrower; }
    [[nodiscard]] const AssetId& asset() const noexcept { return m_key.asset; }
    [[nodiscard]] Amount amount() const noexcept { return m_amount; }
    [[nodiscard]] Amount pledged() const noexcept { return m_pledged; }
    [[nodiscard]] Amount free() const noexcept { return m_amount - m_pledged; }
    [[nodiscard]] const Pledges& pledges() const noexcept { return m_pledges; }
    [[nodiscard]] std::optional<Amount> pledgeOf(LoanId loanId) const noexcept;

    Expected<void> credit(Amount amount) noexcept;
    Expected<void> debit(Amount amount) noexcept;
    Expected<void> pledge(LoanId loanId, Amount amount) noexcept;
    // Moves the remaining pledge back to the free part.
    Expected<Amount> release(LoanId loanId) noexcept;
    // Removes collateral from a pledge and from the position.
    Expected<Amount> takeFromPledge(LoanId loanId, Amount amount) noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    PositionKey m_key;
    Amount m_amount{};
    Amount m_pledged{};
    Pledges m_pledges;
};

//-------------------------------------------------------------------------

}  // namespace lendora::collateral

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendora::collateral::CollateralPosition>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendora::collateral::CollateralPosition& pos, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "CollateralPosition{{.borrower = {}, .asset = {}, .amount = {}, .pledged = {}}}",
            pos.borrower(),
            pos.asset(),
            pos.amount(),
            pos.pledged());
    }
};

//-------------------------------------------------------------------------
