/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/ErrorCode.hpp"
#include "lendora/common/types.hpp"
#include "lendora/serialization/JsonSerializable.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace lendora::loan
{

//-------------------------------------------------------------------------

enum class LoanStatus : uint32_t
{
    PENDING,
    ACTIVE,
    REPAID,
    DEFAULTED,
    LIQUIDATED
};

[[nodiscard]] constexpr bool isTerminal(LoanStatus status) noexcept
{
    return status == LoanStatus::REPAID
        || status == LoanStatus::DEFAULTED
        || status == LoanStatus::LIQUIDATED;
}

[[nodiscard]] constexpr bool isValidTransition(LoanStatus from, LoanStatus to) noexcept
{
    switch (from) {
        case LoanStatus::PENDING:
            return to == LoanStatus::ACTIVE;
        case LoanStatus::ACTIVE:
            return isTerminal(to);
        default:
            return false;
    }
}

//-------------------------------------------------------------------------

struct LoanTransition
{
    LoanStatus from;
    LoanStatus to;
    Timestamp timestamp;
    AccountId actor;
    std::string reason;
};

// One applied payment; replaying them from the origination terms yields the balance.
struct Repayment
{
    Timestamp timestamp;
    AccountId payer;
    Amount amount;
    Amount interestPaid;
    Amount principalPaid;
    Amount remaining;

    [[nodiscard]] bool operator==(const Repayment&) const noexcept = default;
};

//-------------------------------------------------------------------------

struct LoanDesc
{
    LoanId id;
    AccountId borrower;
    AccountId lender;
    Amount principal;
    Bps rate;
    uint32_t termMonths;
    Timestamp originatedAt;
    Amount totalInterest;
    AssetId collateralAsset;
    Amount collateralAmount;
};

//-------------------------------------------------------------------------

class Loan : public JsonSerializable
{
public:
    Loan() noexcept = default;
    explicit Loan(const LoanDesc& desc);

    [[nodiscard]] LoanId id() const noexcept { return m_id; }
    [[nodiscard]] const AccountId& borrower() const noexcept { return m_borrower; }
    [[nodiscard]] const AccountId& lender() const noexcept { return m_lender; }
    [[nodiscard]] Amount principal() const noexcept { return m_principal; }
    [[nodiscard]] Bps rate() const noexcept { return m_rate; }
    [[nodiscard]] uint32_t termMonths() const noexcept { return m_termMonths; }
    [[nodiscard]] Timestamp originatedAt() const noexcept { return m_originatedAt; }
    [[nodiscard]] Timestamp maturesAt() const noexcept { return m_maturesAt; }
    [[nodiscard]] Amount totalInterest() const noexcept { return m_totalInterest; }
    [[nodiscard]] Amount principalRepaid() const noexcept { return m_principalRepaid; }
    [[nodiscard]] Amount interestRepaid() const noexcept { return m_interestRepaid; }
    [[nodiscard]] LoanStatus status() const noexcept { return m_status; }
    [[nodiscard]] const AssetId& collateralAsset() const noexcept { return m_collateralAsset; }
    // Collateral currently pledged to the loan; zero once settled.
    [[nodiscard]] Amount collateralAmount() const noexcept { return m_collateralAmount; }
    [[nodiscard]] const std::vector<LoanTransition>& history() const noexcept { return m_history; }
    [[nodiscard]] const std::vector<Repayment>& repayments() const noexcept { return m_repayments; }

    [[nodiscard]] Amount outstandingPrincipal() const noexcept
    {
        return m_principal - m_principalRepaid;
    }
    [[nodiscard]] Amount outstandingInterest() const noexcept
    {
        return m_totalInterest - m_interestRepaid;
    }
    [[nodiscard]] Amount outstanding() const noexcept
    {
        return outstandingPrincipal() + outstandingInterest();
    }
    [[nodiscard]] bool matured(Timestamp now) const noexcept { return now >= m_maturesAt; }

    // Interest first, then principal. Returns the balance left.
    Expected<Amount> applyRepayment(Amount amount, Timestamp timestamp, const AccountId& payer);
    Expected<void> transition(
        LoanStatus to, Timestamp timestamp, const AccountId& actor, std::string reason);
    void setCollateralAmount(Amount amount) noexcept { m_collateralAmount = amount; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    LoanId m_id{LOAN_ID_INVALID};
    AccountId m_borrower;
    AccountId m_lender;
    Amount m_principal{};
    Bps m_rate{};
    uint32_t m_termMonths{};
    Timestamp m_originatedAt{};
    Timestamp m_maturesAt{};
    Amount m_totalInterest{};
    Amount m_principalRepaid{};
    Amount m_interestRepaid{};
    LoanStatus m_status{LoanStatus::PENDING};
    AssetId m_collateralAsset;
    Amount m_collateralAmount{};
    std::vector<LoanTransition> m_history;
    std::vector<Repayment> m_repayments;
};

//-------------------------------------------------------------------------

}  // namespace lendora::loan

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendora::loan::LoanStatus>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lendora::loan::LoanStatus status, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(status));
    }
};

template<>
struct fmt::formatter<lendora::loan::LoanTransition>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendora::loan::LoanTransition& tr, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "{},{},{},{},{}", tr.timestamp, tr.from, tr.to, tr.actor, tr.reason);
    }
};

template<>
struct fmt::formatter<lendora::loan::Repayment>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendora::loan::Repayment& r, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{},{},{},{},{},{}",
            r.timestamp,
            r.payer,
            r.amount,
            r.interestPaid,
            r.principalPaid,
            r.remaining);
    }
};

template<>
struct fmt::formatter<lendora::loan::Loan>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendora::loan::Loan& loan, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Loan{{.id = {}, .borrower = {}, .principal = {}, .rate = {}, "
            ".outstanding = {}, .status = {}}}",
            loan.id(),
            loan.borrower(),
            loan.principal(),
            loan.rate(),
            loan.outstanding(),
            loan.status());
    }
};

//-------------------------------------------------------------------------
