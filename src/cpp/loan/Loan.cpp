/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/loan/Loan.hpp"

#include <algorithm>
#include <limits>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendora::loan
{

//-------------------------------------------------------------------------

Loan::Loan(const LoanDesc& desc)
    : m_id{desc.id},
      m_borrower{desc.borrower},
      m_lender{desc.lender},
      m_principal{desc.principal},
      m_rate{desc.rate},
      m_termMonths{desc.termMonths},
      m_originatedAt{desc.originatedAt},
      m_totalInterest{desc.totalInterest},
      m_collateralAsset{desc.collateralAsset},
      m_collateralAmount{desc.collateralAmount}
{
    const Timestamp termSeconds = Timestamp{desc.termMonths} * kSecondsPerMonth;
    if (desc.id == LOAN_ID_INVALID
        || desc.principal == 0
        || desc.principal > std::numeric_limits<Amount>::max() - desc.totalInterest
        || desc.originatedAt > std::numeric_limits<Timestamp>::max() - termSeconds) {
        throw std::invalid_argument{fmt::format(
            "{}: malformed loan {}", std::source_location::current().function_name(), desc.id)};
    }
    m_maturesAt = desc.originatedAt + termSeconds;
}

//-------------------------------------------------------------------------

Expected<Amount> Loan::applyRepayment(
    Amount amount, Timestamp timestamp, const AccountId& payer)
{
    if (amount == 0) {
        return Unexpected{ErrorCode::INVALID_AMOUNT};
    }
    if (m_status != LoanStatus::ACTIVE) {
        return Unexpected{ErrorCode::LOAN_NOT_ACTIVE};
    }
    if (amount > outstanding()) {
        return Unexpected{ErrorCode::OVER_REPAYMENT};
    }
    const Amount toInterest = std::min(amount, outstandingInterest());
    m_interestRepaid += toInterest;
    m_principalRepaid += amount - toInterest;
    m_repayments.push_back(Repayment{
        .timestamp = timestamp,
        .payer = payer,
        .amount = amount,
        .interestPaid = toInterest,
        .principalPaid = amount - toInterest,
        .remaining = outstanding()
    });
    return outstanding();
}

//-------------------------------------------------------------------------

Expected<void> Loan::transition(
    LoanStatus to, Timestamp timestamp, const AccountId& actor, std::string reason)
{
    if (!isValidTransition(m_status, to)) {
        return Unexpected{ErrorCode::LOAN_NOT_ACTIVE};
    }
    m_history.push_back(LoanTransition{
        .from = m_status,
        .to = to,
        .timestamp = timestamp,
        .actor = actor,
        .reason = std::move(reason)
    });
    m_status = to;
    return {};
}

//-------------------------------------------------------------------------

void Loan::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{m_id}, allocator);
        json.AddMember("borrower", json::makeString(m_borrower, allocator), allocator);
        json.AddMember("lender", json::makeString(m_lender, allocator), allocator);
        json.AddMember("principal", rapidjson::Value{m_principal}, allocator);
        json.AddMember("rate", rapidjson::Value{m_rate}, allocator);
        json.AddMember("termMonths", rapidjson::Value{m_termMonths}, allocator);
        json.AddMember("originatedAt", rapidjson::Value{m_originatedAt}, allocator);
        json.AddMember("maturesAt", rapidjson::Value{m_maturesAt}, allocator);
        json.AddMember("totalInterest", rapidjson::Value{m_totalInterest}, allocator);
        json.AddMember("principalRepaid", rapidjson::Value{m_principalRepaid}, allocator);
        json.AddMember("interestRepaid", rapidjson::Value{m_interestRepaid}, allocator);
        json.AddMember("outstanding", rapidjson::Value{outstanding()}, allocator);
        json.AddMember(
            "status", json::makeString(magic_enum::enum_name(m_status), allocator), allocator);
        json.AddMember(
            "collateralAsset", json::makeString(m_collateralAsset, allocator), allocator);
        json.AddMember("collateralAmount", rapidjson::Value{m_collateralAmount}, allocator);
        rapidjson::Value historyJson{rapidjson::kArrayType};
        for (const auto& tr : m_history) {
            rapidjson::Value trJson{rapidjson::kObjectType};
            trJson.AddMember(
                "from", json::makeString(magic_enum::enum_name(tr.from), allocator), allocator);
            trJson.AddMember(
                "to", json::makeString(magic_enum::enum_name(tr.to), allocator), allocator);
            trJson.AddMember("timestamp", rapidjson::Value{tr.timestamp}, allocator);
            trJson.AddMember("actor", json::makeString(tr.actor, allocator), allocator);
            trJson.AddMember("reason", json::makeString(tr.reason, allocator), allocator);
            historyJson.PushBack(trJson, allocator);
        }
        json.AddMember("history", historyJson, allocator);
        rapidjson::Value repaymentsJson{rapidjson::kArrayType};
        for (const auto& r : m_repayments) {
            rapidjson::Value rJson{rapidjson::kObjectType};
            rJson.AddMember("timestamp", rapidjson::Value{r.timestamp}, allocator);
            rJson.AddMember("payer", json::makeString(r.payer, allocator), allocator);
            rJson.AddMember("amount", rapidjson::Value{r.amount}, allocator);
            rJson.AddMember("interestPaid", rapidjson::Value{r.interestPaid}, allocator);
            rJson.AddMember("principalPaid", rapidjson::Value{r.principalPaid}, allocator);
            rJson.AddMember("remaining", rapidjson::Value{r.remaining}, allocator);
            repaymentsJson.PushBack(rJson, allocator);
        }
        json.AddMember("repayments", repaymentsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendora::loan

//-------------------------------------------------------------------------
