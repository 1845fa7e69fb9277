/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/collateral/CollateralPosition.hpp"

#include <algorithm>
#include <limits>

//-------------------------------------------------------------------------

namespace lendora::collateral
{

//-------------------------------------------------------------------------

std::optional<Amount> CollateralPosition::pledgeOf(LoanId loanId) const noexcept
{
    if (const auto it = m_pledges.find(loanId); it != m_pledges.end()) {
        return it->second;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

Expected<void> CollateralPosition::credit(Amount amount) noexcept
{
    if (amount == 0) {
        return Unexpected{ErrorCode::INVALID_AMOUNT};
    }
    if (m_amount > std::numeric_limits<Amount>::max() - amount) [[unlikely]] {
        return Unexpected{ErrorCode::ARITHMETIC_OVERFLOW};
    }
    m_amount += amount;
    return {};
}

//-------------------------------------------------------------------------

Expected<void> CollateralPosition::debit(Amount amount) noexcept
{
    if (amount == 0) {
        return Unexpected{ErrorCode::INVALID_AMOUNT};
    }
    if (amount > free()) {
        return Unexpected{ErrorCode::INSUFFICIENT_COLLATERAL};
    }
    m_amount -= amount;
    return {};
}

//-------------------------------------------------------------------------

Expected<void> CollateralPosition::pledge(LoanId loanId, Amount amount) noexcept
{
    if (amount == 0) {
        return Unexpected{ErrorCode::INVALID_AMOUNT};
    }
    if (amount > free()) {
        return Unexpected{ErrorCode::INSUFFICIENT_COLLATERAL};
    }
    m_pledges[loanId] += amount;
    m_pledged += amount;
    return {};
}

//-------------------------------------------------------------------------

Expected<Amount> CollateralPosition::release(LoanId loanId) noexcept
{
    const auto it = m_pledges.find(loanId);
    if (it == m_pledges.end()) {
        return Unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    const Amount released = it->second;
    m_pledged -= released;
    m_pledges.erase(it);
    return released;
}

//-------------------------------------------------------------------------

Expected<Amount> CollateralPosition::takeFromPledge(LoanId loanId, Amount amount) noexcept
{
    const auto it = m_pledges.find(loanId);
    if (it == m_pledges.end()) {
        return Unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    const Amount taken = std::min(amount, it->second);
    it->second -= taken;
    m_pledged -= taken;
    m_amount -= taken;
    return taken;
}

//-------------------------------------------------------------------------

void CollateralPosition::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("borrower", json::makeString(m_key.borrower, allocator), allocator);
        json.AddMember("asset", json::makeString(m_key.asset, allocator), allocator);
        json.AddMember("amount", rapidjson::Value{m_amount}, allocator);
        json.AddMember("free", rapidjson::Value{free()}, allocator);
        rapidjson::Value pledgesJson{rapidjson::kArrayType};
        for (const auto& [loanId, amount] : m_pledges) {
            rapidjson::Value pledgeJson{rapidjson::kObjectType};
            pledgeJson.AddMember("loanId", rapidjson::Value{loanId}, allocator);
            pledgeJson.AddMember("amount", rapidjson::Value{amount}, allocator);
            pledgesJson.PushBack(pledgeJson, allocator);
        }
        json.AddMember("pledges", pledgesJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendora::collateral

//-------------------------------------------------------------------------
