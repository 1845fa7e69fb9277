/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/liquidation/LiquidationEvent.hpp"

#include "lendora/serialization/json_util.hpp"

//-------------------------------------------------------------------------

namespace lendora::liquidation
{

//-------------------------------------------------------------------------

void LiquidationEvent::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("sequence", rapidjson::Value{sequence}, allocator);
        json.AddMember(
            "kind", json::makeString(magic_enum::enum_name(kind), allocator), allocator);
        json.AddMember("loanId", rapidjson::Value{loanId}, allocator);
        json.AddMember("borrower", json::makeString(borrower, allocator), allocator);
        json.AddMember("lender", json::makeString(lender, allocator), allocator);
        json.AddMember("liquidator", json::makeString(liquidator, allocator), allocator);
        json.AddMember("asset", json::makeString(asset, allocator), allocator);
        json.AddMember("triggeringRatio", rapidjson::Value{triggeringRatio}, allocator);
        json.AddMember("seized", rapidjson::Value{seizedAmount}, allocator);
        json.AddMember("bonus", rapidjson::Value{bonusAmount}, allocator);
        json.AddMember("lenderShare", rapidjson::Value{lenderAmount}, allocator);
        json.AddMember("borrowerRemainder", rapidjson::Value{borrowerRemainder}, allocator);
        json.AddMember("price", rapidjson::Value{price}, allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendora::liquidation

//-------------------------------------------------------------------------
