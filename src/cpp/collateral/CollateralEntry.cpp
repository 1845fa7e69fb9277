/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/collateral/CollateralEntry.hpp"

#include "lendora/serialization/json_util.hpp"

//-------------------------------------------------------------------------

namespace lendora::collateral
{

//-------------------------------------------------------------------------

void CollateralEntry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("sequence", rapidjson::Value{sequence}, allocator);
        json.AddMember(
            "kind", json::makeString(magic_enum::enum_name(kind), allocator), allocator);
        json.AddMember("borrower", json::makeString(borrower, allocator), allocator);
        json.AddMember("asset", json::makeString(asset, allocator), allocator);
        json.AddMember(
            "loanId",
            loanId.has_value() ? rapidjson::Value{*loanId} : rapidjson::Value{rapidjson::kNullType},
            allocator);
        json.AddMember("amount", rapidjson::Value{amount}, allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendora::collateral

//-------------------------------------------------------------------------
