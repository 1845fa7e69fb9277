/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/config/ConfigRegistry.hpp"

#include <fmt/format.h>

#include <functional>
#include <source_location>
#include <stdexcept>
#include <utility>

//-------------------------------------------------------------------------

namespace lendora::config
{

//-------------------------------------------------------------------------

ConfigRegistry::ConfigRegistry(
    AccountId administrator, const ProtocolParameters& initial, Clock::Ptr clock)
    : m_administrator{std::move(administrator)},
      m_clock{std::move(clock)}
{
    if (!validateProtocolParameters(initial)) {
        throw std::invalid_argument{fmt::format(
            "{}: initial protocol parameters out of bounds",
            std::source_location::current().function_name())};
    }
    m_snapshot.store(
        std::make_shared<const ConfigSnapshot>(ConfigSnapshot{.version = 1, .parameters = initial}),
        std::memory_order_release);
}

//-------------------------------------------------------------------------

template<typename Mutator>
Expected<uint64_t> ConfigRegistry::update(const AccountId& caller, Mutator&& mutate)
{
    std::vector<ConfigAuditRecord> committed;
    Expected<uint64_t> res;
    {
        std::lock_guard lock{m_writeMtx};
        auto candidate = parameters();
        auto changes = std::invoke(std::forward<Mutator>(mutate), candidate);
        res = commit(caller, candidate, std::move(changes), committed);
    }
    for (const auto& record : committed) {
        m_changed(record);
    }
    return res;
}

//-------------------------------------------------------------------------

Expected<uint64_t> ConfigRegistry::setBaseRate(const AccountId& caller, Bps baseRate)
{
    return update(caller, [&](ProtocolParameters& params) {
        const Bps old = std::exchange(params.rateModel.baseRate, baseRate);
        return std::vector<Change>{{"baseRate", old, baseRate}};
    });
}

//-------------------------------------------------------------------------

Expected<uint64_t> ConfigRegistry::setRiskPremiumMultiplier(const AccountId& caller, Bps multiplier)
{
    return update(caller, [&](ProtocolParameters& params) {
        const Bps old = std::exchange(params.rateModel.riskPremiumMultiplier, multiplier);
        return std::vector<Change>{{"riskPremiumMultiplier", old, multiplier}};
    });
}

//-------------------------------------------------------------------------

Expected<uint64_t> ConfigRegistry::setLiquidationParams(
    const AccountId& caller, Bps threshold, Bps bonus)
{
    return update(caller, [&](ProtocolParameters& params) {
        const Bps oldThreshold = std::exchange(params.liquidation.threshold, threshold);
        const Bps oldBonus = std::exchange(params.liquidation.bonus, bonus);
        return std::vector<Change>{
            {"liquidationThreshold", oldThreshold, threshold},
            {"liquidationBonus", oldBonus, bonus}};
    });
}

//-------------------------------------------------------------------------

Expected<uint64_t> ConfigRegistry::setMinCollateralRatio(const AccountId& caller, Bps minRatio)
{
    return update(caller, [&](ProtocolParameters& params) {
        const Bps old = std::exchange(params.minCollateralRatio, minRatio);
        return std::vector<Change>{{"minCollateralRatio", old, minRatio}};
    });
}

//-------------------------------------------------------------------------

std::vector<ConfigAuditRecord> ConfigRegistry::auditTrail() const
{
    std::lock_guard lock{m_writeMtx};
    return m_auditTrail;
}

//-------------------------------------------------------------------------

void ConfigRegistry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        const auto current = snapshot();
        const auto& params = current->parameters;
        json.AddMember("version", rapidjson::Value{current->version}, allocator);
        json.AddMember("administrator", json::makeString(m_administrator, allocator), allocator);
        json.AddMember("baseRate", rapidjson::Value{params.rateModel.baseRate}, allocator);
        json.AddMember(
            "riskPremiumMultiplier",
            rapidjson::Value{params.rateModel.riskPremiumMultiplier},
            allocator);
        json.AddMember("minCollateralRatio", rapidjson::Value{params.minCollateralRatio}, allocator);
        json.AddMember(
            "liquidationThreshold", rapidjson::Value{params.liquidation.threshold}, allocator);
        json.AddMember("liquidationBonus", rapidjson::Value{params.liquidation.bonus}, allocator);
        rapidjson::Value trailJson{rapidjson::kArrayType};
        for (const auto& record : auditTrail()) {
            rapidjson::Value recordJson{rapidjson::kObjectType};
            recordJson.AddMember("version", rapidjson::Value{record.version}, allocator);
            recordJson.AddMember("timestamp", rapidjson::Value{record.timestamp}, allocator);
            recordJson.AddMember("actor", json::makeString(record.actor, allocator), allocator);
            recordJson.AddMember(
                "parameter", json::makeString(record.parameter, allocator), allocator);
            recordJson.AddMember("oldValue", rapidjson::Value{record.oldValue}, allocator);
            recordJson.AddMember("newValue", rapidjson::Value{record.newValue}, allocator);
            trailJson.PushBack(recordJson, allocator);
        }
        json.AddMember("auditTrail", trailJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Expected<uint64_t> ConfigRegistry::commit(
    const AccountId& caller,
    const ProtocolParameters& candidate,
    std::vector<Change> changes,
    std::vector<ConfigAuditRecord>& committed)
{
    if (caller != m_administrator) {
        return Unexpected{ErrorCode::UNAUTHORIZED};
    }
    if (!validateProtocolParameters(candidate)) {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }

    const auto current = snapshot();
    const uint64_t version = current->version + 1;
    const Timestamp now = m_clock->now();

    m_snapshot.store(
        std::make_shared<const ConfigSnapshot>(
            ConfigSnapshot{.version = version, .parameters = candidate}),
        std::memory_order_release);

    for (auto& change : changes) {
        committed.push_back(m_auditTrail.emplace_back(ConfigAuditRecord{
            .version = version,
            .timestamp = now,
            .actor = caller,
            .parameter = std::move(change.parameter),
            .oldValue = change.oldValue,
            .newValue = change.newValue
        }));
    }

    return version;
}

//-------------------------------------------------------------------------

}  // namespace lendora::config

//-------------------------------------------------------------------------
