/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/Clock.hpp"
#include "lendora/common/signals.hpp"
#include "lendora/config/ProtocolConfig.hpp"
#include "lendora/serialization/JsonSerializable.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace lendora::config
{

//-------------------------------------------------------------------------

struct ConfigAuditRecord
{
    uint64_t version;
    Timestamp timestamp;
    AccountId actor;
    std::string parameter;
    uint64_t oldValue;
    uint64_t newValue;
};

struct ConfigSnapshot
{
    uint64_t version;
    ProtocolParameters parameters;
};

//-------------------------------------------------------------------------

/**
 * Versioned holder of the runtime-mutable protocol parameters. Readers take
 * an immutable snapshot without locking; writers are serialized, restricted
 * to the administrator, and leave an audit record per changed value.
 */
class ConfigRegistry : public JsonSerializable
{
public:
    using Ptr = std::shared_ptr<ConfigRegistry>;

    ConfigRegistry(AccountId administrator, const ProtocolParameters& initial, Clock::Ptr clock);

    [[nodiscard]] std::shared_ptr<const ConfigSnapshot> snapshot() const noexcept
    {
        return m_snapshot.load(std::memory_order_acquire);
    }
    [[nodiscard]] ProtocolParameters parameters() const noexcept { return snapshot()->parameters; }
    [[nodiscard]] uint64_t version() const noexcept { return snapshot()->version; }
    [[nodiscard]] const AccountId& administrator() const noexcept { return m_administrator; }

    Expected<uint64_t> setBaseRate(const AccountId& caller, Bps baseRate);
    Expected<uint64_t> setRiskPremiumMultiplier(const AccountId& caller, Bps multiplier);
    Expected<uint64_t> setLiquidationParams(const AccountId& caller, Bps threshold, Bps bonus);
    Expected<uint64_t> setMinCollateralRatio(const AccountId& caller, Bps minRatio);

    [[nodiscard]] std::vector<ConfigAuditRecord> auditTrail() const;

    [[nodiscard]] auto&& changed(this auto&& self) noexcept { return self.m_changed; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    struct Change
    {
        std::string parameter;
        uint64_t oldValue;
        uint64_t newValue;
    };

    // Applies `mutate` to a copy of the parameters under the write lock;
    // change signals fire once the lock is released.
    template<typename Mutator>
    Expected<uint64_t> update(const AccountId& caller, Mutator&& mutate);

    Expected<uint64_t> commit(
        const AccountId& caller,
        const ProtocolParameters& candidate,
        std::vector<Change> changes,
        std::vector<ConfigAuditRecord>& committed);

    AccountId m_administrator;
    Clock::Ptr m_clock;
    std::atomic<std::shared_ptr<const ConfigSnapshot>> m_snapshot;
    mutable std::mutex m_writeMtx;
    std::vector<ConfigAuditRecord> m_auditTrail;
    SyncSignal<void(const ConfigAuditRecord&)> m_changed;
};

//-------------------------------------------------------------------------

}  // namespace lendora::config

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendora::config::ConfigAuditRecord>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendora::config::ConfigAuditRecord& record, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "ConfigAuditRecord{{.version = {}, .timestamp = {}, .actor = {}, "
            ".parameter = {}, .oldValue = {}, .newValue = {}}}",
            record.version,
            record.timestamp,
            record.actor,
            record.parameter,
            record.oldValue,
            record.newValue);
    }
};

//-------------------------------------------------------------------------
