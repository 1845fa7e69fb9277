/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/collateral/CollateralEntry.hpp"
#include "lendora/collateral/CollateralPosition.hpp"
#include "lendora/common/BoundedExecutor.hpp"
#include "lendora/common/Clock.hpp"
#include "lendora/common/signals.hpp"
#include "lendora/config/ConfigRegistry.hpp"
#include "lendora/oracle/PriceOracle.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

//-------------------------------------------------------------------------

namespace lendora::loan
{
class LoanManager;
}  // namespace lendora::loan

namespace lendora::collateral
{

//-------------------------------------------------------------------------

// Capability for the ledger operations that bypass the ratio checks.
class LedgerAccess
{
    friend class loan::LoanManager;

    LedgerAccess() noexcept = default;
};

//-------------------------------------------------------------------------

struct PriceSnapshot
{
    uint64_t sequence{};
    std::map<AssetId, oracle::PriceObservation> prices;
};

//-------------------------------------------------------------------------

enum class PledgeState : uint32_t
{
    // Origination has not committed; the pledge is locked and refundable.
    PENDING,
    ACTIVE,
    // Seized from; awaiting release of the remainder.
    SETTLING
};

struct PledgeView
{
    PositionKey key;
    Amount amount;
    Amount outstanding;
    PledgeState state;
};

//-------------------------------------------------------------------------

struct CollateralLedgerDesc
{
    oracle::PriceOracle::Ptr oracle;
    BoundedExecutor::Ptr executor;
    config::ConfigRegistry::Ptr config;
    Clock::Ptr clock;
    uint32_t priceDecimals = kDefaultPriceDecimals;
    Timestamp priceFreshness = 3600;
    std::chrono::milliseconds oracleTimeout{250};
};

//-------------------------------------------------------------------------

/**
 * Borrower collateral positions, the loan pledges against them and the
 * latest price per asset. Every mutation is atomic under the ledger mutex
 * and journalled; price reads go through an immutable snapshot and take no
 * lock.
 */
class CollateralLedger : public JsonSerializable
{
public:
    using Ptr = std::shared_ptr<CollateralLedger>;

    explicit CollateralLedger(const CollateralLedgerDesc& desc);

    Expected<void> post(const AccountId& borrower, const AssetId& asset, Amount amount);
    Expected<void> withdraw(const AccountId& borrower, const AssetId& asset, Amount amount);

    [[nodiscard]] Expected<Bps> ratio(LoanId loanId, Amount outstanding, Timestamp now) const;
    [[nodiscard]] Expected<Bps> ratio(
        const AccountId& borrower, const AssetId& asset, Amount outstanding, Timestamp now) const;

    Expected<oracle::PriceObservation> refreshPrice(const AssetId& asset);
    Expected<void> applyPrice(const AssetId& asset, const oracle::PriceObservation& observation);
    [[nodiscard]] Expected<oracle::PriceObservation> freshPrice(
        const AssetId& asset, Timestamp now) const;
    // Falls back to the oracle when the snapshot has no fresh price.
    Expected<oracle::PriceObservation> ensureFreshPrice(const AssetId& asset);

    [[nodiscard]] std::shared_ptr<const PriceSnapshot> priceSnapshot() const noexcept
    {
        return m_prices.load(std::memory_order_acquire);
    }

    // Posts and pledges in one step; the pledge stays PENDING until activated.
    Expected<void> postAndPledge(
        const LedgerAccess& access,
        const AccountId& borrower,
        const AssetId& asset,
        LoanId loanId,
        Amount amount,
        Amount outstanding);
    Expected<void> activatePledge(const LedgerAccess& access, LoanId loanId);
    // Returns a PENDING pledge to the borrower and removes it from the position.
    Expected<Amount> refund(const LedgerAccess& access, LoanId loanId);
    Expected<void> updateDebt(const LedgerAccess& access, LoanId loanId, Amount outstanding);
    Expected<Amount> release(const LedgerAccess& access, LoanId loanId);
    // No ratio check; returns the amount actually taken, at most the pledge.
    Expected<Amount> seize(
        const LedgerAccess& access,
        const AccountId& borrower,
        const AssetId& asset,
        LoanId loanId,
        Amount amount);

    [[nodiscard]] std::optional<CollateralPosition> position(
        const AccountId& borrower, const AssetId& asset) const;
    [[nodiscard]] std::vector<CollateralPosition> positions(const AccountId& borrower) const;
    [[nodiscard]] std::optional<PledgeView> pledge(LoanId loanId) const;
    [[nodiscard]] std::vector<CollateralEntry> journal() const;

    [[nodiscard]] uint32_t priceDecimals() const noexcept { return m_priceDecimals; }
    [[nodiscard]] Timestamp priceFreshness() const noexcept { return m_priceFreshness; }

    [[nodiscard]] auto&& journalled(this auto&& self) noexcept { return self.m_journalled; }
    [[nodiscard]] auto&& priceUpdated(this auto&& self) noexcept { return self.m_priceUpdated; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    struct PledgeRecord
    {
        PositionKey key;
        Amount outstanding;
        PledgeState state;
    };

    [[nodiscard]] Expected<Bps> ratioOf(
        Amount collateral, const AssetId& asset, Amount outstanding, Timestamp now) const;
    void appendEntry(
        CollateralEntryKind kind,
        const PositionKey& key,
        std::optional<LoanId> loanId,
        Amount amount,
        std::vector<CollateralEntry>& appended);
    // Journal signals fire outside the ledger lock.
    void publish(const std::vector<CollateralEntry>& entries);

    oracle::PriceOracle::Ptr m_oracle;
    BoundedExecutor::Ptr m_executor;
    config::ConfigRegistry::Ptr m_config;
    Clock::Ptr m_clock;
    uint32_t m_priceDecimals;
    Timestamp m_priceFreshness;
    std::chrono::milliseconds m_oracleTimeout;

    mutable std::shared_mutex m_mtx;
    std::map<PositionKey, CollateralPosition> m_positions;
    std::map<LoanId, PledgeRecord> m_pledges;
    std::vector<CollateralEntry> m_journal;

    std::mutex m_priceWriteMtx;
    std::atomic<std::shared_ptr<const PriceSnapshot>> m_prices;

    SyncSignal<void(const CollateralEntry&)> m_journalled;
    SyncSignal<void(const AssetId&, const oracle::PriceObservation&)> m_priceUpdated;
    std::shared_ptr<spdlog::logger> m_logger;
};

//-------------------------------------------------------------------------

}  // namespace lendora::collateral

//-------------------------------------------------------------------------
