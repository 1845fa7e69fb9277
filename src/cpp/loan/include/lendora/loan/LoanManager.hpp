/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/collateral/CollateralLedger.hpp"
#include "lendora/common/Clock.hpp"
#include "lendora/common/signals.hpp"
#include "lendora/config/ConfigRegistry.hpp"
#include "lendora/credit/CreditGate.hpp"
#include "lendora/liquidation/LiquidationEngine.hpp"
#include "lendora/loan/Loan.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace lendora::loan
{

//-------------------------------------------------------------------------

struct OriginationRequest
{
    AccountId borrower;
    AccountId lender;
    Amount principal;
    uint32_t termMonths;
    AssetId collateralAsset;
    Amount collateralAmount;
    credit::Attestation attestation;
};

//-------------------------------------------------------------------------

struct LoanManagerDesc
{
    config::ConfigRegistry::Ptr config;
    collateral::CollateralLedger::Ptr ledger;
    credit::CreditGate::Ptr creditGate;
    liquidation::LiquidationEngine::Ptr engine;
    Clock::Ptr clock;
    Amount minPrincipal = 1;
    uint32_t maxTermMonths = config::kMaxTermMonths;
    std::chrono::milliseconds lockTimeout{100};
};

//-------------------------------------------------------------------------

/**
 * Owns every loan and is the only writer of loan state. Each loan has its
 * own timed mutex; operations on different loans never contend. A status
 * change and the collateral movement it implies commit together or not at
 * all.
 */
class LoanManager : public JsonSerializable
{
public:
    using Ptr = std::shared_ptr<LoanManager>;

    static constexpr std::string_view kProtocolActor = "protocol";

    explicit LoanManager(const LoanManagerDesc& desc);
    ~LoanManager() noexcept;

    LoanManager(const LoanManager&) = delete;
    LoanManager& operator=(const LoanManager&) = delete;

    Expected<LoanId> originate(const OriginationRequest& request);
    // Returns the balance left after the payment.
    Expected<Amount> repay(LoanId loanId, Amount amount, const AccountId& payer);
    Expected<liquidation::LiquidationDecision> checkHealth(
        LoanId loanId, const AccountId& liquidator);
    Expected<liquidation::LiquidationEvent> expire(LoanId loanId);

    [[nodiscard]] Expected<Loan> loan(LoanId loanId) const;
    [[nodiscard]] Expected<LoanStatus> status(LoanId loanId) const;
    [[nodiscard]] Expected<Bps> collateralRatio(LoanId loanId) const;
    [[nodiscard]] std::vector<Loan> loans(std::optional<LoanStatus> filter = {}) const;
    [[nodiscard]] std::vector<LoanId> activeLoanIds() const;
    [[nodiscard]] std::vector<liquidation::LiquidationEvent> liquidationHistory() const;
    [[nodiscard]] std::vector<liquidation::LiquidationEvent> liquidationHistory(
        LoanId loanId) const;

    Expected<uint64_t> setBaseRate(const AccountId& caller, Bps baseRate);
    Expected<uint64_t> setRiskPremiumMultiplier(const AccountId& caller, Bps multiplier);
    Expected<uint64_t> setLiquidationParams(const AccountId& caller, Bps threshold, Bps bonus);
    Expected<uint64_t> setMinCollateralRatio(const AccountId& caller, Bps minRatio);

    [[nodiscard]] auto&& configRegistry(this auto&& self) noexcept { return *self.m_config; }
    [[nodiscard]] auto&& collateralLedger(this auto&& self) noexcept { return *self.m_ledger; }
    [[nodiscard]] auto&& liquidationEngine(this auto&& self) noexcept { return *self.m_engine; }

    [[nodiscard]] auto&& transitioned(this auto&& self) noexcept { return self.m_transitioned; }
    [[nodiscard]] auto&& repaid(this auto&& self) noexcept { return self.m_repaid; }
    [[nodiscard]] auto&& liquidated(this auto&& self) noexcept { return self.m_liquidated; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    struct LoanSlot
    {
        mutable std::timed_mutex mtx;
        Loan loan;
    };

    using SlotLock = std::unique_lock<std::timed_mutex>;

    [[nodiscard]] LoanSlot* findSlot(LoanId loanId) const;
    [[nodiscard]] Expected<Loan> readLoan(const LoanSlot& slot) const;
    [[nodiscard]] Loan withLiveCollateral(Loan loan) const;
    [[nodiscard]] Expected<Bps> ratioWithRefresh(
        LoanId loanId, const AssetId& asset, Amount outstanding);
    // Releases `lock` once the loan is terminal, before anything is published.
    Expected<liquidation::LiquidationEvent> settle(
        SlotLock& lock,
        LoanSlot& slot,
        const liquidation::LiquidationPlan& plan,
        liquidation::LiquidationKind kind,
        const AccountId& actor,
        Timestamp now);
    void publishTransition(const Loan& loan);

    config::ConfigRegistry::Ptr m_config;
    collateral::CollateralLedger::Ptr m_ledger;
    credit::CreditGate::Ptr m_creditGate;
    liquidation::LiquidationEngine::Ptr m_engine;
    Clock::Ptr m_clock;
    Amount m_minPrincipal;
    uint32_t m_maxTermMonths;
    std::chrono::milliseconds m_lockTimeout;
    collateral::LedgerAccess m_ledgerAccess;

    mutable std::shared_mutex m_slotsMtx;
    std::map<LoanId, std::unique_ptr<LoanSlot>> m_slots;
    std::atomic<LoanId> m_nextLoanId{1};

    mutable std::mutex m_historyMtx;
    std::vector<liquidation::LiquidationEvent> m_liquidations;

    SyncSignal<void(const Loan&, const LoanTransition&)> m_transitioned;
    SyncSignal<void(const Loan&, const Repayment&)> m_repaid;
    SyncSignal<void(const liquidation::LiquidationEvent&)> m_liquidated;
    std::shared_ptr<spdlog::logger> m_logger;
};

//-------------------------------------------------------------------------

}  // namespace lendora::loan

//-------------------------------------------------------------------------
