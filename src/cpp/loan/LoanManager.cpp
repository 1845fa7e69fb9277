/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/loan/LoanManager.hpp"

#include "lendora/collateral/LedgerTransaction.hpp"
#include "lendora/logging/logging.hpp"
#include "lendora/rate/RateModel.hpp"

#include <algorithm>
#include <limits>
#include <ranges>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendora::loan
{

//-------------------------------------------------------------------------

LoanManager::LoanManager(const LoanManagerDesc& desc)
    : m_config{desc.config},
      m_ledger{desc.ledger},
      m_creditGate{desc.creditGate},
      m_engine{desc.engine},
      m_clock{desc.clock},
      m_minPrincipal{desc.minPrincipal},
      m_maxTermMonths{desc.maxTermMonths},
      m_lockTimeout{desc.lockTimeout},
      m_logger{logging::componentLogger("LoanManager")}
{
    if (!m_config || !m_ledger || !m_creditGate || !m_engine || !m_clock) {
        throw std::invalid_argument{fmt::format(
            "{}: config, ledger, credit gate, engine and clock are required",
            std::source_location::current().function_name())};
    }
    if (m_maxTermMonths == 0 || m_maxTermMonths > config::kMaxTermMonths) {
        throw std::invalid_argument{fmt::format(
            "{}: maxTermMonths must be in [1, {}], was {}",
            std::source_location::current().function_name(),
            config::kMaxTermMonths,
            m_maxTermMonths)};
    }
    m_engine->registerManager(*this);
}

//-------------------------------------------------------------------------

LoanManager::~LoanManager() noexcept
{
    m_engine->unregisterManager(*this);
}

//-------------------------------------------------------------------------

Expected<LoanId> LoanManager::originate(const OriginationRequest& request)
{
    if (request.principal == 0 || request.collateralAmount == 0) {
        return Unexpected{ErrorCode::INVALID_AMOUNT};
    }
    if (request.principal < m_minPrincipal) {
        return Unexpected{ErrorCode::PRINCIPAL_BELOW_MINIMUM};
    }
    if (request.termMonths == 0 || request.termMonths > m_maxTermMonths
        || request.borrower.empty() || request.lender.empty()
        || request.collateralAsset.empty()) {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }

    const auto credit = m_creditGate->verify(request.borrower, request.attestation);

    // One parameter version for the whole origination.
    const auto params = m_config->snapshot()->parameters;
    const LoanId loanId = m_nextLoanId.fetch_add(1);

    collateral::LedgerTransaction txn{*m_ledger, m_ledgerAccess, loanId};
    if (auto res = txn.postAndPledge(
            request.borrower, request.collateralAsset, request.collateralAmount, request.principal);
        !res) {
        return Unexpected{res.error()};
    }

    const auto ratio = ratioWithRefresh(loanId, request.collateralAsset, request.principal);
    if (!ratio) {
        m_logger->warn(
            "ORIGINATION {} FOR {} REJECTED: {}", loanId, request.borrower, ratio.error());
        return Unexpected{ratio.error()};
    }
    if (*ratio < params.minCollateralRatio) {
        m_logger->info(
            "ORIGINATION {} FOR {} REJECTED: RATIO {} < {}",
            loanId, request.borrower, *ratio, params.minCollateralRatio);
        return Unexpected{ErrorCode::INSUFFICIENT_COLLATERAL};
    }

    const Bps rate = rate::computeRate(*ratio, credit.eligible, params.rateModel);
    const auto interest = rate::computeTotalInterest(request.principal, rate, request.termMonths);
    if (!interest) {
        return Unexpected{interest.error()};
    }
    if (request.principal > std::numeric_limits<Amount>::max() - *interest) {
        return Unexpected{ErrorCode::ARITHMETIC_OVERFLOW};
    }

    const Timestamp now = m_clock->now();
    auto slot = std::make_unique<LoanSlot>();
    slot->loan = Loan{LoanDesc{
        .id = loanId,
        .borrower = request.borrower,
        .lender = request.lender,
        .principal = request.principal,
        .rate = rate,
        .termMonths = request.termMonths,
        .originatedAt = now,
        .totalInterest = *interest,
        .collateralAsset = request.collateralAsset,
        .collateralAmount = request.collateralAmount
    }};
    if (auto res = slot->loan.transition(
            LoanStatus::ACTIVE,
            now,
            request.borrower,
            fmt::format("originated at ratio {} eligible {}", *ratio, credit.eligible));
        !res) {
        return Unexpected{res.error()};
    }
    if (auto res = txn.commit(); !res) {
        return Unexpected{res.error()};
    }

    m_logger->info("ORIGINATED {}", slot->loan);
    const Loan originated = slot->loan;
    {
        std::unique_lock lock{m_slotsMtx};
        m_slots.emplace(loanId, std::move(slot));
    }
    publishTransition(originated);
    return loanId;
}

//-------------------------------------------------------------------------

Expected<Amount> LoanManager::repay(LoanId loanId, Amount amount, const AccountId& payer)
{
    if (amount == 0) {
        return Unexpected{ErrorCode::INVALID_AMOUNT};
    }
    auto* slot = findSlot(loanId);
    if (slot == nullptr) {
        return Unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    SlotLock lock{slot->mtx, m_lockTimeout};
    if (!lock.owns_lock()) {
        return Unexpected{ErrorCode::CONCURRENCY_CONFLICT};
    }

    const Timestamp now = m_clock->now();
    Loan next = slot->loan;
    const auto remaining = next.applyRepayment(amount, now, payer);
    if (!remaining) {
        return remaining;
    }

    if (*remaining == 0) {
        if (auto res = next.transition(LoanStatus::REPAID, now, payer, "repaid in full"); !res) {
            return Unexpected{res.error()};
        }
        if (auto released = m_ledger->release(m_ledgerAccess, loanId); !released) {
            return Unexpected{released.error()};
        }
        next.setCollateralAmount(0);
    }
    else if (auto res = m_ledger->updateDebt(m_ledgerAccess, loanId, next.outstandingPrincipal());
             !res) {
        return Unexpected{res.error()};
    }

    slot->loan = std::move(next);
    const Loan repaid = slot->loan;
    lock.unlock();

    m_logger->info("LOAN {} : {} REPAID {}, {} LEFT", loanId, payer, amount, *remaining);
    m_repaid(repaid, repaid.repayments().back());
    if (*remaining == 0) {
        publishTransition(repaid);
    }
    return remaining;
}

//-------------------------------------------------------------------------

Expected<liquidation::LiquidationDecision> LoanManager::checkHealth(
    LoanId loanId, const AccountId& liquidator)
{
    auto* slot = findSlot(loanId);
    if (slot == nullptr) {
        return Unexpected{ErrorCode::LOAN_NOT_FOUND};
    }

    // Optimistic pass on a copy; most checks end here.
    const auto observed = readLoan(*slot);
    if (!observed) {
        return Unexpected{observed.error()};
    }
    if (observed->status() != LoanStatus::ACTIVE) {
        return Unexpected{ErrorCode::LOAN_NOT_ACTIVE};
    }
    if (const auto price = m_ledger->ensureFreshPrice(observed->collateralAsset()); !price) {
        return Unexpected{price.error()};
    }
    const auto optimistic = m_engine->evaluate(*observed, m_clock->now());
    if (!optimistic) {
        // A settlement that committed after the copy was taken releases the pledge.
        if (const auto current = readLoan(*slot);
            current && current->status() != LoanStatus::ACTIVE) {
            return Unexpected{ErrorCode::LOAN_NOT_ACTIVE};
        }
        return optimistic;
    }
    if (!liquidation::isEligible(*optimistic)) {
        return optimistic;
    }

    SlotLock lock{slot->mtx, m_lockTimeout};
    if (!lock.owns_lock()) {
        return Unexpected{ErrorCode::CONCURRENCY_CONFLICT};
    }
    if (slot->loan.status() != LoanStatus::ACTIVE) {
        return Unexpected{ErrorCode::LOAN_NOT_ACTIVE};
    }

    // The price may have moved since the optimistic pass.
    const Timestamp now = m_clock->now();
    const auto decision = m_engine->evaluate(slot->loan, now);
    if (!decision || !liquidation::isEligible(*decision)) {
        return decision;
    }
    const auto& plan = std::get<liquidation::LiquidationPlan>(*decision);
    if (auto event = settle(
            lock, *slot, plan, liquidation::LiquidationKind::LIQUIDATION, liquidator, now);
        !event) {
        return Unexpected{event.error()};
    }
    return decision;
}

//-------------------------------------------------------------------------

Expected<liquidation::LiquidationEvent> LoanManager::expire(LoanId loanId)
{
    auto* slot = findSlot(loanId);
    if (slot == nullptr) {
        return Unexpected{ErrorCode::LOAN_NOT_FOUND};
    }

    // The oracle is consulted before the loan is locked; the checks repeat under the lock.
    const auto observed = readLoan(*slot);
    if (!observed) {
        return Unexpected{observed.error()};
    }
    if (observed->status() != LoanStatus::ACTIVE) {
        return Unexpected{ErrorCode::LOAN_NOT_ACTIVE};
    }
    if (!observed->matured(m_clock->now())) {
        return Unexpected{ErrorCode::LOAN_NOT_MATURED};
    }
    if (const auto price = m_ledger->ensureFreshPrice(observed->collateralAsset()); !price) {
        m_logger->warn("LOAN {} : DEFAULT DEFERRED, NO USABLE PRICE ({})", loanId, price.error());
        return Unexpected{price.error()};
    }

    SlotLock lock{slot->mtx, m_lockTimeout};
    if (!lock.owns_lock()) {
        return Unexpected{ErrorCode::CONCURRENCY_CONFLICT};
    }
    if (slot->loan.status() != LoanStatus::ACTIVE) {
        return Unexpected{ErrorCode::LOAN_NOT_ACTIVE};
    }
    const Timestamp now = m_clock->now();
    if (!slot->loan.matured(now)) {
        return Unexpected{ErrorCode::LOAN_NOT_MATURED};
    }

    const auto plan = m_engine->settleDefault(slot->loan, now);
    if (!plan) {
        return Unexpected{plan.error()};
    }
    return settle(
        lock, *slot, *plan, liquidation::LiquidationKind::DEFAULT, AccountId{kProtocolActor}, now);
}

//-------------------------------------------------------------------------

Expected<Loan> LoanManager::loan(LoanId loanId) const
{
    const auto* slot = findSlot(loanId);
    if (slot == nullptr) {
        return Unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    return readLoan(*slot).transform([this](Loan loan) {
        return withLiveCollateral(std::move(loan));
    });
}

//-------------------------------------------------------------------------

Expected<LoanStatus> LoanManager::status(LoanId loanId) const
{
    return loan(loanId).transform([](const Loan& loan) { return loan.status(); });
}

//-------------------------------------------------------------------------

Expected<Bps> LoanManager::collateralRatio(LoanId loanId) const
{
    return loan(loanId).and_then([this](const Loan& loan) -> Expected<Bps> {
        if (loan.status() != LoanStatus::ACTIVE) {
            return Unexpected{ErrorCode::LOAN_NOT_ACTIVE};
        }
        return m_ledger->ratio(loan.id(), loan.outstandingPrincipal(), m_clock->now());
    });
}

//-------------------------------------------------------------------------

std::vector<Loan> LoanManager::loans(std::optional<LoanStatus> filter) const
{
    std::vector<const LoanSlot*> slots;
    {
        std::shared_lock lock{m_slotsMtx};
        for (const auto& slot : m_slots | std::views::values) {
            slots.push_back(slot.get());
        }
    }

    std::vector<Loan> res;
    for (const auto* slot : slots) {
        std::lock_guard lock{slot->mtx};
        if (!filter || slot->loan.status() == *filter) {
            res.push_back(slot->loan);
        }
    }
    for (auto& loan : res) {
        loan = withLiveCollateral(std::move(loan));
    }
    return res;
}

//-------------------------------------------------------------------------

std::vector<LoanId> LoanManager::activeLoanIds() const
{
    std::vector<LoanId> res;
    for (const auto& loan : loans(LoanStatus::ACTIVE)) {
        res.push_back(loan.id());
    }
    return res;
}

//-------------------------------------------------------------------------

std::vector<liquidation::LiquidationEvent> LoanManager::liquidationHistory() const
{
    std::lock_guard lock{m_historyMtx};
    return m_liquidations;
}

//-------------------------------------------------------------------------

std::vector<liquidation::LiquidationEvent> LoanManager::liquidationHistory(LoanId loanId) const
{
    std::lock_guard lock{m_historyMtx};
    std::vector<liquidation::LiquidationEvent> res;
    for (const auto& event : m_liquidations) {
        if (event.loanId == loanId) {
            res.push_back(event);
        }
    }
    return res;
}

//-------------------------------------------------------------------------

Expected<uint64_t> LoanManager::setBaseRate(const AccountId& caller, Bps baseRate)
{
    auto res = m_config->setBaseRate(caller, baseRate);
    if (!res) {
        m_logger->warn("setBaseRate({}) BY {} REJECTED: {}", baseRate, caller, res.error());
    }
    return res;
}

//-------------------------------------------------------------------------

Expected<uint64_t> LoanManager::setRiskPremiumMultiplier(const AccountId& caller, Bps multiplier)
{
    auto res = m_config->setRiskPremiumMultiplier(caller, multiplier);
    if (!res) {
        m_logger->warn(
            "setRiskPremiumMultiplier({}) BY {} REJECTED: {}", multiplier, caller, res.error());
    }
    return res;
}

//-------------------------------------------------------------------------

Expected<uint64_t> LoanManager::setLiquidationParams(
    const AccountId& caller, Bps threshold, Bps bonus)
{
    auto res = m_config->setLiquidationParams(caller, threshold, bonus);
    if (!res) {
        m_logger->warn(
            "setLiquidationParams({}, {}) BY {} REJECTED: {}",
            threshold, bonus, caller, res.error());
    }
    return res;
}

//-------------------------------------------------------------------------

Expected<uint64_t> LoanManager::setMinCollateralRatio(const AccountId& caller, Bps minRatio)
{
    auto res = m_config->setMinCollateralRatio(caller, minRatio);
    if (!res) {
        m_logger->warn(
            "setMinCollateralRatio({}) BY {} REJECTED: {}", minRatio, caller, res.error());
    }
    return res;
}

//-------------------------------------------------------------------------

void LoanManager::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        m_config->jsonSerialize(json, "config");
        rapidjson::Value loansJson{rapidjson::kArrayType};
        for (const auto& loan : loans()) {
            rapidjson::Document loanJson{&allocator};
            loan.jsonSerialize(loanJson);
            loansJson.PushBack(loanJson, allocator);
        }
        json.AddMember("loans", loansJson, allocator);
        m_ledger->jsonSerialize(json, "collateral");
        rapidjson::Value liquidationsJson{rapidjson::kArrayType};
        for (const auto& event : liquidationHistory()) {
            rapidjson::Document eventJson{&allocator};
            event.jsonSerialize(eventJson);
            liquidationsJson.PushBack(eventJson, allocator);
        }
        json.AddMember("liquidations", liquidationsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

LoanManager::LoanSlot* LoanManager::findSlot(LoanId loanId) const
{
    std::shared_lock lock{m_slotsMtx};
    const auto it = m_slots.find(loanId);
    return it != m_slots.end() ? it->second.get() : nullptr;
}

//-------------------------------------------------------------------------

Expected<Loan> LoanManager::readLoan(const LoanSlot& slot) const
{
    SlotLock lock{slot.mtx, m_lockTimeout};
    if (!lock.owns_lock()) {
        return Unexpected{ErrorCode::CONCURRENCY_CONFLICT};
    }
    return slot.loan;
}

//-------------------------------------------------------------------------

Loan LoanManager::withLiveCollateral(Loan loan) const
{
    // Withdrawals draw on pledges inside the ledger; the pledge is the live figure.
    if (loan.status() == LoanStatus::ACTIVE) {
        if (const auto pledge = m_ledger->pledge(loan.id())) {
            loan.setCollateralAmount(pledge->amount);
        }
    }
    return loan;
}

//-------------------------------------------------------------------------

Expected<Bps> LoanManager::ratioWithRefresh(
    LoanId loanId, const AssetId& asset, Amount outstanding)
{
    if (const auto price = m_ledger->ensureFreshPrice(asset); !price) {
        m_logger->debug("LOAN {} : NO USABLE {} PRICE ({})", loanId, asset, price.error());
        return Unexpected{price.error()};
    }
    return m_ledger->ratio(loanId, outstanding, m_clock->now());
}

//-------------------------------------------------------------------------

Expected<liquidation::LiquidationEvent> LoanManager::settle(
    SlotLock& lock,
    LoanSlot& slot,
    const liquidation::LiquidationPlan& plan,
    liquidation::LiquidationKind kind,
    const AccountId& actor,
    Timestamp now)
{
    const bool isDefault = kind == liquidation::LiquidationKind::DEFAULT;
    Loan next = slot.loan;
    if (auto res = next.transition(
            isDefault ? LoanStatus::DEFAULTED : LoanStatus::LIQUIDATED,
            now,
            actor,
            isDefault
                ? fmt::format("matured with {} outstanding", next.outstanding())
                : fmt::format("ratio {} below threshold", plan.triggeringRatio));
        !res) {
        return Unexpected{res.error()};
    }

    const auto seized = m_ledger->seize(
        m_ledgerAccess, next.borrower(), next.collateralAsset(), next.id(), plan.seizeAmount);
    if (!seized) {
        return Unexpected{seized.error()};
    }
    // Collateral has left the pledge; the loan goes terminal either way.
    Amount remainder{};
    if (const auto released = m_ledger->release(m_ledgerAccess, next.id()); released) {
        remainder = *released;
    }
    else {
        m_logger->critical(
            "LOAN {} : RELEASE AFTER SEIZURE FAILED: {}", next.id(), released.error());
    }

    next.setCollateralAmount(0);

    const Amount bonus = std::min(plan.bonusAmount, *seized);
    liquidation::LiquidationEvent event{
        .sequence = 0,
        .kind = kind,
        .loanId = next.id(),
        .borrower = next.borrower(),
        .lender = next.lender(),
        .liquidator = isDefault ? AccountId{} : actor,
        .asset = next.collateralAsset(),
        .triggeringRatio = plan.triggeringRatio,
        .seizedAmount = *seized,
        .bonusAmount = bonus,
        .lenderAmount = *seized - bonus,
        .borrowerRemainder = remainder,
        .price = plan.price,
        .timestamp = now
    };
    {
        std::lock_guard lock{m_historyMtx};
        event.sequence = m_liquidations.size() + 1;
        m_liquidations.push_back(event);
    }

    slot.loan = std::move(next);
    const Loan settled = slot.loan;
    lock.unlock();

    m_logger->info("LOAN {} {} BY {}: {}", event.loanId, settled.status(), actor, plan);
    publishTransition(settled);
    m_liquidated(event);
    return event;
}

//-------------------------------------------------------------------------

void LoanManager::publishTransition(const Loan& loan)
{
    if (!loan.history().empty()) {
        m_transitioned(loan, loan.history().back());
    }
}

//-------------------------------------------------------------------------

}  // namespace lendora::loan

//-------------------------------------------------------------------------
