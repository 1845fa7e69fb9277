/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/collateral/CollateralLedger.hpp"

#include "lendora/common/fixed_point.hpp"
#include "lendora/logging/logging.hpp"

#include <algorithm>
#include <ranges>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendora::collateral
{

//-------------------------------------------------------------------------

CollateralLedger::CollateralLedger(const CollateralLedgerDesc& desc)
    : m_oracle{desc.oracle},
      m_executor{desc.executor},
      m_config{desc.config},
      m_clock{desc.clock},
      m_priceDecimals{desc.priceDecimals},
      m_priceFreshness{desc.priceFreshness},
      m_oracleTimeout{desc.oracleTimeout},
      m_logger{logging::componentLogger("CollateralLedger")}
{
    if (!m_oracle || !m_executor || !m_config || !m_clock) {
        throw std::invalid_argument{fmt::format(
            "{}: oracle, executor, config and clock are required",
            std::source_location::current().function_name())};
    }
    if (!util::pow10(m_priceDecimals)) {
        throw std::invalid_argument{fmt::format(
            "{}: priceDecimals {} out of range",
            std::source_location::current().function_name(), m_priceDecimals)};
    }
    m_prices.store(std::make_shared<const PriceSnapshot>(), std::memory_order_release);
}

//-------------------------------------------------------------------------

Expected<void> CollateralLedger::post(
    const AccountId& borrower, const AssetId& asset, Amount amount)
{
    if (amount == 0) {
        return Unexpected{ErrorCode::INVALID_AMOUNT};
    }
    if (borrower.empty() || asset.empty()) {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }

    std::vector<CollateralEntry> appended;
    {
        std::unique_lock lock{m_mtx};
        PositionKey key{borrower, asset};
        auto it = m_positions.try_emplace(key, key).first;
        if (auto res = it->second.credit(amount); !res) {
            return res;
        }
        appendEntry(CollateralEntryKind::POST, key, std::nullopt, amount, appended);
    }
    publish(appended);
    return {};
}

//-------------------------------------------------------------------------

Expected<void> CollateralLedger::withdraw(
    const AccountId& borrower, const AssetId& asset, Amount amount)
{
    if (amount == 0) {
        return Unexpected{ErrorCode::INVALID_AMOUNT};
    }

    const PositionKey key{borrower, asset};

    // Draws beyond the free balance need a usable price; fetch one before locking.
    bool drawsOnPledges{};
    {
        std::shared_lock lock{m_mtx};
        if (const auto it = m_positions.find(key); it != m_positions.end()) {
            drawsOnPledges = amount > it->second.free();
        }
    }
    if (drawsOnPledges) {
        if (const auto price = ensureFreshPrice(asset); !price) {
            return Unexpected{price.error()};
        }
    }

    std::vector<CollateralEntry> appended;
    const auto outcome = [&]() -> Expected<void> {
        std::unique_lock lock{m_mtx};
        auto it = m_positions.find(key);
        if (it == m_positions.end() || amount > it->second.amount()) {
            return Unexpected{ErrorCode::INSUFFICIENT_COLLATERAL};
        }
        auto& pos = it->second;

        const Amount fromFree = std::min(pos.free(), amount);
        Amount remaining = amount - fromFree;

        // Plan the draws against pledges first; nothing is touched unless every
        // affected loan stays at or above the minimum ratio.
        std::vector<std::pair<LoanId, Amount>> draws;
        if (remaining > 0) {
            const auto price = freshPrice(asset, m_clock->now());
            if (!price) {
                return Unexpected{price.error()};
            }
            const Bps minRatio = m_config->parameters().minCollateralRatio;
            for (const auto& [loanId, pledged] : pos.pledges()) {
                if (remaining == 0) break;
                const auto& record = m_pledges.at(loanId);
                if (record.state != PledgeState::ACTIVE) continue;
                const Amount take = std::min(pledged, remaining);
                const auto value =
                    util::collateralValue(pledged - take, price->price, m_priceDecimals);
                if (!value) {
                    return Unexpected{value.error()};
                }
                if (const Bps ratio = util::ratioBps(*value, record.outstanding);
                    ratio < minRatio) {
                    m_logger->info(
                        "WITHDRAW {} {} OF {} REJECTED: LOAN {} WOULD FALL TO {} < {}",
                        amount, asset, borrower, loanId, ratio, minRatio);
                    return Unexpected{ErrorCode::BELOW_MINIMUM_RATIO};
                }
                draws.emplace_back(loanId, take);
                remaining -= take;
            }
            if (remaining > 0) {
                return Unexpected{ErrorCode::INSUFFICIENT_COLLATERAL};
            }
        }

        if (fromFree > 0) {
            if (auto res = pos.debit(fromFree); !res) {
                return res;
            }
            appendEntry(CollateralEntryKind::WITHDRAW, key, std::nullopt, fromFree, appended);
        }
        for (const auto& [loanId, take] : draws) {
            const auto taken = pos.takeFromPledge(loanId, take);
            if (!taken) {
                return Unexpected{taken.error()};
            }
            appendEntry(CollateralEntryKind::WITHDRAW, key, loanId, *taken, appended);
        }
        return {};
    }();
    publish(appended);
    return outcome;
}

//-------------------------------------------------------------------------

Expected<Bps> CollateralLedger::ratio(LoanId loanId, Amount outstanding, Timestamp now) const
{
    Amount pledged{};
    AssetId asset;
    {
        std::shared_lock lock{m_mtx};
        const auto it = m_pledges.find(loanId);
        if (it == m_pledges.end()) {
            return Unexpected{ErrorCode::LOAN_NOT_FOUND};
        }
        pledged = m_positions.at(it->second.key).pledgeOf(loanId).value_or(0);
        asset = it->second.key.asset;
    }
    return ratioOf(pledged, asset, outstanding, now);
}

//-------------------------------------------------------------------------

Expected<Bps> CollateralLedger::ratio(
    const AccountId& borrower, const AssetId& asset, Amount outstanding, Timestamp now) const
{
    Amount amount{};
    {
        std::shared_lock lock{m_mtx};
        const auto it = m_positions.find(PositionKey{borrower, asset});
        if (it == m_positions.end()) {
            return Unexpected{ErrorCode::UNKNOWN_ASSET};
        }
        amount = it->second.amount();
    }
    return ratioOf(amount, asset, outstanding, now);
}

//-------------------------------------------------------------------------

Expected<oracle::PriceObservation> CollateralLedger::refreshPrice(const AssetId& asset)
{
    std::optional<Expected<oracle::PriceObservation>> result;
    try {
        result = m_executor->run(
            [oracle = m_oracle, asset] { return oracle->getPrice(asset); }, m_oracleTimeout);
    }
    catch (const std::exception& exc) {
        m_logger->error("PRICE FEED FOR {} FAILED: {}", asset, exc.what());
        return Unexpected{ErrorCode::PRICE_UNAVAILABLE};
    }

    if (!result.has_value()) {
        m_logger->warn(
            "PRICE FEED FOR {} TIMED OUT AFTER {}ms", asset, m_oracleTimeout.count());
        return Unexpected{ErrorCode::PRICE_UNAVAILABLE};
    }
    if (!result->has_value()) {
        m_logger->warn("PRICE FEED FOR {} RETURNED {}", asset, result->error());
        return Unexpected{result->error()};
    }
    if (auto applied = applyPrice(asset, result->value()); !applied) {
        return Unexpected{applied.error()};
    }
    return result->value();
}

//-------------------------------------------------------------------------

Expected<void> CollateralLedger::applyPrice(
    const AssetId& asset, const oracle::PriceObservation& observation)
{
    if (asset.empty() || observation.price == 0) {
        m_logger->warn("REJECTED PRICE FOR '{}': {}", asset, observation);
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }

    std::lock_guard lock{m_priceWriteMtx};
    const auto current = priceSnapshot();
    if (const auto it = current->prices.find(asset);
        it != current->prices.end() && observation.observedAt < it->second.observedAt) {
        m_logger->warn(
            "REJECTED OUT OF ORDER PRICE FOR {}: {} OLDER THAN {}",
            asset, observation, it->second);
        return Unexpected{ErrorCode::STALE_PRICE};
    }
    else if (it != current->prices.end() && it->second == observation) {
        return {};
    }

    auto next = std::make_shared<PriceSnapshot>(*current);
    next->sequence = current->sequence + 1;
    next->prices[asset] = observation;
    m_prices.store(std::move(next), std::memory_order_release);

    m_logger->debug("PRICE {} -> {}", asset, observation);
    m_priceUpdated(asset, observation);
    return {};
}

//-------------------------------------------------------------------------

Expected<oracle::PriceObservation> CollateralLedger::freshPrice(
    const AssetId& asset, Timestamp now) const
{
    const auto snapshot = priceSnapshot();
    const auto it = snapshot->prices.find(asset);
    if (it == snapshot->prices.end()) {
        return Unexpected{ErrorCode::PRICE_UNAVAILABLE};
    }
    const auto& observation = it->second;
    if (now > observation.observedAt && now - observation.observedAt > m_priceFreshness) {
        return Unexpected{ErrorCode::STALE_PRICE};
    }
    return observation;
}

//-------------------------------------------------------------------------

Expected<oracle::PriceObservation> CollateralLedger::ensureFreshPrice(const AssetId& asset)
{
    if (auto price = freshPrice(asset, m_clock->now());
        price || !isRetryable(price.error())) {
        return price;
    }
    if (auto refreshed = refreshPrice(asset); !refreshed) {
        return refreshed;
    }
    return freshPrice(asset, m_clock->now());
}

//-------------------------------------------------------------------------

Expected<void> CollateralLedger::postAndPledge(
    const LedgerAccess&,
    const AccountId& borrower,
    const AssetId& asset,
    LoanId loanId,
    Amount amount,
    Amount outstanding)
{
    if (amount == 0) {
        return Unexpected{ErrorCode::INVALID_AMOUNT};
    }
    if (borrower.empty() || asset.empty() || loanId == LOAN_ID_INVALID) {
        return Unexpected{ErrorCode::INVALID_PARAMETER};
    }

    std::vector<CollateralEntry> appended;
    {
        std::unique_lock lock{m_mtx};
        if (m_pledges.contains(loanId)) {
            return Unexpected{ErrorCode::INVALID_PARAMETER};
        }
        PositionKey key{borrower, asset};
        auto& pos = m_positions.try_emplace(key, key).first->second;
        if (auto res = pos.credit(amount); !res) {
            return res;
        }
        if (auto res = pos.pledge(loanId, amount); !res) {
            return pos.debit(amount).and_then([&] { return res; });
        }
        m_pledges.emplace(
            loanId,
            PledgeRecord{.key = key, .outstanding = outstanding, .state = PledgeState::PENDING});
        appendEntry(CollateralEntryKind::POST, key, std::nullopt, amount, appended);
        appendEntry(CollateralEntryKind::PLEDGE, key, loanId, amount, appended);
    }
    publish(appended);
    return {};
}

//-------------------------------------------------------------------------

Expected<void> CollateralLedger::activatePledge(const LedgerAccess&, LoanId loanId)
{
    std::unique_lock lock{m_mtx};
    const auto it = m_pledges.find(loanId);
    if (it == m_pledges.end()) {
        return Unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    if (it->second.state != PledgeState::PENDING) {
        return Unexpected{ErrorCode::LOAN_NOT_ACTIVE};
    }
    it->second.state = PledgeState::ACTIVE;
    return {};
}

//-------------------------------------------------------------------------

Expected<Amount> CollateralLedger::refund(const LedgerAccess&, LoanId loanId)
{
    std::vector<CollateralEntry> appended;
    Amount refunded{};
    {
        std::unique_lock lock{m_mtx};
        const auto it = m_pledges.find(loanId);
        if (it == m_pledges.end()) {
            return Unexpected{ErrorCode::LOAN_NOT_FOUND};
        }
        if (it->second.state != PledgeState::PENDING) {
            return Unexpected{ErrorCode::LOAN_NOT_ACTIVE};
        }
        const PositionKey key = it->second.key;
        auto& pos = m_positions.at(key);
        const auto released = pos.release(loanId);
        if (!released) {
            return released;
        }
        if (auto res = pos.debit(*released); !res) {
            return Unexpected{res.error()};
        }
        refunded = *released;
        m_pledges.erase(it);
        appendEntry(CollateralEntryKind::REFUND, key, loanId, refunded, appended);
    }
    publish(appended);
    return refunded;
}

//-------------------------------------------------------------------------

Expected<void> CollateralLedger::updateDebt(
    const LedgerAccess&, LoanId loanId, Amount outstanding)
{
    std::unique_lock lock{m_mtx};
    const auto it = m_pledges.find(loanId);
    if (it == m_pledges.end()) {
        return Unexpected{ErrorCode::LOAN_NOT_FOUND};
    }
    it->second.outstanding = outstanding;
    return {};
}

//-------------------------------------------------------------------------

Expected<Amount> CollateralLedger::release(const LedgerAccess&, LoanId loanId)
{
    std::vector<CollateralEntry> appended;
    Amount released{};
    {
        std::unique_lock lock{m_mtx};
        const auto it = m_pledges.find(loanId);
        if (it == m_pledges.end()) {
            return Unexpected{ErrorCode::LOAN_NOT_FOUND};
        }
        const PositionKey key = it->second.key;
        const auto res = m_positions.at(key).release(loanId);
        if (!res) {
            return res;
        }
        released = *res;
        m_pledges.erase(it);
        appendEntry(CollateralEntryKind::RELEASE, key, loanId, released, appended);
    }
    publish(appended);
    return released;
}

//-------------------------------------------------------------------------

Expected<Amount> CollateralLedger::seize(
    const LedgerAccess&,
    const AccountId& borrower,
    const AssetId& asset,
    LoanId loanId,
    Amount amount)
{
    std::vector<CollateralEntry> appended;
    Amount seized{};
    {
        std::unique_lock lock{m_mtx};
        const auto it = m_pledges.find(loanId);
        if (it == m_pledges.end() || it->second.key != PositionKey{borrower, asset}) {
            return Unexpected{ErrorCode::LOAN_NOT_FOUND};
        }
        it->second.state = PledgeState::SETTLING;
        const auto res = m_positions.at(it->second.key).takeFromPledge(loanId, amount);
        if (!res) {
            return res;
        }
        seized = *res;
        if (seized > 0) {
            appendEntry(CollateralEntryKind::SEIZE, it->second.key, loanId, seized, appended);
        }
    }
    publish(appended);
    return seized;
}

//-------------------------------------------------------------------------

std::optional<CollateralPosition> CollateralLedger::position(
    const AccountId& borrower, const AssetId& asset) const
{
    std::shared_lock lock{m_mtx};
    if (const auto it = m_positions.find(PositionKey{borrower, asset}); it != m_positions.end()) {
        return it->second;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

std::vector<CollateralPosition> CollateralLedger::positions(const AccountId& borrower) const
{
    std::shared_lock lock{m_mtx};
    std::vector<CollateralPosition> res;
    for (auto it = m_positions.lower_bound(PositionKey{borrower, {}});
         it != m_positions.end() && it->first.borrower == borrower;
         ++it) {
        res.push_back(it->second);
    }
    return res;
}

//-------------------------------------------------------------------------

std::optional<PledgeView> CollateralLedger::pledge(LoanId loanId) const
{
    std::shared_lock lock{m_mtx};
    const auto it = m_pledges.find(loanId);
    if (it == m_pledges.end()) {
        return std::nullopt;
    }
    return PledgeView{
        .key = it->second.key,
        .amount = m_positions.at(it->second.key).pledgeOf(loanId).value_or(0),
        .outstanding = it->second.outstanding,
        .state = it->second.state
    };
}

//-------------------------------------------------------------------------

std::vector<CollateralEntry> CollateralLedger::journal() const
{
    std::shared_lock lock{m_mtx};
    return m_journal;
}

//-------------------------------------------------------------------------

void CollateralLedger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();

        std::shared_lock lock{m_mtx};
        rapidjson::Value positionsJson{rapidjson::kArrayType};
        for (const auto& pos : m_positions | std::views::values) {
            rapidjson::Document posJson{&allocator};
            pos.jsonSerialize(posJson);
            positionsJson.PushBack(posJson, allocator);
        }
        json.AddMember("positions", positionsJson, allocator);

        rapidjson::Value journalJson{rapidjson::kArrayType};
        for (const auto& entry : m_journal) {
            rapidjson::Document entryJson{&allocator};
            entry.jsonSerialize(entryJson);
            journalJson.PushBack(entryJson, allocator);
        }
        json.AddMember("journal", journalJson, allocator);
        lock.unlock();

        rapidjson::Value pricesJson{rapidjson::kObjectType};
        for (const auto& [asset, observation] : priceSnapshot()->prices) {
            rapidjson::Value obsJson{rapidjson::kObjectType};
            obsJson.AddMember("price", rapidjson::Value{observation.price}, allocator);
            obsJson.AddMember("observedAt", rapidjson::Value{observation.observedAt}, allocator);
            pricesJson.AddMember(json::makeString(asset, allocator), obsJson, allocator);
        }
        json.AddMember("prices", pricesJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Expected<Bps> CollateralLedger::ratioOf(
    Amount collateral, const AssetId& asset, Amount outstanding, Timestamp now) const
{
    return freshPrice(asset, now).and_then(
        [&](const oracle::PriceObservation& observation) {
            return util::collateralValue(collateral, observation.price, m_priceDecimals);
        })
        .transform([outstanding](Amount value) { return util::ratioBps(value, outstanding); });
}

//-------------------------------------------------------------------------

void CollateralLedger::appendEntry(
    CollateralEntryKind kind,
    const PositionKey& key,
    std::optional<LoanId> loanId,
    Amount amount,
    std::vector<CollateralEntry>& appended)
{
    appended.push_back(m_journal.emplace_back(CollateralEntry{
        .sequence = m_journal.size() + 1,
        .kind = kind,
        .borrower = key.borrower,
        .asset = key.asset,
        .loanId = loanId,
        .amount = amount,
        .timestamp = m_clock->now()
    }));
}

//-------------------------------------------------------------------------

void CollateralLedger::publish(const std::vector<CollateralEntry>& entries)
{
    for (const auto& entry : entries) {
        m_journalled(entry);
    }
}

//-------------------------------------------------------------------------

}  // namespace lendora::collateral

//-------------------------------------------------------------------------
