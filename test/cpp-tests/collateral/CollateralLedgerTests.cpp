/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/collateral/CollateralLedger.hpp"
#include "test-common/TestProtocol.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace lendora;
using namespace lendora::collateral;
using namespace lendora::test;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

struct CollateralLedgerTest : Test
{
    TestProtocol fixture;
    CollateralLedger& ledger = fixture.ledger();

    LoanId originate(const AccountId& borrower, Amount principal, Amount collateral)
    {
        const auto loanId = fixture.manager().originate(
            fixture.request(borrower, principal, collateral));
        if (!loanId) {
            throw std::runtime_error{fmt::format("origination failed: {}", loanId.error())};
        }
        return *loanId;
    }
};

}  // namespace

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, PostCreditsPositionAndJournals)
{
    ASSERT_TRUE(ledger.post("alice", kAsset, 500));
    ASSERT_TRUE(ledger.post("alice", kAsset, 250));

    const auto pos = ledger.position("alice", kAsset);
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->amount(), 750);
    EXPECT_EQ(pos->free(), 750);
    EXPECT_EQ(pos->pledged(), 0);

    const auto journal = ledger.journal();
    ASSERT_EQ(journal.size(), 2);
    EXPECT_EQ(journal[0].sequence, 1);
    EXPECT_EQ(journal[0].kind, CollateralEntryKind::POST);
    EXPECT_EQ(journal[0].amount, 500);
    EXPECT_EQ(journal[0].timestamp, kStart);
    EXPECT_FALSE(journal[0].loanId.has_value());
    EXPECT_EQ(journal[1].sequence, 2);
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, PostRejectsBadInput)
{
    EXPECT_EQ(ledger.post("alice", kAsset, 0).error(), ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(ledger.post("", kAsset, 10).error(), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(ledger.post("alice", "", 10).error(), ErrorCode::INVALID_PARAMETER);
    EXPECT_FALSE(ledger.position("alice", kAsset).has_value());
    EXPECT_THAT(ledger.journal(), IsEmpty());
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, WithdrawFromFreeBalance)
{
    ASSERT_TRUE(ledger.post("alice", kAsset, 500));
    ASSERT_TRUE(ledger.withdraw("alice", kAsset, 200));
    EXPECT_EQ(ledger.position("alice", kAsset)->amount(), 300);

    EXPECT_EQ(ledger.withdraw("alice", kAsset, 301).error(), ErrorCode::INSUFFICIENT_COLLATERAL);
    EXPECT_EQ(ledger.withdraw("bob", kAsset, 1).error(), ErrorCode::INSUFFICIENT_COLLATERAL);
    EXPECT_EQ(ledger.withdraw("alice", kAsset, 0).error(), ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(ledger.position("alice", kAsset)->amount(), 300);

    const auto journal = ledger.journal();
    ASSERT_EQ(journal.size(), 2);
    EXPECT_EQ(journal[1].kind, CollateralEntryKind::WITHDRAW);
    EXPECT_EQ(journal[1].amount, 200);
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, FreeOnlyWithdrawNeedsNoPrice)
{
    ASSERT_TRUE(ledger.post("alice", kAsset, 500));
    EXPECT_TRUE(ledger.withdraw("alice", kAsset, 500));
    EXPECT_EQ(ledger.position("alice", kAsset)->amount(), 0);
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, PositionRatio)
{
    fixture.setPrice(kParPrice);
    ASSERT_TRUE(ledger.post("bob", kAsset, 150'000));
    EXPECT_THAT(ledger.ratio("bob", kAsset, 100'000, kStart), Optional(15'000));
    EXPECT_THAT(ledger.ratio("bob", kAsset, 0, kStart), Optional(kMaxRatioBps));
    EXPECT_EQ(ledger.ratio("carol", kAsset, 100, kStart).error(), ErrorCode::UNKNOWN_ASSET);
    EXPECT_EQ(ledger.ratio(42, 100, kStart).error(), ErrorCode::LOAN_NOT_FOUND);
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, PricesAreValidatedAndOrdered)
{
    const oracle::PriceObservation first{.price = kParPrice, .observedAt = kStart};
    EXPECT_EQ(
        ledger.applyPrice(kAsset, {.price = 0, .observedAt = kStart}).error(),
        ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(ledger.freshPrice(kAsset, kStart).error(), ErrorCode::PRICE_UNAVAILABLE);

    ASSERT_TRUE(ledger.applyPrice(kAsset, first));
    const auto snapshot = ledger.priceSnapshot();
    EXPECT_EQ(snapshot->sequence, 1);

    EXPECT_EQ(
        ledger.applyPrice(kAsset, {.price = 2 * kParPrice, .observedAt = kStart - 1}).error(),
        ErrorCode::STALE_PRICE);
    ASSERT_TRUE(ledger.applyPrice(kAsset, {.price = 2 * kParPrice, .observedAt = kStart + 10}));

    // Readers holding the older snapshot are unaffected.
    EXPECT_EQ(snapshot->prices.at(kAsset), first);
    EXPECT_EQ(ledger.priceSnapshot()->sequence, 2);
    EXPECT_THAT(
        ledger.freshPrice(kAsset, kStart + 10),
        Optional(oracle::PriceObservation{.price = 2 * kParPrice, .observedAt = kStart + 10}));
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, PriceGoesStale)
{
    fixture.setPrice(kParPrice);
    const Timestamp freshness = ledger.priceFreshness();
    EXPECT_TRUE(ledger.freshPrice(kAsset, kStart + freshness));
    EXPECT_EQ(ledger.freshPrice(kAsset, kStart + freshness + 1).error(), ErrorCode::STALE_PRICE);
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, RefreshPriceReadsOracle)
{
    EXPECT_EQ(ledger.refreshPrice(kAsset).error(), ErrorCode::PRICE_UNAVAILABLE);

    fixture.oracle->publish(kAsset, {.price = 3 * kParPrice, .observedAt = kStart});
    EXPECT_THAT(
        ledger.refreshPrice(kAsset),
        Optional(oracle::PriceObservation{.price = 3 * kParPrice, .observedAt = kStart}));
    EXPECT_THAT(
        ledger.freshPrice(kAsset, kStart),
        Optional(oracle::PriceObservation{.price = 3 * kParPrice, .observedAt = kStart}));
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, OriginationPledgesCollateral)
{
    fixture.setPrice(kParPrice);
    const LoanId loanId = originate("alice", 100'000, 200'000);

    const auto pledge = ledger.pledge(loanId);
    ASSERT_TRUE(pledge.has_value());
    EXPECT_EQ(pledge->state, PledgeState::ACTIVE);
    EXPECT_EQ(pledge->amount, 200'000);
    EXPECT_EQ(pledge->outstanding, 100'000);

    const auto pos = ledger.position("alice", kAsset);
    EXPECT_EQ(pos->amount(), 200'000);
    EXPECT_EQ(pos->pledged(), 200'000);
    EXPECT_EQ(pos->free(), 0);
    EXPECT_THAT(ledger.ratio(loanId, 100'000, kStart), Optional(20'000));

    const auto journal = ledger.journal();
    ASSERT_EQ(journal.size(), 2);
    EXPECT_EQ(journal[0].kind, CollateralEntryKind::POST);
    EXPECT_EQ(journal[1].kind, CollateralEntryKind::PLEDGE);
    EXPECT_THAT(journal[1].loanId, Optional(loanId));
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, WithdrawBelowMinimumRatioChangesNothing)
{
    fixture.setPrice(kParPrice);
    const LoanId loanId = originate("alice", 100'000, 200'000);
    const auto journalBefore = ledger.journal();

    // 140'000 left against 100'000 principal is 14'000 < 15'000.
    EXPECT_EQ(ledger.withdraw("alice", kAsset, 60'000).error(), ErrorCode::BELOW_MINIMUM_RATIO);
    EXPECT_EQ(ledger.pledge(loanId)->amount, 200'000);
    EXPECT_EQ(ledger.position("alice", kAsset)->amount(), 200'000);
    EXPECT_EQ(ledger.journal().size(), journalBefore.size());
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, WithdrawDrawsFreeThenPledge)
{
    fixture.setPrice(kParPrice);
    const LoanId loanId = originate("alice", 100'000, 200'000);
    ASSERT_TRUE(ledger.post("alice", kAsset, 10'000));

    // 10'000 free, then 50'000 from the pledge which lands exactly on 15'000.
    ASSERT_TRUE(ledger.withdraw("alice", kAsset, 60'000));
    EXPECT_EQ(ledger.pledge(loanId)->amount, 150'000);
    const auto pos = ledger.position("alice", kAsset);
    EXPECT_EQ(pos->amount(), 150'000);
    EXPECT_EQ(pos->free(), 0);

    const auto journal = ledger.journal();
    ASSERT_GE(journal.size(), 2);
    const auto& fromFree = journal[journal.size() - 2];
    const auto& fromPledge = journal.back();
    EXPECT_EQ(fromFree.kind, CollateralEntryKind::WITHDRAW);
    EXPECT_EQ(fromFree.amount, 10'000);
    EXPECT_FALSE(fromFree.loanId.has_value());
    EXPECT_EQ(fromPledge.kind, CollateralEntryKind::WITHDRAW);
    EXPECT_EQ(fromPledge.amount, 50'000);
    EXPECT_THAT(fromPledge.loanId, Optional(loanId));
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, PledgedWithdrawFailsClosedOnStalePrice)
{
    fixture.setPrice(kParPrice);
    static_cast<void>(originate("alice", 100'000, 200'000));

    fixture.clock->advance(ledger.priceFreshness() + 1);
    EXPECT_EQ(ledger.withdraw("alice", kAsset, 1).error(), ErrorCode::STALE_PRICE);
    EXPECT_EQ(ledger.position("alice", kAsset)->amount(), 200'000);
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, JournalSignalFollowsSequence)
{
    std::vector<uint64_t> sequences;
    bs2::scoped_connection conn = ledger.journalled().connect(
        [&](const CollateralEntry& entry) { sequences.push_back(entry.sequence); });

    ASSERT_TRUE(ledger.post("alice", kAsset, 10));
    ASSERT_TRUE(ledger.post("bob", kAsset, 20));
    ASSERT_TRUE(ledger.withdraw("alice", kAsset, 5));

    EXPECT_THAT(sequences, ElementsAre(1, 2, 3));
    EXPECT_THAT(ledger.positions("alice"), SizeIs(1));
}

//-------------------------------------------------------------------------

TEST_F(CollateralLedgerTest, JournalSubscribersMayReadLedger)
{
    std::vector<size_t> journalSizes;
    std::vector<Amount> balances;
    bs2::scoped_connection conn = ledger.journalled().connect([&](const CollateralEntry& entry) {
        journalSizes.push_back(ledger.journal().size());
        balances.push_back(ledger.position(entry.borrower, entry.asset)->amount());
    });

    ASSERT_TRUE(ledger.post("alice", kAsset, 10));
    ASSERT_TRUE(ledger.post("alice", kAsset, 20));
    ASSERT_TRUE(ledger.withdraw("alice", kAsset, 5));

    EXPECT_THAT(journalSizes, ElementsAre(1, 2, 3));
    EXPECT_THAT(balances, ElementsAre(10, 30, 25));
}

//-------------------------------------------------------------------------
