/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/credit/AttestationRegistry.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace lendora;
using namespace lendora::credit;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

Attestation makeAttestation(const std::string& hash, const std::string& signal = "1")
{
    return Attestation{
        .proofHash = hash,
        .proof = {"0x1", "0x2", "0x3", "0x4", "0x5", "0x6", "0x7", "0x8"},
        .publicSignals = {signal}
    };
}

}  // namespace

//-------------------------------------------------------------------------

TEST(AttestationRegistryTests, WellFormed)
{
    EXPECT_TRUE(makeAttestation("0xabc").wellFormed());
    EXPECT_TRUE(makeAttestation("0xabc", "12345").wellFormed());
    EXPECT_FALSE(makeAttestation("").wellFormed());
    EXPECT_FALSE(makeAttestation("0xabc", "0xzz").wellFormed());

    auto attestation = makeAttestation("0xabc");
    attestation.proof[3] = "";
    EXPECT_FALSE(attestation.wellFormed());

    attestation = makeAttestation("0xabc");
    attestation.publicSignals.clear();
    EXPECT_FALSE(attestation.wellFormed());
}

//-------------------------------------------------------------------------

TEST(AttestationRegistryTests, SignalIsOne)
{
    EXPECT_TRUE(signalIsOne("1"));
    EXPECT_TRUE(signalIsOne("0x1"));
    EXPECT_TRUE(signalIsOne("0x0001"));
    EXPECT_FALSE(signalIsOne("0"));
    EXPECT_FALSE(signalIsOne("10"));
    EXPECT_FALSE(signalIsOne("0x"));
}

//-------------------------------------------------------------------------

TEST(AttestationRegistryTests, PublishedAttestationDecidesEligibility)
{
    AttestationRegistry registry;
    const auto good = makeAttestation("0xa1");
    const auto bad = makeAttestation("0xa0", "0");
    registry.publish("alice", good);
    registry.publish("alice", bad);

    EXPECT_THAT(registry.verify("alice", good), Optional(true));
    EXPECT_THAT(registry.verify("alice", bad), Optional(false));
    // Bound to the borrower it was published for.
    EXPECT_THAT(registry.verify("bob", good), Optional(false));
    // Any field differing from the published copy fails.
    auto tampered = good;
    tampered.proof[0] = "0x9";
    EXPECT_THAT(registry.verify("alice", tampered), Optional(false));
    // Idempotent.
    EXPECT_THAT(registry.verify("alice", good), Optional(true));

    registry.revoke("alice", "0xa1");
    EXPECT_THAT(registry.verify("alice", good), Optional(false));
}

//-------------------------------------------------------------------------

TEST(AttestationRegistryTests, OfflineIsUnavailable)
{
    AttestationRegistry registry;
    const auto good = makeAttestation("0xa1");
    registry.publish("alice", good);
    registry.setOnline(false);
    EXPECT_EQ(registry.verify("alice", good).error(), ErrorCode::VERIFICATION_UNAVAILABLE);
    registry.setOnline(true);
    EXPECT_THAT(registry.verify("alice", good), Optional(true));
}

//-------------------------------------------------------------------------
