/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/credit/CreditGate.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

//-------------------------------------------------------------------------

using namespace lendora;
using namespace lendora::credit;
using namespace std::chrono_literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

struct MockCreditVerifier : CreditVerifier
{
    MOCK_METHOD(
        Expected<bool>, verify, (const AccountId&, const Attestation&), (override));
};

struct CreditGateTest : Test
{
    std::shared_ptr<MockCreditVerifier> verifier = std::make_shared<MockCreditVerifier>();
    BoundedExecutor::Ptr executor = std::make_shared<BoundedExecutor>(1);
    CreditGate gate{verifier, executor, 20ms};
    Attestation attestation{
        .proofHash = "0xfeed",
        .proof = {"1", "2", "3", "4", "5", "6", "7", "8"},
        .publicSignals = {"1"}
    };
};

}  // namespace

//-------------------------------------------------------------------------

TEST_F(CreditGateTest, PassesVerifierAnswerThrough)
{
    EXPECT_CALL(*verifier, verify("alice", attestation)).WillOnce(Return(Expected<bool>{true}));
    EXPECT_CALL(*verifier, verify("bob", attestation)).WillOnce(Return(Expected<bool>{false}));

    const auto alice = gate.verify("alice", attestation);
    EXPECT_TRUE(alice.eligible);
    EXPECT_FALSE(alice.reason.has_value());

    const auto bob = gate.verify("bob", attestation);
    EXPECT_FALSE(bob.eligible);
    EXPECT_FALSE(bob.reason.has_value());
}

//-------------------------------------------------------------------------

TEST_F(CreditGateTest, UnavailableVerifierMeansNotEligible)
{
    EXPECT_CALL(*verifier, verify(_, _))
        .WillOnce(Return(Expected<bool>{Unexpected{ErrorCode::VERIFICATION_UNAVAILABLE}}));

    const auto decision = gate.verify("alice", attestation);
    EXPECT_FALSE(decision.eligible);
    EXPECT_EQ(decision.reason, ErrorCode::VERIFICATION_UNAVAILABLE);
}

//-------------------------------------------------------------------------

TEST_F(CreditGateTest, ThrowingVerifierMeansNotEligible)
{
    EXPECT_CALL(*verifier, verify(_, _)).WillOnce(Throw(std::runtime_error{"prover crashed"}));

    const auto decision = gate.verify("alice", attestation);
    EXPECT_FALSE(decision.eligible);
    EXPECT_EQ(decision.reason, ErrorCode::VERIFICATION_UNAVAILABLE);
}

//-------------------------------------------------------------------------

TEST_F(CreditGateTest, SlowVerifierTimesOut)
{
    EXPECT_CALL(*verifier, verify(_, _)).WillOnce([](const AccountId&, const Attestation&) {
        std::this_thread::sleep_for(200ms);
        return Expected<bool>{true};
    });

    const auto decision = gate.verify("alice", attestation);
    EXPECT_FALSE(decision.eligible);
    EXPECT_EQ(decision.reason, ErrorCode::VERIFICATION_UNAVAILABLE);
}

//-------------------------------------------------------------------------

TEST(CreditGateTests, RequiresVerifierAndExecutor)
{
    EXPECT_THROW(
        CreditGate(nullptr, std::make_shared<BoundedExecutor>(1), 10ms), std::invalid_argument);
    EXPECT_THROW(
        CreditGate(std::make_shared<MockCreditVerifier>(), nullptr, 10ms), std::invalid_argument);
}

//-------------------------------------------------------------------------
