/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/credit/AttestationRegistry.hpp"
#include "lendora/oracle/ManualPriceOracle.hpp"
#include "lendora/protocol/Protocol.hpp"

#include <fmt/format.h>

#include <chrono>
#include <memory>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendora::test
{

//-------------------------------------------------------------------------

inline constexpr Timestamp kStart = 1'700'000'000;
// One collateral unit is worth one currency unit at this price.
inline constexpr Price kParPrice = 100'000'000;
inline constexpr const char* kAsset = "ETH";

struct TestProtocolDesc
{
    config::ProtocolParameters parameters{};
    std::chrono::milliseconds lockTimeout{100};
    std::chrono::milliseconds creditTimeout{250};
    credit::CreditVerifier::Ptr verifier{};
};

//-------------------------------------------------------------------------

struct TestProtocol
{
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(kStart);
    std::shared_ptr<oracle::ManualPriceOracle> oracle =
        std::make_shared<oracle::ManualPriceOracle>();
    std::shared_ptr<credit::AttestationRegistry> attestations =
        std::make_shared<credit::AttestationRegistry>();
    std::unique_ptr<protocol::Protocol> instance;

    explicit TestProtocol(const TestProtocolDesc& desc = {})
    {
        config::ProtocolConfig config;
        config.parameters = desc.parameters;
        config.timeouts.lock = desc.lockTimeout;
        config.timeouts.credit = desc.creditTimeout;
        instance = std::make_unique<protocol::Protocol>(protocol::ProtocolDesc{
            .config = config,
            .clock = clock,
            .oracle = oracle,
            .verifier = desc.verifier ? desc.verifier : attestations
        });
    }

    [[nodiscard]] loan::LoanManager& manager() { return instance->manager(); }
    [[nodiscard]] collateral::CollateralLedger& ledger() { return instance->ledger(); }

    void setPrice(Price price, const AssetId& asset = kAsset)
    {
        const oracle::PriceObservation observation{.price = price, .observedAt = clock->now()};
        oracle->publish(asset, observation);
        if (!ledger().applyPrice(asset, observation)) {
            throw std::runtime_error{"price rejected"};
        }
    }

    [[nodiscard]] credit::Attestation attest(const AccountId& borrower, bool eligible = true)
    {
        credit::Attestation attestation{
            .proofHash = fmt::format("0x{}{}", borrower, eligible ? "01" : "00"),
            .proof = {"0x1", "0x2", "0x3", "0x4", "0x5", "0x6", "0x7", "0x8"},
            .publicSignals = {eligible ? "1" : "0"}
        };
        attestations->publish(borrower, attestation);
        return attestation;
    }

    [[nodiscard]] loan::OriginationRequest request(
        const AccountId& borrower, Amount principal, Amount collateral, uint32_t termMonths = 12)
    {
        return loan::OriginationRequest{
            .borrower = borrower,
            .lender = "pool",
            .principal = principal,
            .termMonths = termMonths,
            .collateralAsset = kAsset,
            .collateralAmount = collateral,
            .attestation = attest(borrower)
        };
    }
};

//-------------------------------------------------------------------------

}  // namespace lendora::test

//-------------------------------------------------------------------------
