/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/BoundedExecutor.hpp"
#include "lendora/credit/CreditVerifier.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <optional>

//-------------------------------------------------------------------------

namespace lendora::credit
{

//-------------------------------------------------------------------------

struct CreditDecision
{
    bool eligible;
    // Set when eligibility was denied because the verifier could not answer.
    std::optional<ErrorCode> reason;
};

//-------------------------------------------------------------------------

class CreditGate
{
public:
    using Ptr = std::shared_ptr<CreditGate>;

    CreditGate(
        CreditVerifier::Ptr verifier,
        BoundedExecutor::Ptr executor,
        std::chrono::milliseconds timeout);

    // Never fails: an unavailable, slow or throwing verifier yields "not eligible".
    [[nodiscard]] CreditDecision verify(
        const AccountId& borrower, const Attestation& attestation) const;

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return m_timeout; }

private:
    CreditVerifier::Ptr m_verifier;
    BoundedExecutor::Ptr m_executor;
    std::chrono::milliseconds m_timeout;
    std::shared_ptr<spdlog::logger> m_logger;
};

//-------------------------------------------------------------------------

}  // namespace lendora::credit

//-------------------------------------------------------------------------
