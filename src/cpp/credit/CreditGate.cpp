/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/credit/CreditGate.hpp"

#include "lendora/logging/logging.hpp"

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendora::credit
{

//-------------------------------------------------------------------------

CreditGate::CreditGate(
    CreditVerifier::Ptr verifier,
    BoundedExecutor::Ptr executor,
    std::chrono::milliseconds timeout)
    : m_verifier{std::move(verifier)},
      m_executor{std::move(executor)},
      m_timeout{timeout},
      m_logger{logging::componentLogger("CreditGate")}
{
    if (!m_verifier || !m_executor) {
        throw std::invalid_argument{fmt::format(
            "{}: verifier and executor are required",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

CreditDecision CreditGate::verify(const AccountId& borrower, const Attestation& attestation) const
{
    std::optional<Expected<bool>> result;
    try {
        result = m_executor->run(
            [verifier = m_verifier, borrower, attestation] {
                return verifier->verify(borrower, attestation);
            },
            m_timeout);
    }
    catch (const std::exception& exc) {
        m_logger->warn(
            "BORROWER {} : VERIFIER FAILED ({}), TREATING AS NOT ELIGIBLE", borrower, exc.what());
        return {.eligible = false, .reason = ErrorCode::VERIFICATION_UNAVAILABLE};
    }

    if (!result.has_value()) {
        m_logger->warn(
            "BORROWER {} : VERIFIER TIMED OUT AFTER {}ms, TREATING AS NOT ELIGIBLE",
            borrower, m_timeout.count());
        return {.eligible = false, .reason = ErrorCode::VERIFICATION_UNAVAILABLE};
    }
    if (!result->has_value()) {
        m_logger->warn(
            "BORROWER {} : VERIFIER RETURNED {}, TREATING AS NOT ELIGIBLE",
            borrower, result->error());
        return {.eligible = false, .reason = result->error()};
    }

    m_logger->debug("BORROWER {} : ATTESTATION {} ELIGIBLE {}",
        borrower, attestation.proofHash, result->value());
    return {.eligible = result->value(), .reason = std::nullopt};
}

//-------------------------------------------------------------------------

}  // namespace lendora::credit

//-------------------------------------------------------------------------
