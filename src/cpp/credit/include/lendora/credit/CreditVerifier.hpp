/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/ErrorCode.hpp"
#include "lendora/common/types.hpp"
#include "lendora/credit/Attestation.hpp"

#include <memory>

//-------------------------------------------------------------------------

namespace lendora::credit
{

//-------------------------------------------------------------------------

// Capability boundary for the zero-knowledge backend. Must be idempotent
// and side-effect free; VERIFICATION_UNAVAILABLE when the proof cannot be
// checked at all.
struct CreditVerifier
{
    using Ptr = std::shared_ptr<CreditVerifier>;

    virtual ~CreditVerifier() noexcept = default;

    [[nodiscard]] virtual Expected<bool> verify(
        const AccountId& borrower, const Attestation& attestation) = 0;
};

//-------------------------------------------------------------------------

}  // namespace lendora::credit

//-------------------------------------------------------------------------
