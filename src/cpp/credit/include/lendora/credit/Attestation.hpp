/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace lendora::credit
{

//-------------------------------------------------------------------------

inline constexpr size_t kProofWordCount = 8;

/**
 * Opaque credit attestation as produced by the attestation service: a
 * Groth16 proof flattened to [a0, a1, b00, b01, b10, b11, c0, c1] (hex or
 * decimal field elements), its public signals ([isEligible]) and the hash
 * under which the service published it. The underlying score never appears.
 */
struct Attestation
{
    std::string proofHash;
    std::array<std::string, kProofWordCount> proof;
    std::vector<std::string> publicSignals;

    [[nodiscard]] bool wellFormed() const noexcept;
    [[nodiscard]] bool operator==(const Attestation&) const noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace lendora::credit

//-------------------------------------------------------------------------
