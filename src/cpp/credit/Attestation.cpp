/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/credit/Attestation.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendora::credit
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] bool isFieldElement(const std::string& word) noexcept
{
    std::string_view digits{word};
    const bool hex = digits.starts_with("0x") || digits.starts_with("0X");
    if (hex) {
        digits.remove_prefix(2);
    }
    if (digits.empty()) {
        return false;
    }
    return std::ranges::all_of(digits, [hex](unsigned char c) {
        return hex ? std::isxdigit(c) != 0 : std::isdigit(c) != 0;
    });
}

}  // namespace

//-------------------------------------------------------------------------

bool Attestation::wellFormed() const noexcept
{
    return !proofHash.empty()
        && std::ranges::all_of(proof, isFieldElement)
        && !publicSignals.empty()
        && std::ranges::all_of(publicSignals, isFieldElement);
}

//-------------------------------------------------------------------------

}  // namespace lendora::credit

//-------------------------------------------------------------------------
