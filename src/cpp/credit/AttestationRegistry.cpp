/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/credit/AttestationRegistry.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace lendora::credit
{

//-------------------------------------------------------------------------

Expected<bool> AttestationRegistry::verify(
    const AccountId& borrower, const Attestation& attestation)
{
    if (!online()) {
        return Unexpected{ErrorCode::VERIFICATION_UNAVAILABLE};
    }
    if (!attestation.wellFormed()) {
        return false;
    }

    std::shared_lock lock{m_mtx};
    const auto it = m_published.find(Key{borrower, attestation.proofHash});
    if (it == m_published.end() || it->second != attestation) {
        return false;
    }
    return signalIsOne(attestation.publicSignals.front());
}

//-------------------------------------------------------------------------

void AttestationRegistry::publish(const AccountId& borrower, const Attestation& attestation)
{
    std::unique_lock lock{m_mtx};
    m_published.insert_or_assign(Key{borrower, attestation.proofHash}, attestation);
}

//-------------------------------------------------------------------------

void AttestationRegistry::revoke(const AccountId& borrower, const std::string& proofHash)
{
    std::unique_lock lock{m_mtx};
    m_published.erase(Key{borrower, proofHash});
}

//-------------------------------------------------------------------------

bool signalIsOne(std::string_view signal) noexcept
{
    if (signal.starts_with("0x") || signal.starts_with("0X")) {
        signal.remove_prefix(2);
    }
    while (signal.size() > 1 && signal.front() == '0') {
        signal.remove_prefix(1);
    }
    return signal == "1";
}

//-------------------------------------------------------------------------

}  // namespace lendora::credit

//-------------------------------------------------------------------------
