/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/credit/CreditVerifier.hpp"

#include <atomic>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

//-------------------------------------------------------------------------

namespace lendora::credit
{

//-------------------------------------------------------------------------

/**
 * Verifier backed by the attestations the attestation service has published
 * on the verification network. An attestation is eligible iff it was
 * published for that borrower, matches the published proof word for word,
 * and its first public signal is 1.
 */
class AttestationRegistry : public CreditVerifier
{
public:
    [[nodiscard]] virtual Expected<bool> verify(
        const AccountId& borrower, const Attestation& attestation) override;

    void publish(const AccountId& borrower, const Attestation& attestation);
    void revoke(const AccountId& borrower, const std::string& proofHash);

    void setOnline(bool flag) noexcept { m_online.store(flag, std::memory_order_release); }
    [[nodiscard]] bool online() const noexcept { return m_online.load(std::memory_order_acquire); }

private:
    using Key = std::pair<AccountId, std::string>;

    std::map<Key, Attestation> m_published;
    mutable std::shared_mutex m_mtx;
    std::atomic<bool> m_online{true};
};

//-------------------------------------------------------------------------

[[nodiscard]] bool signalIsOne(std::string_view signal) noexcept;

//-------------------------------------------------------------------------

}  // namespace lendora::credit

//-------------------------------------------------------------------------
