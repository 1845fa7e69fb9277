/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/BoundedExecutor.hpp"
#include "lendora/common/Clock.hpp"
#include "lendora/config/ProtocolConfig.hpp"
#include "lendora/credit/CreditVerifier.hpp"
#include "lendora/loan/LoanManager.hpp"
#include "lendora/oracle/PriceOracle.hpp"

#include <filesystem>
#include <memory>

//-------------------------------------------------------------------------

namespace lendora::protocol
{

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

struct ProtocolDesc
{
    config::ProtocolConfig config;
    Clock::Ptr clock;
    oracle::PriceOracle::Ptr oracle;
    credit::CreditVerifier::Ptr verifier;
};

//-------------------------------------------------------------------------

/**
 * Owns one fully wired protocol instance. Construction order resolves the
 * LiquidationEngine <-> LoanManager cycle by registration.
 */
class Protocol
{
public:
    explicit Protocol(const ProtocolDesc& desc);

    [[nodiscard]] static std::unique_ptr<Protocol> fromXML(
        const fs::path& path,
        Clock::Ptr clock,
        oracle::PriceOracle::Ptr oracle,
        credit::CreditVerifier::Ptr verifier);

    [[nodiscard]] const config::ProtocolConfig& config() const noexcept { return m_config; }
    [[nodiscard]] auto&& clock(this auto&& self) noexcept { return *self.m_clock; }
    [[nodiscard]] auto&& executor(this auto&& self) noexcept { return *self.m_executor; }
    [[nodiscard]] auto&& registry(this auto&& self) noexcept { return *self.m_registry; }
    [[nodiscard]] auto&& ledger(this auto&& self) noexcept { return *self.m_ledger; }
    [[nodiscard]] auto&& engine(this auto&& self) noexcept { return *self.m_engine; }
    [[nodiscard]] auto&& manager(this auto&& self) noexcept { return *self.m_manager; }

private:
    config::ProtocolConfig m_config;
    Clock::Ptr m_clock;
    BoundedExecutor::Ptr m_executor;
    config::ConfigRegistry::Ptr m_registry;
    collateral::CollateralLedger::Ptr m_ledger;
    credit::CreditGate::Ptr m_creditGate;
    liquidation::LiquidationEngine::Ptr m_engine;
    loan::LoanManager::Ptr m_manager;
};

//-------------------------------------------------------------------------

}  // namespace lendora::protocol

//-------------------------------------------------------------------------
