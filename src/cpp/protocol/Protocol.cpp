/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/protocol/Protocol.hpp"

#include "lendora/logging/logging.hpp"

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendora::protocol
{

//-------------------------------------------------------------------------

Protocol::Protocol(const ProtocolDesc& desc)
    : m_config{desc.config},
      m_clock{desc.clock}
{
    if (!m_clock || !desc.oracle || !desc.verifier) {
        throw std::invalid_argument{fmt::format(
            "{}: clock, oracle and verifier are required",
            std::source_location::current().function_name())};
    }

    m_executor = std::make_shared<BoundedExecutor>(m_config.workerThreads);
    m_registry = std::make_shared<config::ConfigRegistry>(
        m_config.administrator, m_config.parameters, m_clock);
    m_ledger = std::make_shared<collateral::CollateralLedger>(collateral::CollateralLedgerDesc{
        .oracle = desc.oracle,
        .executor = m_executor,
        .config = m_registry,
        .clock = m_clock,
        .priceDecimals = m_config.priceDecimals,
        .priceFreshness = m_config.priceFreshness,
        .oracleTimeout = m_config.timeouts.oracle
    });
    m_creditGate = std::make_shared<credit::CreditGate>(
        desc.verifier, m_executor, m_config.timeouts.credit);
    m_engine = std::make_shared<liquidation::LiquidationEngine>(m_ledger, m_registry);
    m_manager = std::make_shared<loan::LoanManager>(loan::LoanManagerDesc{
        .config = m_registry,
        .ledger = m_ledger,
        .creditGate = m_creditGate,
        .engine = m_engine,
        .clock = m_clock,
        .minPrincipal = m_config.minPrincipal,
        .maxTermMonths = m_config.maxTermMonths,
        .lockTimeout = m_config.timeouts.lock
    });

    logging::componentLogger("Protocol")->info(
        "PROTOCOL UP: ADMIN {}, {} WORKERS, PRICE DECIMALS {}, FRESHNESS {}s",
        m_config.administrator,
        m_config.workerThreads,
        m_config.priceDecimals,
        m_config.priceFreshness);
}

//-------------------------------------------------------------------------

std::unique_ptr<Protocol> Protocol::fromXML(
    const fs::path& path,
    Clock::Ptr clock,
    oracle::PriceOracle::Ptr oracle,
    credit::CreditVerifier::Ptr verifier)
{
    return std::make_unique<Protocol>(ProtocolDesc{
        .config = config::loadProtocolConfig(path),
        .clock = std::move(clock),
        .oracle = std::move(oracle),
        .verifier = std::move(verifier)
    });
}

//-------------------------------------------------------------------------

}  // namespace lendora::protocol

//-------------------------------------------------------------------------
