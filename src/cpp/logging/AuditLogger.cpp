/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/logging/AuditLogger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace lendora::logging
{

//-------------------------------------------------------------------------

AuditLogger::AuditLogger(const fs::path& directory, loan::LoanManager& manager)
    : m_directory{directory}
{
    fs::create_directories(m_directory);

    m_transitionLogger = makeLogger(kTransitionsFile, "time,loanId,from,to,actor,reason");
    m_repaymentLogger = makeLogger(
        kRepaymentsFile, "time,loanId,payer,amount,interestPaid,principalPaid,remaining");
    m_collateralLogger =
        makeLogger(kCollateralFile, "sequence,time,kind,borrower,asset,loanId,amount");
    m_liquidationLogger = makeLogger(
        kLiquidationsFile,
        "sequence,time,kind,loanId,borrower,liquidator,asset,ratio,seized,bonus,"
        "lenderShare,borrowerRemainder,price");
    m_priceLogger = makeLogger(kPricesFile, "asset,price,observedAt");
    m_configLogger =
        makeLogger(kConfigFile, "version,time,actor,parameter,oldValue,newValue");

    m_transitionFeed = manager.transitioned().connect(
        [this](const loan::Loan& loan, const loan::LoanTransition& tr) {
            m_transitionLogger->trace("{},{},{},{},{},{}",
                tr.timestamp, loan.id(), tr.from, tr.to, tr.actor, tr.reason);
            m_transitionLogger->flush();
        });
    m_repaymentFeed = manager.repaid().connect(
        [this](const loan::Loan& loan, const loan::Repayment& repayment) {
            m_repaymentLogger->trace("{},{},{},{},{},{},{}",
                repayment.timestamp, loan.id(), repayment.payer, repayment.amount,
                repayment.interestPaid, repayment.principalPaid, repayment.remaining);
            m_repaymentLogger->flush();
        });
    m_collateralFeed = manager.collateralLedger().journalled().connect(
        [this](const collateral::CollateralEntry& entry) {
            m_collateralLogger->trace("{}", entry);
            m_collateralLogger->flush();
        });
    m_liquidationFeed = manager.liquidated().connect(
        [this](const liquidation::LiquidationEvent& event) {
            m_liquidationLogger->trace("{}", event);
            m_liquidationLogger->flush();
        });
    m_priceFeed = manager.collateralLedger().priceUpdated().connect(
        [this](const AssetId& asset, const oracle::PriceObservation& observation) {
            m_priceLogger->trace("{},{},{}", asset, observation.price, observation.observedAt);
            m_priceLogger->flush();
        });
    m_configFeed = manager.configRegistry().changed().connect(
        [this](const config::ConfigAuditRecord& record) {
            m_configLogger->trace("{},{},{},{},{},{}",
                record.version, record.timestamp, record.actor,
                record.parameter, record.oldValue, record.newValue);
            m_configLogger->flush();
        });
}

//-------------------------------------------------------------------------

std::unique_ptr<spdlog::logger> AuditLogger::makeLogger(
    std::string_view filename, std::string_view header) const
{
    // Slots fire on whichever thread mutated the protocol.
    auto logger = std::make_unique<spdlog::logger>(
        std::string{filename},
        std::make_shared<spdlog::sinks::basic_file_sink_mt>((m_directory / filename).string()));
    logger->set_level(spdlog::level::trace);
    logger->set_pattern("%v");
    logger->trace("{}", header);
    logger->flush();
    return logger;
}

//-------------------------------------------------------------------------

}  // namespace lendora::logging

//-------------------------------------------------------------------------
