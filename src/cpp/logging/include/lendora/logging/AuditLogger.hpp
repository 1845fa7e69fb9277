/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/loan/LoanManager.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

//-------------------------------------------------------------------------

namespace lendora::logging
{

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

/**
 * Append-only CSV trails of everything that changes protocol state: loan
 * transitions, repayments, collateral journal entries, liquidations, price
 * updates and configuration changes. One file per stream under the given directory.
 */
class AuditLogger
{
public:
    AuditLogger(const fs::path& directory, loan::LoanManager& manager);

    [[nodiscard]] const fs::path& directory() const noexcept { return m_directory; }

    static constexpr std::string_view kTransitionsFile = "transitions.csv";
    static constexpr std::string_view kRepaymentsFile = "repayments.csv";
    static constexpr std::string_view kCollateralFile = "collateral.csv";
    static constexpr std::string_view kLiquidationsFile = "liquidations.csv";
    static constexpr std::string_view kPricesFile = "prices.csv";
    static constexpr std::string_view kConfigFile = "config.csv";

private:
    [[nodiscard]] std::unique_ptr<spdlog::logger> makeLogger(
        std::string_view filename, std::string_view header) const;

    fs::path m_directory;
    std::unique_ptr<spdlog::logger> m_transitionLogger;
    std::unique_ptr<spdlog::logger> m_repaymentLogger;
    std::unique_ptr<spdlog::logger> m_collateralLogger;
    std::unique_ptr<spdlog::logger> m_liquidationLogger;
    std::unique_ptr<spdlog::logger> m_priceLogger;
    std::unique_ptr<spdlog::logger> m_configLogger;
    bs2::scoped_connection m_transitionFeed;
    bs2::scoped_connection m_repaymentFeed;
    bs2::scoped_connection m_collateralFeed;
    bs2::scoped_connection m_liquidationFeed;
    bs2::scoped_connection m_priceFeed;
    bs2::scoped_connection m_configFeed;
};

//-------------------------------------------------------------------------

}  // namespace lendora::logging

//-------------------------------------------------------------------------
