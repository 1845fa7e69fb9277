/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/credit/AttestationRegistry.hpp"
#include "lendora/oracle/ManualPriceOracle.hpp"
#include "lendora/protocol/Protocol.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace lendora::scenario
{

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

struct ScenarioStep
{
    size_t index;
    std::string action;
    // "OK", an error code name, or an action-specific result.
    std::string outcome;
    std::string expected;
    bool passed;
};

struct ScenarioReport
{
    std::vector<ScenarioStep> steps;

    [[nodiscard]] size_t failures() const noexcept;
    [[nodiscard]] bool passed() const noexcept { return failures() == 0; }
};

//-------------------------------------------------------------------------

/**
 * Replays a scripted sequence of protocol calls. The runner owns the clock,
 * the price feed and the attestation registry the protocol is wired to, so
 * a script can move time, publish prices and publish attestations.
 *
 *   <Scenario start="1700000000">
 *     <Price asset="ETH" price="200000000000"/>
 *     <Attestation borrower="alice" hash="0xa1" signals="1"/>
 *     <Originate id="l1" borrower="alice" lender="pool" principal="100000" term="12"
 *                asset="ETH" collateral="100" attestation="0xa1" expect="OK"/>
 *     <Advance months="12"/>
 *     <Expire loan="l1" expect="OK"/>
 *   </Scenario>
 */
class ScenarioRunner
{
public:
    ScenarioRunner(const config::ProtocolConfig& config, Timestamp start = {});

    ScenarioReport run(pugi::xml_node scenario);
    ScenarioReport runFile(const fs::path& path);

    [[nodiscard]] protocol::Protocol& protocol() noexcept { return *m_protocol; }
    [[nodiscard]] ManualClock& clock() noexcept { return *m_clock; }
    [[nodiscard]] oracle::ManualPriceOracle& oracle() noexcept { return *m_oracle; }
    [[nodiscard]] credit::AttestationRegistry& attestations() noexcept { return *m_attestations; }

private:
    [[nodiscard]] std::string step(pugi::xml_node node);
    [[nodiscard]] LoanId resolveLoan(pugi::xml_node node) const;

    std::shared_ptr<ManualClock> m_clock;
    std::shared_ptr<oracle::ManualPriceOracle> m_oracle;
    std::shared_ptr<credit::AttestationRegistry> m_attestations;
    std::unique_ptr<protocol::Protocol> m_protocol;
    std::map<std::string, LoanId> m_loanAliases;
    std::map<std::string, credit::Attestation> m_publishedAttestations;
    std::shared_ptr<spdlog::logger> m_logger;
};

//-------------------------------------------------------------------------

}  // namespace lendora::scenario

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendora::scenario::ScenarioStep>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendora::scenario::ScenarioStep& step, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "#{} {} -> {}{}",
            step.index,
            step.action,
            step.outcome,
            step.passed ? "" : fmt::format(" (expected {})", step.expected));
    }
};

//-------------------------------------------------------------------------
