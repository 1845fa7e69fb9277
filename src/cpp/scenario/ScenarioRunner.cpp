/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/scenario/ScenarioRunner.hpp"

#include "lendora/common/ProtocolException.hpp"
#include "lendora/logging/logging.hpp"

#include <magic_enum.hpp>

#include <algorithm>
#include <ranges>
#include <source_location>
#include <stdexcept>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendora::scenario
{

//-------------------------------------------------------------------------

namespace
{

template<typename T>
[[nodiscard]] std::string describe(const Expected<T>& res)
{
    return res ? std::string{"OK"} : std::string{ErrorCode2StrView(res.error())};
}

[[nodiscard]] std::vector<std::string> splitList(std::string_view str)
{
    std::vector<std::string> res;
    for (auto part : str | std::views::split(',')) {
        std::string_view word{part.begin(), part.end()};
        if (!word.empty()) {
            res.emplace_back(word);
        }
    }
    return res;
}

[[nodiscard]] std::string requireAttribute(pugi::xml_node node, const char* name)
{
    const pugi::xml_attribute attr = node.attribute(name);
    if (!attr) {
        throw std::invalid_argument{fmt::format(
            "{}: <{}> is missing attribute '{}'",
            std::source_location::current().function_name(), node.name(), name)};
    }
    return attr.as_string();
}

[[nodiscard]] credit::Attestation makeAttestation(pugi::xml_node node)
{
    credit::Attestation attestation{.proofHash = requireAttribute(node, "hash")};
    const auto words = splitList(node.attribute("proof").as_string());
    for (size_t i = 0; i < attestation.proof.size(); ++i) {
        attestation.proof[i] = i < words.size() ? words[i] : fmt::format("0x{:x}", i + 1);
    }
    attestation.publicSignals = splitList(node.attribute("signals").as_string("1"));
    return attestation;
}

}  // namespace

//-------------------------------------------------------------------------

size_t ScenarioReport::failures() const noexcept
{
    return static_cast<size_t>(
        std::ranges::count_if(steps, [](const ScenarioStep& step) { return !step.passed; }));
}

//-------------------------------------------------------------------------

ScenarioRunner::ScenarioRunner(const config::ProtocolConfig& config, Timestamp start)
    : m_clock{std::make_shared<ManualClock>(start)},
      m_oracle{std::make_shared<oracle::ManualPriceOracle>()},
      m_attestations{std::make_shared<credit::AttestationRegistry>()},
      m_protocol{std::make_unique<protocol::Protocol>(protocol::ProtocolDesc{
          .config = config,
          .clock = m_clock,
          .oracle = m_oracle,
          .verifier = m_attestations
      })},
      m_logger{logging::componentLogger("ScenarioRunner")}
{}

//-------------------------------------------------------------------------

ScenarioReport ScenarioRunner::run(pugi::xml_node scenario)
{
    if (pugi::xml_attribute attr = scenario.attribute("start")) {
        m_clock->set(attr.as_ullong());
    }

    ScenarioReport report;
    for (pugi::xml_node node : scenario.children()) {
        if (node.type() != pugi::node_element) continue;
        ScenarioStep step{
            .index = report.steps.size() + 1,
            .action = node.name(),
            .outcome = this->step(node),
            .expected = node.attribute("expect").as_string(),
            .passed = true
        };
        step.passed = step.expected.empty() || step.expected == step.outcome;
        if (step.passed) {
            m_logger->info("{}", step);
        }
        else {
            m_logger->error("{}", step);
        }
        report.steps.push_back(std::move(step));
    }
    return report;
}

//-------------------------------------------------------------------------

ScenarioReport ScenarioRunner::runFile(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    if (pugi::xml_parse_result result = doc.load_file(path.c_str()); !result) {
        throw ProtocolException{fmt::format(
            "{}: failed to load '{}': {}", ctx, path.string(), result.description())};
    }
    pugi::xml_node node = doc.child("Scenario");
    if (!node) {
        throw ProtocolException{fmt::format("{}: missing node 'Scenario' in '{}'", ctx, path.string())};
    }
    return run(node);
}

//-------------------------------------------------------------------------

std::string ScenarioRunner::step(pugi::xml_node node)
{
    const std::string_view action = node.name();
    auto& manager = m_protocol->manager();
    auto& ledger = m_protocol->ledger();

    if (action == "Advance") {
        const Timestamp delta = node.attribute("seconds").as_ullong()
            + node.attribute("days").as_ullong() * 86'400
            + node.attribute("months").as_ullong() * kSecondsPerMonth;
        m_clock->advance(delta);
        return "OK";
    }
    if (action == "Price") {
        const AssetId asset = requireAttribute(node, "asset");
        const Timestamp now = m_clock->now();
        const Timestamp age = std::min<Timestamp>(node.attribute("age").as_ullong(), now);
        m_oracle->publish(
            asset,
            oracle::PriceObservation{
                .price = node.attribute("price").as_ullong(),
                .observedAt = now - age
            });
        return describe(ledger.refreshPrice(asset));
    }
    if (action == "Attestation") {
        auto attestation = makeAttestation(node);
        if (node.attribute("publish").as_bool(true)) {
            m_attestations->publish(requireAttribute(node, "borrower"), attestation);
        }
        m_publishedAttestations.insert_or_assign(attestation.proofHash, std::move(attestation));
        return "OK";
    }
    if (action == "Verifier") {
        m_attestations->setOnline(node.attribute("online").as_bool(true));
        return "OK";
    }
    if (action == "Post") {
        return describe(ledger.post(
            requireAttribute(node, "borrower"),
            requireAttribute(node, "asset"),
            node.attribute("amount").as_ullong()));
    }
    if (action == "Withdraw") {
        return describe(ledger.withdraw(
            requireAttribute(node, "borrower"),
            requireAttribute(node, "asset"),
            node.attribute("amount").as_ullong()));
    }
    if (action == "Originate") {
        loan::OriginationRequest request{
            .borrower = requireAttribute(node, "borrower"),
            .lender = node.attribute("lender").as_string("pool"),
            .principal = node.attribute("principal").as_ullong(),
            .termMonths = node.attribute("term").as_uint(),
            .collateralAsset = requireAttribute(node, "asset"),
            .collateralAmount = node.attribute("collateral").as_ullong(),
            .attestation = {}
        };
        if (const auto it = m_publishedAttestations.find(node.attribute("attestation").as_string());
            it != m_publishedAttestations.end()) {
            request.attestation = it->second;
        }
        const auto loanId = manager.originate(request);
        if (loanId) {
            if (pugi::xml_attribute alias = node.attribute("id")) {
                m_loanAliases.insert_or_assign(alias.as_string(), *loanId);
            }
        }
        return describe(loanId);
    }
    if (action == "Repay") {
        return describe(manager.repay(
            resolveLoan(node),
            node.attribute("amount").as_ullong(),
            node.attribute("payer").as_string("borrower")));
    }
    if (action == "CheckHealth") {
        const auto decision =
            manager.checkHealth(resolveLoan(node), node.attribute("liquidator").as_string("keeper"));
        if (!decision) {
            return describe(decision);
        }
        return liquidation::isEligible(*decision) ? "LIQUIDATED" : "HEALTHY";
    }
    if (action == "Expire") {
        return describe(manager.expire(resolveLoan(node)));
    }
    if (action == "Sweep") {
        const auto report =
            m_protocol->engine().sweep(node.attribute("liquidator").as_string("keeper"));
        return std::to_string(report.liquidated);
    }
    if (action == "Admin") {
        const AccountId caller = requireAttribute(node, "caller");
        const std::string parameter = requireAttribute(node, "set");
        const auto value = static_cast<Bps>(node.attribute("value").as_uint());
        if (parameter == "baseRate") {
            return describe(manager.setBaseRate(caller, value));
        }
        if (parameter == "riskPremiumMultiplier") {
            return describe(manager.setRiskPremiumMultiplier(caller, value));
        }
        if (parameter == "minCollateralRatio") {
            return describe(manager.setMinCollateralRatio(caller, value));
        }
        if (parameter == "liquidation") {
            return describe(manager.setLiquidationParams(
                caller,
                static_cast<Bps>(node.attribute("threshold").as_uint()),
                static_cast<Bps>(node.attribute("bonus").as_uint())));
        }
        throw std::invalid_argument{fmt::format(
            "{}: unknown parameter '{}'",
            std::source_location::current().function_name(), parameter)};
    }
    if (action == "Status") {
        const auto status = manager.status(resolveLoan(node));
        return status ? std::string{magic_enum::enum_name(*status)} : describe(status);
    }
    if (action == "Outstanding") {
        const auto loan = manager.loan(resolveLoan(node));
        return loan ? std::to_string(loan->outstanding()) : describe(loan);
    }
    if (action == "Rate") {
        const auto loan = manager.loan(resolveLoan(node));
        return loan ? std::to_string(loan->rate()) : describe(loan);
    }
    if (action == "Ratio") {
        const auto ratio = manager.collateralRatio(resolveLoan(node));
        return ratio ? std::to_string(*ratio) : describe(ratio);
    }
    if (action == "Free") {
        const auto pos = ledger.position(
            requireAttribute(node, "borrower"), requireAttribute(node, "asset"));
        return std::to_string(pos ? pos->free() : 0);
    }

    throw std::invalid_argument{fmt::format(
        "{}: unknown scenario action <{}>",
        std::source_location::current().function_name(), action)};
}

//-------------------------------------------------------------------------

LoanId ScenarioRunner::resolveLoan(pugi::xml_node node) const
{
    const std::string ref = requireAttribute(node, "loan");
    if (const auto it = m_loanAliases.find(ref); it != m_loanAliases.end()) {
        return it->second;
    }
    // Unknown aliases resolve to the invalid id and surface as LOAN_NOT_FOUND.
    return node.attribute("loan").as_ullong(LOAN_ID_INVALID);
}

//-------------------------------------------------------------------------

}  // namespace lendora::scenario

//-------------------------------------------------------------------------
