/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/config/ProtocolConfig.hpp"
#include "lendora/logging/AuditLogger.hpp"
#include "lendora/logging/logging.hpp"
#include "lendora/scenario/ScenarioRunner.hpp"
#include "lendora/serialization/json_util.hpp"

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"Lendora protocol core v1.0"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Protocol config file")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path scenario;
    app.add_option("-s,--scenario-file", scenario, "Scenario to replay")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path snapshot;
    app.add_option("-o,--snapshot-file", snapshot, "Write the final protocol state as JSON");

    fs::path auditDir;
    app.add_option("-a,--audit-dir", auditDir, "Directory for the CSV audit trails");

    std::string logLevel{"info"};
    app.add_option("-l,--log-level", logLevel, "trace, debug, info, warn, error, critical, off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    CLI11_PARSE(app, argc, argv);

    fmt::print("{}\n", app.get_description());
    lendora::logging::setLevel(spdlog::level::from_str(logLevel));

    lendora::scenario::ScenarioRunner runner{lendora::config::loadProtocolConfig(config)};
    fmt::print(" - '{}' loaded successfully\n", config.string());

    std::optional<lendora::logging::AuditLogger> auditLogger;
    if (!auditDir.empty()) {
        auditLogger.emplace(auditDir, runner.protocol().manager());
    }

    const auto report = runner.runFile(scenario);

    if (!snapshot.empty()) {
        rapidjson::Document json;
        runner.protocol().manager().jsonSerialize(json);
        std::ofstream ofs{snapshot};
        lendora::json::dumpJson(json, ofs, {.indent = lendora::json::IndentOptions{}});
        fmt::print(" - snapshot written to '{}'\n", snapshot.string());
    }

    fmt::print(
        " - scenario finished: {} steps, {} failed\n", report.steps.size(), report.failures());
    for (const auto& step : report.steps) {
        if (!step.passed) {
            fmt::print("   {}\n", step);
        }
    }

    return report.passed() ? 0 : 1;
}

//-------------------------------------------------------------------------
