/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/logging/logging.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace lendora::logging
{

//-------------------------------------------------------------------------

namespace
{

std::mutex s_registryMtx;

}  // namespace

//-------------------------------------------------------------------------

std::shared_ptr<spdlog::logger> componentLogger(const std::string& name)
{
    std::lock_guard lock{s_registryMtx};
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    const auto& sinks = spdlog::default_logger()->sinks();
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::default_logger()->level());
    spdlog::register_logger(logger);
    return logger;
}

//-------------------------------------------------------------------------

void setLevel(spdlog::level::level_enum level)
{
    std::lock_guard lock{s_registryMtx};
    spdlog::set_level(level);
}

//-------------------------------------------------------------------------

}  // namespace lendora::logging

//-------------------------------------------------------------------------
