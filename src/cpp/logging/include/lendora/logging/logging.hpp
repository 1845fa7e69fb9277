/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

//-------------------------------------------------------------------------

namespace lendora::logging
{

// Named component logger sharing the sinks of the default logger.
[[nodiscard]] std::shared_ptr<spdlog::logger> componentLogger(const std::string& name);

void setLevel(spdlog::level::level_enum level);

}  // namespace lendora::logging

//-------------------------------------------------------------------------
