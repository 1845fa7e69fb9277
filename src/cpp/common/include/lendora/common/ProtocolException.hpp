/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace lendora
{

class ProtocolException : public std::runtime_error
{
public:
    ProtocolException(const std::string& message) : std::runtime_error(message) {}
    ProtocolException(const ProtocolException& exception) = default;
    ProtocolException(ProtocolException&& exception) = default;
};

}  // namespace lendora

//-------------------------------------------------------------------------
