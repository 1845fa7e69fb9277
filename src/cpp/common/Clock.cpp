/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/common/Clock.hpp"

#include <chrono>

//-------------------------------------------------------------------------

namespace lendora
{

//-------------------------------------------------------------------------

Timestamp SystemClock::now() const noexcept
{
    using namespace std::chrono;
    return static_cast<Timestamp>(
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

//-------------------------------------------------------------------------

}  // namespace lendora

//-------------------------------------------------------------------------
