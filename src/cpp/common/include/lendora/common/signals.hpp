/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <boost/signals2.hpp>

#include <functional>

//-------------------------------------------------------------------------

namespace bs2 = boost::signals2;

namespace lendora
{

// Emitted from worker threads; slots must be connected before traffic starts.
template<typename SlotType>
requires requires { typename std::function<SlotType>; }
using SyncSignal = bs2::signal<SlotType>;

}  // namespace lendora

//-------------------------------------------------------------------------
