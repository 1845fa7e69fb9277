/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendora/common/BoundedExecutor.hpp"

//-------------------------------------------------------------------------

namespace lendora
{

//-------------------------------------------------------------------------

BoundedExecutor::BoundedExecutor(size_t threadCount)
    : m_pool{threadCount}
{}

//-------------------------------------------------------------------------

BoundedExecutor::~BoundedExecutor() noexcept
{
    m_pool.join();
}

//-------------------------------------------------------------------------

}  // namespace lendora

//-------------------------------------------------------------------------
