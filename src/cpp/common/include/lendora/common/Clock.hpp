/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendora/common/types.hpp"

#include <atomic>
#include <memory>

//-------------------------------------------------------------------------

namespace lendora
{

//-------------------------------------------------------------------------

struct Clock
{
    using Ptr = std::shared_ptr<Clock>;

    virtual ~Clock() noexcept = default;

    [[nodiscard]] virtual Timestamp now() const noexcept = 0;
};

//-------------------------------------------------------------------------

struct SystemClock : Clock
{
    [[nodiscard]] virtual Timestamp now() const noexcept override;
};

//-------------------------------------------------------------------------

class ManualClock : public Clock
{
public:
    explicit ManualClock(Timestamp start = {}) noexcept : m_now{start} {}

    [[nodiscard]] virtual Timestamp now() const noexcept override
    {
        return m_now.load(std::memory_order_acquire);
    }

    void set(Timestamp time) noexcept { m_now.store(time, std::memory_order_release); }
    void advance(Timestamp delta) noexcept { m_now.fetch_add(delta, std::memory_order_acq_rel); }

private:
    std::atomic<Timestamp> m_now;
};

//-------------------------------------------------------------------------

}  // namespace lendora

//-------------------------------------------------------------------------
