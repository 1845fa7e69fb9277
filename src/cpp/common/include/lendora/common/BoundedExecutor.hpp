/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <concepts>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <type_traits>

//-------------------------------------------------------------------------

namespace lendora
{

//-------------------------------------------------------------------------

/**
 * Runs collaborator calls (price oracle, credit verifier) on a worker pool
 * and waits for at most a deadline. A call that misses its deadline keeps
 * running on the pool but its result is discarded.
 */
class BoundedExecutor
{
public:
    using Ptr = std::shared_ptr<BoundedExecutor>;

    explicit BoundedExecutor(size_t threadCount = 2);
    ~BoundedExecutor() noexcept;

    BoundedExecutor(const BoundedExecutor&) = delete;
    BoundedExecutor& operator=(const BoundedExecutor&) = delete;

    // Empty on timeout; rethrows whatever the call threw.
    template<typename F>
    requires std::invocable<F> && (!std::is_void_v<std::invoke_result_t<F>>)
    [[nodiscard]] std::optional<std::invoke_result_t<F>> run(
        F&& fn, std::chrono::milliseconds timeout)
    {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        boost::asio::post(m_pool, [task] { (*task)(); });
        if (future.wait_for(timeout) != std::future_status::ready) {
            return std::nullopt;
        }
        return future.get();
    }

private:
    boost::asio::thread_pool m_pool;
};

//-------------------------------------------------------------------------

}  // namespace lendora

//-------------------------------------------------------------------------
