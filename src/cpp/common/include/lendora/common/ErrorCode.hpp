/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <cstdint>
#include <expected>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendora
{

//-------------------------------------------------------------------------

enum class ErrorCode : uint32_t
{
    INVALID_AMOUNT,
    INVALID_PARAMETER,
    PRINCIPAL_BELOW_MINIMUM,
    ARITHMETIC_OVERFLOW,
    UNAUTHORIZED,
    UNKNOWN_ASSET,
    LOAN_NOT_FOUND,
    INSUFFICIENT_COLLATERAL,
    BELOW_MINIMUM_RATIO,
    OVER_REPAYMENT,
    LOAN_NOT_ACTIVE,
    LOAN_NOT_MATURED,
    STALE_PRICE,
    PRICE_UNAVAILABLE,
    VERIFICATION_UNAVAILABLE,
    CONCURRENCY_CONFLICT
};

enum class ErrorKind : uint32_t
{
    VALIDATION,
    BUSINESS_RULE,
    DEPENDENCY_UNAVAILABLE,
    CONCURRENCY
};

template<typename T>
using Expected = std::expected<T, ErrorCode>;

using Unexpected = std::unexpected<ErrorCode>;

//-------------------------------------------------------------------------

[[nodiscard]] constexpr ErrorKind errorKind(ErrorCode ec) noexcept
{
    switch (ec) {
        case ErrorCode::INSUFFICIENT_COLLATERAL:
        case ErrorCode::BELOW_MINIMUM_RATIO:
        case ErrorCode::OVER_REPAYMENT:
        case ErrorCode::LOAN_NOT_ACTIVE:
        case ErrorCode::LOAN_NOT_MATURED:
            return ErrorKind::BUSINESS_RULE;
        case ErrorCode::STALE_PRICE:
        case ErrorCode::PRICE_UNAVAILABLE:
        case ErrorCode::VERIFICATION_UNAVAILABLE:
            return ErrorKind::DEPENDENCY_UNAVAILABLE;
        case ErrorCode::CONCURRENCY_CONFLICT:
            return ErrorKind::CONCURRENCY;
        default:
            return ErrorKind::VALIDATION;
    }
}

// Dependency outages and lost lock races never applied anything.
[[nodiscard]] constexpr bool isRetryable(ErrorCode ec) noexcept
{
    const auto kind = errorKind(ec);
    return kind == ErrorKind::DEPENDENCY_UNAVAILABLE || kind == ErrorKind::CONCURRENCY;
}

[[nodiscard]] constexpr std::string_view ErrorCode2StrView(ErrorCode ec) noexcept
{
    return magic_enum::enum_name(ec);
}

//-------------------------------------------------------------------------

}  // namespace lendora

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendora::ErrorCode>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lendora::ErrorCode ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", lendora::ErrorCode2StrView(ec));
    }
};

template<>
struct fmt::formatter<lendora::ErrorKind>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lendora::ErrorKind kind, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(kind));
    }
};

//-------------------------------------------------------------------------
