/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace dealcore
{

enum class ErrorCode : uint32_t
{
    POLICY_VIOLATION,
    CONFLICT,
    NOT_YET_VERIFIED,
    AMBIGUOUS_MATCH,
    ALREADY_CONSUMED,
    EXTERNAL_TRANSFER_FAILURE,
    EXPIRED,
    RECORD_NOT_FOUND,
    INVALID_STATE,
    COOLDOWN_ACTIVE,
    RATE_LIMITED,
    STAKE_OUT_OF_BOUNDS,
    BANKROLL_INSUFFICIENT,
    BALANCE_UNAVAILABLE,
    OUTCOME_UNAVAILABLE,
    UNKNOWN_GAME,
    JACKPOT_NOT_ELIGIBLE
};

[[nodiscard]] constexpr std::string_view ErrorCode2StrView(ErrorCode ec) noexcept
{
    return magic_enum::enum_name(ec);
}

// Benign outcomes and outcomes the caller may retry are not worth an error log line.
[[nodiscard]] constexpr bool isRetryable(ErrorCode ec) noexcept
{
    return ec == ErrorCode::NOT_YET_VERIFIED || ec == ErrorCode::CONFLICT;
}

//-------------------------------------------------------------------------

struct Error
{
    ErrorCode code;
    std::string message;
};

template<typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline std::unexpected<Error> makeError(ErrorCode code, std::string message)
{
    return std::unexpected<Error>{Error{.code = code, .message = std::move(message)}};
}

}  // namespace dealcore

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<dealcore::ErrorCode>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(dealcore::ErrorCode ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", dealcore::ErrorCode2StrView(ec));
    }
};

template<>
struct fmt::formatter<dealcore::Error>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const dealcore::Error& error, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}: {}", error.code, error.message);
    }
};

//-------------------------------------------------------------------------
