/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace dealcore::settlement
{

//-------------------------------------------------------------------------

enum class ExecutionStatus : uint32_t
{
    COMPLETED,
    ALREADY_CLAIMED,
    FAILED
};

[[nodiscard]] constexpr std::string_view ExecutionStatus2StrView(ExecutionStatus status) noexcept
{
    return magic_enum::enum_name(status);
}

struct ExecutionOutcome
{
    ExecutionStatus status;
    std::optional<TransferId> transferId;
    std::optional<std::string> failureNote;
};

struct SettlementEvent
{
    std::string settlementId;
    std::string kind;
    ExecutionStatus status;
    std::optional<TransferId> transferId;
    std::optional<std::string> note;
    Timestamp timestamp;
};

// Emission may happen from several request threads at once, hence the locking signal type.
struct SettlementSignals
{
    bs2::signal<void(const SettlementEvent&)> settled;
    bs2::signal<void(const SettlementEvent&)> failed;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::settlement

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<dealcore::settlement::ExecutionStatus>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(dealcore::settlement::ExecutionStatus status, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "{}", dealcore::settlement::ExecutionStatus2StrView(status));
    }
};

//-------------------------------------------------------------------------
