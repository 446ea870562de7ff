/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

enum class WagerStatus : uint32_t
{
    PENDING_PAYOUT,
    PAID,
    LOST,
    FAILED
};

[[nodiscard]] constexpr std::string_view WagerStatus2StrView(WagerStatus status) noexcept
{
    return magic_enum::enum_name(status);
}

[[nodiscard]] WagerStatus str2WagerStatus(std::string_view str);

//-------------------------------------------------------------------------

struct WagerRecord
{
    RecordId id;
    std::string requesterId;
    std::string channel;
    std::string game;
    decimal_t stake;
    TransferId stakeTransferId;
    std::optional<std::string> payerAddress;
    uint32_t outcomeValue;
    decimal_t multiplier;
    decimal_t payout;
    decimal_t jackpotContribution;
    WagerStatus status;
    std::optional<Timestamp> claimedAt;
    std::optional<TransferId> payoutTransferId;
    std::optional<std::string> failureNote;
    Timestamp createdAt;
    std::optional<Timestamp> completedAt;

    [[nodiscard]] bool isWin() const noexcept { return multiplier > 0_dec; }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct RequesterStats
{
    uint64_t wagers{};
    uint64_t wins{};
    uint64_t losses{};
    decimal_t staked{};
    decimal_t paidOut{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<dealcore::wager::WagerStatus>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(dealcore::wager::WagerStatus status, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", dealcore::wager::WagerStatus2StrView(status));
    }
};

//-------------------------------------------------------------------------
