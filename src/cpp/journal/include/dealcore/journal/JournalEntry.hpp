/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace dealcore::journal
{

//-------------------------------------------------------------------------

enum class EntryKind : uint32_t
{
    TRADE,
    ITEM,
    WAGER,
    JACKPOT
};

enum class Outcome : uint32_t
{
    PROFIT,
    LOSS,
    NEUTRAL
};

[[nodiscard]] constexpr Outcome outcomeFromPnl(decimal_t pnl) noexcept
{
    if (pnl > decimal_t{}) return Outcome::PROFIT;
    if (pnl < decimal_t{}) return Outcome::LOSS;
    return Outcome::NEUTRAL;
}

//-------------------------------------------------------------------------

// One closed settlement. From and to are seen from the agent's side.
struct JournalEntry
{
    EntryKind kind;
    std::string action;
    std::optional<std::string> assetFrom;
    std::optional<std::string> assetTo;
    std::optional<decimal_t> amountFrom;
    std::optional<decimal_t> amountTo;
    std::optional<std::string> counterparty;
    std::optional<std::string> referenceId;
    std::optional<std::string> reasoning;
    Outcome outcome{Outcome::NEUTRAL};
    std::optional<decimal_t> pnl;
    std::optional<TransferId> transferId;
    Timestamp createdAt{};
    Timestamp closedAt{};
};

//-------------------------------------------------------------------------

}  // namespace dealcore::journal

//-------------------------------------------------------------------------
