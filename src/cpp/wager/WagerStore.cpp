/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/wager/WagerStore.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

namespace
{

using namespace store;

constexpr std::string_view s_columns =
    "id, requester_id, channel, game, stake, stake_transfer_id, payer_address, "
    "outcome_value, multiplier, payout, jackpot_contribution, status, claimed_at, "
    "payout_transfer_id, failure_note, created_at, completed_at";

[[nodiscard]] Value status(WagerStatus status)
{
    return text(WagerStatus2StrView(status));
}

[[nodiscard]] WagerRecord readWager(const Row& row)
{
    return {
        .id = row.text("id"),
        .requesterId = row.text("requester_id"),
        .channel = row.text("channel"),
        .game = row.text("game"),
        .stake = row.decimal("stake"),
        .stakeTransferId = row.text("stake_transfer_id"),
        .payerAddress = row.optText("payer_address"),
        .outcomeValue = static_cast<uint32_t>(row.integer("outcome_value")),
        .multiplier = row.decimal("multiplier"),
        .payout = row.decimal("payout"),
        .jackpotContribution = row.decimal("jackpot_contribution"),
        .status = str2WagerStatus(row.text("status")),
        .claimedAt = row.optTimestamp("claimed_at"),
        .payoutTransferId = row.optText("payout_transfer_id"),
        .failureNote = row.optText("failure_note"),
        .createdAt = row.timestamp("created_at"),
        .completedAt = row.optTimestamp("completed_at")
    };
}

}  // namespace

//-------------------------------------------------------------------------

WagerStore::WagerStore(Database& db) noexcept
    : m_db{db}
{}

//-------------------------------------------------------------------------

void WagerStore::insert(const WagerRecord& wager)
{
    if (!m_db.insertUnique(
            fmt::format(
                "INSERT INTO wagers ({}) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                s_columns),
            {
                text(wager.id),
                text(wager.requesterId),
                text(wager.channel),
                text(wager.game),
                decimal(wager.stake),
                text(wager.stakeTransferId),
                nullable(wager.payerAddress),
                integer(wager.outcomeValue),
                decimal(wager.multiplier),
                decimal(wager.payout),
                decimal(wager.jackpotContribution),
                status(wager.status),
                nullable(wager.claimedAt),
                nullable(wager.payoutTransferId),
                nullable(wager.failureNote),
                integer(wager.createdAt),
                nullable(wager.completedAt)
            })) {
        throw StoreError{fmt::format(
            "{}: Wager '{}' already exists",
            std::source_location::current().function_name(), wager.id)};
    }
}

//-------------------------------------------------------------------------

std::optional<WagerRecord> WagerStore::find(const RecordId& id) const
{
    const auto row = m_db.queryOne(
        fmt::format("SELECT {} FROM wagers WHERE id = ?", s_columns), {text(id)});
    if (!row.has_value()) return {};
    return readWager(row.value());
}

//-------------------------------------------------------------------------

std::vector<WagerRecord> WagerStore::listByRequester(
    const std::string& requesterId, size_t limit) const
{
    return m_db.query(
            fmt::format(
                "SELECT {} FROM wagers WHERE requester_id = ? "
                "ORDER BY created_at DESC, id LIMIT ?",
                s_columns),
            {text(requesterId), integer(limit)})
        | views::transform(readWager)
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

bool WagerStore::claim(const RecordId& id, Timestamp now)
{
    return m_db.execute(
        "UPDATE wagers SET claimed_at = ? WHERE id = ? AND status = ? AND claimed_at IS NULL",
        {integer(now), text(id), status(WagerStatus::PENDING_PAYOUT)}) == 1;
}

//-------------------------------------------------------------------------

void WagerStore::complete(const RecordId& id, const TransferId& receipt, Timestamp now)
{
    const auto changed = m_db.execute(
        "UPDATE wagers SET status = ?, payout_transfer_id = ?, completed_at = ? "
        "WHERE id = ? AND status = ? AND claimed_at IS NOT NULL",
        {
            status(WagerStatus::PAID),
            text(receipt),
            integer(now),
            text(id),
            status(WagerStatus::PENDING_PAYOUT)
        });
    if (changed != 1) {
        throw StoreError{fmt::format(
            "{}: Wager '{}' is not claimed for payout",
            std::source_location::current().function_name(), id)};
    }
}

//-------------------------------------------------------------------------

void WagerStore::fail(const RecordId& id, const std::string& note, Timestamp now)
{
    const auto changed = m_db.execute(
        "UPDATE wagers SET status = ?, failure_note = ?, completed_at = ?, claimed_at = NULL "
        "WHERE id = ? AND status = ? AND claimed_at IS NOT NULL",
        {
            status(WagerStatus::FAILED),
            text(note),
            integer(now),
            text(id),
            status(WagerStatus::PENDING_PAYOUT)
        });
    if (changed != 1) {
        throw StoreError{fmt::format(
            "{}: Wager '{}' is not claimed for payout",
            std::source_location::current().function_name(), id)};
    }
}

//-------------------------------------------------------------------------

RequesterStats WagerStore::requesterStats(const std::string& requesterId) const
{
    // Amounts are TEXT decimals, so they are summed here rather than by SQL.
    const auto rows = m_db.query(
        "SELECT stake, multiplier, payout, status FROM wagers WHERE requester_id = ?",
        {text(requesterId)});

    RequesterStats stats;
    for (const auto& row : rows) {
        ++stats.wagers;
        stats.staked += row.decimal("stake");
        if (row.decimal("multiplier") > 0_dec) {
            ++stats.wins;
        } else {
            ++stats.losses;
        }
        if (str2WagerStatus(row.text("status")) == WagerStatus::PAID) {
            stats.paidOut += row.decimal("payout");
        }
    }
    return stats;
}

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
