/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/journal/Journal.hpp"

//-------------------------------------------------------------------------

namespace dealcore::journal
{

//-------------------------------------------------------------------------

SqliteJournal::SqliteJournal(store::Database& db) noexcept
    : m_db{db}
{}

//-------------------------------------------------------------------------

void SqliteJournal::append(const JournalEntry& entry)
{
    using namespace store;

    if (entry.closedAt < entry.createdAt) {
        throw std::invalid_argument{fmt::format(
            "{}: Entry closes at {} before it was created at {}",
            std::source_location::current().function_name(), entry.closedAt, entry.createdAt)};
    }
    m_db.execute(
        "INSERT INTO journal_entries (kind, action, asset_from, asset_to, amount_from, amount_to, "
        "counterparty, reference_id, reasoning, outcome, pnl, transfer_id, created_at, closed_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        {
            text(magic_enum::enum_name(entry.kind)),
            text(entry.action),
            nullable(entry.assetFrom),
            nullable(entry.assetTo),
            nullable(entry.amountFrom),
            nullable(entry.amountTo),
            nullable(entry.counterparty),
            nullable(entry.referenceId),
            nullable(entry.reasoning),
            text(magic_enum::enum_name(entry.outcome)),
            nullable(entry.pnl),
            nullable(entry.transferId),
            integer(entry.createdAt),
            integer(entry.closedAt)
        });
}

//-------------------------------------------------------------------------

size_t SqliteJournal::size() const
{
    const auto row = m_db.queryOne("SELECT COUNT(*) AS n FROM journal_entries");
    return static_cast<size_t>(row->integer("n"));
}

//-------------------------------------------------------------------------

}  // namespace dealcore::journal

//-------------------------------------------------------------------------
