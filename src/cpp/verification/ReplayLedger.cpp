/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/verification/ReplayLedger.hpp"

//-------------------------------------------------------------------------

namespace dealcore::verification
{

//-------------------------------------------------------------------------

ReplayLedger::ReplayLedger(store::Database& db) noexcept
    : m_db{db}
{}

//-------------------------------------------------------------------------

ConsumeResult ReplayLedger::consume(const ConsumedTransfer& transfer)
{
    using namespace store;

    const bool inserted = m_db.insertUnique(
        "INSERT INTO consumed_transfers (transfer_id, claimant_id, amount, purpose_tag, used_at) "
        "VALUES (?, ?, ?, ?, ?)",
        {
            text(transfer.transferId),
            text(transfer.claimantId),
            nullable(transfer.amount),
            text(transfer.purposeTag),
            integer(transfer.usedAt)
        });
    if (inserted) return ConsumeResult::CONSUMED;

    const auto owner = find(transfer.transferId);
    if (!owner.has_value()) {
        throw StoreError{fmt::format(
            "{}: Transfer '{}' collided on insert but cannot be found",
            std::source_location::current().function_name(), transfer.transferId)};
    }
    return owner->claimantId == transfer.claimantId
        ? ConsumeResult::ALREADY_OWNED
        : ConsumeResult::CONSUMED_ELSEWHERE;
}

//-------------------------------------------------------------------------

std::optional<ConsumedTransfer> ReplayLedger::find(const TransferId& transferId) const
{
    const auto row = m_db.queryOne(
        "SELECT transfer_id, claimant_id, amount, purpose_tag, used_at "
        "FROM consumed_transfers WHERE transfer_id = ?",
        {store::text(transferId)});
    if (!row.has_value()) return {};
    return ConsumedTransfer{
        .transferId = row->text("transfer_id"),
        .claimantId = row->text("claimant_id"),
        .amount = row->optDecimal("amount"),
        .purposeTag = row->text("purpose_tag"),
        .usedAt = row->timestamp("used_at")
    };
}

//-------------------------------------------------------------------------

}  // namespace dealcore::verification

//-------------------------------------------------------------------------
