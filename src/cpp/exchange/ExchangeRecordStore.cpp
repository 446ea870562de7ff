/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/exchange/ExchangeRecordStore.hpp"

#include "JsonSerializable.hpp"

//-------------------------------------------------------------------------

namespace dealcore::exchange
{

//-------------------------------------------------------------------------

namespace
{

using namespace store;

constexpr std::string_view s_columns =
    "id, status, initiator_channel, counterparty_id, counterparty_address, "
    "offered_kind, offered_quantity, offered_item_ref, offered_value, "
    "requested_kind, requested_quantity, requested_item_ref, requested_value, "
    "compliance_result, matched_transfer_id, verified_at, payer_address, "
    "claimed_at, completed_at, external_transfer_id, failure_note, "
    "created_at, expires_at, notes";

// Appends ?2 to the notes column, joined with " | ".
constexpr std::string_view s_appendNote =
    "notes = CASE WHEN notes IS NULL OR notes = '' THEN ?2 ELSE notes || ' | ' || ?2 END";

[[nodiscard]] Value status(ExchangeStatus status)
{
    return text(ExchangeStatus2StrView(status));
}

void appendAsset(Params& params, const asset::AssetValue& asset)
{
    params.push_back(text(asset::AssetKind2StrView(asset.kind())));
    params.push_back(nullable(asset.quantity()));
    params.push_back(nullable(asset.itemRef()));
    params.push_back(decimal(asset.estimatedReferenceValue()));
}

[[nodiscard]] asset::AssetValue readAsset(const Row& row, std::string_view prefix)
{
    const auto column = [&](std::string_view name) { return fmt::format("{}_{}", prefix, name); };
    if (asset::str2AssetKind(row.text(column("kind"))) == asset::AssetKind::CURRENCY) {
        return asset::AssetValue::currency(row.decimal(column("quantity")));
    }
    return asset::AssetValue::item(row.text(column("item_ref")), row.decimal(column("value")));
}

[[nodiscard]] ExchangeRecord readRecord(const Row& row)
{
    std::optional<VerificationInfo> verification;
    if (const auto matched = row.optText("matched_transfer_id")) {
        verification = VerificationInfo{
            .matchedTransferId = matched.value(),
            .verifiedAt = row.timestamp("verified_at"),
            .payerAddress = row.optText("payer_address")
        };
    }
    return ExchangeRecord{
        .id = row.text("id"),
        .status = str2ExchangeStatus(row.text("status")),
        .initiatorChannel = row.text("initiator_channel"),
        .counterpartyId = row.text("counterparty_id"),
        .counterpartyAddress = row.optText("counterparty_address"),
        .offered = readAsset(row, "offered"),
        .requested = readAsset(row, "requested"),
        .complianceResult = compliance::ComplianceResult::fromJson(
            json::str2json(row.text("compliance_result"))),
        .verification = std::move(verification),
        .execution = {
            .claimedAt = row.optTimestamp("claimed_at"),
            .completedAt = row.optTimestamp("completed_at"),
            .externalTransferId = row.optText("external_transfer_id"),
            .failureNote = row.optText("failure_note")
        },
        .createdAt = row.timestamp("created_at"),
        .expiresAt = row.timestamp("expires_at"),
        .notes = row.optText("notes")
    };
}

}  // namespace

//-------------------------------------------------------------------------

ExchangeRecordStore::ExchangeRecordStore(Database& db) noexcept
    : m_db{db}
{}

//-------------------------------------------------------------------------

void ExchangeRecordStore::insert(const ExchangeRecord& record)
{
    if (record.expiresAt <= record.createdAt) {
        throw std::invalid_argument{fmt::format(
            "{}: Record '{}' would expire at {}, not after its creation at {}",
            std::source_location::current().function_name(),
            record.id, record.expiresAt, record.createdAt)};
    }

    Params params{
        text(record.id),
        status(record.status),
        text(record.initiatorChannel),
        text(record.counterpartyId),
        nullable(record.counterpartyAddress)
    };
    appendAsset(params, record.offered);
    appendAsset(params, record.requested);
    params.push_back(json::jsonSerializable2str(record.complianceResult));
    params.insert(params.end(), {
        integer(record.createdAt),
        integer(record.expiresAt),
        nullable(record.notes)
    });

    if (!m_db.insertUnique(
            "INSERT INTO exchange_records (id, status, initiator_channel, counterparty_id, "
            "counterparty_address, offered_kind, offered_quantity, offered_item_ref, offered_value, "
            "requested_kind, requested_quantity, requested_item_ref, requested_value, "
            "compliance_result, created_at, expires_at, notes) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            params)) {
        throw StoreError{fmt::format(
            "{}: Record '{}' already exists",
            std::source_location::current().function_name(), record.id)};
    }
}

//-------------------------------------------------------------------------

std::optional<ExchangeRecord> ExchangeRecordStore::find(const RecordId& id) const
{
    const auto row = m_db.queryOne(
        fmt::format("SELECT {} FROM exchange_records WHERE id = ?", s_columns), {text(id)});
    if (!row.has_value()) return {};
    return readRecord(row.value());
}

//-------------------------------------------------------------------------

std::vector<ExchangeRecord> ExchangeRecordStore::list(
    std::optional<ExchangeStatus> filter, size_t limit) const
{
    const auto rows = filter.has_value()
        ? m_db.query(
            fmt::format(
                "SELECT {} FROM exchange_records WHERE status = ? "
                "ORDER BY created_at DESC, id LIMIT ?",
                s_columns),
            {status(filter.value()), integer(limit)})
        : m_db.query(
            fmt::format(
                "SELECT {} FROM exchange_records ORDER BY created_at DESC, id LIMIT ?", s_columns),
            {integer(limit)});
    return rows | views::transform(readRecord) | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

bool ExchangeRecordStore::transition(const RecordId& id, ExchangeStatus from, ExchangeStatus to)
{
    return m_db.execute(
        "UPDATE exchange_records SET status = ? WHERE id = ? AND status = ?",
        {status(to), text(id), status(from)}) == 1;
}

//-------------------------------------------------------------------------

bool ExchangeRecordStore::cancel(const RecordId& id, ExchangeStatus from, const std::string& note)
{
    return m_db.execute(
        fmt::format(
            "UPDATE exchange_records SET status = ?3, {} WHERE id = ?1 AND status = ?4",
            s_appendNote),
        {text(id), text(note), status(ExchangeStatus::CANCELLED), status(from)}) == 1;
}

//-------------------------------------------------------------------------

bool ExchangeRecordStore::expire(const RecordId& id, ExchangeStatus from, Timestamp now)
{
    return m_db.execute(
        "UPDATE exchange_records SET status = ? WHERE id = ? AND status = ? AND expires_at < ?",
        {status(ExchangeStatus::EXPIRED), text(id), status(from), integer(now)}) == 1;
}

//-------------------------------------------------------------------------

bool ExchangeRecordStore::markVerified(const RecordId& id, const VerificationInfo& info)
{
    return m_db.execute(
        "UPDATE exchange_records SET status = ?, matched_transfer_id = ?, verified_at = ?, "
        "payer_address = ? "
        "WHERE id = ? AND status = ? AND matched_transfer_id IS NULL AND ? <= expires_at",
        {
            status(ExchangeStatus::VERIFIED),
            text(info.matchedTransferId),
            integer(info.verifiedAt),
            nullable(info.payerAddress),
            text(id),
            status(ExchangeStatus::ACCEPTED),
            integer(info.verifiedAt)
        }) == 1;
}

//-------------------------------------------------------------------------

bool ExchangeRecordStore::claim(const RecordId& id, Timestamp now)
{
    return m_db.execute(
        "UPDATE exchange_records SET claimed_at = ? "
        "WHERE id = ? AND status = ? AND claimed_at IS NULL",
        {integer(now), text(id), status(ExchangeStatus::VERIFIED)}) == 1;
}

//-------------------------------------------------------------------------

void ExchangeRecordStore::complete(const RecordId& id, const TransferId& receipt, Timestamp now)
{
    const auto changed = m_db.execute(
        "UPDATE exchange_records SET status = ?, completed_at = ?, external_transfer_id = ? "
        "WHERE id = ? AND status = ? AND claimed_at IS NOT NULL",
        {
            status(ExchangeStatus::COMPLETED),
            integer(now),
            text(receipt),
            text(id),
            status(ExchangeStatus::VERIFIED)
        });
    if (changed != 1) {
        throw StoreError{fmt::format(
            "{}: Record '{}' is not claimed for execution",
            std::source_location::current().function_name(), id)};
    }
}

//-------------------------------------------------------------------------

void ExchangeRecordStore::fail(const RecordId& id, const std::string& note)
{
    const auto changed = m_db.execute(
        fmt::format(
            "UPDATE exchange_records SET status = ?3, claimed_at = NULL, failure_note = ?2, {} "
            "WHERE id = ?1 AND status = ?4 AND claimed_at IS NOT NULL",
            s_appendNote),
        {text(id), text(note), status(ExchangeStatus::FAILED), status(ExchangeStatus::VERIFIED)});
    if (changed != 1) {
        throw StoreError{fmt::format(
            "{}: Record '{}' is not claimed for execution",
            std::source_location::current().function_name(), id)};
    }
}

//-------------------------------------------------------------------------

size_t ExchangeRecordStore::expireStale(Timestamp now)
{
    return static_cast<size_t>(m_db.execute(
        "UPDATE exchange_records SET status = ? WHERE status IN (?, ?) AND expires_at < ?",
        {
            status(ExchangeStatus::EXPIRED),
            status(ExchangeStatus::PROPOSED),
            status(ExchangeStatus::ACCEPTED),
            integer(now)
        }));
}

//-------------------------------------------------------------------------

bool ExchangeRecordStore::hasVerifiedItemSale(
    const CounterpartyId& counterpartyId, const ItemRef& itemRef, Timestamp since) const
{
    return m_db.queryOne(
        "SELECT id FROM exchange_records "
        "WHERE status = ? AND claimed_at IS NULL AND counterparty_id = ? "
        "AND offered_kind = ? AND offered_item_ref = ? AND verified_at >= ? LIMIT 1",
        {
            status(ExchangeStatus::VERIFIED),
            text(counterpartyId),
            text(asset::AssetKind2StrView(asset::AssetKind::ITEM)),
            text(itemRef),
            integer(since)
        }).has_value();
}

//-------------------------------------------------------------------------

}  // namespace dealcore::exchange

//-------------------------------------------------------------------------
