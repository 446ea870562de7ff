/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/store/Schema.hpp"

//-------------------------------------------------------------------------

namespace dealcore::store
{

//-------------------------------------------------------------------------

namespace
{

constexpr std::string_view s_schema = R"sql(
CREATE TABLE IF NOT EXISTS exchange_records (
    id                   TEXT PRIMARY KEY,
    status               TEXT NOT NULL,
    initiator_channel    TEXT NOT NULL,
    counterparty_id      TEXT NOT NULL,
    counterparty_address TEXT,
    offered_kind         TEXT NOT NULL,
    offered_quantity     TEXT,
    offered_item_ref     TEXT,
    offered_value        TEXT NOT NULL,
    requested_kind       TEXT NOT NULL,
    requested_quantity   TEXT,
    requested_item_ref   TEXT,
    requested_value      TEXT NOT NULL,
    compliance_result    TEXT NOT NULL,
    matched_transfer_id  TEXT,
    verified_at          INTEGER,
    payer_address        TEXT,
    claimed_at           INTEGER,
    completed_at         INTEGER,
    external_transfer_id TEXT,
    failure_note         TEXT,
    created_at           INTEGER NOT NULL,
    expires_at           INTEGER NOT NULL,
    notes                TEXT,
    CHECK (expires_at > created_at)
);
CREATE INDEX IF NOT EXISTS exchange_records_status ON exchange_records (status);
CREATE INDEX IF NOT EXISTS exchange_records_counterparty ON exchange_records (counterparty_id);

CREATE TABLE IF NOT EXISTS consumed_transfers (
    transfer_id TEXT PRIMARY KEY,
    claimant_id TEXT NOT NULL,
    amount      TEXT,
    purpose_tag TEXT NOT NULL,
    used_at     INTEGER NOT NULL
);
CREATE TRIGGER IF NOT EXISTS consumed_transfers_no_update
BEFORE UPDATE ON consumed_transfers
BEGIN
    SELECT RAISE(ABORT, 'consumed_transfers is append-only');
END;
CREATE TRIGGER IF NOT EXISTS consumed_transfers_no_delete
BEFORE DELETE ON consumed_transfers
BEGIN
    SELECT RAISE(ABORT, 'consumed_transfers is append-only');
END;

CREATE TABLE IF NOT EXISTS jackpot_state (
    id                 INTEGER PRIMARY KEY CHECK (id = 1),
    accumulated_amount TEXT NOT NULL,
    last_winner_id     TEXT,
    last_awarded_at    INTEGER,
    version            INTEGER NOT NULL
);
INSERT OR IGNORE INTO jackpot_state (id, accumulated_amount, version) VALUES (1, '0', 0);

CREATE TABLE IF NOT EXISTS wager_cooldowns (
    requester_id  TEXT PRIMARY KEY,
    last_wager_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS wager_rate_buckets (
    requester_id TEXT NOT NULL,
    bucket_start INTEGER NOT NULL,
    attempts     INTEGER NOT NULL,
    PRIMARY KEY (requester_id, bucket_start)
);

CREATE TABLE IF NOT EXISTS wagers (
    id                   TEXT PRIMARY KEY,
    requester_id         TEXT NOT NULL,
    channel              TEXT NOT NULL,
    game                 TEXT NOT NULL,
    stake                TEXT NOT NULL,
    stake_transfer_id    TEXT NOT NULL,
    payer_address        TEXT,
    outcome_value        INTEGER NOT NULL,
    multiplier           TEXT NOT NULL,
    payout               TEXT NOT NULL,
    jackpot_contribution TEXT NOT NULL,
    status               TEXT NOT NULL,
    claimed_at           INTEGER,
    payout_transfer_id   TEXT,
    failure_note         TEXT,
    created_at           INTEGER NOT NULL,
    completed_at         INTEGER
);
CREATE INDEX IF NOT EXISTS wagers_requester ON wagers (requester_id);

CREATE TABLE IF NOT EXISTS journal_entries (
    id           INTEGER PRIMARY KEY AUTOINCREMENT,
    kind         TEXT NOT NULL,
    action       TEXT NOT NULL,
    asset_from   TEXT,
    asset_to     TEXT,
    amount_from  TEXT,
    amount_to    TEXT,
    counterparty TEXT,
    reference_id TEXT,
    reasoning    TEXT,
    outcome      TEXT NOT NULL,
    pnl          TEXT,
    transfer_id  TEXT,
    created_at   INTEGER NOT NULL,
    closed_at    INTEGER NOT NULL
);
CREATE TRIGGER IF NOT EXISTS journal_entries_no_update
BEFORE UPDATE ON journal_entries
BEGIN
    SELECT RAISE(ABORT, 'journal_entries is append-only');
END;
CREATE TRIGGER IF NOT EXISTS journal_entries_no_delete
BEFORE DELETE ON journal_entries
BEGIN
    SELECT RAISE(ABORT, 'journal_entries is append-only');
END;
)sql";

}  // namespace

//-------------------------------------------------------------------------

void applySchema(Database& db)
{
    db.exec(std::string{s_schema});

    const auto version = db.queryOne("PRAGMA user_version");
    const auto current = version ? version->integer("user_version") : 0;
    if (current > kSchemaVersion) {
        throw StoreError{fmt::format(
            "{}: Store '{}' has schema version {}, newer than supported {}",
            std::source_location::current().function_name(),
            db.path().c_str(),
            current,
            kSchemaVersion)};
    }
    db.exec(fmt::format("PRAGMA user_version = {};", kSchemaVersion));
}

//-------------------------------------------------------------------------

}  // namespace dealcore::store

//-------------------------------------------------------------------------
