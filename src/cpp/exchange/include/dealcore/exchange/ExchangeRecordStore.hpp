/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/exchange/ExchangeRecord.hpp"
#include "dealcore/store/Database.hpp"

//-------------------------------------------------------------------------

namespace dealcore::exchange
{

//-------------------------------------------------------------------------

/**
 * Durable exchange records.
 *
 * Each mutator is one conditional UPDATE and reports whether it applied.
 * A `false` return means another request moved the record first.
 */
class ExchangeRecordStore
{
public:
    explicit ExchangeRecordStore(store::Database& db) noexcept;

    void insert(const ExchangeRecord& record);

    [[nodiscard]] std::optional<ExchangeRecord> find(const RecordId& id) const;
    [[nodiscard]] std::vector<ExchangeRecord> list(
        std::optional<ExchangeStatus> status = {}, size_t limit = 50) const;

    [[nodiscard]] bool transition(const RecordId& id, ExchangeStatus from, ExchangeStatus to);
    [[nodiscard]] bool cancel(const RecordId& id, ExchangeStatus from, const std::string& note);
    [[nodiscard]] bool expire(const RecordId& id, ExchangeStatus from, Timestamp now);
    [[nodiscard]] bool markVerified(const RecordId& id, const VerificationInfo& info);

    [[nodiscard]] bool claim(const RecordId& id, Timestamp now);
    void complete(const RecordId& id, const TransferId& receipt, Timestamp now);
    void fail(const RecordId& id, const std::string& note);

    [[nodiscard]] size_t expireStale(Timestamp now);

    [[nodiscard]] bool hasVerifiedItemSale(
        const CounterpartyId& counterpartyId, const ItemRef& itemRef, Timestamp since) const;

private:
    store::Database& m_db;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::exchange

//-------------------------------------------------------------------------
