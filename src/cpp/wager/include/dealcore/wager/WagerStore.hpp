/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/store/Database.hpp"
#include "dealcore/wager/WagerRecord.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

// Durable wagers. Payout transitions are conditional updates, as for exchange records.
class WagerStore
{
public:
    explicit WagerStore(store::Database& db) noexcept;

    void insert(const WagerRecord& wager);

    [[nodiscard]] std::optional<WagerRecord> find(const RecordId& id) const;
    [[nodiscard]] std::vector<WagerRecord> listByRequester(
        const std::string& requesterId, size_t limit = 50) const;

    [[nodiscard]] bool claim(const RecordId& id, Timestamp now);
    void complete(const RecordId& id, const TransferId& receipt, Timestamp now);
    void fail(const RecordId& id, const std::string& note, Timestamp now);

    [[nodiscard]] RequesterStats requesterStats(const std::string& requesterId) const;

private:
    store::Database& m_db;
};

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
