/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Clock.hpp"
#include "dealcore/collaborators/Inventory.hpp"
#include "dealcore/collaborators/Ledger.hpp"
#include "dealcore/collaborators/Messenger.hpp"
#include "dealcore/journal/Journal.hpp"
#include "dealcore/settlement/Settlement.hpp"
#include "dealcore/settlement/SettlementSignals.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace dealcore::settlement
{

//-------------------------------------------------------------------------

struct SettlementExecutorDesc
{
    collaborators::Ledger& ledger;
    collaborators::Inventory& inventory;
    collaborators::Messenger& messenger;
    journal::Journal& journal;
    const Clock& clock;
    SettlementSignals* signals{};
};

//-------------------------------------------------------------------------

/**
 * Claim, transfer, then record: the only path by which the agent moves value out.
 *
 * The claim happens before the external call so that no two callers can
 * both reach the collaborator for the same settlement. Nothing is retried.
 */
class SettlementExecutor
{
public:
    explicit SettlementExecutor(const SettlementExecutorDesc& desc) noexcept;

    [[nodiscard]] ExecutionOutcome run(Settlement& settlement);

    void notify(const Notice& notice) noexcept;

private:
    [[nodiscard]] std::expected<TransferId, std::string> dispatch(const TransferOrder& order);
    [[nodiscard]] std::expected<TransferId, std::string> sendCurrency(const CurrencyTransfer& order);
    [[nodiscard]] std::expected<TransferId, std::string> sendItem(const ItemTransfer& order);

    void recordFailure(Settlement& settlement, const std::string& note);
    void emit(bs2::signal<void(const SettlementEvent&)> SettlementSignals::*signal,
        const SettlementEvent& event) noexcept;

    collaborators::Ledger& m_ledger;
    collaborators::Inventory& m_inventory;
    collaborators::Messenger& m_messenger;
    journal::Journal& m_journal;
    const Clock& m_clock;
    SettlementSignals* m_signals;
    std::shared_ptr<spdlog::logger> m_logger;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::settlement

//-------------------------------------------------------------------------
