/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/exchange/ExchangeSettlement.hpp"

#include "util.hpp"

//-------------------------------------------------------------------------

namespace dealcore::exchange
{

//-------------------------------------------------------------------------

ExchangeSettlement::ExchangeSettlement(
    ExchangeRecordStore& records, ExchangeRecord record, const ExchangeConfig& config)
    : m_records{records},
      m_record{std::move(record)},
      m_config{config}
{}

//-------------------------------------------------------------------------

bool ExchangeSettlement::claim(Timestamp now)
{
    return m_records.claim(m_record.id, now);
}

//-------------------------------------------------------------------------

std::expected<settlement::TransferOrder, std::string> ExchangeSettlement::transferOrder() const
{
    if (m_record.offered.isItem()) {
        return settlement::ItemTransfer{
            .itemRef = m_record.offered.itemRef().value(),
            .destination = m_record.counterpartyId
        };
    }

    const auto destination = [&]() -> std::optional<std::string> {
        if (m_record.verification.has_value() && m_record.verification->payerAddress.has_value()) {
            return m_record.verification->payerAddress;
        }
        return m_record.counterpartyAddress;
    }();
    if (!destination.has_value() || destination->empty()) {
        return std::unexpected{fmt::format(
            "No ledger address is known for counterparty '{}'", m_record.counterpartyId)};
    }
    return settlement::CurrencyTransfer{
        .destination = destination.value(),
        .amount = m_record.offered.quantity().value(),
        .memo = fmt::format(
            "Deal #{} - {}", m_record.id, m_record.requested.describe(m_config.currencySymbol))
    };
}

//-------------------------------------------------------------------------

void ExchangeSettlement::complete(const TransferId& receipt, Timestamp now)
{
    m_records.complete(m_record.id, receipt, now);
}

//-------------------------------------------------------------------------

void ExchangeSettlement::fail(const std::string& note, [[maybe_unused]] Timestamp now)
{
    m_records.fail(m_record.id, note);
}

//-------------------------------------------------------------------------

journal::JournalEntry ExchangeSettlement::journalEntry(
    const TransferId& receipt, Timestamp now) const
{
    const auto& offered = m_record.offered;
    const auto& requested = m_record.requested;
    const auto [kind, action] = [&]() -> std::pair<journal::EntryKind, std::string_view> {
        switch (compliance::tradeDirection(offered, requested)) {
            case compliance::TradeDirection::AGENT_BUYS_ITEM:
                return {journal::EntryKind::ITEM, "buy_item"};
            case compliance::TradeDirection::AGENT_SELLS_ITEM:
                return {journal::EntryKind::ITEM, "sell_item"};
            case compliance::TradeDirection::ITEM_SWAP:
                return {journal::EntryKind::ITEM, "swap_item"};
            default:
                return {journal::EntryKind::TRADE, "swap_currency"};
        }
    }();
    const auto pnl = m_record.complianceResult.profit;

    return {
        .kind = kind,
        .action = std::string{action},
        .assetFrom = offered.describe(m_config.currencySymbol),
        .assetTo = requested.describe(m_config.currencySymbol),
        .amountFrom = offered.estimatedReferenceValue(),
        .amountTo = requested.estimatedReferenceValue(),
        .counterparty = m_record.counterpartyId,
        .referenceId = m_record.id,
        .reasoning = m_record.complianceResult.rule,
        .outcome = journal::outcomeFromPnl(pnl),
        .pnl = pnl,
        .transferId = receipt,
        .createdAt = m_record.createdAt,
        .closedAt = now
    };
}

//-------------------------------------------------------------------------

std::optional<settlement::Notice> ExchangeSettlement::completionNotice(
    const TransferId& receipt) const
{
    return settlement::Notice{
        .channel = m_record.initiatorChannel,
        .text = fmt::format(
            "Deal #{} completed. Sent {}. Transfer: {}",
            m_record.id, m_record.offered.describe(m_config.currencySymbol), receipt)
    };
}

//-------------------------------------------------------------------------

std::optional<settlement::Notice> ExchangeSettlement::failureNotice(const std::string& note) const
{
    return settlement::Notice{
        .channel = m_record.initiatorChannel,
        .text = fmt::format(
            "Deal #{} could not be completed: {}. An operator will follow up.",
            m_record.id, note)
    };
}

//-------------------------------------------------------------------------

}  // namespace dealcore::exchange

//-------------------------------------------------------------------------
