/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/wager/WagerSettlement.hpp"

#include "util.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

WagerPayoutSettlement::WagerPayoutSettlement(
    WagerStore& wagers, WagerRecord wager, std::string currencySymbol)
    : m_wagers{wagers},
      m_wager{std::move(wager)},
      m_currencySymbol{std::move(currencySymbol)}
{}

//-------------------------------------------------------------------------

bool WagerPayoutSettlement::claim(Timestamp now)
{
    return m_wagers.claim(m_wager.id, now);
}

//-------------------------------------------------------------------------

std::expected<settlement::TransferOrder, std::string> WagerPayoutSettlement::transferOrder() const
{
    if (!m_wager.payerAddress.has_value() || m_wager.payerAddress->empty()) {
        return std::unexpected{fmt::format(
            "The stake of wager '{}' carries no sender address", m_wager.id)};
    }
    return settlement::CurrencyTransfer{
        .destination = m_wager.payerAddress.value(),
        .amount = m_wager.payout,
        .memo = fmt::format("{} win x{} (wager {})", m_wager.game, m_wager.multiplier, m_wager.id)
    };
}

//-------------------------------------------------------------------------

void WagerPayoutSettlement::complete(const TransferId& receipt, Timestamp now)
{
    m_wagers.complete(m_wager.id, receipt, now);
}

//-------------------------------------------------------------------------

void WagerPayoutSettlement::fail(const std::string& note, Timestamp now)
{
    m_wagers.fail(m_wager.id, note, now);
}

//-------------------------------------------------------------------------

journal::JournalEntry WagerPayoutSettlement::journalEntry(
    const TransferId& receipt, Timestamp now) const
{
    const auto pnl = m_wager.stake - m_wager.payout;
    return {
        .kind = journal::EntryKind::WAGER,
        .action = "wager_payout",
        .assetFrom = util::formatAmount(m_wager.payout) + " " + m_currencySymbol,
        .assetTo = util::formatAmount(m_wager.stake) + " " + m_currencySymbol,
        .amountFrom = m_wager.payout,
        .amountTo = m_wager.stake,
        .counterparty = m_wager.requesterId,
        .referenceId = m_wager.id,
        .reasoning = fmt::format(
            "{} outcome {} pays x{}", m_wager.game, m_wager.outcomeValue, m_wager.multiplier),
        .outcome = journal::outcomeFromPnl(pnl),
        .pnl = pnl,
        .transferId = receipt,
        .createdAt = m_wager.createdAt,
        .closedAt = now
    };
}

//-------------------------------------------------------------------------

std::optional<settlement::Notice> WagerPayoutSettlement::completionNotice(
    const TransferId& receipt) const
{
    return settlement::Notice{
        .channel = m_wager.channel,
        .text = fmt::format(
            "{} rolled {} for x{}. Paid {} {}. Transfer: {}",
            m_wager.game, m_wager.outcomeValue, m_wager.multiplier,
            util::formatAmount(m_wager.payout), m_currencySymbol, receipt)
    };
}

//-------------------------------------------------------------------------

std::optional<settlement::Notice> WagerPayoutSettlement::failureNotice(
    const std::string& note) const
{
    return settlement::Notice{
        .channel = m_wager.channel,
        .text = fmt::format(
            "Payout of wager {} failed: {}. An operator will follow up.", m_wager.id, note)
    };
}

//-------------------------------------------------------------------------

JackpotSettlement::JackpotSettlement(
    JackpotAccumulator& accumulator,
    std::string winnerId,
    std::string winnerAddress,
    std::string channel,
    std::string currencySymbol)
    : m_accumulator{accumulator},
      m_id{util::generateId("jackpot")},
      m_winnerId{std::move(winnerId)},
      m_winnerAddress{std::move(winnerAddress)},
      m_channel{std::move(channel)},
      m_currencySymbol{std::move(currencySymbol)}
{}

//-------------------------------------------------------------------------

bool JackpotSettlement::claim(Timestamp now)
{
    auto award = m_accumulator.award(m_winnerId, now);
    if (!award.has_value()) {
        m_claimError = std::move(award).error();
        return false;
    }
    m_claimError.reset();
    m_award = std::move(award).value();
    return true;
}

//-------------------------------------------------------------------------

std::expected<settlement::TransferOrder, std::string> JackpotSettlement::transferOrder() const
{
    if (m_winnerAddress.empty()) {
        return std::unexpected{fmt::format("No ledger address for winner '{}'", m_winnerId)};
    }
    return settlement::CurrencyTransfer{
        .destination = m_winnerAddress,
        .amount = m_award.value().amount,
        .memo = fmt::format("Jackpot {}", m_id)
    };
}

//-------------------------------------------------------------------------

void JackpotSettlement::complete(
    [[maybe_unused]] const TransferId& receipt, [[maybe_unused]] Timestamp now)
{}

//-------------------------------------------------------------------------

void JackpotSettlement::fail([[maybe_unused]] const std::string& note, [[maybe_unused]] Timestamp now)
{
    m_accumulator.rollback(m_award.value());
}

//-------------------------------------------------------------------------

journal::JournalEntry JackpotSettlement::journalEntry(const TransferId& receipt, Timestamp now) const
{
    const auto& award = m_award.value();
    return {
        .kind = journal::EntryKind::JACKPOT,
        .action = "jackpot_award",
        .assetFrom = util::formatAmount(award.amount) + " " + m_currencySymbol,
        .amountFrom = award.amount,
        .counterparty = m_winnerId,
        .referenceId = m_id,
        .reasoning = "Jackpot floor reached and cooldown elapsed",
        .outcome = journal::Outcome::LOSS,
        .pnl = -award.amount,
        .transferId = receipt,
        .createdAt = award.awardedAt,
        .closedAt = now
    };
}

//-------------------------------------------------------------------------

std::optional<settlement::Notice> JackpotSettlement::completionNotice(
    const TransferId& receipt) const
{
    return settlement::Notice{
        .channel = m_channel,
        .text = fmt::format(
            "JACKPOT! {} wins {} {}. Transfer: {}",
            m_winnerId, util::formatAmount(m_award.value().amount), m_currencySymbol, receipt)
    };
}

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
