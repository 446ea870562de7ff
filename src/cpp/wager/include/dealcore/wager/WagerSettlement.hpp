/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/settlement/Settlement.hpp"
#include "dealcore/wager/JackpotAccumulator.hpp"
#include "dealcore/wager/WagerStore.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

// Payout of a winning wager to the address the stake came from.
class WagerPayoutSettlement : public settlement::Settlement
{
public:
    WagerPayoutSettlement(WagerStore& wagers, WagerRecord wager, std::string currencySymbol);

    [[nodiscard]] virtual const std::string& id() const noexcept override { return m_wager.id; }
    [[nodiscard]] virtual std::string_view kind() const noexcept override { return "wager"; }

    [[nodiscard]] virtual bool claim(Timestamp now) override;
    [[nodiscard]] virtual std::expected<settlement::TransferOrder, std::string>
        transferOrder() const override;
    virtual void complete(const TransferId& receipt, Timestamp now) override;
    virtual void fail(const std::string& note, Timestamp now) override;

    [[nodiscard]] virtual journal::JournalEntry journalEntry(
        const TransferId& receipt, Timestamp now) const override;

    [[nodiscard]] virtual std::optional<settlement::Notice> completionNotice(
        const TransferId& receipt) const override;
    [[nodiscard]] virtual std::optional<settlement::Notice> failureNotice(
        const std::string& note) const override;

private:
    WagerStore& m_wagers;
    WagerRecord m_wager;
    std::string m_currencySymbol;
};

//-------------------------------------------------------------------------

/**
 * Payout of the jackpot.
 *
 * Claiming is the award itself; failing puts the award back.
 */
class JackpotSettlement : public settlement::Settlement
{
public:
    JackpotSettlement(
        JackpotAccumulator& accumulator,
        std::string winnerId,
        std::string winnerAddress,
        std::string channel,
        std::string currencySymbol);

    [[nodiscard]] virtual const std::string& id() const noexcept override { return m_id; }
    [[nodiscard]] virtual std::string_view kind() const noexcept override { return "jackpot"; }

    [[nodiscard]] virtual bool claim(Timestamp now) override;
    [[nodiscard]] virtual std::expected<settlement::TransferOrder, std::string>
        transferOrder() const override;
    virtual void complete(const TransferId& receipt, Timestamp now) override;
    virtual void fail(const std::string& note, Timestamp now) override;

    [[nodiscard]] virtual journal::JournalEntry journalEntry(
        const TransferId& receipt, Timestamp now) const override;

    [[nodiscard]] virtual std::optional<settlement::Notice> completionNotice(
        const TransferId& receipt) const override;

    [[nodiscard]] const std::optional<JackpotAward>& award() const noexcept { return m_award; }
    // Why the last claim was refused, if it was.
    [[nodiscard]] const std::optional<Error>& claimError() const noexcept { return m_claimError; }

private:
    JackpotAccumulator& m_accumulator;
    std::string m_id;
    std::string m_winnerId;
    std::string m_winnerAddress;
    std::string m_channel;
    std::string m_currencySymbol;
    std::optional<JackpotAward> m_award;
    std::optional<Error> m_claimError;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
