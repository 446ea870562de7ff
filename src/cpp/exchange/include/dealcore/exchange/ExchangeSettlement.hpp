/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/exchange/ExchangeConfig.hpp"
#include "dealcore/exchange/ExchangeRecordStore.hpp"
#include "dealcore/settlement/Settlement.hpp"

//-------------------------------------------------------------------------

namespace dealcore::exchange
{

// The agent's side of a verified exchange.
class ExchangeSettlement : public settlement::Settlement
{
public:
    ExchangeSettlement(
        ExchangeRecordStore& records, ExchangeRecord record, const ExchangeConfig& config);

    [[nodiscard]] virtual const std::string& id() const noexcept override { return m_record.id; }
    [[nodiscard]] virtual std::string_view kind() const noexcept override { return "exchange"; }

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
    ExchangeRecordStore& m_records;
    ExchangeRecord m_record;
    const ExchangeConfig& m_config;
};

}  // namespace dealcore::exchange

//-------------------------------------------------------------------------
