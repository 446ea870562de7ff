/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/journal/JournalEntry.hpp"

//-------------------------------------------------------------------------

namespace dealcore::settlement
{

//-------------------------------------------------------------------------

struct CurrencyTransfer
{
    std::string destination;
    decimal_t amount;
    std::string memo;
};

struct ItemTransfer
{
    ItemRef itemRef;
    CounterpartyId destination;
};

using TransferOrder = std::variant<CurrencyTransfer, ItemTransfer>;

struct Notice
{
    std::string channel;
    std::string text;
};

//-------------------------------------------------------------------------

/**
 * One obligation of the agent that can be discharged by a single outbound transfer.
 *
 * `claim` must be an atomic compare-and-swap in the durable store that
 * succeeds for at most one caller. `fail` must release the claim so that an
 * operator can retry or reconcile.
 */
class Settlement
{
public:
    virtual ~Settlement() noexcept = default;

    [[nodiscard]] virtual const std::string& id() const noexcept = 0;
    [[nodiscard]] virtual std::string_view kind() const noexcept = 0;

    [[nodiscard]] virtual bool claim(Timestamp now) = 0;
    [[nodiscard]] virtual std::expected<TransferOrder, std::string> transferOrder() const = 0;
    virtual void complete(const TransferId& receipt, Timestamp now) = 0;
    virtual void fail(const std::string& note, Timestamp now) = 0;

    [[nodiscard]] virtual journal::JournalEntry journalEntry(
        const TransferId& receipt, Timestamp now) const = 0;

    [[nodiscard]] virtual std::optional<Notice> completionNotice(const TransferId&) const
    {
        return {};
    }

    [[nodiscard]] virtual std::optional<Notice> failureNotice(const std::string&) const
    {
        return {};
    }

protected:
    Settlement() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::settlement

//-------------------------------------------------------------------------
