/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace dealcore::collaborators
{

//-------------------------------------------------------------------------

struct LedgerTransfer
{
    TransferId id;
    decimal_t amount;
    std::string sender;
    std::string memo;
    Timestamp timestamp;
};

//-------------------------------------------------------------------------

class Ledger
{
public:
    virtual ~Ledger() noexcept = default;

    [[nodiscard]] virtual std::expected<TransferId, std::string> submitTransfer(
        const std::string& destination, decimal_t amount, const std::string& memo) = 0;

    // Inbound transfers to `address` no older than `since`.
    [[nodiscard]] virtual std::vector<LedgerTransfer> queryTransfers(
        const std::string& address, Timestamp since) = 0;

    [[nodiscard]] virtual std::optional<decimal_t> balance(const std::string& address) = 0;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::collaborators

//-------------------------------------------------------------------------
