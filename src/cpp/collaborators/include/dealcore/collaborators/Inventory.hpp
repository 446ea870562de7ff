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

struct ReceivedItem
{
    std::string itemId;
    ItemRef itemRef;
    CounterpartyId senderId;
    Timestamp receivedAt;
};

// The platform wants a fee settled before it moves the item.
struct PaymentRequired
{
    std::string invoiceId;
    std::optional<decimal_t> fee;
};

using ItemTransferResult = std::variant<TransferId, PaymentRequired>;

//-------------------------------------------------------------------------

class Inventory
{
public:
    virtual ~Inventory() noexcept = default;

    [[nodiscard]] virtual std::vector<ReceivedItem> listRecentlyReceivedItems(
        const std::string& accountId) = 0;

    [[nodiscard]] virtual std::expected<ItemTransferResult, std::string> transferItem(
        const ItemRef& itemRef, const CounterpartyId& destinationId) = 0;

    [[nodiscard]] virtual std::expected<void, std::string> payTransferFee(
        const PaymentRequired& payment) = 0;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::collaborators

//-------------------------------------------------------------------------
