/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/compliance/ComplianceChecker.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace dealcore::exchange
{

struct ExchangeConfig
{
    Timestamp expirySeconds{120};
    // Ledger address that receives the counterparty's currency.
    std::string agentAddress;
    // Inventory account that receives the counterparty's items.
    std::string agentAccountId;
    std::string currencySymbol{"TON"};
    bool autoExecute{true};
    compliance::CompliancePolicy compliance;
};

[[nodiscard]] ExchangeConfig makeExchangeConfig(pugi::xml_node node);

}  // namespace dealcore::exchange

//-------------------------------------------------------------------------
