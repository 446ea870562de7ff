/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/wager/MultiplierTable.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

struct WagerConfig
{
    decimal_t minStake{DEC(0.1)};
    decimal_t maxStakeFraction{DEC(0.05)};
    decimal_t minBankroll{DEC(10)};
    Timestamp cooldownSeconds{30};
    uint32_t rateLimitMax{5};
    Timestamp rateLimitWindowSeconds{60};
    Timestamp paymentWindowSeconds{300};
    // Ledger address that receives stakes and pays out wins.
    std::string treasuryAddress;
    std::string currencySymbol{"TON"};
    std::map<std::string, MultiplierTable, std::less<>> games;
};

// Falls back to the slot and dice tables when no <Game> is listed.
[[nodiscard]] WagerConfig makeWagerConfig(pugi::xml_node node);

[[nodiscard]] std::map<std::string, MultiplierTable, std::less<>> defaultGames();

//-------------------------------------------------------------------------

struct JackpotPolicy
{
    decimal_t contributionFraction{DEC(0.05)};
    decimal_t floor{DEC(100)};
    Timestamp cooldownSeconds{86400};
};

[[nodiscard]] JackpotPolicy makeJackpotPolicy(pugi::xml_node node);

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
