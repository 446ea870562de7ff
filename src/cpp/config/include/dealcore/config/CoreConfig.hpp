/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/exchange/ExchangeConfig.hpp"
#include "dealcore/logging/Logging.hpp"
#include "dealcore/store/Database.hpp"
#include "dealcore/verification/TransferVerifier.hpp"
#include "dealcore/wager/WagerConfig.hpp"

//-------------------------------------------------------------------------

namespace dealcore::config
{

//-------------------------------------------------------------------------

struct StoreConfig
{
    fs::path path{store::Database::kInMemory};
};

struct CoreConfig
{
    StoreConfig store;
    logging::LoggingConfig logging;
    exchange::ExchangeConfig exchange;
    verification::VerifierConfig verification;
    std::optional<wager::WagerConfig> wager;
    wager::JackpotPolicy jackpot;
};

// Sections other than <Exchange> may be left out; <Wager> enables the wager tables.
[[nodiscard]] CoreConfig makeCoreConfig(pugi::xml_node node);

// Reads the <DealCore> root of the XML file at `path`.
[[nodiscard]] CoreConfig loadConfig(const fs::path& path);

//-------------------------------------------------------------------------

}  // namespace dealcore::config

//-------------------------------------------------------------------------
