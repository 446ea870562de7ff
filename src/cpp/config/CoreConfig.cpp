/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/config/CoreConfig.hpp"

//-------------------------------------------------------------------------

namespace dealcore::config
{

//-------------------------------------------------------------------------

CoreConfig makeCoreConfig(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (std::string_view{node.name()} != "DealCore") {
        throw std::invalid_argument{fmt::format(
            "{}: Expected a <DealCore> node, got <{}>", ctx, node.name())};
    }

    pugi::xml_node exchangeNode = node.child("Exchange");
    if (!exchangeNode) {
        throw std::invalid_argument{fmt::format("{}: Missing <Exchange> section", ctx)};
    }

    CoreConfig config{
        .logging = logging::makeLoggingConfig(node.child("Logging")),
        .exchange = exchange::makeExchangeConfig(exchangeNode),
        .verification = verification::makeVerifierConfig(node.child("Verification")),
        .jackpot = wager::makeJackpotPolicy(node.child("Jackpot"))
    };
    if (pugi::xml_attribute attr = node.child("Store").attribute("path"); !attr.empty()) {
        config.store.path = attr.as_string();
    }
    if (pugi::xml_node wagerNode = node.child("Wager")) {
        auto wagerConfig = wager::makeWagerConfig(wagerNode);
        if (wagerConfig.treasuryAddress.empty()) {
            wagerConfig.treasuryAddress = config.exchange.agentAddress;
        }
        if (wagerNode.attribute("currency").empty()) {
            wagerConfig.currencySymbol = config.exchange.currencySymbol;
        }
        config.wager = std::move(wagerConfig);
    }

    return config;
}

//-------------------------------------------------------------------------

CoreConfig loadConfig(const fs::path& path)
{
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing '{}' at offset {}: {}",
            std::source_location::current().function_name(),
            path.c_str(), result.offset, result.description())};
    }
    return makeCoreConfig(doc.child("DealCore"));
}

//-------------------------------------------------------------------------

}  // namespace dealcore::config

//-------------------------------------------------------------------------
