/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/exchange/ExchangeConfig.hpp"

//-------------------------------------------------------------------------

namespace dealcore::exchange
{

ExchangeConfig makeExchangeConfig(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    ExchangeConfig config;
    config.expirySeconds = node.attribute("expirySeconds").as_ullong(config.expirySeconds);
    if (config.expirySeconds == 0) {
        throw std::invalid_argument{fmt::format("{}: 'expirySeconds' must be positive", ctx)};
    }
    config.agentAddress = node.attribute("agentAddress").as_string();
    if (config.agentAddress.empty()) {
        throw std::invalid_argument{fmt::format("{}: 'agentAddress' is required", ctx)};
    }
    config.agentAccountId = node.attribute("agentAccountId").as_string();
    if (pugi::xml_attribute attr = node.attribute("currency"); !attr.empty()) {
        config.currencySymbol = attr.as_string();
    }
    config.autoExecute = node.attribute("autoExecute").as_bool(config.autoExecute);
    config.compliance = compliance::makeCompliancePolicy(node.child("Compliance"));
    return config;
}

}  // namespace dealcore::exchange

//-------------------------------------------------------------------------
