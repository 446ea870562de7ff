/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/wager/WagerConfig.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] decimal_t decimalAttribute(pugi::xml_node node, const char* name, decimal_t def)
{
    pugi::xml_attribute attr = node.attribute(name);
    return attr.empty() ? def : util::double2decimal(attr.as_double());
}

}  // namespace

//-------------------------------------------------------------------------

std::map<std::string, MultiplierTable, std::less<>> defaultGames()
{
    std::map<std::string, MultiplierTable, std::less<>> games;
    for (auto table : {MultiplierTable::slot(), MultiplierTable::dice()}) {
        auto game = table.game();
        games.emplace(std::move(game), std::move(table));
    }
    return games;
}

//-------------------------------------------------------------------------

WagerConfig makeWagerConfig(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    WagerConfig config;
    config.minStake = decimalAttribute(node, "minStake", config.minStake);
    config.maxStakeFraction = decimalAttribute(node, "maxStakeFraction", config.maxStakeFraction);
    config.minBankroll = decimalAttribute(node, "minBankroll", config.minBankroll);
    config.cooldownSeconds = node.attribute("cooldownSeconds").as_ullong(config.cooldownSeconds);
    config.rateLimitMax = node.attribute("rateLimitMax").as_uint(config.rateLimitMax);
    config.rateLimitWindowSeconds =
        node.attribute("rateLimitWindowSeconds").as_ullong(config.rateLimitWindowSeconds);
    config.paymentWindowSeconds =
        node.attribute("paymentWindowSeconds").as_ullong(config.paymentWindowSeconds);
    config.treasuryAddress = node.attribute("treasuryAddress").as_string();
    if (pugi::xml_attribute attr = node.attribute("currency"); !attr.empty()) {
        config.currencySymbol = attr.as_string();
    }

    if (config.minStake <= 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: 'minStake' should be positive, was {}", ctx, config.minStake)};
    }
    if (config.maxStakeFraction <= 0_dec || config.maxStakeFraction > 1_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: 'maxStakeFraction' should be in (0, 1], was {}", ctx, config.maxStakeFraction)};
    }
    if (config.minBankroll < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: 'minBankroll' cannot be negative, was {}", ctx, config.minBankroll)};
    }
    if (config.rateLimitMax == 0 || config.rateLimitWindowSeconds == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: Rate limit of {} per {}s admits nothing",
            ctx, config.rateLimitMax, config.rateLimitWindowSeconds)};
    }

    for (pugi::xml_node gameNode : node.children("Game")) {
        auto table = makeMultiplierTable(gameNode);
        auto game = table.game();
        if (!config.games.emplace(std::move(game), std::move(table)).second) {
            throw std::invalid_argument{fmt::format(
                "{}: Game '{}' is listed twice", ctx, gameNode.attribute("name").as_string())};
        }
    }
    if (config.games.empty()) {
        config.games = defaultGames();
    }

    return config;
}

//-------------------------------------------------------------------------

JackpotPolicy makeJackpotPolicy(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    JackpotPolicy policy;
    policy.contributionFraction =
        decimalAttribute(node, "contributionFraction", policy.contributionFraction);
    policy.floor = decimalAttribute(node, "floor", policy.floor);
    policy.cooldownSeconds = node.attribute("cooldownSeconds").as_ullong(policy.cooldownSeconds);

    if (policy.contributionFraction < 0_dec || policy.contributionFraction >= 1_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: 'contributionFraction' should be in [0, 1), was {}",
            ctx, policy.contributionFraction)};
    }
    if (policy.floor <= 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: 'floor' should be positive, was {}", ctx, policy.floor)};
    }

    return policy;
}

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
