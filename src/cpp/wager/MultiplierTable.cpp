/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/wager/MultiplierTable.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

MultiplierTable::MultiplierTable(std::string game, std::vector<Band> bands)
    : m_game{std::move(game)},
      m_bands{std::move(bands)}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_game.empty()) {
        throw std::invalid_argument{fmt::format("{}: Game name cannot be empty", ctx)};
    }
    ranges::sort(m_bands, {}, &Band::first);
    for (const auto& band : m_bands) {
        if (band.first > band.last) {
            throw std::invalid_argument{fmt::format(
                "{}: Band [{}, {}] of '{}' is empty", ctx, band.first, band.last, m_game)};
        }
        if (band.multiplier < 0_dec) {
            throw std::invalid_argument{fmt::format(
                "{}: Band [{}, {}] of '{}' has negative multiplier {}",
                ctx, band.first, band.last, m_game, band.multiplier)};
        }
        if (band.multiplier > m_maxMultiplier) {
            m_maxMultiplier = band.multiplier;
        }
    }
    for (size_t i = 1; i < m_bands.size(); ++i) {
        const auto& lhs = m_bands[i - 1];
        const auto& rhs = m_bands[i];
        if (lhs.last >= rhs.first) {
            throw std::invalid_argument{fmt::format(
                "{}: Bands [{}, {}] and [{}, {}] of '{}' overlap",
                ctx, lhs.first, lhs.last, rhs.first, rhs.last, m_game)};
        }
    }
}

//-------------------------------------------------------------------------

decimal_t MultiplierTable::multiplierFor(uint32_t outcome) const noexcept
{
    const auto it = ranges::find_if(m_bands, [outcome](const Band& band) {
        return band.first <= outcome && outcome <= band.last;
    });
    return it != m_bands.end() ? it->multiplier : 0_dec;
}

//-------------------------------------------------------------------------

MultiplierTable MultiplierTable::slot()
{
    return MultiplierTable{"slot", {
        {.first = 43, .last = 54, .multiplier = DEC(1.2)},
        {.first = 55, .last = 59, .multiplier = DEC(1.8)},
        {.first = 60, .last = 63, .multiplier = DEC(2.5)},
        {.first = 64, .last = 64, .multiplier = DEC(5.0)}
    }};
}

//-------------------------------------------------------------------------

MultiplierTable MultiplierTable::dice()
{
    return MultiplierTable{"dice", {
        {.first = 4, .last = 4, .multiplier = DEC(1.3)},
        {.first = 5, .last = 5, .multiplier = DEC(1.8)},
        {.first = 6, .last = 6, .multiplier = DEC(2.5)}
    }};
}

//-------------------------------------------------------------------------

MultiplierTable makeMultiplierTable(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::vector<Band> bands;
    for (pugi::xml_node bandNode : node.children("Band")) {
        if (bandNode.attribute("from").empty() || bandNode.attribute("multiplier").empty()) {
            throw std::invalid_argument{fmt::format(
                "{}: Band of '{}' needs 'from' and 'multiplier'",
                ctx, node.attribute("name").as_string())};
        }
        const auto first = bandNode.attribute("from").as_uint();
        bands.push_back({
            .first = first,
            .last = bandNode.attribute("to").as_uint(first),
            .multiplier = util::double2decimal(bandNode.attribute("multiplier").as_double())
        });
    }
    return MultiplierTable{node.attribute("name").as_string(), std::move(bands)};
}

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
