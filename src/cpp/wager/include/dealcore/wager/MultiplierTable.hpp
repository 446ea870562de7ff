/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

// Inclusive range of outcome values paying the same multiplier.
struct Band
{
    uint32_t first;
    uint32_t last;
    decimal_t multiplier;
};

//-------------------------------------------------------------------------

class MultiplierTable
{
public:
    MultiplierTable(std::string game, std::vector<Band> bands);

    [[nodiscard]] const std::string& game() const noexcept { return m_game; }
    [[nodiscard]] const std::vector<Band>& bands() const noexcept { return m_bands; }
    [[nodiscard]] decimal_t maxMultiplier() const noexcept { return m_maxMultiplier; }

    // Zero for outcomes outside every band.
    [[nodiscard]] decimal_t multiplierFor(uint32_t outcome) const noexcept;

    [[nodiscard]] static MultiplierTable slot();
    [[nodiscard]] static MultiplierTable dice();

private:
    std::string m_game;
    std::vector<Band> m_bands;
    decimal_t m_maxMultiplier{};
};

[[nodiscard]] MultiplierTable makeMultiplierTable(pugi::xml_node node);

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
