/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ErrorCode.hpp"
#include "dealcore/wager/WagerConfig.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

struct StakeBounds
{
    decimal_t minStake;
    decimal_t maxStake;
};

/**
 * Keeps every admissible wager payable out of the treasury.
 *
 * The largest stake is the smaller of a fixed fraction of the balance and
 * the balance divided by the best multiplier of the game.
 */
class BankrollGuard
{
public:
    explicit BankrollGuard(const WagerConfig& config) noexcept;

    [[nodiscard]] Expected<StakeBounds> bounds(
        decimal_t treasuryBalance, decimal_t maxMultiplier) const;

    [[nodiscard]] Expected<StakeBounds> check(
        decimal_t stake, decimal_t treasuryBalance, decimal_t maxMultiplier) const;

private:
    decimal_t m_minStake;
    decimal_t m_maxStakeFraction;
    decimal_t m_minBankroll;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
