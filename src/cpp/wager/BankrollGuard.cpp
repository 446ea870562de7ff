/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/wager/BankrollGuard.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

BankrollGuard::BankrollGuard(const WagerConfig& config) noexcept
    : m_minStake{config.minStake},
      m_maxStakeFraction{config.maxStakeFraction},
      m_minBankroll{config.minBankroll}
{}

//-------------------------------------------------------------------------

Expected<StakeBounds> BankrollGuard::bounds(
    decimal_t treasuryBalance, decimal_t maxMultiplier) const
{
    if (treasuryBalance < m_minBankroll) {
        return makeError(
            ErrorCode::BANKROLL_INSUFFICIENT,
            fmt::format(
                "Treasury holds {}, below the {} needed to open the table",
                util::round(treasuryBalance, 2), m_minBankroll));
    }

    auto maxStake = treasuryBalance * m_maxStakeFraction;
    if (maxMultiplier > 0_dec) {
        maxStake = util::min(maxStake, treasuryBalance / maxMultiplier);
    }
    maxStake = util::round(maxStake, 2);

    if (maxStake < m_minStake) {
        return makeError(
            ErrorCode::BANKROLL_INSUFFICIENT,
            fmt::format(
                "Treasury of {} cannot cover the minimum stake of {}",
                util::round(treasuryBalance, 2), m_minStake));
    }
    return StakeBounds{.minStake = m_minStake, .maxStake = maxStake};
}

//-------------------------------------------------------------------------

Expected<StakeBounds> BankrollGuard::check(
    decimal_t stake, decimal_t treasuryBalance, decimal_t maxMultiplier) const
{
    return bounds(treasuryBalance, maxMultiplier).and_then(
        [stake](StakeBounds bounds) -> Expected<StakeBounds> {
            if (stake < bounds.minStake || stake > bounds.maxStake) {
                return makeError(
                    ErrorCode::STAKE_OUT_OF_BOUNDS,
                    fmt::format(
                        "Stake of {} is outside [{}, {}]",
                        stake, bounds.minStake, bounds.maxStake));
            }
            return bounds;
        });
}

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
