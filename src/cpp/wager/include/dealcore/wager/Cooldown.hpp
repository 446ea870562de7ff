/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/store/Database.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

/**
 * Minimum spacing between two wagers of one requester.
 *
 * The check and the stamp are a single upsert, so two concurrent requests
 * from the same requester cannot both pass.
 */
class Cooldown
{
public:
    Cooldown(store::Database& db, Timestamp cooldownSeconds) noexcept;

    // On rejection, the error holds the seconds left to wait.
    [[nodiscard]] std::expected<void, Timestamp> tryStart(
        const std::string& requesterId, Timestamp now);

    [[nodiscard]] Timestamp remaining(const std::string& requesterId, Timestamp now) const;

    [[nodiscard]] Timestamp cooldownSeconds() const noexcept { return m_cooldownSeconds; }

private:
    store::Database& m_db;
    Timestamp m_cooldownSeconds;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
