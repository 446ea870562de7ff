/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/wager/Cooldown.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

Cooldown::Cooldown(store::Database& db, Timestamp cooldownSeconds) noexcept
    : m_db{db},
      m_cooldownSeconds{cooldownSeconds}
{}

//-------------------------------------------------------------------------

std::expected<void, Timestamp> Cooldown::tryStart(const std::string& requesterId, Timestamp now)
{
    using namespace store;

    const auto changed = m_db.execute(
        "INSERT INTO wager_cooldowns (requester_id, last_wager_at) VALUES (?1, ?2) "
        "ON CONFLICT (requester_id) DO UPDATE SET last_wager_at = excluded.last_wager_at "
        "WHERE excluded.last_wager_at - wager_cooldowns.last_wager_at >= ?3",
        {text(requesterId), integer(now), integer(m_cooldownSeconds)});
    if (changed == 1) {
        return {};
    }
    return std::unexpected{std::max<Timestamp>(remaining(requesterId, now), 1)};
}

//-------------------------------------------------------------------------

Timestamp Cooldown::remaining(const std::string& requesterId, Timestamp now) const
{
    const auto row = m_db.queryOne(
        "SELECT last_wager_at FROM wager_cooldowns WHERE requester_id = ?",
        {store::text(requesterId)});
    if (!row.has_value()) {
        return 0;
    }
    const auto last = row->timestamp("last_wager_at");
    const auto elapsed = now > last ? now - last : 0;
    return elapsed >= m_cooldownSeconds ? 0 : m_cooldownSeconds - elapsed;
}

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
