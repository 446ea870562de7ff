/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/store/Database.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

// Fixed-window attempt counter per requester.
class RateLimiter
{
public:
    RateLimiter(store::Database& db, uint32_t maxAttempts, Timestamp windowSeconds);

    [[nodiscard]] bool tryAcquire(const std::string& requesterId, Timestamp now);

    // Drops the buckets of finished windows.
    size_t prune(Timestamp now);

    [[nodiscard]] Timestamp bucketStart(Timestamp now) const noexcept
    {
        return now - now % m_windowSeconds;
    }

private:
    store::Database& m_db;
    uint32_t m_maxAttempts;
    Timestamp m_windowSeconds;
};

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
