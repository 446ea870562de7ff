/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/wager/RateLimiter.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

RateLimiter::RateLimiter(store::Database& db, uint32_t maxAttempts, Timestamp windowSeconds)
    : m_db{db},
      m_maxAttempts{maxAttempts},
      m_windowSeconds{windowSeconds}
{
    if (m_maxAttempts == 0 || m_windowSeconds == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: Rate limit of {} per {}s admits nothing",
            std::source_location::current().function_name(), m_maxAttempts, m_windowSeconds)};
    }
}

//-------------------------------------------------------------------------

bool RateLimiter::tryAcquire(const std::string& requesterId, Timestamp now)
{
    using namespace store;

    return m_db.execute(
        "INSERT INTO wager_rate_buckets (requester_id, bucket_start, attempts) VALUES (?1, ?2, 1) "
        "ON CONFLICT (requester_id, bucket_start) DO UPDATE SET attempts = attempts + 1 "
        "WHERE attempts < ?3",
        {text(requesterId), integer(bucketStart(now)), integer(m_maxAttempts)}) == 1;
}

//-------------------------------------------------------------------------

size_t RateLimiter::prune(Timestamp now)
{
    return static_cast<size_t>(m_db.execute(
        "DELETE FROM wager_rate_buckets WHERE bucket_start < ?",
        {store::integer(bucketStart(now))}));
}

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
