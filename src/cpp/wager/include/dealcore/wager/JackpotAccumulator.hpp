/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ErrorCode.hpp"
#include "JsonSerializable.hpp"
#include "dealcore/store/Database.hpp"
#include "dealcore/wager/WagerConfig.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

struct JackpotState
{
    decimal_t accumulatedAmount;
    std::optional<std::string> lastWinnerId;
    std::optional<Timestamp> lastAwardedAt;
    int64_t version;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

// Everything needed to undo an award whose payout failed.
struct JackpotAward
{
    std::string winnerId;
    decimal_t amount;
    Timestamp awardedAt;
    std::optional<std::string> priorWinnerId;
    std::optional<Timestamp> priorAwardedAt;
};

//-------------------------------------------------------------------------

/**
 * Single shared jackpot balance.
 *
 * Every write is a compare-and-set on the row version. Credits retry on
 * contention; an award never does, so at most one of several concurrent
 * awards can win.
 */
class JackpotAccumulator
{
public:
    static constexpr uint32_t kMaxCasAttempts = 64;

    JackpotAccumulator(store::Database& db, const JackpotPolicy& policy) noexcept;

    [[nodiscard]] const JackpotPolicy& policy() const noexcept { return m_policy; }

    [[nodiscard]] JackpotState state() const;

    // Returns the contribution added for a wager of `stake`.
    decimal_t credit(decimal_t stake);

    [[nodiscard]] bool isEligible(const JackpotState& state, Timestamp now) const noexcept;

    [[nodiscard]] Expected<JackpotAward> award(const std::string& winnerId, Timestamp now);

    // Puts an award back on top of whatever was credited since.
    void rollback(const JackpotAward& award);

private:
    store::Database& m_db;
    JackpotPolicy m_policy;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
