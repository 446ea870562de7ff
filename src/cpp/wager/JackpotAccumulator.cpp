/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/wager/JackpotAccumulator.hpp"

#include "dealcore/logging/Logging.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

namespace
{

using namespace store;

[[nodiscard]] JackpotState readState(const Row& row)
{
    return {
        .accumulatedAmount = row.decimal("accumulated_amount"),
        .lastWinnerId = row.optText("last_winner_id"),
        .lastAwardedAt = row.optTimestamp("last_awarded_at"),
        .version = row.integer("version")
    };
}

}  // namespace

//-------------------------------------------------------------------------

void JackpotState::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::setDecimal(json, "accumulatedAmount", accumulatedAmount);
        json::setOptionalMember(json, "lastWinnerId", lastWinnerId);
        json::setOptionalMember(json, "lastAwardedAt", lastAwardedAt);
        json.AddMember("version", rapidjson::Value{version}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

JackpotAccumulator::JackpotAccumulator(Database& db, const JackpotPolicy& policy) noexcept
    : m_db{db},
      m_policy{policy}
{}

//-------------------------------------------------------------------------

JackpotState JackpotAccumulator::state() const
{
    const auto row = m_db.queryOne(
        "SELECT accumulated_amount, last_winner_id, last_awarded_at, version "
        "FROM jackpot_state WHERE id = 1");
    if (!row.has_value()) {
        throw StoreError{fmt::format(
            "{}: Jackpot row is missing; was the schema applied?",
            std::source_location::current().function_name())};
    }
    return readState(row.value());
}

//-------------------------------------------------------------------------

decimal_t JackpotAccumulator::credit(decimal_t stake)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (stake < 0_dec) {
        throw std::invalid_argument{fmt::format("{}: Negative stake {}", ctx, stake)};
    }
    const auto contribution = util::round(stake * m_policy.contributionFraction);
    if (contribution == 0_dec) {
        return contribution;
    }

    for (uint32_t attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
        const auto current = state();
        const auto changed = m_db.execute(
            "UPDATE jackpot_state SET accumulated_amount = ?, version = version + 1 "
            "WHERE id = 1 AND version = ?",
            {decimal(current.accumulatedAmount + contribution), integer(current.version)});
        if (changed == 1) {
            return contribution;
        }
    }
    throw StoreError{fmt::format(
        "{}: Jackpot credit of {} lost {} races in a row", ctx, contribution, kMaxCasAttempts)};
}

//-------------------------------------------------------------------------

bool JackpotAccumulator::isEligible(const JackpotState& state, Timestamp now) const noexcept
{
    if (state.accumulatedAmount < m_policy.floor) {
        return false;
    }
    return !state.lastAwardedAt.has_value()
        || (now >= state.lastAwardedAt.value()
            && now - state.lastAwardedAt.value() >= m_policy.cooldownSeconds);
}

//-------------------------------------------------------------------------

Expected<JackpotAward> JackpotAccumulator::award(const std::string& winnerId, Timestamp now)
{
    const auto current = state();
    if (!isEligible(current, now)) {
        return makeError(
            ErrorCode::JACKPOT_NOT_ELIGIBLE,
            fmt::format(
                "Jackpot of {} is below the floor of {} or still cooling down",
                current.accumulatedAmount, m_policy.floor));
    }

    // The amount and cooldown columns are re-checked against the values that
    // were judged eligible, on top of the version.
    const auto changed = m_db.execute(
        "UPDATE jackpot_state SET accumulated_amount = '0', last_winner_id = ?1, "
        "last_awarded_at = ?2, version = version + 1 "
        "WHERE id = 1 AND version = ?3 AND accumulated_amount = ?4 "
        "AND (last_awarded_at IS NULL OR ?2 - last_awarded_at >= ?5)",
        {
            text(winnerId),
            integer(now),
            integer(current.version),
            decimal(current.accumulatedAmount),
            integer(m_policy.cooldownSeconds)
        });
    if (changed != 1) {
        return makeError(
            ErrorCode::CONFLICT,
            fmt::format("Jackpot changed while being awarded to '{}'", winnerId));
    }

    logging::get()->info("Jackpot of {} awarded to '{}'", current.accumulatedAmount, winnerId);
    return JackpotAward{
        .winnerId = winnerId,
        .amount = current.accumulatedAmount,
        .awardedAt = now,
        .priorWinnerId = current.lastWinnerId,
        .priorAwardedAt = current.lastAwardedAt
    };
}

//-------------------------------------------------------------------------

void JackpotAccumulator::rollback(const JackpotAward& award)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    for (uint32_t attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
        const auto current = state();
        // Winner fields are only ours to restore while they still name this award.
        const bool ownsWinner = current.lastWinnerId == award.winnerId
            && current.lastAwardedAt == award.awardedAt;
        const auto changed = m_db.execute(
            "UPDATE jackpot_state SET accumulated_amount = ?, last_winner_id = ?, "
            "last_awarded_at = ?, version = version + 1 "
            "WHERE id = 1 AND version = ?",
            {
                decimal(current.accumulatedAmount + award.amount),
                ownsWinner ? nullable(award.priorWinnerId) : nullable(current.lastWinnerId),
                ownsWinner ? nullable(award.priorAwardedAt) : nullable(current.lastAwardedAt),
                integer(current.version)
            });
        if (changed == 1) {
            logging::get()->warn(
                "Jackpot award of {} to '{}' rolled back", award.amount, award.winnerId);
            return;
        }
    }
    throw StoreError{fmt::format(
        "{}: Rollback of the {} jackpot awarded to '{}' lost {} races in a row",
        ctx, award.amount, award.winnerId, kMaxCasAttempts)};
}

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
