/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Clock.hpp"
#include "ErrorCode.hpp"
#include "dealcore/collaborators/OutcomeSource.hpp"
#include "dealcore/settlement/SettlementExecutor.hpp"
#include "dealcore/verification/TransferVerifier.hpp"
#include "dealcore/wager/BankrollGuard.hpp"
#include "dealcore/wager/Cooldown.hpp"
#include "dealcore/wager/RateLimiter.hpp"
#include "dealcore/wager/WagerSettlement.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

struct WagerRequest
{
    std::string requesterId;
    // Memo the requester was told to attach to the stake transfer.
    std::string requesterHandle;
    std::string channel;
    std::string game;
    decimal_t stake;
};

struct WagerOutcome
{
    WagerRecord wager;
    // Empty for losses.
    std::optional<settlement::ExecutionOutcome> payout;
};

struct WagerServiceDesc
{
    WagerConfig config;
    store::Database& db;
    JackpotAccumulator& jackpot;
    verification::TransferVerifier& verifier;
    settlement::SettlementExecutor& executor;
    collaborators::Ledger& ledger;
    collaborators::OutcomeSource& outcomes;
    journal::Journal& journal;
    const Clock& clock;
};

//-------------------------------------------------------------------------

class WagerService
{
public:
    explicit WagerService(const WagerServiceDesc& desc);

    [[nodiscard]] const WagerConfig& config() const noexcept { return m_config; }

    // Rate limit, bankroll, stake bounds, cooldown, payment, outcome, jackpot, settle.
    [[nodiscard]] Expected<WagerOutcome> place(const WagerRequest& request);

    [[nodiscard]] Expected<StakeBounds> stakeBounds(std::string_view game);

    [[nodiscard]] std::optional<WagerRecord> find(const RecordId& id) const;
    [[nodiscard]] RequesterStats requesterStats(const std::string& requesterId) const;

private:
    [[nodiscard]] Expected<decimal_t> treasuryBalance();
    [[nodiscard]] Expected<WagerRecord> record(
        const WagerRequest& request,
        const RecordId& id,
        const verification::TransferMatch& match,
        uint32_t outcome,
        const MultiplierTable& table);
    void journalLoss(const WagerRecord& wager);
    [[nodiscard]] WagerRecord reload(const WagerRecord& wager) const;

    WagerConfig m_config;
    WagerStore m_wagers;
    Cooldown m_cooldown;
    RateLimiter m_rateLimiter;
    BankrollGuard m_bankroll;
    JackpotAccumulator& m_jackpot;
    verification::TransferVerifier& m_verifier;
    settlement::SettlementExecutor& m_executor;
    collaborators::Ledger& m_ledger;
    collaborators::OutcomeSource& m_outcomes;
    journal::Journal& m_journal;
    const Clock& m_clock;
    std::shared_ptr<spdlog::logger> m_logger;
};

//-------------------------------------------------------------------------

struct JackpotPayout
{
    JackpotAward award;
    settlement::ExecutionOutcome execution;
};

struct JackpotServiceDesc
{
    JackpotAccumulator& accumulator;
    settlement::SettlementExecutor& executor;
    const Clock& clock;
    std::string currencySymbol{"TON"};
};

class JackpotService
{
public:
    explicit JackpotService(const JackpotServiceDesc& desc);

    [[nodiscard]] JackpotState state() const { return m_accumulator.state(); }
    [[nodiscard]] bool isEligible() const;

    // Awards the whole balance to `winnerId` and pays it out; undone if the payout fails.
    [[nodiscard]] Expected<JackpotPayout> awardAndPay(
        const std::string& winnerId, const std::string& winnerAddress, const std::string& channel);

private:
    JackpotAccumulator& m_accumulator;
    settlement::SettlementExecutor& m_executor;
    const Clock& m_clock;
    std::string m_currencySymbol;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
