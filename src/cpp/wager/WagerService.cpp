/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/wager/WagerService.hpp"

#include "dealcore/logging/Logging.hpp"
#include "util.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] Error toError(verification::VerificationFailure failure, const WagerRequest& request)
{
    using verification::VerificationFailure;
    switch (failure) {
        case VerificationFailure::NOT_FOUND:
            return {ErrorCode::NOT_YET_VERIFIED, fmt::format(
                "No stake of {} with memo '{}' has arrived yet",
                request.stake, request.requesterHandle)};
        case VerificationFailure::AMBIGUOUS_MULTIPLE_MATCHES:
            return {ErrorCode::AMBIGUOUS_MATCH, fmt::format(
                "Several unclaimed stakes carry memo '{}'; manual review required",
                request.requesterHandle)};
        case VerificationFailure::ALREADY_CONSUMED:
            return {ErrorCode::ALREADY_CONSUMED, fmt::format(
                "The stake with memo '{}' already paid for another wager",
                request.requesterHandle)};
    }
    throw std::logic_error{fmt::format(
        "{}: Unhandled verification failure", std::source_location::current().function_name())};
}

}  // namespace

//-------------------------------------------------------------------------

WagerService::WagerService(const WagerServiceDesc& desc)
    : m_config{desc.config},
      m_wagers{desc.db},
      m_cooldown{desc.db, desc.config.cooldownSeconds},
      m_rateLimiter{desc.db, desc.config.rateLimitMax, desc.config.rateLimitWindowSeconds},
      m_bankroll{desc.config},
      m_jackpot{desc.jackpot},
      m_verifier{desc.verifier},
      m_executor{desc.executor},
      m_ledger{desc.ledger},
      m_outcomes{desc.outcomes},
      m_journal{desc.journal},
      m_clock{desc.clock},
      m_logger{logging::get()}
{
    if (m_config.treasuryAddress.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Wagers need a treasury address", std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

Expected<WagerOutcome> WagerService::place(const WagerRequest& request)
{
    const auto gameIt = m_config.games.find(request.game);
    if (gameIt == m_config.games.end()) {
        return makeError(ErrorCode::UNKNOWN_GAME, fmt::format("No game named '{}'", request.game));
    }
    const auto& table = gameIt->second;
    const auto now = m_clock.now();

    if (const auto pruned = m_rateLimiter.prune(now); pruned > 0) {
        m_logger->debug("Dropped {} finished rate limit windows", pruned);
    }
    if (!m_rateLimiter.tryAcquire(request.requesterId, now)) {
        m_logger->info("Wager from '{}' rate limited", request.requesterId);
        return makeError(
            ErrorCode::RATE_LIMITED,
            fmt::format(
                "At most {} wagers per {} seconds",
                m_config.rateLimitMax, m_config.rateLimitWindowSeconds));
    }

    const auto balance = treasuryBalance();
    if (!balance.has_value()) {
        return std::unexpected{balance.error()};
    }
    if (auto bounds = m_bankroll.check(request.stake, balance.value(), table.maxMultiplier());
        !bounds.has_value()) {
        m_logger->info("Wager from '{}' refused: {}", request.requesterId, bounds.error());
        return std::unexpected{std::move(bounds).error()};
    }

    if (const auto started = m_cooldown.tryStart(request.requesterId, now); !started.has_value()) {
        return makeError(
            ErrorCode::COOLDOWN_ACTIVE,
            fmt::format("Wait {} more seconds before the next wager", started.error()));
    }

    const auto id = util::generateId("wager");
    const auto match = m_verifier.verifyCurrency({
        .expectedRecipient = m_config.treasuryAddress,
        .expectedAmount = request.stake,
        .earliestAcceptableTime = now > m_config.paymentWindowSeconds
            ? now - m_config.paymentWindowSeconds : 0,
        .correlationTag = request.requesterHandle,
        .claimantId = id,
        .purposeTag = "wager"
    });
    if (!match.has_value()) {
        auto error = toError(match.error(), request);
        if (isRetryable(error.code)) {
            m_logger->debug("{}", error);
        } else {
            m_logger->error("{}", error);
        }
        return std::unexpected{std::move(error)};
    }

    const auto outcome = [&]() -> std::optional<uint32_t> {
        try {
            return m_outcomes.draw(table.game(), request.channel);
        }
        catch (const std::exception& exc) {
            m_logger->error("Outcome source failed for wager '{}': {}", id, exc.what());
            return {};
        }
    }();
    if (!outcome.has_value()) {
        // The stake is already consumed, so the wager is kept for an operator to refund.
        m_wagers.insert({
            .id = id,
            .requesterId = request.requesterId,
            .channel = request.channel,
            .game = table.game(),
            .stake = request.stake,
            .stakeTransferId = match->transferId,
            .payerAddress = match->payerAddress,
            .outcomeValue = 0,
            .multiplier = 0_dec,
            .payout = 0_dec,
            .jackpotContribution = 0_dec,
            .status = WagerStatus::FAILED,
            .failureNote = "No outcome could be drawn; stake to be refunded",
            .createdAt = now
        });
        return makeError(
            ErrorCode::OUTCOME_UNAVAILABLE,
            fmt::format("No outcome for wager '{}'; the stake will be refunded", id));
    }

    auto wager = record(request, id, match.value(), outcome.value(), table);
    if (!wager.has_value()) {
        return std::unexpected{std::move(wager).error()};
    }

    if (!wager->isWin()) {
        journalLoss(wager.value());
        return WagerOutcome{.wager = std::move(wager).value()};
    }

    WagerPayoutSettlement settlement{m_wagers, wager.value(), m_config.currencySymbol};
    auto execution = m_executor.run(settlement);
    return WagerOutcome{.wager = reload(wager.value()), .payout = std::move(execution)};
}

//-------------------------------------------------------------------------

Expected<StakeBounds> WagerService::stakeBounds(std::string_view game)
{
    const auto gameIt = m_config.games.find(game);
    if (gameIt == m_config.games.end()) {
        return makeError(ErrorCode::UNKNOWN_GAME, fmt::format("No game named '{}'", game));
    }
    return treasuryBalance().and_then([&](decimal_t balance) {
        return m_bankroll.bounds(balance, gameIt->second.maxMultiplier());
    });
}

//-------------------------------------------------------------------------

std::optional<WagerRecord> WagerService::find(const RecordId& id) const
{
    return m_wagers.find(id);
}

//-------------------------------------------------------------------------

RequesterStats WagerService::requesterStats(const std::string& requesterId) const
{
    return m_wagers.requesterStats(requesterId);
}

//-------------------------------------------------------------------------

Expected<decimal_t> WagerService::treasuryBalance()
{
    std::optional<decimal_t> balance;
    try {
        balance = m_ledger.balance(m_config.treasuryAddress);
    }
    catch (const std::exception& exc) {
        m_logger->error("Treasury balance lookup raised an error: {}", exc.what());
    }
    if (!balance.has_value()) {
        return makeError(
            ErrorCode::BALANCE_UNAVAILABLE,
            fmt::format("Balance of treasury '{}' is unavailable", m_config.treasuryAddress));
    }
    return balance.value();
}

//-------------------------------------------------------------------------

Expected<WagerRecord> WagerService::record(
    const WagerRequest& request,
    const RecordId& id,
    const verification::TransferMatch& match,
    uint32_t outcome,
    const MultiplierTable& table)
{
    const auto multiplier = table.multiplierFor(outcome);
    const auto contribution = m_jackpot.credit(request.stake);

    WagerRecord wager{
        .id = id,
        .requesterId = request.requesterId,
        .channel = request.channel,
        .game = table.game(),
        .stake = request.stake,
        .stakeTransferId = match.transferId,
        .payerAddress = match.payerAddress,
        .outcomeValue = outcome,
        .multiplier = multiplier,
        .payout = util::round(request.stake * multiplier),
        .jackpotContribution = contribution,
        .status = multiplier > 0_dec ? WagerStatus::PENDING_PAYOUT : WagerStatus::LOST,
        .createdAt = m_clock.now()
    };
    m_wagers.insert(wager);

    m_logger->info(
        "Wager '{}' by '{}': {} {} rolled {} -> x{}",
        wager.id, wager.requesterId, wager.game, wager.stake, outcome, multiplier);
    return wager;
}

//-------------------------------------------------------------------------

void WagerService::journalLoss(const WagerRecord& wager)
{
    try {
        m_journal.append({
            .kind = journal::EntryKind::WAGER,
            .action = "wager_loss",
            .assetTo = util::formatAmount(wager.stake) + " " + m_config.currencySymbol,
            .amountTo = wager.stake,
            .counterparty = wager.requesterId,
            .referenceId = wager.id,
            .reasoning = fmt::format("{} outcome {} pays nothing", wager.game, wager.outcomeValue),
            .outcome = journal::Outcome::PROFIT,
            .pnl = wager.stake,
            .transferId = wager.stakeTransferId,
            .createdAt = wager.createdAt,
            .closedAt = m_clock.now()
        });
    }
    catch (const std::exception& exc) {
        m_logger->error("Journal entry for lost wager '{}' not written: {}", wager.id, exc.what());
    }
}

//-------------------------------------------------------------------------

WagerRecord WagerService::reload(const WagerRecord& wager) const
{
    return m_wagers.find(wager.id).value_or(wager);
}

//-------------------------------------------------------------------------

JackpotService::JackpotService(const JackpotServiceDesc& desc)
    : m_accumulator{desc.accumulator},
      m_executor{desc.executor},
      m_clock{desc.clock},
      m_currencySymbol{desc.currencySymbol}
{}

//-------------------------------------------------------------------------

bool JackpotService::isEligible() const
{
    return m_accumulator.isEligible(m_accumulator.state(), m_clock.now());
}

//-------------------------------------------------------------------------

Expected<JackpotPayout> JackpotService::awardAndPay(
    const std::string& winnerId, const std::string& winnerAddress, const std::string& channel)
{
    JackpotSettlement settlement{m_accumulator, winnerId, winnerAddress, channel, m_currencySymbol};
    auto execution = m_executor.run(settlement);

    switch (execution.status) {
        case settlement::ExecutionStatus::COMPLETED:
            return JackpotPayout{
                .award = settlement.award().value(),
                .execution = std::move(execution)
            };
        case settlement::ExecutionStatus::ALREADY_CLAIMED:
            return std::unexpected{settlement.claimError().value_or(Error{
                .code = ErrorCode::CONFLICT, .message = "Jackpot was claimed concurrently"})};
        case settlement::ExecutionStatus::FAILED:
            break;
    }
    return makeError(
        ErrorCode::EXTERNAL_TRANSFER_FAILURE,
        fmt::format(
            "Jackpot payout to '{}' failed and was rolled back: {}",
            winnerId, execution.failureNote.value_or("unknown error")));
}

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
