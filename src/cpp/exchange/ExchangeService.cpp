/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/exchange/ExchangeService.hpp"

#include "dealcore/exchange/ExchangeSettlement.hpp"
#include "dealcore/logging/Logging.hpp"
#include "util.hpp"

//-------------------------------------------------------------------------

namespace dealcore::exchange
{

//-------------------------------------------------------------------------

namespace
{

constexpr std::string_view s_purposeTag = "exchange";

[[nodiscard]] Error toError(verification::VerificationFailure failure, const RecordId& id)
{
    using verification::VerificationFailure;
    switch (failure) {
        case VerificationFailure::NOT_FOUND:
            return {ErrorCode::NOT_YET_VERIFIED, fmt::format("No matching transfer for '{}' yet", id)};
        case VerificationFailure::AMBIGUOUS_MULTIPLE_MATCHES:
            return {ErrorCode::AMBIGUOUS_MATCH, fmt::format(
                "Several unconsumed transfers match '{}'; manual review required", id)};
        case VerificationFailure::ALREADY_CONSUMED:
            return {ErrorCode::ALREADY_CONSUMED, fmt::format(
                "The transfer matching '{}' already settled another obligation", id)};
    }
    throw std::logic_error{fmt::format(
        "{}: Unhandled verification failure", std::source_location::current().function_name())};
}

}  // namespace

//-------------------------------------------------------------------------

ExchangeService::ExchangeService(const ExchangeServiceDesc& desc)
    : m_config{desc.config},
      m_checker{desc.config.compliance},
      m_records{desc.records},
      m_verifier{desc.verifier},
      m_executor{desc.executor},
      m_messenger{desc.messenger},
      m_clock{desc.clock},
      m_logger{logging::get()}
{}

//-------------------------------------------------------------------------

Expected<ExchangeRecord> ExchangeService::propose(const ProposalDesc& desc)
{
    const auto result = m_checker.check(desc.offered, desc.requested);
    if (!result.acceptable) {
        m_logger->info(
            "Rejected proposal to '{}': {} -> {}", desc.counterpartyId, desc.offered, result);
        return makeError(
            ErrorCode::POLICY_VIOLATION,
            fmt::format("[{}] {}", result.rule, result.reason.value_or("rule not satisfied")));
    }

    const auto now = m_clock.now();
    ExchangeRecord record{
        .id = util::generateId("deal"),
        .status = ExchangeStatus::PROPOSED,
        .initiatorChannel = desc.initiatorChannel,
        .counterpartyId = desc.counterpartyId,
        .counterpartyAddress = desc.counterpartyAddress,
        .offered = desc.offered,
        .requested = desc.requested,
        .complianceResult = result,
        .createdAt = now,
        .expiresAt = now + m_config.expirySeconds,
        .notes = desc.notes
    };
    m_records.insert(record);
    m_logger->info(
        "Proposed '{}' to '{}': give {}, receive {}, profit {}",
        record.id, record.counterpartyId, record.offered, record.requested, result.profit);

    deliverProposal(record);
    return record;
}

//-------------------------------------------------------------------------

Expected<ExchangeRecord> ExchangeService::accept(const RecordId& id)
{
    return respond(id, ExchangeStatus::ACCEPTED);
}

//-------------------------------------------------------------------------

Expected<ExchangeRecord> ExchangeService::decline(const RecordId& id)
{
    return respond(id, ExchangeStatus::DECLINED);
}

//-------------------------------------------------------------------------

Expected<ExchangeRecord> ExchangeService::cancel(const RecordId& id, const std::string& reason)
{
    auto record = load(id);
    if (!record.has_value()) return std::unexpected{record.error()};

    const auto prior = record->status;
    if (prior != ExchangeStatus::PROPOSED && prior != ExchangeStatus::ACCEPTED) {
        return makeError(
            ErrorCode::INVALID_STATE,
            fmt::format("Cannot cancel '{}' in status {}", id, prior));
    }
    if (!m_records.cancel(id, prior, cancellationNote(reason))) {
        m_logger->debug("Cancel of '{}' lost a race", id);
        return makeError(ErrorCode::CONFLICT, fmt::format("'{}' was moved concurrently", id));
    }
    m_logger->info("Cancelled '{}': {}", id, reason);

    if (prior == ExchangeStatus::ACCEPTED) {
        m_executor.notify({
            .channel = record->initiatorChannel,
            .text = fmt::format("Deal #{} was cancelled: {}", id, reason)
        });
    }
    return load(id);
}

//-------------------------------------------------------------------------

Expected<VerificationOutcome> ExchangeService::verify(const RecordId& id)
{
    auto record = load(id);
    if (!record.has_value()) return std::unexpected{record.error()};

    const auto now = m_clock.now();
    if (auto error = expireIfDue(record.value(), now)) {
        return std::unexpected{std::move(error).value()};
    }
    if (record->status == ExchangeStatus::EXPIRED) {
        return makeError(ErrorCode::EXPIRED, fmt::format("'{}' has expired", id));
    }
    if (record->status != ExchangeStatus::ACCEPTED) {
        return makeError(
            ErrorCode::INVALID_STATE,
            fmt::format("'{}' is {}, verification requires ACCEPTED", id, record->status));
    }

    const auto match = matchObligation(record.value());
    if (!match.has_value()) {
        auto error = toError(match.error(), id);
        if (isRetryable(error.code)) {
            m_logger->debug("{}", error);
        } else {
            m_logger->error("{}", error);
        }
        return std::unexpected{std::move(error)};
    }

    const VerificationInfo info{
        .matchedTransferId = match->transferId,
        .verifiedAt = m_clock.now(),
        .payerAddress = match->payerAddress
    };
    if (!m_records.markVerified(id, info)) {
        const auto current = load(id);
        if (current.has_value()) {
            if (auto error = expireIfDue(current.value(), info.verifiedAt)) {
                return std::unexpected{std::move(error).value()};
            }
            if (current->status == ExchangeStatus::EXPIRED) {
                return makeError(ErrorCode::EXPIRED, fmt::format("'{}' has expired", id));
            }
        }
        m_logger->debug("Verification of '{}' lost a race", id);
        return makeError(ErrorCode::CONFLICT, fmt::format("'{}' was moved concurrently", id));
    }
    m_logger->info("Verified '{}' with transfer '{}'", id, info.matchedTransferId);

    auto verified = load(id);
    if (!verified.has_value()) return std::unexpected{verified.error()};

    VerificationOutcome outcome{.record = verified.value(), .match = match.value()};
    if (m_config.autoExecute) {
        outcome.execution = settle(verified.value());
        if (auto settled = find(id)) {
            outcome.record = std::move(settled).value();
        }
    }
    return outcome;
}

//-------------------------------------------------------------------------

Expected<settlement::ExecutionOutcome> ExchangeService::execute(const RecordId& id)
{
    auto record = load(id);
    if (!record.has_value()) return std::unexpected{record.error()};

    if (auto error = expireIfDue(record.value(), m_clock.now())) {
        return std::unexpected{std::move(error).value()};
    }
    switch (record->status) {
        case ExchangeStatus::VERIFIED:
            return settle(std::move(record).value());
        case ExchangeStatus::COMPLETED:
            m_logger->debug("'{}' is already completed", id);
            return settlement::ExecutionOutcome{
                .status = settlement::ExecutionStatus::ALREADY_CLAIMED,
                .transferId = record->execution.externalTransferId
            };
        case ExchangeStatus::EXPIRED:
            return makeError(ErrorCode::EXPIRED, fmt::format("'{}' has expired", id));
        default:
            return makeError(
                ErrorCode::INVALID_STATE,
                fmt::format("'{}' is {}, execution requires VERIFIED", id, record->status));
    }
}

//-------------------------------------------------------------------------

std::optional<ExchangeRecord> ExchangeService::find(const RecordId& id) const
{
    return m_records.find(id);
}

//-------------------------------------------------------------------------

std::vector<ExchangeRecord> ExchangeService::list(
    std::optional<ExchangeStatus> status, size_t limit) const
{
    return m_records.list(status, limit);
}

//-------------------------------------------------------------------------

bool ExchangeService::hasVerifiedItemSale(
    const CounterpartyId& counterpartyId, const ItemRef& itemRef, Timestamp windowSeconds) const
{
    const auto now = m_clock.now();
    const auto since = now > windowSeconds ? now - windowSeconds : 0;
    return m_records.hasVerifiedItemSale(counterpartyId, itemRef, since);
}

//-------------------------------------------------------------------------

size_t ExchangeService::expireStale()
{
    const auto expired = m_records.expireStale(m_clock.now());
    if (expired > 0) {
        m_logger->info("Expired {} stale record(s)", expired);
    }
    return expired;
}

//-------------------------------------------------------------------------

Expected<ExchangeRecord> ExchangeService::load(const RecordId& id) const
{
    auto record = m_records.find(id);
    if (!record.has_value()) {
        return makeError(ErrorCode::RECORD_NOT_FOUND, fmt::format("No record '{}'", id));
    }
    return std::move(record).value();
}

//-------------------------------------------------------------------------

std::optional<Error> ExchangeService::expireIfDue(const ExchangeRecord& record, Timestamp now)
{
    const bool open =
        record.status == ExchangeStatus::PROPOSED || record.status == ExchangeStatus::ACCEPTED;
    if (!open || !record.isExpired(now)) return {};

    if (m_records.expire(record.id, record.status, now)) {
        m_logger->info(
            "'{}' expired at {} while {}",
            record.id, util::formatTimestamp(record.expiresAt), record.status);
        return Error{ErrorCode::EXPIRED, fmt::format("'{}' has expired", record.id)};
    }
    m_logger->debug("Expiry of '{}' lost a race", record.id);
    return Error{ErrorCode::CONFLICT, fmt::format("'{}' was moved concurrently", record.id)};
}

//-------------------------------------------------------------------------

Expected<ExchangeRecord> ExchangeService::respond(const RecordId& id, ExchangeStatus to)
{
    auto record = load(id);
    if (!record.has_value()) return std::unexpected{record.error()};

    if (auto error = expireIfDue(record.value(), m_clock.now())) {
        return std::unexpected{std::move(error).value()};
    }
    if (record->status != ExchangeStatus::PROPOSED) {
        return makeError(
            record->status == ExchangeStatus::EXPIRED ? ErrorCode::EXPIRED : ErrorCode::INVALID_STATE,
            fmt::format("'{}' is {}, expected PROPOSED", id, record->status));
    }
    if (!m_records.transition(id, ExchangeStatus::PROPOSED, to)) {
        m_logger->debug("Transition of '{}' to {} lost a race", id, to);
        return makeError(ErrorCode::CONFLICT, fmt::format("'{}' was moved concurrently", id));
    }
    m_logger->info("'{}' is now {}", id, to);
    return load(id);
}

//-------------------------------------------------------------------------

verification::VerificationResult ExchangeService::matchObligation(const ExchangeRecord& record)
{
    if (record.requested.isCurrency()) {
        const auto skew = m_verifier.config().clockSkewSeconds;
        return m_verifier.verifyCurrency({
            .expectedRecipient = m_config.agentAddress,
            .expectedAmount = record.requested.quantity().value(),
            .earliestAcceptableTime = record.createdAt > skew ? record.createdAt - skew : 0,
            .correlationTag = record.id,
            .claimantId = record.id,
            .purposeTag = std::string{s_purposeTag}
        });
    }
    return m_verifier.verifyItemReceipt({
        .accountId = m_config.agentAccountId,
        .expectedItem = record.requested.itemRef().value(),
        .expectedSender = record.counterpartyId,
        .earliestAcceptableTime = record.createdAt,
        .claimantId = record.id,
        .purposeTag = std::string{s_purposeTag}
    });
}

//-------------------------------------------------------------------------

settlement::ExecutionOutcome ExchangeService::settle(ExchangeRecord record)
{
    ExchangeSettlement settlement{m_records, std::move(record), m_config};
    return m_executor.run(settlement);
}

//-------------------------------------------------------------------------

void ExchangeService::deliverProposal(const ExchangeRecord& record)
{
    bool delivered = false;
    try {
        delivered = m_messenger.deliverProposalCard(record.initiatorChannel, record.id);
    }
    catch (const std::exception& exc) {
        m_logger->warn("Proposal card for '{}' raised an error: {}", record.id, exc.what());
    }
    if (delivered) return;

    m_executor.notify({
        .channel = record.initiatorChannel,
        .text = fmt::format(
            "Deal #{}: I give {}, you give {}. Reply to accept within {} seconds.",
            record.id,
            record.offered.describe(m_config.currencySymbol),
            record.requested.describe(m_config.currencySymbol),
            m_config.expirySeconds)
    });
}

//-------------------------------------------------------------------------

}  // namespace dealcore::exchange

//-------------------------------------------------------------------------
