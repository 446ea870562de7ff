/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Clock.hpp"
#include "ErrorCode.hpp"
#include "dealcore/collaborators/Messenger.hpp"
#include "dealcore/exchange/ExchangeConfig.hpp"
#include "dealcore/exchange/ExchangeRecordStore.hpp"
#include "dealcore/settlement/SettlementExecutor.hpp"
#include "dealcore/verification/TransferVerifier.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace dealcore::exchange
{

//-------------------------------------------------------------------------

struct ProposalDesc
{
    std::string initiatorChannel;
    CounterpartyId counterpartyId;
    std::optional<std::string> counterpartyAddress;
    // What the agent gives.
    asset::AssetValue offered;
    // What the agent receives.
    asset::AssetValue requested;
    std::optional<std::string> notes;
};

struct VerificationOutcome
{
    ExchangeRecord record;
    verification::TransferMatch match;
    std::optional<settlement::ExecutionOutcome> execution;
};

struct ExchangeServiceDesc
{
    ExchangeConfig config;
    ExchangeRecordStore& records;
    verification::TransferVerifier& verifier;
    settlement::SettlementExecutor& executor;
    collaborators::Messenger& messenger;
    const Clock& clock;
};

//-------------------------------------------------------------------------

/**
 * Lifecycle of a negotiated exchange:
 * proposed -> accepted -> verified -> completed, with exits to declined,
 * expired, cancelled and failed.
 *
 * Expiry is lazy; it is applied by whichever operation first observes it.
 */
class ExchangeService
{
public:
    explicit ExchangeService(const ExchangeServiceDesc& desc);

    [[nodiscard]] const ExchangeConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const compliance::ComplianceChecker& checker() const noexcept { return m_checker; }

    [[nodiscard]] Expected<ExchangeRecord> propose(const ProposalDesc& desc);
    [[nodiscard]] Expected<ExchangeRecord> accept(const RecordId& id);
    [[nodiscard]] Expected<ExchangeRecord> decline(const RecordId& id);
    [[nodiscard]] Expected<ExchangeRecord> cancel(const RecordId& id, const std::string& reason);
    [[nodiscard]] Expected<VerificationOutcome> verify(const RecordId& id);
    [[nodiscard]] Expected<settlement::ExecutionOutcome> execute(const RecordId& id);

    [[nodiscard]] std::optional<ExchangeRecord> find(const RecordId& id) const;
    [[nodiscard]] std::vector<ExchangeRecord> list(
        std::optional<ExchangeStatus> status = {}, size_t limit = 50) const;

    // Whether the agent may hand `itemRef` to `counterpartyId` under a verified, unexecuted deal.
    [[nodiscard]] bool hasVerifiedItemSale(
        const CounterpartyId& counterpartyId,
        const ItemRef& itemRef,
        Timestamp windowSeconds = 300) const;

    size_t expireStale();

private:
    [[nodiscard]] Expected<ExchangeRecord> load(const RecordId& id) const;
    [[nodiscard]] std::optional<Error> expireIfDue(const ExchangeRecord& record, Timestamp now);
    [[nodiscard]] Expected<ExchangeRecord> respond(const RecordId& id, ExchangeStatus to);
    [[nodiscard]] verification::VerificationResult matchObligation(const ExchangeRecord& record);
    [[nodiscard]] settlement::ExecutionOutcome settle(ExchangeRecord record);
    void deliverProposal(const ExchangeRecord& record);

    ExchangeConfig m_config;
    compliance::ComplianceChecker m_checker;
    ExchangeRecordStore& m_records;
    verification::TransferVerifier& m_verifier;
    settlement::SettlementExecutor& m_executor;
    collaborators::Messenger& m_messenger;
    const Clock& m_clock;
    std::shared_ptr<spdlog::logger> m_logger;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::exchange

//-------------------------------------------------------------------------
