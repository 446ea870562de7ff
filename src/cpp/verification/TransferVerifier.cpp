/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/verification/TransferVerifier.hpp"

#include "dealcore/logging/Logging.hpp"
#include "util.hpp"

//-------------------------------------------------------------------------

namespace dealcore::verification
{

//-------------------------------------------------------------------------

VerifierConfig makeVerifierConfig(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    VerifierConfig config;
    if (pugi::xml_attribute attr = node.attribute("toleranceRatio"); !attr.empty()) {
        config.toleranceRatio = util::double2decimal(attr.as_double());
        if (config.toleranceRatio <= 0_dec || config.toleranceRatio > 1_dec) {
            throw std::invalid_argument{fmt::format(
                "{}: 'toleranceRatio' should be in (0,1], was {}", ctx, config.toleranceRatio)};
        }
    }
    if (pugi::xml_attribute attr = node.attribute("clockSkewSeconds"); !attr.empty()) {
        config.clockSkewSeconds = attr.as_ullong();
    }
    return config;
}

//-------------------------------------------------------------------------

TransferId itemTransferKey(std::string_view itemId)
{
    return fmt::format("item:{}", itemId);
}

//-------------------------------------------------------------------------

TransferVerifier::TransferVerifier(
    ReplayLedger& replayLedger,
    collaborators::Ledger& ledger,
    collaborators::Inventory& inventory,
    const Clock& clock,
    VerifierConfig config) noexcept
    : m_replayLedger{replayLedger},
      m_ledger{ledger},
      m_inventory{inventory},
      m_clock{clock},
      m_config{config},
      m_logger{logging::get()}
{}

//-------------------------------------------------------------------------

VerificationResult TransferVerifier::verifyCurrency(const CurrencyObligation& obligation)
{
    const auto minAmount = obligation.expectedAmount * m_config.toleranceRatio;

    const auto transfers = m_ledger.queryTransfers(
        obligation.expectedRecipient, obligation.earliestAcceptableTime);
    auto candidates = transfers
        | views::filter([&](const collaborators::LedgerTransfer& transfer) {
            return transfer.amount >= minAmount
                && transfer.timestamp >= obligation.earliestAcceptableTime
                && !transfer.sender.empty()
                && util::tagsMatch(transfer.memo, obligation.correlationTag);
        })
        | views::transform([](const collaborators::LedgerTransfer& transfer) {
            return TransferMatch{
                .transferId = transfer.id,
                .matched = transfer.amount,
                .matchedAt = transfer.timestamp,
                .payerAddress = transfer.sender
            };
        })
        | ranges::to<std::vector>();

    m_logger->debug(
        "Currency check for '{}': {} candidate(s) of at least {} tagged '{}'",
        obligation.claimantId, candidates.size(), minAmount, obligation.correlationTag);

    return resolve(std::move(candidates), obligation.claimantId, obligation.purposeTag);
}

//-------------------------------------------------------------------------

VerificationResult TransferVerifier::verifyItemReceipt(const ItemObligation& obligation)
{
    const auto items = m_inventory.listRecentlyReceivedItems(obligation.accountId);
    auto candidates = items
        | views::filter([&](const collaborators::ReceivedItem& item) {
            return item.itemRef == obligation.expectedItem
                && item.senderId == obligation.expectedSender
                && item.receivedAt >= obligation.earliestAcceptableTime;
        })
        | views::transform([](const collaborators::ReceivedItem& item) {
            return TransferMatch{
                .transferId = itemTransferKey(item.itemId),
                .matched = item.itemRef,
                .matchedAt = item.receivedAt
            };
        })
        | ranges::to<std::vector>();

    m_logger->debug(
        "Item check for '{}': {} candidate(s) of '{}' from '{}'",
        obligation.claimantId, candidates.size(), obligation.expectedItem,
        obligation.expectedSender);

    return resolve(std::move(candidates), obligation.claimantId, obligation.purposeTag);
}

//-------------------------------------------------------------------------

VerificationResult TransferVerifier::resolve(
    std::vector<TransferMatch> candidates,
    const std::string& claimantId,
    const std::string& purposeTag)
{
    if (candidates.empty()) {
        return std::unexpected{VerificationFailure::NOT_FOUND};
    }

    std::vector<TransferMatch> unconsumed;
    for (auto& candidate : candidates) {
        const auto owner = m_replayLedger.find(candidate.transferId);
        if (!owner.has_value()) {
            unconsumed.push_back(std::move(candidate));
        } else if (owner->claimantId == claimantId) {
            return candidate;
        }
    }

    if (unconsumed.empty()) {
        m_logger->warn(
            "All {} candidate transfer(s) for '{}' were consumed by other obligations",
            candidates.size(), claimantId);
        return std::unexpected{VerificationFailure::ALREADY_CONSUMED};
    }
    if (unconsumed.size() > 1) {
        m_logger->warn(
            "{} unconsumed transfers match '{}'; refusing to pick one",
            unconsumed.size(), claimantId);
        return std::unexpected{VerificationFailure::AMBIGUOUS_MULTIPLE_MATCHES};
    }

    auto& match = unconsumed.front();
    const auto amount = std::holds_alternative<decimal_t>(match.matched)
        ? std::optional{std::get<decimal_t>(match.matched)}
        : std::nullopt;
    const auto result = m_replayLedger.consume({
        .transferId = match.transferId,
        .claimantId = claimantId,
        .amount = amount,
        .purposeTag = purposeTag,
        .usedAt = m_clock.now()
    });
    if (result == ConsumeResult::CONSUMED_ELSEWHERE) {
        m_logger->warn(
            "Transfer '{}' was consumed by another obligation while verifying '{}'",
            match.transferId, claimantId);
        return std::unexpected{VerificationFailure::ALREADY_CONSUMED};
    }

    m_logger->info("Transfer '{}' consumed by '{}' ({})", match.transferId, claimantId, result);
    return std::move(match);
}

//-------------------------------------------------------------------------

}  // namespace dealcore::verification

//-------------------------------------------------------------------------
