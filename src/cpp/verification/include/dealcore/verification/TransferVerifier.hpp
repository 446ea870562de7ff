/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Clock.hpp"
#include "dealcore/collaborators/Inventory.hpp"
#include "dealcore/collaborators/Ledger.hpp"
#include "dealcore/verification/ReplayLedger.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace dealcore::verification
{

//-------------------------------------------------------------------------

struct VerifierConfig
{
    // Smallest fraction of the expected amount accepted as payment.
    decimal_t toleranceRatio{DEC(0.99)};
    // How far before an obligation was issued a payment may be dated.
    Timestamp clockSkewSeconds{300};
};

[[nodiscard]] VerifierConfig makeVerifierConfig(pugi::xml_node node);

//-------------------------------------------------------------------------

enum class VerificationFailure : uint32_t
{
    NOT_FOUND,
    AMBIGUOUS_MULTIPLE_MATCHES,
    ALREADY_CONSUMED
};

[[nodiscard]] constexpr std::string_view VerificationFailure2StrView(
    VerificationFailure failure) noexcept
{
    return magic_enum::enum_name(failure);
}

struct CurrencyObligation
{
    std::string expectedRecipient;
    decimal_t expectedAmount;
    Timestamp earliestAcceptableTime;
    std::string correlationTag;
    std::string claimantId;
    std::string purposeTag;
};

struct ItemObligation
{
    std::string accountId;
    ItemRef expectedItem;
    CounterpartyId expectedSender;
    Timestamp earliestAcceptableTime;
    std::string claimantId;
    std::string purposeTag;
};

struct TransferMatch
{
    TransferId transferId;
    std::variant<decimal_t, ItemRef> matched;
    Timestamp matchedAt;
    std::optional<std::string> payerAddress;
};

using VerificationResult = std::expected<TransferMatch, VerificationFailure>;

//-------------------------------------------------------------------------

class TransferVerifier
{
public:
    TransferVerifier(
        ReplayLedger& replayLedger,
        collaborators::Ledger& ledger,
        collaborators::Inventory& inventory,
        const Clock& clock,
        VerifierConfig config) noexcept;

    [[nodiscard]] const VerifierConfig& config() const noexcept { return m_config; }

    [[nodiscard]] VerificationResult verifyCurrency(const CurrencyObligation& obligation);
    [[nodiscard]] VerificationResult verifyItemReceipt(const ItemObligation& obligation);

private:
    [[nodiscard]] VerificationResult resolve(
        std::vector<TransferMatch> candidates,
        const std::string& claimantId,
        const std::string& purposeTag);

    ReplayLedger& m_replayLedger;
    collaborators::Ledger& m_ledger;
    collaborators::Inventory& m_inventory;
    const Clock& m_clock;
    VerifierConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;
};

//-------------------------------------------------------------------------

// Key under which an inbound item is recorded in the replay ledger.
[[nodiscard]] TransferId itemTransferKey(std::string_view itemId);

//-------------------------------------------------------------------------

}  // namespace dealcore::verification

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<dealcore::verification::VerificationFailure>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(dealcore::verification::VerificationFailure failure, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "{}", dealcore::verification::VerificationFailure2StrView(failure));
    }
};

//-------------------------------------------------------------------------
