/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/asset/AssetValue.hpp"
#include "dealcore/compliance/ComplianceResult.hpp"

//-------------------------------------------------------------------------

namespace dealcore::exchange
{

//-------------------------------------------------------------------------

enum class ExchangeStatus : uint32_t
{
    PROPOSED,
    ACCEPTED,
    VERIFIED,
    COMPLETED,
    DECLINED,
    EXPIRED,
    CANCELLED,
    FAILED
};

[[nodiscard]] constexpr std::string_view ExchangeStatus2StrView(ExchangeStatus status) noexcept
{
    return magic_enum::enum_name(status);
}

[[nodiscard]] ExchangeStatus str2ExchangeStatus(std::string_view str);
[[nodiscard]] std::vector<std::string> exchangeStatusNames();

[[nodiscard]] constexpr bool isTerminal(ExchangeStatus status) noexcept
{
    switch (status) {
        case ExchangeStatus::PROPOSED:
        case ExchangeStatus::ACCEPTED:
        case ExchangeStatus::VERIFIED:
            return false;
        default:
            return true;
    }
}

// Note written to a record cancelled for `reason`.
[[nodiscard]] std::string cancellationNote(std::string_view reason);

//-------------------------------------------------------------------------

struct VerificationInfo
{
    TransferId matchedTransferId;
    Timestamp verifiedAt;
    std::optional<std::string> payerAddress;
};

struct ExecutionInfo
{
    std::optional<Timestamp> claimedAt;
    std::optional<Timestamp> completedAt;
    std::optional<TransferId> externalTransferId;
    std::optional<std::string> failureNote;
};

//-------------------------------------------------------------------------

struct ExchangeRecord
{
    RecordId id;
    ExchangeStatus status;
    std::string initiatorChannel;
    CounterpartyId counterpartyId;
    std::optional<std::string> counterpartyAddress;
    asset::AssetValue offered;
    asset::AssetValue requested;
    compliance::ComplianceResult complianceResult;
    std::optional<VerificationInfo> verification;
    ExecutionInfo execution;
    Timestamp createdAt;
    Timestamp expiresAt;
    std::optional<std::string> notes;

    [[nodiscard]] bool isExpired(Timestamp now) const noexcept { return now > expiresAt; }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::exchange

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<dealcore::exchange::ExchangeStatus>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(dealcore::exchange::ExchangeStatus status, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", dealcore::exchange::ExchangeStatus2StrView(status));
    }
};

//-------------------------------------------------------------------------
