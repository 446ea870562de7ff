/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/store/Database.hpp"

//-------------------------------------------------------------------------

namespace dealcore::verification
{

//-------------------------------------------------------------------------

struct ConsumedTransfer
{
    TransferId transferId;
    std::string claimantId;
    std::optional<decimal_t> amount;
    std::string purposeTag;
    Timestamp usedAt;
};

enum class ConsumeResult : uint32_t
{
    CONSUMED,
    ALREADY_OWNED,
    CONSUMED_ELSEWHERE
};

//-------------------------------------------------------------------------

/**
 * Append-only set of external transfer ids that have discharged an obligation.
 *
 * A transfer id is owned by exactly one claimant for the lifetime of the
 * store. The primary key on `transfer_id` is the replay detector.
 */
class ReplayLedger
{
public:
    explicit ReplayLedger(store::Database& db) noexcept;

    [[nodiscard]] ConsumeResult consume(const ConsumedTransfer& transfer);

    [[nodiscard]] std::optional<ConsumedTransfer> find(const TransferId& transferId) const;

private:
    store::Database& m_db;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::verification

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<dealcore::verification::ConsumeResult>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(dealcore::verification::ConsumeResult result, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(result));
    }
};

//-------------------------------------------------------------------------
