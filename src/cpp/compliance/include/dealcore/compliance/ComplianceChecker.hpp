/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/asset/AssetValue.hpp"
#include "dealcore/collaborators/ValueOracle.hpp"
#include "dealcore/compliance/ComplianceResult.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace dealcore::compliance
{

//-------------------------------------------------------------------------

struct CompliancePolicy
{
    // Most the agent pays for an item, as a fraction of its reference value.
    decimal_t buyMaxMultiplier{DEC(0.80)};
    // Least the agent accepts for an item, as a fraction of its reference value.
    decimal_t sellMinMultiplier{DEC(1.15)};
};

[[nodiscard]] CompliancePolicy makeCompliancePolicy(pugi::xml_node node);

//-------------------------------------------------------------------------

enum class TradeDirection : uint32_t
{
    AGENT_BUYS_ITEM,
    AGENT_SELLS_ITEM,
    ITEM_SWAP,
    CURRENCY_SWAP
};

[[nodiscard]] TradeDirection tradeDirection(
    const asset::AssetValue& offered, const asset::AssetValue& requested) noexcept;

//-------------------------------------------------------------------------

/**
 * Pure evaluation of a proposed exchange against the margin rules.
 *
 * `offered` is what the agent gives, `requested` what it receives. The
 * profit is computed for every outcome, acceptable or not.
 */
class ComplianceChecker
{
public:
    explicit ComplianceChecker(CompliancePolicy policy) noexcept;

    [[nodiscard]] const CompliancePolicy& policy() const noexcept { return m_policy; }

    [[nodiscard]] ComplianceResult check(
        const asset::AssetValue& offered, const asset::AssetValue& requested) const;

private:
    [[nodiscard]] ComplianceResult checkBuy(
        const asset::AssetValue& offered, const asset::AssetValue& requested) const;
    [[nodiscard]] ComplianceResult checkSell(
        const asset::AssetValue& offered, const asset::AssetValue& requested) const;

    CompliancePolicy m_policy;
};

//-------------------------------------------------------------------------

[[nodiscard]] std::optional<asset::AssetValue> appraise(
    collaborators::ValueOracle& oracle, const ItemRef& itemRef);

//-------------------------------------------------------------------------

}  // namespace dealcore::compliance

//-------------------------------------------------------------------------
