/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/compliance/ComplianceChecker.hpp"

#include "util.hpp"

//-------------------------------------------------------------------------

namespace dealcore::compliance
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::string percentLabel(decimal_t multiplier)
{
    return fmt::format("{:g}%", util::decimal2double(multiplier * 100));
}

[[nodiscard]] std::optional<double> percentageOf(decimal_t amount, decimal_t reference)
{
    if (reference == 0_dec) return {};
    return util::decimal2double(amount) / util::decimal2double(reference) * 100.0;
}

}  // namespace

//-------------------------------------------------------------------------

CompliancePolicy makeCompliancePolicy(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    CompliancePolicy policy;
    auto getMultiplier = [&](const char* name, decimal_t fallback) {
        pugi::xml_attribute attr = node.attribute(name);
        if (attr.empty()) return fallback;
        const auto multiplier = util::double2decimal(attr.as_double());
        if (multiplier <= 0_dec) {
            throw std::invalid_argument{fmt::format(
                "{}: Attribute '{}' should be positive, was {}", ctx, name, multiplier)};
        }
        return multiplier;
    };
    policy.buyMaxMultiplier = getMultiplier("buyMaxMultiplier", policy.buyMaxMultiplier);
    policy.sellMinMultiplier = getMultiplier("sellMinMultiplier", policy.sellMinMultiplier);

    if (policy.buyMaxMultiplier > policy.sellMinMultiplier) {
        throw std::invalid_argument{fmt::format(
            "{}: 'buyMaxMultiplier' {} cannot exceed 'sellMinMultiplier' {}",
            ctx, policy.buyMaxMultiplier, policy.sellMinMultiplier)};
    }
    return policy;
}

//-------------------------------------------------------------------------

TradeDirection tradeDirection(
    const asset::AssetValue& offered, const asset::AssetValue& requested) noexcept
{
    if (offered.isCurrency()) {
        return requested.isItem() ? TradeDirection::AGENT_BUYS_ITEM : TradeDirection::CURRENCY_SWAP;
    }
    return requested.isCurrency() ? TradeDirection::AGENT_SELLS_ITEM : TradeDirection::ITEM_SWAP;
}

//-------------------------------------------------------------------------

ComplianceChecker::ComplianceChecker(CompliancePolicy policy) noexcept
    : m_policy{policy}
{}

//-------------------------------------------------------------------------

ComplianceResult ComplianceChecker::check(
    const asset::AssetValue& offered, const asset::AssetValue& requested) const
{
    switch (tradeDirection(offered, requested)) {
        case TradeDirection::AGENT_BUYS_ITEM:
            return checkBuy(offered, requested);
        case TradeDirection::AGENT_SELLS_ITEM:
            return checkSell(offered, requested);
        case TradeDirection::ITEM_SWAP: {
            const auto given = offered.estimatedReferenceValue();
            const auto received = requested.estimatedReferenceValue();
            ComplianceResult result{
                .acceptable = received >= given,
                .rule = "SWAP: no value loss",
                .profit = received - given,
                .referenceValueUsed = given
            };
            if (!result.acceptable) {
                result.reason = fmt::format(
                    "Swap would lose value. Giving item worth {}, receiving item worth {}.",
                    util::formatAmount(given),
                    util::formatAmount(received));
            }
            return result;
        }
        case TradeDirection::CURRENCY_SWAP: {
            const auto given = offered.quantity().value();
            const auto received = requested.quantity().value();
            ComplianceResult result{
                .acceptable = received >= given,
                .rule = "CURRENCY SWAP: no loss",
                .profit = received - given
            };
            if (!result.acceptable) {
                result.reason = fmt::format(
                    "Currency swap would lose {}. Giving {}, receiving {}.",
                    util::formatAmount(given - received),
                    util::formatAmount(given),
                    util::formatAmount(received));
            }
            return result;
        }
    }
    throw std::logic_error{fmt::format(
        "{}: Unhandled trade direction", std::source_location::current().function_name())};
}

//-------------------------------------------------------------------------

ComplianceResult ComplianceChecker::checkBuy(
    const asset::AssetValue& offered, const asset::AssetValue& requested) const
{
    const auto price = offered.quantity().value();
    const auto reference = requested.estimatedReferenceValue();
    const auto maxAllowed = reference * m_policy.buyMaxMultiplier;
    const auto percentage = percentageOf(price, reference);

    ComplianceResult result{
        .acceptable = price <= maxAllowed,
        .rule = fmt::format("BUYING: max {} of reference", percentLabel(m_policy.buyMaxMultiplier)),
        .profit = reference - price,
        .referenceValueUsed = reference,
        .percentageOfReference = percentage
    };
    if (!result.acceptable) {
        result.reason = fmt::format(
            "Cannot pay more than {} of reference value. Item worth {}, offering {}{}. "
            "Max allowed: {}",
            percentLabel(m_policy.buyMaxMultiplier),
            util::formatAmount(reference),
            util::formatAmount(price),
            percentage ? fmt::format(" ({:.0f}%)", *percentage) : "",
            util::formatAmount(maxAllowed));
    }
    return result;
}

//-------------------------------------------------------------------------

ComplianceResult ComplianceChecker::checkSell(
    const asset::AssetValue& offered, const asset::AssetValue& requested) const
{
    const auto price = requested.quantity().value();
    const auto reference = offered.estimatedReferenceValue();
    const auto minRequired = reference * m_policy.sellMinMultiplier;
    const auto percentage = percentageOf(price, reference);

    ComplianceResult result{
        .acceptable = price >= minRequired,
        .rule = fmt::format(
            "SELLING: min {} of reference", percentLabel(m_policy.sellMinMultiplier)),
        .profit = price - reference,
        .referenceValueUsed = reference,
        .percentageOfReference = percentage
    };
    if (!result.acceptable) {
        result.reason = fmt::format(
            "Must receive at least {} of reference value. Item worth {}, offered {}{}. "
            "Min required: {}",
            percentLabel(m_policy.sellMinMultiplier),
            util::formatAmount(reference),
            util::formatAmount(price),
            percentage ? fmt::format(" ({:.0f}%)", *percentage) : "",
            util::formatAmount(minRequired));
    }
    return result;
}

//-------------------------------------------------------------------------

std::optional<asset::AssetValue> appraise(
    collaborators::ValueOracle& oracle, const ItemRef& itemRef)
{
    const auto estimate = oracle.estimateValue(itemRef);
    if (!estimate.has_value() || *estimate < 0_dec) return {};
    return asset::AssetValue::item(itemRef, *estimate);
}

//-------------------------------------------------------------------------

}  // namespace dealcore::compliance

//-------------------------------------------------------------------------
