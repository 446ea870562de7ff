/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/asset/AssetValue.hpp"

#include "util.hpp"

//-------------------------------------------------------------------------

namespace dealcore::asset
{

//-------------------------------------------------------------------------

AssetKind str2AssetKind(std::string_view str)
{
    const auto kind = magic_enum::enum_cast<AssetKind>(str);
    if (!kind.has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown asset kind '{}'", std::source_location::current().function_name(), str)};
    }
    return kind.value();
}

//-------------------------------------------------------------------------

AssetValue::AssetValue(
    AssetKind kind,
    std::optional<decimal_t> quantity,
    std::optional<ItemRef> itemRef,
    decimal_t estimatedReferenceValue)
    : m_kind{kind},
      m_quantity{quantity},
      m_itemRef{std::move(itemRef)},
      m_estimatedReferenceValue{estimatedReferenceValue}
{
    static constexpr auto ctx = std::source_location::current().function_name();
    if (m_estimatedReferenceValue < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Reference value cannot be negative, was {}", ctx, m_estimatedReferenceValue)};
    }
    if (m_kind == AssetKind::CURRENCY && m_quantity.value() < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Currency quantity cannot be negative, was {}", ctx, m_quantity.value())};
    }
    if (m_kind == AssetKind::ITEM && m_itemRef.value().empty()) {
        throw std::invalid_argument{fmt::format("{}: Item reference cannot be empty", ctx)};
    }
}

//-------------------------------------------------------------------------

AssetValue AssetValue::currency(decimal_t quantity)
{
    return AssetValue{AssetKind::CURRENCY, quantity, std::nullopt, quantity};
}

//-------------------------------------------------------------------------

AssetValue AssetValue::item(ItemRef itemRef, decimal_t estimatedReferenceValue)
{
    return AssetValue{AssetKind::ITEM, std::nullopt, std::move(itemRef), estimatedReferenceValue};
}

//-------------------------------------------------------------------------

std::string AssetValue::describe(std::string_view currencySymbol) const
{
    if (isCurrency()) {
        return fmt::format("{} {}", util::formatAmount(m_quantity.value()), currencySymbol);
    }
    return fmt::format("item {}", m_itemRef.value());
}

//-------------------------------------------------------------------------

bool AssetValue::operator==(const AssetValue& other) const noexcept
{
    return m_kind == other.m_kind
        && m_quantity == other.m_quantity
        && m_itemRef == other.m_itemRef
        && m_estimatedReferenceValue == other.m_estimatedReferenceValue;
}

//-------------------------------------------------------------------------

void AssetValue::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        json::setString(json, "kind", AssetKind2StrView(m_kind));
        json::setOptionalMember(json, "quantity", m_quantity);
        json::setOptionalMember(json, "itemRef", m_itemRef);
        json::setDecimal(json, "estimatedReferenceValue", m_estimatedReferenceValue);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

AssetValue AssetValue::fromJson(const rapidjson::Value& json)
{
    const auto kind = str2AssetKind(json["kind"].GetString());
    if (kind == AssetKind::CURRENCY) {
        return currency(json::getDecimal(json["quantity"]));
    }
    return item(json["itemRef"].GetString(), json::getDecimal(json["estimatedReferenceValue"]));
}

//-------------------------------------------------------------------------

}  // namespace dealcore::asset

//-------------------------------------------------------------------------
