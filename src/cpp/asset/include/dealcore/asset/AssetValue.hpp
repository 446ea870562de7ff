/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace dealcore::asset
{

//-------------------------------------------------------------------------

enum class AssetKind : uint32_t
{
    CURRENCY,
    ITEM
};

[[nodiscard]] constexpr std::string_view AssetKind2StrView(AssetKind kind) noexcept
{
    return magic_enum::enum_name(kind);
}

[[nodiscard]] AssetKind str2AssetKind(std::string_view str);

//-------------------------------------------------------------------------

class AssetValue : public JsonSerializable
{
public:
    [[nodiscard]] static AssetValue currency(decimal_t quantity);
    [[nodiscard]] static AssetValue item(ItemRef itemRef, decimal_t estimatedReferenceValue);

    [[nodiscard]] AssetKind kind() const noexcept { return m_kind; }
    [[nodiscard]] bool isCurrency() const noexcept { return m_kind == AssetKind::CURRENCY; }
    [[nodiscard]] bool isItem() const noexcept { return m_kind == AssetKind::ITEM; }

    // Present for currency only.
    [[nodiscard]] const std::optional<decimal_t>& quantity() const noexcept { return m_quantity; }
    // Present for items only.
    [[nodiscard]] const std::optional<ItemRef>& itemRef() const noexcept { return m_itemRef; }
    [[nodiscard]] decimal_t estimatedReferenceValue() const noexcept { return m_estimatedReferenceValue; }

    [[nodiscard]] std::string describe(std::string_view currencySymbol) const;

    [[nodiscard]] bool operator==(const AssetValue& other) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static AssetValue fromJson(const rapidjson::Value& json);

private:
    AssetValue(
        AssetKind kind,
        std::optional<decimal_t> quantity,
        std::optional<ItemRef> itemRef,
        decimal_t estimatedReferenceValue);

    AssetKind m_kind;
    std::optional<decimal_t> m_quantity;
    std::optional<ItemRef> m_itemRef;
    decimal_t m_estimatedReferenceValue;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::asset

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<dealcore::asset::AssetKind>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(dealcore::asset::AssetKind kind, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", dealcore::asset::AssetKind2StrView(kind));
    }
};

template<>
struct fmt::formatter<dealcore::asset::AssetValue>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const dealcore::asset::AssetValue& asset, FormatContext& ctx) const
    {
        if (asset.isCurrency()) {
            return fmt::format_to(ctx.out(), "{{CURRENCY {}}}", asset.quantity().value());
        }
        return fmt::format_to(
            ctx.out(),
            "{{ITEM {} ~{}}}",
            asset.itemRef().value(),
            asset.estimatedReferenceValue());
    }
};

//-------------------------------------------------------------------------
