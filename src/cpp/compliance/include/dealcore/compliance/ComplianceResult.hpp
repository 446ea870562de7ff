/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace dealcore::compliance
{

struct ComplianceResult
{
    bool acceptable{};
    std::string rule;
    decimal_t profit{};
    std::optional<std::string> reason;
    std::optional<decimal_t> referenceValueUsed;
    std::optional<double> percentageOfReference;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static ComplianceResult fromJson(const rapidjson::Value& json);
};

}  // namespace dealcore::compliance

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<dealcore::compliance::ComplianceResult>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const dealcore::compliance::ComplianceResult& result, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{{{} [{}] profit={}{}}}",
            result.acceptable ? "ACCEPT" : "REJECT",
            result.rule,
            result.profit,
            result.reason ? fmt::format(" reason='{}'", *result.reason) : "");
    }
};

//-------------------------------------------------------------------------
