/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/decimal/decimal.hpp"

#include <rapidjson/document.h>

#include <concepts>
#include <functional>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace dealcore::json
{

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 4;
};

struct FormatOptions
{
    std::optional<IndentOptions> indent = {};
};

[[nodiscard]] std::string json2str(
    const rapidjson::Value& json, const FormatOptions& formatOptions = {});

[[nodiscard]] rapidjson::Document str2json(const std::string& str);

// Decimals travel as strings so that they survive the round trip exactly.
[[nodiscard]] decimal_t getDecimal(const rapidjson::Value& json);

[[nodiscard]] std::optional<decimal_t> getOptionalDecimal(
    const rapidjson::Value& json, const char* key);

[[nodiscard]] std::optional<std::string> getOptionalString(
    const rapidjson::Value& json, const char* key);

void setDecimal(rapidjson::Document& json, const std::string& key, decimal_t val);

void setString(rapidjson::Document& json, const std::string& key, std::string_view val);

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

template<typename T>
inline constexpr bool kAlwaysFalse = false;

template<typename T>
void setOptionalMember(rapidjson::Document& json, const std::string& key, std::optional<T> opt)
{
    auto& allocator = json.GetAllocator();
    json.AddMember(
        rapidjson::Value{key.c_str(), allocator},
        [&] {
            if (!opt.has_value()) {
                return std::move(rapidjson::Value{}.SetNull());
            }
            if constexpr (std::same_as<T, decimal_t>) {
                return std::move(
                    rapidjson::Value{util::decimal2str(opt.value()).c_str(), allocator});
            } else if constexpr (std::constructible_from<rapidjson::Value, T>) {
                return std::move(rapidjson::Value{opt.value()});
            } else if constexpr (
                requires (T t) {{ t.c_str() } -> std::convertible_to<const char*>; }) {
                return std::move(rapidjson::Value{opt.value().c_str(), allocator});
            } else {
                static_assert(kAlwaysFalse<T>, "No conversion from T to rapidjson::Value exists");
            }
        }(),
        allocator);
}

//-------------------------------------------------------------------------

}  // namespace dealcore::json

//-------------------------------------------------------------------------
