/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "json_util.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <source_location>

//-------------------------------------------------------------------------

namespace dealcore::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    rapidjson::StringBuffer buffer;
    if (formatOptions.indent.has_value()) {
        const auto& opts = formatOptions.indent.value();
        rapidjson::PrettyWriter writer{buffer};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        json.Accept(writer);
    } else {
        rapidjson::Writer writer{buffer};
        json.Accept(writer);
    }
    return buffer.GetString();
}

//-------------------------------------------------------------------------

rapidjson::Document str2json(const std::string& str)
{
    rapidjson::Document json;
    if (json.Parse(str.c_str()).HasParseError()) {
        static constexpr size_t maxCharsShown = 200uz;
        std::string_view facade{str.data(), std::min(maxCharsShown, str.size())};
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing Json string: {}{}",
            std::source_location::current().function_name(),
            facade,
            facade.size() < str.size() ? "..." : "")};
    }
    return json;
}

//-------------------------------------------------------------------------

decimal_t getDecimal(const rapidjson::Value& json)
{
    if (json.IsString()) [[likely]] {
        return util::str2decimal(json.GetString());
    } else if (json.IsNumber()) {
        return util::double2decimal(json.GetDouble());
    } else {
        throw std::invalid_argument{fmt::format(
            "{}: Ill-formed Json value to form a decimal with: {}",
            std::source_location::current().function_name(),
            json2str(json))};
    }
}

//-------------------------------------------------------------------------

std::optional<decimal_t> getOptionalDecimal(const rapidjson::Value& json, const char* key)
{
    if (!json.HasMember(key) || json[key].IsNull()) return {};
    return getDecimal(json[key]);
}

//-------------------------------------------------------------------------

std::optional<std::string> getOptionalString(const rapidjson::Value& json, const char* key)
{
    if (!json.HasMember(key) || json[key].IsNull()) return {};
    return json[key].GetString();
}

//-------------------------------------------------------------------------

void setDecimal(rapidjson::Document& json, const std::string& key, decimal_t val)
{
    auto& allocator = json.GetAllocator();
    json.AddMember(
        rapidjson::Value{key.c_str(), allocator},
        rapidjson::Value{util::decimal2str(val).c_str(), allocator},
        allocator);
}

//-------------------------------------------------------------------------

void setString(rapidjson::Document& json, const std::string& key, std::string_view val)
{
    auto& allocator = json.GetAllocator();
    json.AddMember(
        rapidjson::Value{key.c_str(), allocator},
        rapidjson::Value{val.data(), static_cast<rapidjson::SizeType>(val.size()), allocator},
        allocator);
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace dealcore::json

//-------------------------------------------------------------------------
