/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/compliance/ComplianceResult.hpp"

//-------------------------------------------------------------------------

namespace dealcore::compliance
{

//-------------------------------------------------------------------------

void ComplianceResult::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("acceptable", rapidjson::Value{acceptable}, allocator);
        json::setString(json, "rule", rule);
        json::setDecimal(json, "profit", profit);
        json::setOptionalMember(json, "reason", reason);
        json::setOptionalMember(json, "referenceValueUsed", referenceValueUsed);
        json::setOptionalMember(json, "percentageOfReference", percentageOfReference);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

ComplianceResult ComplianceResult::fromJson(const rapidjson::Value& json)
{
    ComplianceResult result;
    result.acceptable = json["acceptable"].GetBool();
    result.rule = json["rule"].GetString();
    result.profit = json::getDecimal(json["profit"]);
    result.reason = json::getOptionalString(json, "reason");
    result.referenceValueUsed = json::getOptionalDecimal(json, "referenceValueUsed");
    if (json.HasMember("percentageOfReference") && json["percentageOfReference"].IsNumber()) {
        result.percentageOfReference = json["percentageOfReference"].GetDouble();
    }
    return result;
}

//-------------------------------------------------------------------------

}  // namespace dealcore::compliance

//-------------------------------------------------------------------------
