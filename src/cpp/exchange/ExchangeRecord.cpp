/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/exchange/ExchangeRecord.hpp"

//-------------------------------------------------------------------------

namespace dealcore::exchange
{

//-------------------------------------------------------------------------

ExchangeStatus str2ExchangeStatus(std::string_view str)
{
    const auto status = magic_enum::enum_cast<ExchangeStatus>(str);
    if (!status.has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown exchange status '{}'",
            std::source_location::current().function_name(), str)};
    }
    return status.value();
}

//-------------------------------------------------------------------------

std::vector<std::string> exchangeStatusNames()
{
    const auto& names = magic_enum::enum_names<ExchangeStatus>();
    return names
        | views::transform([](std::string_view name) { return std::string{name}; })
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

std::string cancellationNote(std::string_view reason)
{
    return fmt::format("Cancelled: {}", reason);
}

//-------------------------------------------------------------------------

void ExchangeRecord::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::setString(json, "id", id);
        json::setString(json, "status", ExchangeStatus2StrView(status));
        json::setString(json, "initiatorChannel", initiatorChannel);
        json::setString(json, "counterpartyId", counterpartyId);
        json::setOptionalMember(json, "counterpartyAddress", counterpartyAddress);
        offered.jsonSerialize(json, "offered");
        requested.jsonSerialize(json, "requested");
        complianceResult.jsonSerialize(json, "complianceResult");
        json::serializeHelper(
            json,
            "verification",
            [this](rapidjson::Document& json) {
                if (!verification.has_value()) {
                    json.SetNull();
                    return;
                }
                json.SetObject();
                auto& allocator = json.GetAllocator();
                json::setString(json, "matchedTransferId", verification->matchedTransferId);
                json.AddMember(
                    "verifiedAt", rapidjson::Value{verification->verifiedAt}, allocator);
                json::setOptionalMember(json, "payerAddress", verification->payerAddress);
            });
        json::serializeHelper(
            json,
            "execution",
            [this](rapidjson::Document& json) {
                json.SetObject();
                json::setOptionalMember(json, "claimedAt", execution.claimedAt);
                json::setOptionalMember(json, "completedAt", execution.completedAt);
                json::setOptionalMember(json, "externalTransferId", execution.externalTransferId);
                json::setOptionalMember(json, "failureNote", execution.failureNote);
            });
        json.AddMember("createdAt", rapidjson::Value{createdAt}, allocator);
        json.AddMember("expiresAt", rapidjson::Value{expiresAt}, allocator);
        json::setOptionalMember(json, "notes", notes);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace dealcore::exchange

//-------------------------------------------------------------------------
