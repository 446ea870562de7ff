/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/wager/WagerRecord.hpp"

//-------------------------------------------------------------------------

namespace dealcore::wager
{

//-------------------------------------------------------------------------

WagerStatus str2WagerStatus(std::string_view str)
{
    const auto status = magic_enum::enum_cast<WagerStatus>(str);
    if (!status.has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown wager status '{}'",
            std::source_location::current().function_name(), str)};
    }
    return status.value();
}

//-------------------------------------------------------------------------

void WagerRecord::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::setString(json, "id", id);
        json::setString(json, "requesterId", requesterId);
        json::setString(json, "channel", channel);
        json::setString(json, "game", game);
        json::setDecimal(json, "stake", stake);
        json::setString(json, "stakeTransferId", stakeTransferId);
        json::setOptionalMember(json, "payerAddress", payerAddress);
        json.AddMember("outcomeValue", rapidjson::Value{outcomeValue}, allocator);
        json::setDecimal(json, "multiplier", multiplier);
        json::setDecimal(json, "payout", payout);
        json::setDecimal(json, "jackpotContribution", jackpotContribution);
        json::setString(json, "status", WagerStatus2StrView(status));
        json::setOptionalMember(json, "claimedAt", claimedAt);
        json::setOptionalMember(json, "payoutTransferId", payoutTransferId);
        json::setOptionalMember(json, "failureNote", failureNote);
        json.AddMember("createdAt", rapidjson::Value{createdAt}, allocator);
        json::setOptionalMember(json, "completedAt", completedAt);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void RequesterStats::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("wagers", rapidjson::Value{wagers}, allocator);
        json.AddMember("wins", rapidjson::Value{wins}, allocator);
        json.AddMember("losses", rapidjson::Value{losses}, allocator);
        json::setDecimal(json, "staked", staked);
        json::setDecimal(json, "paidOut", paidOut);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace dealcore::wager

//-------------------------------------------------------------------------
