/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/config/CoreConfig.hpp"
#include "dealcore/exchange/ExchangeRecordStore.hpp"
#include "dealcore/store/Schema.hpp"
#include "dealcore/wager/JackpotAccumulator.hpp"
#include "dealcore/wager/WagerStore.hpp"
#include "Clock.hpp"
#include "JsonSerializable.hpp"
#include "common.hpp"

#include <CLI/CLI.hpp>

#include <iostream>

using namespace dealcore;

//-------------------------------------------------------------------------

namespace
{

const json::FormatOptions s_pretty{.indent = json::IndentOptions{}};

void printJson(const json::IsJsonSerializable auto& serializable)
{
    fmt::print("{}\n", json::jsonSerializable2str(serializable, s_pretty));
}

void printJsonArray(const auto& range)
{
    rapidjson::Document json;
    json.SetArray();
    auto& allocator = json.GetAllocator();
    for (const auto& item : range) {
        rapidjson::Document itemJson{&allocator};
        item.jsonSerialize(itemJson);
        json.PushBack(itemJson, allocator);
    }
    fmt::print("{}\n", json::json2str(json, s_pretty));
}

struct AssetOptions
{
    std::optional<double> currency;
    std::optional<std::string> item;
    std::optional<double> value;

    [[nodiscard]] asset::AssetValue toAsset(std::string_view side) const
    {
        if (currency.has_value() == item.has_value()) {
            throw CLI::ValidationError{fmt::format(
                "Give exactly one of --{0}-currency and --{0}-item", side)};
        }
        if (currency.has_value()) {
            return asset::AssetValue::currency(util::double2decimal(currency.value()));
        }
        if (!value.has_value()) {
            throw CLI::ValidationError{fmt::format("--{0}-item needs --{0}-value", side)};
        }
        return asset::AssetValue::item(item.value(), util::double2decimal(value.value()));
    }
};

void addAssetOptions(CLI::App* cmd, std::string_view side, AssetOptions& options)
{
    cmd->add_option(fmt::format("--{}-currency", side), options.currency, "Currency quantity");
    cmd->add_option(fmt::format("--{}-item", side), options.item, "Item reference");
    cmd->add_option(fmt::format("--{}-value", side), options.value, "Item reference value");
}

}  // namespace

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"dealctl - settlement core administration"};
    app.require_subcommand(1);

    fs::path configFile;
    app.add_option("-c,--config", configFile, "Configuration file")
        ->required()
        ->check(CLI::ExistingFile);

    RecordId statusId;
    auto statusCmd = app.add_subcommand("status", "Show an exchange record or a wager");
    statusCmd->add_option("id", statusId, "Record id")->required();

    std::optional<std::string> listStatus;
    size_t listLimit = 50;
    auto listCmd = app.add_subcommand("list", "List exchange records, newest first");
    listCmd->add_option("--status", listStatus, "Only records in this status")
        ->check(CLI::IsMember(exchange::exchangeStatusNames()));
    listCmd->add_option("--limit", listLimit, "Maximum number of records")
        ->check(CLI::PositiveNumber);

    RecordId cancelId;
    std::string cancelReason = "operator request";
    auto cancelCmd = app.add_subcommand("cancel", "Cancel a proposed or accepted exchange");
    cancelCmd->add_option("id", cancelId, "Record id")->required();
    cancelCmd->add_option("--reason", cancelReason, "Reason recorded in the cancellation note");

    auto expireCmd = app.add_subcommand("expire", "Expire every overdue open exchange");

    AssetOptions offer, request;
    auto checkCmd = app.add_subcommand("check", "Dry-run the compliance rules on a trade");
    addAssetOptions(checkCmd, "offer", offer);
    addAssetOptions(checkCmd, "request", request);

    auto jackpotCmd = app.add_subcommand("jackpot", "Show the jackpot and whether it can be awarded");

    std::string statsRequester;
    auto statsCmd = app.add_subcommand("stats", "Aggregate the wagers of one requester");
    statsCmd->add_option("requester", statsRequester, "Requester id")->required();

    CLI11_PARSE(app, argc, argv);

    const auto config = config::loadConfig(configFile);
    logging::configure(config.logging);

    if (checkCmd->parsed()) {
        const compliance::ComplianceChecker checker{config.exchange.compliance};
        try {
            const auto result = checker.check(offer.toAsset("offer"), request.toAsset("request"));
            printJson(result);
            return result.acceptable ? 0 : 1;
        }
        catch (const CLI::ValidationError& exc) {
            return app.exit(exc);
        }
    }

    store::Database db{config.store.path};
    store::applySchema(db);
    const SystemClock clock;

    exchange::ExchangeRecordStore records{db};
    wager::WagerStore wagers{db};

    if (statusCmd->parsed()) {
        if (const auto record = records.find(statusId)) {
            printJson(record.value());
        } else if (const auto wager = wagers.find(statusId)) {
            printJson(wager.value());
        } else {
            fmt::print(stderr, "No record '{}'\n", statusId);
            return 1;
        }
    }
    else if (listCmd->parsed()) {
        const auto status = listStatus.transform([](const std::string& str) {
            return exchange::str2ExchangeStatus(str);
        });
        printJsonArray(records.list(status, listLimit));
    }
    else if (cancelCmd->parsed()) {
        const auto note = exchange::cancellationNote(cancelReason);
        const bool cancelled = records.cancel(cancelId, exchange::ExchangeStatus::PROPOSED, note)
            || records.cancel(cancelId, exchange::ExchangeStatus::ACCEPTED, note);
        if (!cancelled) {
            fmt::print(stderr, "Record '{}' is not open for cancellation\n", cancelId);
            return 1;
        }
        printJson(records.find(cancelId).value());
    }
    else if (expireCmd->parsed()) {
        fmt::print("{} records expired\n", records.expireStale(clock.now()));
    }
    else if (jackpotCmd->parsed()) {
        const wager::JackpotAccumulator jackpot{db, config.jackpot};
        const auto state = jackpot.state();
        printJson(state);
        fmt::print(
            "eligible: {} (floor {}, cooldown {}s)\n",
            jackpot.isEligible(state, clock.now()),
            config.jackpot.floor,
            config.jackpot.cooldownSeconds);
    }
    else if (statsCmd->parsed()) {
        printJson(wagers.requesterStats(statsRequester));
    }

    return 0;
}

//-------------------------------------------------------------------------
