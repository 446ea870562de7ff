/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/config/CoreConfig.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace dealcore;
using namespace dealcore::config;
using namespace dealcore::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

CoreConfig parse(const char* xml)
{
    pugi::xml_document doc;
    if (!doc.load_string(xml)) {
        throw std::runtime_error{"Test XML does not parse"};
    }
    return makeCoreConfig(doc.document_element());
}

}  // namespace

//-------------------------------------------------------------------------

TEST(CoreConfig, MinimalConfigUsesDefaults)
{
    const auto config = parse(R"(
        <DealCore>
            <Exchange agentAddress="EQ-agent"/>
        </DealCore>
    )");

    EXPECT_EQ(config.store.path, fs::path{store::Database::kInMemory});
    EXPECT_EQ(config.logging.level, spdlog::level::info);
    EXPECT_FALSE(config.logging.file.has_value());
    EXPECT_EQ(config.exchange.agentAddress, "EQ-agent");
    EXPECT_EQ(config.exchange.expirySeconds, 120u);
    EXPECT_EQ(config.exchange.currencySymbol, "TON");
    EXPECT_TRUE(config.exchange.autoExecute);
    EXPECT_EQ(config.exchange.compliance.buyMaxMultiplier, DEC(0.80));
    EXPECT_EQ(config.exchange.compliance.sellMinMultiplier, DEC(1.15));
    EXPECT_EQ(config.verification.toleranceRatio, DEC(0.99));
    EXPECT_FALSE(config.wager.has_value());
    EXPECT_EQ(config.jackpot.floor, 100_dec);
}

TEST(CoreConfig, FullConfig)
{
    const auto config = parse(R"(
        <DealCore>
            <Store path="var/dealcore.db"/>
            <Logging level="debug" file="logs/core.log" settlementLog="logs/settlements.csv"/>
            <Exchange agentAddress="EQ-agent" agentAccountId="agent-1" currency="USD"
                      expirySeconds="300" autoExecute="false">
                <Compliance buyMaxMultiplier="0.75" sellMinMultiplier="1.25"/>
            </Exchange>
            <Verification toleranceRatio="0.5" clockSkewSeconds="60"/>
            <Wager minStake="0.25" cooldownSeconds="10" rateLimitMax="3">
                <Game name="coin">
                    <Band from="1" multiplier="1.5"/>
                </Game>
            </Wager>
            <Jackpot contributionFraction="0.125" floor="50" cooldownSeconds="600"/>
        </DealCore>
    )");

    EXPECT_EQ(config.store.path, fs::path{"var/dealcore.db"});
    EXPECT_EQ(config.logging.level, spdlog::level::debug);
    EXPECT_EQ(config.logging.file, std::optional<fs::path>{"logs/core.log"});
    EXPECT_EQ(config.logging.settlementLog, std::optional<fs::path>{"logs/settlements.csv"});

    EXPECT_EQ(config.exchange.agentAccountId, "agent-1");
    EXPECT_EQ(config.exchange.currencySymbol, "USD");
    EXPECT_EQ(config.exchange.expirySeconds, 300u);
    EXPECT_FALSE(config.exchange.autoExecute);
    EXPECT_EQ(config.exchange.compliance.buyMaxMultiplier, DEC(0.75));
    EXPECT_EQ(config.exchange.compliance.sellMinMultiplier, DEC(1.25));

    EXPECT_EQ(config.verification.toleranceRatio, DEC(0.5));
    EXPECT_EQ(config.verification.clockSkewSeconds, 60u);

    ASSERT_TRUE(config.wager.has_value());
    EXPECT_EQ(config.wager->minStake, DEC(0.25));
    EXPECT_EQ(config.wager->cooldownSeconds, 10u);
    EXPECT_EQ(config.wager->rateLimitMax, 3u);
    EXPECT_EQ(config.wager->treasuryAddress, "EQ-agent");
    EXPECT_EQ(config.wager->currencySymbol, "USD");
    ASSERT_EQ(config.wager->games.size(), 1u);
    EXPECT_EQ(config.wager->games.at("coin").multiplierFor(1), DEC(1.5));

    EXPECT_EQ(config.jackpot.contributionFraction, DEC(0.125));
    EXPECT_EQ(config.jackpot.floor, 50_dec);
    EXPECT_EQ(config.jackpot.cooldownSeconds, 600u);
}

TEST(CoreConfig, WagerWithoutGamesGetsDefaultTables)
{
    const auto config = parse(R"(
        <DealCore>
            <Exchange agentAddress="EQ-agent"/>
            <Wager treasuryAddress="EQ-treasury" currency="TON"/>
        </DealCore>
    )");

    ASSERT_TRUE(config.wager.has_value());
    EXPECT_EQ(config.wager->treasuryAddress, "EQ-treasury");
    EXPECT_THAT(config.wager->games, ElementsAre(Key("dice"), Key("slot")));
}

TEST(CoreConfig, InvalidConfigsThrow)
{
    EXPECT_THROW(parse("<Other/>"), std::invalid_argument);
    EXPECT_THROW(parse("<DealCore/>"), std::invalid_argument);
    EXPECT_THROW(parse("<DealCore><Exchange/></DealCore>"), std::invalid_argument);
    EXPECT_THROW(parse(R"(
        <DealCore>
            <Exchange agentAddress="EQ-agent">
                <Compliance buyMaxMultiplier="1.25" sellMinMultiplier="0.75"/>
            </Exchange>
        </DealCore>
    )"), std::invalid_argument);
    EXPECT_THROW(parse(R"(
        <DealCore>
            <Exchange agentAddress="EQ-agent"/>
            <Logging level="chatty"/>
        </DealCore>
    )"), std::invalid_argument);
    EXPECT_THROW(parse(R"(
        <DealCore>
            <Exchange agentAddress="EQ-agent"/>
            <Wager rateLimitMax="0"/>
        </DealCore>
    )"), std::invalid_argument);
    EXPECT_THROW(parse(R"(
        <DealCore>
            <Exchange agentAddress="EQ-agent"/>
            <Wager>
                <Game name="coin"><Band from="1" multiplier="2"/></Game>
                <Game name="coin"><Band from="2" multiplier="2"/></Game>
            </Wager>
        </DealCore>
    )"), std::invalid_argument);
    EXPECT_THROW(parse(R"(
        <DealCore>
            <Exchange agentAddress="EQ-agent"/>
            <Jackpot contributionFraction="1"/>
        </DealCore>
    )"), std::invalid_argument);
}

TEST(CoreConfig, LoadFromFile)
{
    const auto path = fs::temp_directory_path() / "dealcore-tests" / "config.xml";
    fs::create_directories(path.parent_path());
    {
        std::ofstream file{path};
        file << R"(<DealCore><Exchange agentAddress="EQ-file"/></DealCore>)";
    }
    EXPECT_EQ(loadConfig(path).exchange.agentAddress, "EQ-file");

    {
        std::ofstream file{path};
        file << "<DealCore><Exchange";
    }
    EXPECT_THROW(static_cast<void>(loadConfig(path)), std::invalid_argument);
}

//-------------------------------------------------------------------------
