/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/store/Schema.hpp"
#include "dealcore/wager/JackpotAccumulator.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <latch>
#include <thread>

//-------------------------------------------------------------------------

using namespace dealcore;
using namespace dealcore::wager;
using namespace dealcore::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

constexpr Timestamp kStart = 1'700'000'000;

template<typename F>
void runConcurrently(size_t threadCount, F&& task)
{
    std::latch start{static_cast<std::ptrdiff_t>(threadCount)};
    std::vector<std::thread> threads;
    for (size_t i = 0; i < threadCount; ++i) {
        threads.emplace_back([&, i] {
            start.arrive_and_wait();
            task(i);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
}

}  // namespace

//-------------------------------------------------------------------------

struct JackpotAccumulatorTest : Test
{
    virtual void SetUp() override { store::applySchema(db); }

    store::Database db;
    JackpotAccumulator jackpot{db, JackpotPolicy{
        .contributionFraction = DEC(0.5),
        .floor = 10_dec,
        .cooldownSeconds = 100
    }};
};

//-------------------------------------------------------------------------

TEST_F(JackpotAccumulatorTest, StartsEmpty)
{
    const auto state = jackpot.state();
    EXPECT_EQ(state.accumulatedAmount, 0_dec);
    EXPECT_FALSE(state.lastWinnerId.has_value());
    EXPECT_FALSE(state.lastAwardedAt.has_value());
    EXPECT_EQ(state.version, 0);
}

TEST_F(JackpotAccumulatorTest, CreditAddsContribution)
{
    EXPECT_EQ(jackpot.credit(3_dec), DEC(1.5));
    EXPECT_EQ(jackpot.credit(DEC(0.25)), DEC(0.125));

    const auto state = jackpot.state();
    EXPECT_EQ(state.accumulatedAmount, DEC(1.625));
    EXPECT_EQ(state.version, 2);
}

TEST_F(JackpotAccumulatorTest, ZeroStakeLeavesStateAlone)
{
    EXPECT_EQ(jackpot.credit(0_dec), 0_dec);
    EXPECT_EQ(jackpot.state().version, 0);
    EXPECT_THROW(jackpot.credit(-1_dec), std::invalid_argument);
}

TEST_F(JackpotAccumulatorTest, ConcurrentCreditsAreAllKept)
{
    static constexpr size_t kThreads = 8;

    runConcurrently(kThreads, [&](size_t) { jackpot.credit(2_dec); });

    const auto state = jackpot.state();
    EXPECT_EQ(state.accumulatedAmount, 8_dec);
    EXPECT_EQ(state.version, static_cast<int64_t>(kThreads));
}

//-------------------------------------------------------------------------

TEST_F(JackpotAccumulatorTest, AwardNeedsFloor)
{
    jackpot.credit(18_dec);
    EXPECT_FALSE(jackpot.isEligible(jackpot.state(), kStart));

    const auto award = jackpot.award("alice", kStart);
    ASSERT_FALSE(award.has_value());
    EXPECT_EQ(award.error().code, ErrorCode::JACKPOT_NOT_ELIGIBLE);
    EXPECT_EQ(jackpot.state().accumulatedAmount, 9_dec);
}

TEST_F(JackpotAccumulatorTest, AwardTakesWholeBalanceOnce)
{
    jackpot.credit(24_dec);
    ASSERT_TRUE(jackpot.isEligible(jackpot.state(), kStart));

    const auto award = jackpot.award("alice", kStart);
    ASSERT_TRUE(award.has_value());
    EXPECT_EQ(award->winnerId, "alice");
    EXPECT_EQ(award->amount, 12_dec);
    EXPECT_EQ(award->awardedAt, kStart);
    EXPECT_FALSE(award->priorWinnerId.has_value());

    const auto state = jackpot.state();
    EXPECT_EQ(state.accumulatedAmount, 0_dec);
    EXPECT_EQ(state.lastWinnerId, std::optional<std::string>{"alice"});
    EXPECT_EQ(state.lastAwardedAt, std::optional<Timestamp>{kStart});

    const auto again = jackpot.award("bob", kStart);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::JACKPOT_NOT_ELIGIBLE);
}

TEST_F(JackpotAccumulatorTest, AwardWaitsOutCooldown)
{
    jackpot.credit(20_dec);
    ASSERT_TRUE(jackpot.award("alice", kStart).has_value());
    jackpot.credit(20_dec);

    EXPECT_FALSE(jackpot.isEligible(jackpot.state(), kStart + 99));
    EXPECT_FALSE(jackpot.award("bob", kStart + 99).has_value());

    const auto award = jackpot.award("bob", kStart + 100);
    ASSERT_TRUE(award.has_value());
    EXPECT_EQ(award->priorWinnerId, std::optional<std::string>{"alice"});
    EXPECT_EQ(award->priorAwardedAt, std::optional<Timestamp>{kStart});
}

TEST_F(JackpotAccumulatorTest, ConcurrentAwardsPayOnce)
{
    static constexpr size_t kThreads = 4;

    jackpot.credit(40_dec);
    std::atomic<uint32_t> awarded{};
    runConcurrently(kThreads, [&](size_t i) {
        const auto award = jackpot.award(fmt::format("winner-{}", i), kStart);
        if (award.has_value()) {
            EXPECT_EQ(award->amount, 20_dec);
            ++awarded;
        } else {
            EXPECT_THAT(
                award.error().code,
                AnyOf(ErrorCode::CONFLICT, ErrorCode::JACKPOT_NOT_ELIGIBLE));
        }
    });
    EXPECT_EQ(awarded.load(), 1u);
    EXPECT_EQ(jackpot.state().accumulatedAmount, 0_dec);
}

//-------------------------------------------------------------------------

TEST_F(JackpotAccumulatorTest, RollbackRestoresAmountAndPriorWinner)
{
    jackpot.credit(20_dec);
    const auto award = jackpot.award("alice", kStart);
    ASSERT_TRUE(award.has_value());
    jackpot.credit(4_dec);

    jackpot.rollback(award.value());

    const auto state = jackpot.state();
    EXPECT_EQ(state.accumulatedAmount, 12_dec);
    EXPECT_FALSE(state.lastWinnerId.has_value());
    EXPECT_FALSE(state.lastAwardedAt.has_value());
    EXPECT_TRUE(jackpot.isEligible(state, kStart));
}

TEST_F(JackpotAccumulatorTest, RollbackKeepsLaterWinner)
{
    jackpot.credit(20_dec);
    const auto first = jackpot.award("alice", kStart);
    ASSERT_TRUE(first.has_value());
    jackpot.credit(20_dec);
    ASSERT_TRUE(jackpot.award("bob", kStart + 100).has_value());

    jackpot.rollback(first.value());

    const auto state = jackpot.state();
    EXPECT_EQ(state.accumulatedAmount, 10_dec);
    EXPECT_EQ(state.lastWinnerId, std::optional<std::string>{"bob"});
    EXPECT_EQ(state.lastAwardedAt, std::optional<Timestamp>{kStart + 100});
}

//-------------------------------------------------------------------------
