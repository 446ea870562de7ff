/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/store/Schema.hpp"
#include "dealcore/wager/BankrollGuard.hpp"
#include "dealcore/wager/Cooldown.hpp"
#include "dealcore/wager/RateLimiter.hpp"
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

// Start of a 60 second window.
constexpr Timestamp kWindowStart = 1'699'999'980;

}  // namespace

//-------------------------------------------------------------------------

struct WagerLimitsTest : Test
{
    virtual void SetUp() override { store::applySchema(db); }

    store::Database db;
};

//-------------------------------------------------------------------------

TEST_F(WagerLimitsTest, CooldownSpacesWagersOfOneRequester)
{
    Cooldown cooldown{db, 30};

    EXPECT_TRUE(cooldown.tryStart("alice", kWindowStart).has_value());

    const auto early = cooldown.tryStart("alice", kWindowStart + 10);
    ASSERT_FALSE(early.has_value());
    EXPECT_EQ(early.error(), 20u);
    EXPECT_EQ(cooldown.remaining("alice", kWindowStart + 10), 20u);

    EXPECT_TRUE(cooldown.tryStart("bob", kWindowStart + 10).has_value());
    EXPECT_TRUE(cooldown.tryStart("alice", kWindowStart + 30).has_value());
    EXPECT_EQ(cooldown.remaining("alice", kWindowStart + 30), 30u);
}

TEST_F(WagerLimitsTest, RejectedAttemptDoesNotRestartCooldown)
{
    Cooldown cooldown{db, 30};

    ASSERT_TRUE(cooldown.tryStart("alice", kWindowStart).has_value());
    ASSERT_FALSE(cooldown.tryStart("alice", kWindowStart + 29).has_value());
    EXPECT_TRUE(cooldown.tryStart("alice", kWindowStart + 30).has_value());
}

TEST_F(WagerLimitsTest, UnknownRequesterHasNoCooldown)
{
    Cooldown cooldown{db, 30};
    EXPECT_EQ(cooldown.remaining("nobody", kWindowStart), 0u);
}

TEST_F(WagerLimitsTest, ConcurrentCooldownStartsAdmitOne)
{
    static constexpr size_t kThreads = 8;

    Cooldown cooldown{db, 30};
    std::latch start{kThreads};
    std::atomic<uint32_t> started{};
    std::vector<std::thread> threads;
    for (size_t i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            start.arrive_and_wait();
            if (cooldown.tryStart("alice", kWindowStart).has_value()) {
                ++started;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(started.load(), 1u);
}

//-------------------------------------------------------------------------

TEST_F(WagerLimitsTest, RateLimiterCountsPerWindow)
{
    RateLimiter limiter{db, 3, 60};
    ASSERT_EQ(limiter.bucketStart(kWindowStart + 59), kWindowStart);

    EXPECT_TRUE(limiter.tryAcquire("alice", kWindowStart));
    EXPECT_TRUE(limiter.tryAcquire("alice", kWindowStart + 20));
    EXPECT_TRUE(limiter.tryAcquire("alice", kWindowStart + 40));
    EXPECT_FALSE(limiter.tryAcquire("alice", kWindowStart + 59));
    EXPECT_TRUE(limiter.tryAcquire("bob", kWindowStart + 59));

    EXPECT_TRUE(limiter.tryAcquire("alice", kWindowStart + 60));
}

TEST_F(WagerLimitsTest, RateLimiterPrunesFinishedWindows)
{
    RateLimiter limiter{db, 3, 60};
    ASSERT_TRUE(limiter.tryAcquire("alice", kWindowStart));
    ASSERT_TRUE(limiter.tryAcquire("bob", kWindowStart));
    ASSERT_TRUE(limiter.tryAcquire("alice", kWindowStart + 60));

    EXPECT_EQ(limiter.prune(kWindowStart + 60), 2u);
    EXPECT_EQ(limiter.prune(kWindowStart + 60), 0u);
}

TEST_F(WagerLimitsTest, RateLimiterAdmittingNothingThrows)
{
    EXPECT_THROW(RateLimiter(db, 0, 60), std::invalid_argument);
    EXPECT_THROW(RateLimiter(db, 3, 0), std::invalid_argument);
}

//-------------------------------------------------------------------------

struct BankrollTestParams
{
    decimal_t balance;
    decimal_t maxMultiplier;
    std::optional<decimal_t> maxStake;
};

void PrintTo(const BankrollTestParams& params, std::ostream* os)
{
    *os << fmt::format("{{.balance = {}, .maxMultiplier = {}, .maxStake = {}}}",
        params.balance, params.maxMultiplier,
        params.maxStake ? fmt::format("{}", *params.maxStake) : "insufficient");
}

struct BankrollGuardTest : TestWithParam<BankrollTestParams>
{
    BankrollGuard guard{WagerConfig{}};
};

TEST_P(BankrollGuardTest, MaxStakeFollowsBalance)
{
    const auto& params = GetParam();
    const auto bounds = guard.bounds(params.balance, params.maxMultiplier);
    if (params.maxStake.has_value()) {
        ASSERT_TRUE(bounds.has_value()) << fmt::format("{}", bounds.error());
        EXPECT_EQ(bounds->minStake, DEC(0.1));
        EXPECT_EQ(bounds->maxStake, params.maxStake.value());
    } else {
        ASSERT_FALSE(bounds.has_value());
        EXPECT_EQ(bounds.error().code, ErrorCode::BANKROLL_INSUFFICIENT);
    }
}

INSTANTIATE_TEST_SUITE_P(
    BankrollGuard,
    BankrollGuardTest,
    Values(
        BankrollTestParams{.balance = 100_dec, .maxMultiplier = 5_dec, .maxStake = 5_dec},
        BankrollTestParams{.balance = 100_dec, .maxMultiplier = 50_dec, .maxStake = 2_dec},
        BankrollTestParams{.balance = 10_dec, .maxMultiplier = 5_dec, .maxStake = DEC(0.5)},
        BankrollTestParams{
            .balance = DEC(1234.567), .maxMultiplier = DEC(2.5), .maxStake = DEC(61.72)},
        BankrollTestParams{.balance = DEC(9.99), .maxMultiplier = 5_dec},
        BankrollTestParams{.balance = 10_dec, .maxMultiplier = 200_dec}));

TEST(BankrollGuard, StakeMustLieWithinBounds)
{
    const BankrollGuard guard{WagerConfig{}};

    EXPECT_TRUE(guard.check(DEC(0.1), 100_dec, 5_dec).has_value());
    EXPECT_TRUE(guard.check(5_dec, 100_dec, 5_dec).has_value());

    const auto tooSmall = guard.check(DEC(0.09), 100_dec, 5_dec);
    ASSERT_FALSE(tooSmall.has_value());
    EXPECT_EQ(tooSmall.error().code, ErrorCode::STAKE_OUT_OF_BOUNDS);

    const auto tooLarge = guard.check(DEC(5.01), 100_dec, 5_dec);
    ASSERT_FALSE(tooLarge.has_value());
    EXPECT_EQ(tooLarge.error().code, ErrorCode::STAKE_OUT_OF_BOUNDS);

    const auto broke = guard.check(1_dec, 5_dec, 5_dec);
    ASSERT_FALSE(broke.has_value());
    EXPECT_EQ(broke.error().code, ErrorCode::BANKROLL_INSUFFICIENT);
}

//-------------------------------------------------------------------------
