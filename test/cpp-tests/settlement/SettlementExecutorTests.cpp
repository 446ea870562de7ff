/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/exchange/ExchangeSettlement.hpp"
#include "dealcore/settlement/SettlementExecutor.hpp"
#include "dealcore/settlement/SettlementLogger.hpp"
#include "dealcore/store/Schema.hpp"
#include "ManualClock.hpp"
#include "Mocks.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>
#include <latch>
#include <thread>

//-------------------------------------------------------------------------

using namespace dealcore;
using namespace dealcore::asset;
using namespace dealcore::exchange;
using namespace dealcore::settlement;
using namespace dealcore::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct SettlementExecutorTest : Test
{
    virtual void SetUp() override
    {
        store::applySchema(db);
        config.agentAddress = "EQ-agent";
        config.agentAccountId = "agent-account";
    }

    // A verified record in which the agent owes `offered`.
    [[nodiscard]] ExchangeRecord verifiedRecord(RecordId id, AssetValue offered, AssetValue requested)
    {
        auto result = compliance::ComplianceChecker{config.compliance}.check(offered, requested);
        records.insert({
            .id = id,
            .status = ExchangeStatus::ACCEPTED,
            .initiatorChannel = "chan-1",
            .counterpartyId = "bob",
            .counterpartyAddress = "EQ-bob",
            .offered = std::move(offered),
            .requested = std::move(requested),
            .complianceResult = std::move(result),
            .createdAt = clock.now(),
            .expiresAt = clock.now() + 120
        });
        EXPECT_TRUE(records.markVerified(
            id, {.matchedTransferId = "in-" + id, .verifiedAt = clock.now(), .payerAddress = "EQ-payer"}));
        return records.find(id).value();
    }

    [[nodiscard]] ExecutionOutcome run(const ExchangeRecord& record, journal::Journal& target)
    {
        SettlementExecutor executor{{
            .ledger = ledger,
            .inventory = inventory,
            .messenger = messenger,
            .journal = target,
            .clock = clock,
            .signals = &signals
        }};
        ExchangeSettlement settlement{records, record, config};
        return executor.run(settlement);
    }

    [[nodiscard]] ExecutionOutcome run(const ExchangeRecord& record) { return run(record, journal); }

    store::Database db;
    ExchangeRecordStore records{db};
    journal::SqliteJournal journal{db};
    ExchangeConfig config;
    test::FakeLedger ledger;
    NiceMock<test::MockInventory> inventory;
    NiceMock<test::MockMessenger> messenger;
    test::ManualClock clock;
    SettlementSignals signals;
};

//-------------------------------------------------------------------------

TEST_F(SettlementExecutorTest, CurrencyGoesToPayerAndIsJournaled)
{
    const auto record = verifiedRecord(
        "deal_1", AssetValue::currency(9_dec), AssetValue::item("sword", 12_dec));
    EXPECT_CALL(messenger, notify("chan-1", HasSubstr("completed"))).Times(1);

    const auto outcome = run(record);
    EXPECT_EQ(outcome.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(outcome.transferId, std::optional<TransferId>{"out-1"});

    const auto sent = ledger.submitted();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent.front().destination, "EQ-payer");
    EXPECT_EQ(sent.front().amount, 9_dec);
    EXPECT_EQ(sent.front().memo, "Deal #deal_1 - item sword");

    EXPECT_EQ(records.find("deal_1")->status, ExchangeStatus::COMPLETED);
    EXPECT_EQ(journal.size(), 1u);
}

TEST_F(SettlementExecutorTest, SecondRunIsAlreadyClaimed)
{
    const auto record = verifiedRecord(
        "deal_1", AssetValue::currency(9_dec), AssetValue::item("sword", 12_dec));

    EXPECT_EQ(run(record).status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(run(record).status, ExecutionStatus::ALREADY_CLAIMED);
    EXPECT_EQ(ledger.submitted().size(), 1u);
    EXPECT_EQ(journal.size(), 1u);
}

TEST_F(SettlementExecutorTest, ConcurrentRunsTransferOnce)
{
    static constexpr size_t kThreads = 2;

    const auto record = verifiedRecord(
        "deal_1", AssetValue::currency(9_dec), AssetValue::item("sword", 12_dec));

    std::latch start{kThreads};
    std::vector<ExecutionOutcome> outcomes(kThreads);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            start.arrive_and_wait();
            outcomes[i] = run(record);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto completed = ranges::count_if(outcomes, [](const ExecutionOutcome& outcome) {
        return outcome.status == ExecutionStatus::COMPLETED;
    });
    const auto claimed = ranges::count_if(outcomes, [](const ExecutionOutcome& outcome) {
        return outcome.status == ExecutionStatus::ALREADY_CLAIMED;
    });
    EXPECT_EQ(completed, 1);
    EXPECT_EQ(claimed, 1);
    EXPECT_EQ(ledger.submitted().size(), 1u);
    EXPECT_EQ(journal.size(), 1u);
}

TEST_F(SettlementExecutorTest, FailedTransferReleasesClaim)
{
    const auto record = verifiedRecord(
        "deal_1", AssetValue::currency(9_dec), AssetValue::item("sword", 12_dec));
    ledger.failNextTransfers("insufficient funds");
    EXPECT_CALL(messenger, notify("chan-1", HasSubstr("operator will follow up"))).Times(1);

    std::vector<SettlementEvent> failures;
    bs2::scoped_connection feed = signals.failed.connect(
        [&](const SettlementEvent& event) { failures.push_back(event); });

    const auto outcome = run(record);
    EXPECT_EQ(outcome.status, ExecutionStatus::FAILED);
    EXPECT_EQ(outcome.failureNote, std::optional<std::string>{"insufficient funds"});

    const auto failed = records.find("deal_1");
    EXPECT_EQ(failed->status, ExchangeStatus::FAILED);
    EXPECT_FALSE(failed->execution.claimedAt.has_value());
    EXPECT_EQ(journal.size(), 0u);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures.front().settlementId, "deal_1");
    EXPECT_EQ(failures.front().kind, "exchange");
}

TEST_F(SettlementExecutorTest, ThrowingLedgerIsTreatedAsFailure)
{
    const auto record = verifiedRecord(
        "deal_1", AssetValue::currency(9_dec), AssetValue::item("sword", 12_dec));
    NiceMock<test::MockLedger> brokenLedger;
    EXPECT_CALL(brokenLedger, submitTransfer)
        .WillOnce(Throw(std::runtime_error{"connection reset"}));

    SettlementExecutor executor{{
        .ledger = brokenLedger,
        .inventory = inventory,
        .messenger = messenger,
        .journal = journal,
        .clock = clock
    }};
    ExchangeSettlement settlement{records, record, config};
    const auto outcome = executor.run(settlement);

    EXPECT_EQ(outcome.status, ExecutionStatus::FAILED);
    EXPECT_THAT(outcome.failureNote.value_or(""), HasSubstr("connection reset"));
    EXPECT_EQ(records.find("deal_1")->status, ExchangeStatus::FAILED);
}

TEST_F(SettlementExecutorTest, ItemTransferPaysFeeOnce)
{
    const auto record = verifiedRecord(
        "deal_1", AssetValue::item("sword", 10_dec), AssetValue::currency(12_dec));
    const collaborators::PaymentRequired invoice{.invoiceId = "inv-1", .fee = DEC(0.05)};

    InSequence sequence;
    EXPECT_CALL(inventory, transferItem("sword", "bob"))
        .WillOnce(Return(collaborators::ItemTransferResult{invoice}));
    EXPECT_CALL(inventory, payTransferFee(Field(&collaborators::PaymentRequired::invoiceId, "inv-1")))
        .WillOnce(Return(test::FeeResult{}));
    EXPECT_CALL(inventory, transferItem("sword", "bob"))
        .WillOnce(Return(collaborators::ItemTransferResult{TransferId{"item-tx"}}));

    const auto outcome = run(record);
    EXPECT_EQ(outcome.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(outcome.transferId, std::optional<TransferId>{"item-tx"});
}

TEST_F(SettlementExecutorTest, RepeatedFeeDemandFails)
{
    const auto record = verifiedRecord(
        "deal_1", AssetValue::item("sword", 10_dec), AssetValue::currency(12_dec));
    const collaborators::PaymentRequired invoice{.invoiceId = "inv-1"};

    EXPECT_CALL(inventory, transferItem("sword", "bob"))
        .Times(2)
        .WillRepeatedly(Return(collaborators::ItemTransferResult{invoice}));
    EXPECT_CALL(inventory, payTransferFee).WillOnce(Return(test::FeeResult{}));

    const auto outcome = run(record);
    EXPECT_EQ(outcome.status, ExecutionStatus::FAILED);
    EXPECT_EQ(records.find("deal_1")->status, ExchangeStatus::FAILED);
}

TEST_F(SettlementExecutorTest, JournalFailureDoesNotUndoSettlement)
{
    const auto record = verifiedRecord(
        "deal_1", AssetValue::currency(9_dec), AssetValue::item("sword", 12_dec));
    test::MockJournal brokenJournal;
    EXPECT_CALL(brokenJournal, append).WillOnce(Throw(StoreError{"disk full"}));

    const auto outcome = run(record, brokenJournal);
    EXPECT_EQ(outcome.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(records.find("deal_1")->status, ExchangeStatus::COMPLETED);
}

TEST_F(SettlementExecutorTest, NotificationFailureIsNotFatal)
{
    const auto record = verifiedRecord(
        "deal_1", AssetValue::currency(9_dec), AssetValue::item("sword", 12_dec));
    EXPECT_CALL(messenger, notify).WillOnce(Throw(std::runtime_error{"chat offline"}));

    EXPECT_EQ(run(record).status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(journal.size(), 1u);
}

//-------------------------------------------------------------------------

TEST_F(SettlementExecutorTest, SettlementLoggerWritesCsv)
{
    const auto logPath = fs::temp_directory_path() / "dealcore-tests" / "settlements.csv";
    fs::remove(logPath);
    {
        SettlementLogger logger{logPath, signals};
        const auto completed = verifiedRecord(
            "deal_1", AssetValue::currency(9_dec), AssetValue::item("sword", 12_dec));
        static_cast<void>(run(completed));

        ledger.failNextTransfers("bad, \"quoted\" note");
        const auto failed = verifiedRecord(
            "deal_2", AssetValue::currency(9_dec), AssetValue::item("sword", 12_dec));
        static_cast<void>(run(failed));
    }

    std::ifstream file{logPath};
    std::vector<std::string> lines;
    for (std::string line; std::getline(file, line);) {
        lines.push_back(line);
    }
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], SettlementLogger::s_header);
    EXPECT_THAT(lines[1], EndsWith(",deal_1,exchange,COMPLETED,out-1,"));
    EXPECT_THAT(lines[2], EndsWith(",deal_2,exchange,FAILED,,\"bad, \"\"quoted\"\" note\""));
}

//-------------------------------------------------------------------------
