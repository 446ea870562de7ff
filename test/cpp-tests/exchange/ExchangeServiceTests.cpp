/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/exchange/ExchangeService.hpp"
#include "dealcore/store/Schema.hpp"
#include "ManualClock.hpp"
#include "Mocks.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace dealcore;
using namespace dealcore::asset;
using namespace dealcore::exchange;
using namespace dealcore::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

constexpr Timestamp kStart = 1'700'000'000;

[[nodiscard]] ExchangeConfig makeConfig(bool autoExecute)
{
    ExchangeConfig config;
    config.agentAddress = "EQ-agent";
    config.agentAccountId = "agent-account";
    config.autoExecute = autoExecute;
    return config;
}

}  // namespace

//-------------------------------------------------------------------------

struct ExchangeServiceTest : TestWithParam<bool>
{
    virtual void SetUp() override
    {
        store::applySchema(db);
        ON_CALL(messenger, deliverProposalCard).WillByDefault(Return(true));
        service = std::make_unique<ExchangeService>(ExchangeServiceDesc{
            .config = makeConfig(GetParam()),
            .records = records,
            .verifier = verifier,
            .executor = executor,
            .messenger = messenger,
            .clock = clock
        });
    }

    // Agent sells `item` worth `value` for `price` currency.
    [[nodiscard]] ExchangeRecord proposeSale(
        std::string item = "sword", decimal_t value = 10_dec, decimal_t price = 12_dec)
    {
        auto record = service->propose({
            .initiatorChannel = "chan-1",
            .counterpartyId = "bob",
            .counterpartyAddress = "EQ-bob",
            .offered = AssetValue::item(std::move(item), value),
            .requested = AssetValue::currency(price)
        });
        EXPECT_TRUE(record.has_value());
        return record.value();
    }

    void pay(const RecordId& id, decimal_t amount, Timestamp at)
    {
        ledger.receive(
            {.id = "tx-" + id, .amount = amount, .sender = "EQ-bob", .memo = id, .timestamp = at},
            "EQ-agent");
    }

    store::Database db;
    ExchangeRecordStore records{db};
    verification::ReplayLedger replayLedger{db};
    journal::SqliteJournal journal{db};
    test::FakeLedger ledger;
    NiceMock<test::MockInventory> inventory;
    NiceMock<test::MockMessenger> messenger;
    test::ManualClock clock{kStart};
    verification::TransferVerifier verifier{
        replayLedger, ledger, inventory, clock, verification::VerifierConfig{}};
    settlement::SettlementExecutor executor{settlement::SettlementExecutorDesc{
        .ledger = ledger,
        .inventory = inventory,
        .messenger = messenger,
        .journal = journal,
        .clock = clock
    }};
    std::unique_ptr<ExchangeService> service;
};

//-------------------------------------------------------------------------

TEST_P(ExchangeServiceTest, ProposalFailingComplianceIsNotRecorded)
{
    const auto record = service->propose({
        .initiatorChannel = "chan-1",
        .counterpartyId = "bob",
        .offered = AssetValue::currency(10_dec),
        .requested = AssetValue::item("sword", 12_dec)
    });
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, ErrorCode::POLICY_VIOLATION);
    EXPECT_THAT(record.error().message, HasSubstr("BUYING"));
    EXPECT_TRUE(service->list().empty());
}

TEST_P(ExchangeServiceTest, ProposalIsRecordedWithExpiry)
{
    EXPECT_CALL(messenger, deliverProposalCard("chan-1", _)).WillOnce(Return(true));

    const auto record = proposeSale();
    EXPECT_EQ(record.status, ExchangeStatus::PROPOSED);
    EXPECT_THAT(record.id, StartsWith("deal_"));
    EXPECT_EQ(record.createdAt, kStart);
    EXPECT_EQ(record.expiresAt, kStart + 120);
    EXPECT_TRUE(record.complianceResult.acceptable);
    EXPECT_EQ(record.complianceResult.profit, 2_dec);
}

TEST_P(ExchangeServiceTest, UndeliveredCardFallsBackToNotification)
{
    EXPECT_CALL(messenger, deliverProposalCard).WillOnce(Return(false));
    EXPECT_CALL(messenger, notify("chan-1", HasSubstr("Reply to accept"))).Times(1);

    static_cast<void>(proposeSale());
}

TEST_P(ExchangeServiceTest, VerificationAfterExpiryExpiresRecord)
{
    const auto record = proposeSale();
    ASSERT_TRUE(service->accept(record.id).has_value());
    pay(record.id, 12_dec, kStart + 10);

    clock.set(kStart + 121);
    const auto outcome = service->verify(record.id);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::EXPIRED);
    EXPECT_EQ(service->find(record.id)->status, ExchangeStatus::EXPIRED);
    EXPECT_FALSE(replayLedger.find("tx-" + record.id).has_value());

    // Expiry is final.
    const auto again = service->verify(record.id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::EXPIRED);
}

TEST_P(ExchangeServiceTest, ExpiryDuringVerificationExpiresRecord)
{
    const auto record = proposeSale();
    ASSERT_TRUE(service->accept(record.id).has_value());
    pay(record.id, 12_dec, kStart + 10);

    clock.set(record.expiresAt);
    ledger.onQuery([this, expiresAt = record.expiresAt] { clock.set(expiresAt + 1); });

    const auto outcome = service->verify(record.id);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::EXPIRED);
    EXPECT_EQ(service->find(record.id)->status, ExchangeStatus::EXPIRED);
    EXPECT_TRUE(ledger.submitted().empty());
}

TEST_P(ExchangeServiceTest, AcceptAtExpiryBoundaryIsAllowed)
{
    const auto record = proposeSale();
    clock.set(record.expiresAt);
    EXPECT_TRUE(service->accept(record.id).has_value());

    clock.advance(1);
    const auto late = service->verify(record.id);
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().code, ErrorCode::EXPIRED);
    EXPECT_EQ(service->find(record.id)->status, ExchangeStatus::EXPIRED);
}

TEST_P(ExchangeServiceTest, VerificationWithoutPaymentIsRetryable)
{
    const auto record = proposeSale();
    ASSERT_TRUE(service->accept(record.id).has_value());

    const auto outcome = service->verify(record.id);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::NOT_YET_VERIFIED);
    EXPECT_EQ(service->find(record.id)->status, ExchangeStatus::ACCEPTED);
}

TEST_P(ExchangeServiceTest, VerificationRequiresAcceptance)
{
    const auto record = proposeSale();
    pay(record.id, 12_dec, kStart + 10);

    const auto outcome = service->verify(record.id);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::INVALID_STATE);
}

TEST_P(ExchangeServiceTest, SaleSettlesThroughInventory)
{
    const bool autoExecute = GetParam();
    EXPECT_CALL(inventory, transferItem("sword", "bob"))
        .WillOnce(Return(collaborators::ItemTransferResult{TransferId{"item-tx-1"}}));

    const auto record = proposeSale();
    ASSERT_TRUE(service->accept(record.id).has_value());
    pay(record.id, 12_dec, kStart + 10);
    clock.advance(20);

    EXPECT_FALSE(service->hasVerifiedItemSale("bob", "sword"));
    const auto outcome = service->verify(record.id);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->match.transferId, "tx-" + record.id);

    if (!autoExecute) {
        EXPECT_EQ(outcome->record.status, ExchangeStatus::VERIFIED);
        EXPECT_TRUE(service->hasVerifiedItemSale("bob", "sword"));
        const auto execution = service->execute(record.id);
        ASSERT_TRUE(execution.has_value());
        EXPECT_EQ(execution->status, settlement::ExecutionStatus::COMPLETED);
    } else {
        ASSERT_TRUE(outcome->execution.has_value());
        EXPECT_EQ(outcome->execution->status, settlement::ExecutionStatus::COMPLETED);
    }

    const auto settled = service->find(record.id);
    EXPECT_EQ(settled->status, ExchangeStatus::COMPLETED);
    EXPECT_EQ(settled->execution.externalTransferId, std::optional<TransferId>{"item-tx-1"});
    EXPECT_EQ(journal.size(), 1u);
    EXPECT_FALSE(service->hasVerifiedItemSale("bob", "sword"));

    // A second execution is a no-op.
    const auto repeat = service->execute(record.id);
    ASSERT_TRUE(repeat.has_value());
    EXPECT_EQ(repeat->status, settlement::ExecutionStatus::ALREADY_CLAIMED);
}

TEST_P(ExchangeServiceTest, PurchasePaysCounterpartyAddress)
{
    ON_CALL(inventory, listRecentlyReceivedItems("agent-account"))
        .WillByDefault(Return(std::vector<collaborators::ReceivedItem>{
            {.itemId = "i-9", .itemRef = "shield", .senderId = "bob", .receivedAt = kStart + 5}
        }));

    const auto record = service->propose({
        .initiatorChannel = "chan-1",
        .counterpartyId = "bob",
        .counterpartyAddress = "EQ-bob",
        .offered = AssetValue::currency(8_dec),
        .requested = AssetValue::item("shield", 12_dec)
    });
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(service->accept(record->id).has_value());
    ASSERT_TRUE(service->verify(record->id).has_value());
    if (!GetParam()) {
        ASSERT_TRUE(service->execute(record->id).has_value());
    }

    const auto sent = ledger.submitted();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent.front().destination, "EQ-bob");
    EXPECT_EQ(sent.front().amount, 8_dec);
    EXPECT_THAT(sent.front().memo, HasSubstr(record->id));
    EXPECT_EQ(service->find(record->id)->status, ExchangeStatus::COMPLETED);
}

TEST_P(ExchangeServiceTest, CancelOnlyOpenRecords)
{
    const auto record = proposeSale();
    ASSERT_TRUE(service->accept(record.id).has_value());
    EXPECT_CALL(messenger, notify("chan-1", HasSubstr("cancelled"))).Times(1);

    const auto cancelled = service->cancel(record.id, "buyer vanished");
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(cancelled->status, ExchangeStatus::CANCELLED);
    EXPECT_THAT(cancelled->notes.value_or(""), HasSubstr(cancellationNote("buyer vanished")));

    const auto again = service->cancel(record.id, "twice");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::INVALID_STATE);
}

TEST_P(ExchangeServiceTest, DeclinedProposalCannotBeAccepted)
{
    const auto record = proposeSale();

    const auto declined = service->decline(record.id);
    ASSERT_TRUE(declined.has_value());
    EXPECT_EQ(declined->status, ExchangeStatus::DECLINED);

    const auto accepted = service->accept(record.id);
    ASSERT_FALSE(accepted.has_value());
    EXPECT_EQ(accepted.error().code, ErrorCode::INVALID_STATE);
}

TEST_P(ExchangeServiceTest, UnknownRecordIsReported)
{
    const auto outcome = service->execute("deal_missing");
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::RECORD_NOT_FOUND);
}

TEST_P(ExchangeServiceTest, ExpireStaleSweepsOpenRecords)
{
    const auto first = proposeSale("a");
    const auto second = proposeSale("b");
    ASSERT_TRUE(service->accept(second.id).has_value());

    clock.advance(121);
    const auto third = proposeSale("c");

    EXPECT_EQ(service->expireStale(), 2u);
    EXPECT_EQ(service->find(first.id)->status, ExchangeStatus::EXPIRED);
    EXPECT_EQ(service->find(second.id)->status, ExchangeStatus::EXPIRED);
    EXPECT_EQ(service->find(third.id)->status, ExchangeStatus::PROPOSED);
}

INSTANTIATE_TEST_SUITE_P(AutoExecute, ExchangeServiceTest, Bool());

//-------------------------------------------------------------------------
