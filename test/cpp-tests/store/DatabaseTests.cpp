/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/journal/Journal.hpp"
#include "dealcore/store/Database.hpp"
#include "dealcore/store/Schema.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace dealcore;
using namespace dealcore::store;
using namespace dealcore::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct DatabaseTest : Test
{
    virtual void SetUp() override
    {
        applySchema(db);
    }

    Database db;
};

//-------------------------------------------------------------------------

TEST_F(DatabaseTest, SchemaIsIdempotent)
{
    EXPECT_NO_THROW(applySchema(db));
    const auto version = db.queryOne("PRAGMA user_version");
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(version->integer("user_version"), kSchemaVersion);
}

TEST_F(DatabaseTest, DecimalsRoundTripThroughText)
{
    db.exec("CREATE TABLE amounts (v TEXT)");
    const auto amount = DEC(0.123456789);
    db.execute("INSERT INTO amounts (v) VALUES (?)", {decimal(amount)});

    const auto row = db.queryOne("SELECT v FROM amounts");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->decimal("v"), amount);
}

TEST_F(DatabaseTest, NullableColumns)
{
    db.exec("CREATE TABLE t (a TEXT, b INTEGER)");
    db.execute(
        "INSERT INTO t (a, b) VALUES (?, ?)",
        {nullable(std::optional<std::string>{}), nullable(std::optional<Timestamp>{42})});

    const auto row = db.queryOne("SELECT a, b FROM t");
    ASSERT_TRUE(row.has_value());
    EXPECT_TRUE(row->isNull("a"));
    EXPECT_FALSE(row->optText("a").has_value());
    EXPECT_EQ(row->optTimestamp("b"), std::optional<Timestamp>{42});
    EXPECT_THROW(static_cast<void>(row->text("missing")), StoreError);
}

TEST_F(DatabaseTest, ExecuteReportsChangedRows)
{
    db.exec("CREATE TABLE t (id INTEGER PRIMARY KEY, v INTEGER)");
    db.execute("INSERT INTO t (id, v) VALUES (1, 0), (2, 0), (3, 5)");

    EXPECT_EQ(db.execute("UPDATE t SET v = 1 WHERE v = 0"), 2);
    EXPECT_EQ(db.execute("UPDATE t SET v = 1 WHERE v = 0"), 0);
}

TEST_F(DatabaseTest, InsertUniqueDetectsDuplicates)
{
    db.exec("CREATE TABLE t (id TEXT PRIMARY KEY, v TEXT NOT NULL)");

    EXPECT_TRUE(db.insertUnique("INSERT INTO t (id, v) VALUES (?, ?)", {text("a"), text("x")}));
    EXPECT_FALSE(db.insertUnique("INSERT INTO t (id, v) VALUES (?, ?)", {text("a"), text("y")}));
    // Other constraint failures are errors, not duplicates.
    EXPECT_THROW(
        static_cast<void>(
            db.insertUnique("INSERT INTO t (id, v) VALUES (?, ?)", {text("b"), nullptr})),
        StoreError);
}

TEST_F(DatabaseTest, ConsumedTransfersAreAppendOnly)
{
    db.execute(
        "INSERT INTO consumed_transfers (transfer_id, claimant_id, purpose_tag, used_at) "
        "VALUES ('tx', 'deal_1', 'exchange', 1)");

    EXPECT_THROW(db.execute("UPDATE consumed_transfers SET claimant_id = 'x'"), StoreError);
    EXPECT_THROW(db.execute("DELETE FROM consumed_transfers"), StoreError);
}

TEST_F(DatabaseTest, JournalIsAppendOnly)
{
    journal::SqliteJournal journal{db};
    journal.append({
        .kind = journal::EntryKind::TRADE,
        .action = "swap_currency",
        .pnl = 1_dec,
        .createdAt = 10,
        .closedAt = 20
    });
    EXPECT_EQ(journal.size(), 1u);

    EXPECT_THROW(db.execute("UPDATE journal_entries SET action = 'x'"), StoreError);
    EXPECT_THROW(db.execute("DELETE FROM journal_entries"), StoreError);
}

TEST_F(DatabaseTest, JournalRejectsEntriesClosedBeforeCreation)
{
    journal::SqliteJournal journal{db};
    EXPECT_THROW(
        journal.append({
            .kind = journal::EntryKind::WAGER,
            .action = "wager_loss",
            .createdAt = 20,
            .closedAt = 10
        }),
        std::invalid_argument);
    EXPECT_EQ(journal.size(), 0u);
}

//-------------------------------------------------------------------------
