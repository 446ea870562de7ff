/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/journal/JournalEntry.hpp"
#include "dealcore/store/Database.hpp"

//-------------------------------------------------------------------------

namespace dealcore::journal
{

//-------------------------------------------------------------------------

class Journal
{
public:
    virtual ~Journal() noexcept = default;

    virtual void append(const JournalEntry& entry) = 0;
};

//-------------------------------------------------------------------------

class SqliteJournal : public Journal
{
public:
    explicit SqliteJournal(store::Database& db) noexcept;

    virtual void append(const JournalEntry& entry) override;

    [[nodiscard]] size_t size() const;

private:
    store::Database& m_db;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::journal

//-------------------------------------------------------------------------
