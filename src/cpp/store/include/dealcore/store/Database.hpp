/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "StoreError.hpp"
#include "common.hpp"

#include <concepts>
#include <mutex>

//-------------------------------------------------------------------------

struct sqlite3;
struct sqlite3_stmt;

//-------------------------------------------------------------------------

namespace dealcore::store
{

//-------------------------------------------------------------------------

using Value = std::variant<std::nullptr_t, int64_t, double, std::string>;
using Params = std::vector<Value>;

[[nodiscard]] inline Value text(std::string_view str) { return std::string{str}; }
[[nodiscard]] inline Value integer(uint64_t val) { return static_cast<int64_t>(val); }
[[nodiscard]] inline Value decimal(decimal_t val) { return util::decimal2str(val); }

template<typename T>
[[nodiscard]] Value nullable(const std::optional<T>& opt)
{
    if (!opt.has_value()) return nullptr;
    if constexpr (std::same_as<T, decimal_t>) {
        return decimal(*opt);
    } else if constexpr (std::integral<T>) {
        return static_cast<int64_t>(*opt);
    } else {
        return std::string{*opt};
    }
}

//-------------------------------------------------------------------------

class Row
{
public:
    Row(std::shared_ptr<const std::vector<std::string>> columns, std::vector<Value> values) noexcept;

    [[nodiscard]] bool isNull(std::string_view column) const;

    [[nodiscard]] std::string text(std::string_view column) const;
    [[nodiscard]] std::optional<std::string> optText(std::string_view column) const;
    [[nodiscard]] int64_t integer(std::string_view column) const;
    [[nodiscard]] std::optional<int64_t> optInteger(std::string_view column) const;
    [[nodiscard]] decimal_t decimal(std::string_view column) const;
    [[nodiscard]] std::optional<decimal_t> optDecimal(std::string_view column) const;

    [[nodiscard]] Timestamp timestamp(std::string_view column) const
    {
        return static_cast<Timestamp>(integer(column));
    }

    [[nodiscard]] std::optional<Timestamp> optTimestamp(std::string_view column) const;

private:
    [[nodiscard]] const Value& at(std::string_view column) const;

    std::shared_ptr<const std::vector<std::string>> m_columns;
    std::vector<Value> m_values;
};

//-------------------------------------------------------------------------

/**
 * Owning handle to a SQLite connection.
 *
 * Statements on one handle are serialized, so the affected-row count returned
 * by `execute` always belongs to the statement that was just stepped. Every
 * conditional transition in the core relies on that count.
 */
class Database
{
public:
    static constexpr std::string_view kInMemory = ":memory:";

    explicit Database(const fs::path& path = fs::path{kInMemory});
    ~Database() noexcept;

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void exec(const std::string& script);

    // Returns the number of rows changed.
    int64_t execute(std::string_view sql, const Params& params = {});

    // False iff the insert hit a PRIMARY KEY or UNIQUE constraint.
    [[nodiscard]] bool insertUnique(std::string_view sql, const Params& params);

    [[nodiscard]] std::vector<Row> query(std::string_view sql, const Params& params = {}) const;
    [[nodiscard]] std::optional<Row> queryOne(std::string_view sql, const Params& params = {}) const;

    [[nodiscard]] const fs::path& path() const noexcept { return m_path; }

private:
    class Statement;

    [[nodiscard]] std::string lastError() const;

    fs::path m_path;
    sqlite3* m_db{};
    mutable std::mutex m_mutex;
};

//-------------------------------------------------------------------------

}  // namespace dealcore::store

//-------------------------------------------------------------------------
