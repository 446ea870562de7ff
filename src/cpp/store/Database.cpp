/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/store/Database.hpp"

#include <sqlite3.h>

//-------------------------------------------------------------------------

namespace dealcore::store
{

//-------------------------------------------------------------------------

Row::Row(std::shared_ptr<const std::vector<std::string>> columns, std::vector<Value> values) noexcept
    : m_columns{std::move(columns)},
      m_values{std::move(values)}
{}

//-------------------------------------------------------------------------

const Value& Row::at(std::string_view column) const
{
    const auto it = ranges::find(*m_columns, column);
    if (it == m_columns->end()) {
        throw StoreError{fmt::format(
            "{}: No column '{}' in result row",
            std::source_location::current().function_name(), column)};
    }
    return m_values.at(static_cast<size_t>(std::distance(m_columns->begin(), it)));
}

//-------------------------------------------------------------------------

bool Row::isNull(std::string_view column) const
{
    return std::holds_alternative<std::nullptr_t>(at(column));
}

//-------------------------------------------------------------------------

std::string Row::text(std::string_view column) const
{
    const auto& value = at(column);
    if (const auto str = std::get_if<std::string>(&value)) return *str;
    if (const auto num = std::get_if<int64_t>(&value)) return std::to_string(*num);
    throw StoreError{fmt::format(
        "{}: Column '{}' is not text", std::source_location::current().function_name(), column)};
}

//-------------------------------------------------------------------------

std::optional<std::string> Row::optText(std::string_view column) const
{
    if (isNull(column)) return {};
    return text(column);
}

//-------------------------------------------------------------------------

int64_t Row::integer(std::string_view column) const
{
    const auto& value = at(column);
    if (const auto num = std::get_if<int64_t>(&value)) return *num;
    throw StoreError{fmt::format(
        "{}: Column '{}' is not an integer",
        std::source_location::current().function_name(), column)};
}

//-------------------------------------------------------------------------

std::optional<int64_t> Row::optInteger(std::string_view column) const
{
    if (isNull(column)) return {};
    return integer(column);
}

//-------------------------------------------------------------------------

decimal_t Row::decimal(std::string_view column) const
{
    return util::str2decimal(text(column));
}

//-------------------------------------------------------------------------

std::optional<decimal_t> Row::optDecimal(std::string_view column) const
{
    if (isNull(column)) return {};
    return decimal(column);
}

//-------------------------------------------------------------------------

std::optional<Timestamp> Row::optTimestamp(std::string_view column) const
{
    if (isNull(column)) return {};
    return timestamp(column);
}

//-------------------------------------------------------------------------

class Database::Statement
{
public:
    Statement(sqlite3* db, std::string_view sql)
        : m_db{db}
    {
        if (sqlite3_prepare_v2(
                m_db, sql.data(), static_cast<int>(sql.size()), &m_stmt, nullptr) != SQLITE_OK) {
            throw StoreError{fmt::format(
                "{}: Cannot prepare '{}': {}",
                std::source_location::current().function_name(), sql, sqlite3_errmsg(m_db))};
        }
    }

    ~Statement() noexcept { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(const Params& params)
    {
        for (int idx = 1; const auto& param : params) {
            const int rc = std::visit(
                [&](const auto& val) {
                    using T = std::decay_t<decltype(val)>;
                    if constexpr (std::same_as<T, std::nullptr_t>) {
                        return sqlite3_bind_null(m_stmt, idx);
                    } else if constexpr (std::same_as<T, int64_t>) {
                        return sqlite3_bind_int64(m_stmt, idx, val);
                    } else if constexpr (std::same_as<T, double>) {
                        return sqlite3_bind_double(m_stmt, idx, val);
                    } else {
                        return sqlite3_bind_text(
                            m_stmt, idx, val.data(), static_cast<int>(val.size()), SQLITE_TRANSIENT);
                    }
                },
                param);
            if (rc != SQLITE_OK) {
                throw StoreError{fmt::format(
                    "{}: Cannot bind parameter #{}: {}",
                    std::source_location::current().function_name(), idx, sqlite3_errmsg(m_db))};
            }
            ++idx;
        }
    }

    [[nodiscard]] int step() noexcept { return sqlite3_step(m_stmt); }

    [[nodiscard]] std::shared_ptr<const std::vector<std::string>> columns() const
    {
        auto names = std::make_shared<std::vector<std::string>>();
        const int count = sqlite3_column_count(m_stmt);
        for (int col = 0; col < count; ++col) {
            names->emplace_back(sqlite3_column_name(m_stmt, col));
        }
        return names;
    }

    [[nodiscard]] std::vector<Value> values() const
    {
        std::vector<Value> values;
        const int count = sqlite3_column_count(m_stmt);
        values.reserve(static_cast<size_t>(count));
        for (int col = 0; col < count; ++col) {
            switch (sqlite3_column_type(m_stmt, col)) {
                case SQLITE_NULL:
                    values.emplace_back(nullptr);
                    break;
                case SQLITE_INTEGER:
                    values.emplace_back(static_cast<int64_t>(sqlite3_column_int64(m_stmt, col)));
                    break;
                case SQLITE_FLOAT:
                    values.emplace_back(sqlite3_column_double(m_stmt, col));
                    break;
                default:
                    values.emplace_back(std::string{
                        reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col)),
                        static_cast<size_t>(sqlite3_column_bytes(m_stmt, col))});
                    break;
            }
        }
        return values;
    }

private:
    sqlite3* m_db;
    sqlite3_stmt* m_stmt{};
};

//-------------------------------------------------------------------------

Database::Database(const fs::path& path)
    : m_path{path}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(m_path.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
        const std::string message = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        throw StoreError{fmt::format("{}: Cannot open '{}': {}", ctx, m_path.c_str(), message)};
    }
    sqlite3_extended_result_codes(m_db, 1);
    sqlite3_busy_timeout(m_db, 5000);

    exec(
        "PRAGMA journal_mode = WAL;"
        "PRAGMA synchronous = NORMAL;"
        "PRAGMA foreign_keys = ON;");
}

//-------------------------------------------------------------------------

Database::~Database() noexcept
{
    sqlite3_close(m_db);
}

//-------------------------------------------------------------------------

std::string Database::lastError() const
{
    return sqlite3_errmsg(m_db);
}

//-------------------------------------------------------------------------

void Database::exec(const std::string& script)
{
    std::lock_guard lock{m_mutex};
    char* errmsg{};
    if (sqlite3_exec(m_db, script.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        const std::string message = errmsg ? errmsg : lastError();
        sqlite3_free(errmsg);
        throw StoreError{fmt::format(
            "{}: {}", std::source_location::current().function_name(), message)};
    }
}

//-------------------------------------------------------------------------

int64_t Database::execute(std::string_view sql, const Params& params)
{
    std::lock_guard lock{m_mutex};
    Statement stmt{m_db, sql};
    stmt.bind(params);
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {}
    if (rc != SQLITE_DONE) {
        throw StoreError{fmt::format(
            "{}: Executing '{}' failed: {}",
            std::source_location::current().function_name(), sql, lastError())};
    }
    return sqlite3_changes64(m_db);
}

//-------------------------------------------------------------------------

bool Database::insertUnique(std::string_view sql, const Params& params)
{
    std::lock_guard lock{m_mutex};
    Statement stmt{m_db, sql};
    stmt.bind(params);
    const int rc = stmt.step();
    if (rc == SQLITE_DONE) return true;
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        const int extended = sqlite3_extended_errcode(m_db);
        if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
            return false;
        }
    }
    throw StoreError{fmt::format(
        "{}: Executing '{}' failed: {}",
        std::source_location::current().function_name(), sql, lastError())};
}

//-------------------------------------------------------------------------

std::vector<Row> Database::query(std::string_view sql, const Params& params) const
{
    std::lock_guard lock{m_mutex};
    Statement stmt{m_db, sql};
    stmt.bind(params);
    const auto columns = stmt.columns();
    std::vector<Row> rows;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        rows.emplace_back(columns, stmt.values());
    }
    if (rc != SQLITE_DONE) {
        throw StoreError{fmt::format(
            "{}: Query '{}' failed: {}",
            std::source_location::current().function_name(), sql, lastError())};
    }
    return rows;
}

//-------------------------------------------------------------------------

std::optional<Row> Database::queryOne(std::string_view sql, const Params& params) const
{
    auto rows = query(sql, params);
    if (rows.empty()) return {};
    return std::move(rows.front());
}

//-------------------------------------------------------------------------

}  // namespace dealcore::store

//-------------------------------------------------------------------------
