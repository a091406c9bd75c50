/**
 * @file sqlite_connection.hpp
 * @brief RAII wrappers for a SQLite connection and prepared statement
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sqlite3.h>

#include "log_types.hpp"

namespace sluice
{

inline constexpr int SQLITE_BUSY_TIMEOUT_MS = 5000; // Writers from several pooled connections wait this long for the lock

/// A SQLite call failed
class sqlite_error : public std::runtime_error
{
  public:
    sqlite_error(const std::string &what, int code) : std::runtime_error(what), code_(code) {}

    int code() const { return code_; }

  private:
    int code_;
};

class sqlite_connection;

/**
 * @brief Prepared statement bound to one connection
 *
 * Bind indices are 1-based, as in the SQLite API.
 */
class sqlite_statement
{
  public:
    sqlite_statement(sqlite_connection &conn, std::string_view sql);

    sqlite_statement &bind(int index, int64_t value);
    sqlite_statement &bind(int index, std::string_view value);
    sqlite_statement &bind(int index, const std::string &value) { return bind(index, std::string_view(value)); }
    sqlite_statement &bind(int index, const std::optional<std::string> &value);
    sqlite_statement &bind_null(int index);

    /// Run to completion, discarding any rows
    void execute();

    /// Step once; true while a row is available
    bool step();

    int64_t column_int64(int col) const { return sqlite3_column_int64(stmt_.get(), col); }

    std::optional<std::string> column_text(int col) const
    {
        auto text = sqlite3_column_text(stmt_.get(), col);
        if (!text) return std::nullopt;
        return std::string(reinterpret_cast<const char *>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), col)));
    }

  private:
    void check_bind(int result, int index);

    sqlite_connection &conn_;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt_;
};

/**
 * @brief One open database handle
 *
 * A connection becomes unusable after an error that leaves the handle in a
 * doubtful state (I/O error, corruption, misuse); the pool discards such
 * connections instead of handing them out again.
 */
class sqlite_connection
{
  public:
    /**
     * @param path Database file, or ":memory:"
     * @param flags sqlite3_open_v2 flags
     * @throws sqlite_error when the database cannot be opened
     */
    explicit sqlite_connection(const std::string &path, int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)
        : db_(nullptr, sqlite3_close), path_(path)
    {
        sqlite3 *raw_db = nullptr;
        int result      = sqlite3_open_v2(path.c_str(), &raw_db, flags | SQLITE_OPEN_NOMUTEX, nullptr);
        db_.reset(raw_db);

        if (result != SQLITE_OK)
        {
            std::string error_msg = "Can't open database " + path + ": ";
            error_msg += raw_db ? sqlite3_errmsg(raw_db) : "Unknown error";
            throw sqlite_error(error_msg, result);
        }

        sqlite3_busy_timeout(db_.get(), SQLITE_BUSY_TIMEOUT_MS);
        valid_.store(true);
    }

    sqlite_connection(const sqlite_connection &)            = delete;
    sqlite_connection &operator=(const sqlite_connection &) = delete;

    /// Execute one or more statements without results
    void execute(const std::string &sql)
    {
        char *err_msg = nullptr;
        int result    = sqlite3_exec(get(), sql.c_str(), nullptr, nullptr, &err_msg);
        if (result != SQLITE_OK)
        {
            std::string error = "SQL Error: ";
            if (err_msg)
            {
                error += err_msg;
                sqlite3_free(err_msg);
            }
            else { error += "Unknown error"; }
            note_error(result);
            throw sqlite_error(error, result);
        }
    }

    sqlite_statement prepare(std::string_view sql) { return sqlite_statement(*this, sql); }

    sqlite3 *get()
    {
        if (!db_) { throw sqlite_error("Attempted to use a closed database connection", SQLITE_MISUSE); }
        return db_.get();
    }

    bool is_usable() const { return db_ != nullptr && valid_.load(); }

    /// Mark the connection as unusable so the pool discards it on return
    void invalidate() { valid_.store(false); }

    /**
     * @brief Round trip that reads the database header
     *
     * A failure that compromises the handle invalidates it; a busy or locked
     * database does not.
     * @return is_usable() after the check
     */
    bool ping() noexcept
    {
        if (!is_usable()) return false;

        int result = sqlite3_exec(db_.get(), "PRAGMA schema_version", nullptr, nullptr, nullptr);
        if (result != SQLITE_OK) { note_error(result); }
        return is_usable();
    }

    /// Record a failed result; errors that compromise the handle invalidate it
    void note_error(int result)
    {
        switch (result & 0xff)
        {
        case SQLITE_IOERR:
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
        case SQLITE_CANTOPEN:
        case SQLITE_MISUSE:
            valid_.store(false);
            break;
        default:
            break;
        }
    }

    std::string last_error() { return db_ ? sqlite3_errmsg(db_.get()) : "connection closed"; }

    const std::string &path() const { return path_; }

  private:
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db_;
    std::string path_;
    std::atomic<bool> valid_{false};
};

inline sqlite_statement::sqlite_statement(sqlite_connection &conn, std::string_view sql)
    : conn_(conn), stmt_(nullptr, sqlite3_finalize)
{
    sqlite3_stmt *raw_stmt = nullptr;
    int result             = sqlite3_prepare_v2(conn.get(), sql.data(), static_cast<int>(sql.size()), &raw_stmt, nullptr);
    stmt_.reset(raw_stmt);

    if (result != SQLITE_OK)
    {
        conn_.note_error(result);
        throw sqlite_error("Failed to prepare SQL statement: " + conn_.last_error(), result);
    }
}

inline void sqlite_statement::check_bind(int result, int index)
{
    if (result != SQLITE_OK)
    {
        throw sqlite_error(fmt::format("Failed to bind parameter {}: {}", index, conn_.last_error()), result);
    }
}

inline sqlite_statement &sqlite_statement::bind(int index, int64_t value)
{
    check_bind(sqlite3_bind_int64(stmt_.get(), index, value), index);
    return *this;
}

inline sqlite_statement &sqlite_statement::bind(int index, std::string_view value)
{
    // SQLITE_TRANSIENT makes SQLite copy the data
    check_bind(sqlite3_bind_text(stmt_.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT), index);
    return *this;
}

inline sqlite_statement &sqlite_statement::bind(int index, const std::optional<std::string> &value)
{
    if (!value) return bind_null(index);
    return bind(index, std::string_view(*value));
}

inline sqlite_statement &sqlite_statement::bind_null(int index)
{
    check_bind(sqlite3_bind_null(stmt_.get(), index), index);
    return *this;
}

inline bool sqlite_statement::step()
{
    int result = sqlite3_step(stmt_.get());
    if (result == SQLITE_ROW) return true;
    if (result == SQLITE_DONE) return false;

    conn_.note_error(result);
    throw sqlite_error("Failed to execute statement: " + conn_.last_error(), result);
}

inline void sqlite_statement::execute()
{
    while (step()) {}
}

} // namespace sluice
