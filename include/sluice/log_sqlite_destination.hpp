/**
 * @file log_sqlite_destination.hpp
 * @brief Destination storing entries as rows of an embedded SQLite database
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Table layout:
 * @code
 * LogEntries(Id INTEGER PRIMARY KEY AUTOINCREMENT, TimestampUtc TEXT, LogLevel TEXT,
 *            CategoryName TEXT, EventId INTEGER, EventName TEXT, Message TEXT,
 *            MessageTemplate TEXT, Properties TEXT, ScopeProperties TEXT,
 *            Exception TEXT, CreatedAt DATETIME DEFAULT CURRENT_TIMESTAMP)
 * @endcode
 * TimestampUtc holds ISO-8601 with 7 fractional digits, LogLevel the level
 * name ("Information"), Properties and ScopeProperties a JSON object or NULL
 * when empty, Exception the exception text or NULL.
 */
#pragma once

#include <optional>
#include <string>

#include "log_destination.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"
#include "sqlite_connection_pool.hpp"

namespace sluice
{

struct sqlite_options
{
    std::string path;              ///< Database file; parent directories are created
    size_t pool_size       = DEFAULT_POOL_SIZE;
    bool create_if_missing = true; ///< Create the table and indexes on construction
};

inline constexpr const char *LOG_ENTRIES_SCHEMA = R"sql(
CREATE TABLE IF NOT EXISTS LogEntries (
    Id INTEGER PRIMARY KEY AUTOINCREMENT,
    TimestampUtc TEXT NOT NULL,
    LogLevel TEXT NOT NULL,
    CategoryName TEXT NOT NULL,
    EventId INTEGER NOT NULL,
    EventName TEXT,
    Message TEXT NOT NULL,
    MessageTemplate TEXT,
    Properties TEXT,
    ScopeProperties TEXT,
    Exception TEXT,
    CreatedAt DATETIME DEFAULT CURRENT_TIMESTAMP
);
CREATE INDEX IF NOT EXISTS IX_LogEntries_TimestampUtc ON LogEntries (TimestampUtc);
CREATE INDEX IF NOT EXISTS IX_LogEntries_LogLevel ON LogEntries (LogLevel);
CREATE INDEX IF NOT EXISTS IX_LogEntries_CategoryName ON LogEntries (CategoryName);
)sql";

inline constexpr const char *LOG_ENTRIES_INSERT =
    "INSERT INTO LogEntries (TimestampUtc, LogLevel, CategoryName, EventId, EventName, Message, "
    "MessageTemplate, Properties, ScopeProperties, Exception) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

class sqlite_destination : public buffered_destination
{
  public:
    /**
     * @throws config_error for an invalid path or pool size
     * @throws sink_init_error when the database or its schema cannot be created
     */
    sqlite_destination(destination_options options, const sqlite_options &db)
        : buffered_destination(options), pool_(checked_path(db.path), db.pool_size)
    {
        if (!db.create_if_missing) return;

        ensure_parent_directory(db.path);
        try
        {
            auto conn = pool_.acquire();
            conn->execute("PRAGMA journal_mode = WAL;");
            conn->execute(LOG_ENTRIES_SCHEMA);
        }
        catch (const sqlite_error &e)
        {
            throw sink_init_error("Failed to initialize SQLite log database " + db.path + ": " + e.what());
        }
    }

    ~sqlite_destination() override { close(); }

    std::string name() const override { return "sqlite(" + pool_.path() + ")"; }

    sqlite_connection_pool &pool() { return pool_; }

  protected:
    write_result write_entry(const log_entry &entry) override
    {
        try
        {
            auto conn = pool_.acquire();
            auto stmt = conn->prepare(LOG_ENTRIES_INSERT);
            stmt.bind(1, format_timestamp_precise(entry.timestamp))
                .bind(2, std::string_view(log_level_name(entry.level)))
                .bind(3, entry.category)
                .bind(4, static_cast<int64_t>(entry.event_id.id))
                .bind(5, optional_text(entry.event_id.name))
                .bind(6, entry.message)
                .bind(7, entry.message_template)
                .bind(8, serialize_properties(entry.properties))
                .bind(9, serialize_properties(entry.scope_properties))
                .bind(10, entry.exception ? std::optional<std::string>(entry.exception->to_string()) : std::nullopt);
            stmt.execute();
        }
        catch (const sqlite_error &e)
        {
            return write_result::failure(fmt::format("{} (message: {})", e.what(), entry.message));
        }
        return write_result::success();
    }

    void release_resources() noexcept override { pool_.close(); }

  private:
    static const std::string &checked_path(const std::string &path)
    {
        validate_log_path(path);
        return path;
    }

    static std::optional<std::string> optional_text(const std::string &text)
    {
        if (text.empty()) return std::nullopt;
        return text;
    }

    static std::optional<std::string> serialize_properties(const log_properties &props)
    {
        if (props.empty()) return std::nullopt;
        return properties_to_json(props);
    }

    sqlite_connection_pool pool_;
};

} // namespace sluice
